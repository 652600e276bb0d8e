#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. lens_core/types/chunk.hpp),
// users can simply do `#include "lens_core/types.hpp"`.
//
#include "lens_core/types/chunk.hpp"
#include "lens_core/types/document.hpp"
#include "lens_core/types/retrieval_result.hpp"
