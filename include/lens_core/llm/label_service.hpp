#pragma once

#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "lens_core/llm/ollama_client.hpp"
#include "lens_core/retry_policy.hpp"

namespace lens_core {

struct ClusterLabel {
  std::string label;
  std::vector<std::string> gaps;

  bool operator==(const ClusterLabel &other) const = default;
};

using ClusterTitles = std::map<int, std::vector<std::string>>;
using ClusterLabels = std::map<int, ClusterLabel>;

// Turns cluster membership into a human label and content-gap suggestions per cluster.
class LabelService {
 public:
  virtual ~LabelService() = default;
  virtual ClusterLabels label(const ClusterTitles &clusters) = 0;
};

using LabelServicePtr = std::shared_ptr<LabelService>;

// Fills every cluster id missing from `partial` (or carrying an empty label) with
// "Topic <id>" and no gaps. Ids not in `cluster_ids` are dropped.
ClusterLabels complete_labels(const std::vector<int> &cluster_ids, const ClusterLabels &partial);

struct OllamaLabelOptions {
  std::string ollama_url = "http://localhost:11434";
  std::string model = "llama3.1";
  std::string corpus_description = "a collection of long-form articles";
  size_t max_titles_per_cluster = 20;
};

/**
 * @brief LabelService backed by an Ollama text model.
 *
 * The model is asked for a JSON document of the form
 * {"clusters":[{"id":0,"label":"...","gaps":["..."]}]} and the reply is decoded
 * structurally. Unusable entries are skipped and replaced by placeholders.
 */
class OllamaLabelService : public LabelService {
 public:
  OllamaLabelService(OllamaLabelOptions options, RetryPolicy retry_policy);

  ClusterLabels label(const ClusterTitles &clusters) override;

  std::string build_prompt(const ClusterTitles &clusters) const;

  // Decodes the model's JSON reply; never throws on malformed content
  static ClusterLabels parse_label_response(const nlohmann::json &response);
  static ClusterLabels parse_label_response(const std::string &response_text);

 private:
  std::string generate(const std::string &prompt);

  OllamaLabelOptions options_;
  RetryPolicy retry_policy_;
};

}  // namespace lens_core
