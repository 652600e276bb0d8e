#pragma once

#include <exception>
#include <string>

namespace lens_core {

// Raised when a caller-supplied option makes an operation meaningless
// (non-positive token budgets, k larger than the corpus, ...).
class ConfigurationError : public std::exception {
 public:
  explicit ConfigurationError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

enum class FailureKind { Transient, Fatal, InvalidInput };

inline std::string to_string(FailureKind kind) {
  switch (kind) {
    case FailureKind::Transient:
      return "transient";
    case FailureKind::Fatal:
      return "fatal";
    case FailureKind::InvalidInput:
      return "invalid_input";
    default:
      return "unknown";
  }
}

// Base for failures of the embedding, storage and labeling collaborators.
class CollaboratorError : public std::exception {
 public:
  CollaboratorError(const std::string &message, FailureKind kind)
      : message_(message), kind_(kind) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  FailureKind kind() const noexcept {
    return kind_;
  }

  bool is_retryable() const noexcept {
    return kind_ == FailureKind::Transient;
  }

 private:
  std::string message_;
  FailureKind kind_;
};

}  // namespace lens_core
