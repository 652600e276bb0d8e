#include "lens_core/llm/label_service.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

#include "ollama.hpp"

namespace lens_core {

ClusterLabels complete_labels(const std::vector<int> &cluster_ids, const ClusterLabels &partial) {
  ClusterLabels complete;
  for (int cluster_id : cluster_ids) {
    auto it = partial.find(cluster_id);
    if (it != partial.end() && !it->second.label.empty()) {
      complete[cluster_id] = it->second;
    } else {
      complete[cluster_id] = {"Topic " + std::to_string(cluster_id), {}};
    }
  }
  return complete;
}

OllamaLabelService::OllamaLabelService(OllamaLabelOptions options, RetryPolicy retry_policy)
    : options_(std::move(options)), retry_policy_(std::move(retry_policy)) {
  if (options_.model.empty()) {
    throw ConfigurationError("OllamaLabelService needs a model name");
  }
  if (options_.max_titles_per_cluster == 0) {
    throw ConfigurationError("max_titles_per_cluster must be greater than 0");
  }
  ollama::setServerURL(options_.ollama_url);
}

std::string OllamaLabelService::build_prompt(const ClusterTitles &clusters) const {
  std::ostringstream prompt;
  prompt << "You are analyzing topic clusters from " << options_.corpus_description << ".\n"
         << "Below are document clusters with their titles. For each cluster:\n"
         << "1. Give a short topic label (2-4 words)\n"
         << "2. Suggest 2-3 specific subtopics NOT yet covered that would be valuable additions\n\n"
         << "Respond with JSON only, in exactly this shape:\n"
         << R"({"clusters":[{"id":<cluster number>,"label":"<topic label>","gaps":["<gap>","<gap>"]}]})"
         << "\n\n";

  for (const auto &[cluster_id, titles] : clusters) {
    prompt << "Cluster " << cluster_id << " (" << titles.size() << " documents):\n";
    size_t shown = std::min(titles.size(), options_.max_titles_per_cluster);
    for (size_t i = 0; i < shown; ++i) {
      prompt << "  - " << titles[i] << "\n";
    }
  }
  return prompt.str();
}

std::string OllamaLabelService::generate(const std::string &prompt) {
  try {
    ollama::request request(ollama::message_type::generation);
    request["model"] = options_.model;
    request["prompt"] = prompt;
    request["format"] = "json";
    request["stream"] = false;

    ollama::response response = ollama::generate(request);
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    throw OllamaError("Label generation failed: " + std::string(e.what()),
                      OllamaClient::classify_failure(e.what()));
  }
}

ClusterLabels OllamaLabelService::label(const ClusterTitles &clusters) {
  std::vector<int> cluster_ids;
  for (const auto &[cluster_id, titles] : clusters) {
    cluster_ids.push_back(cluster_id);
  }
  if (clusters.empty()) {
    return {};
  }

  std::string prompt = build_prompt(clusters);
  std::string reply = retry_policy_.run("label clusters", [&]() { return generate(prompt); });

  ClusterLabels parsed = parse_label_response(reply);
  if (parsed.size() < cluster_ids.size()) {
    std::cerr << "[Labels] Model labeled " << parsed.size() << " of " << cluster_ids.size()
              << " clusters; using placeholders for the rest." << std::endl;
  }
  return complete_labels(cluster_ids, parsed);
}

ClusterLabels OllamaLabelService::parse_label_response(const std::string &response_text) {
  nlohmann::json response = nlohmann::json::parse(response_text, nullptr, false);
  if (response.is_discarded()) {
    std::cerr << "[Labels] Model reply is not valid JSON." << std::endl;
    return {};
  }
  return parse_label_response(response);
}

ClusterLabels OllamaLabelService::parse_label_response(const nlohmann::json &response) {
  ClusterLabels labels;
  if (!response.is_object() || !response.contains("clusters") ||
      !response["clusters"].is_array()) {
    return labels;
  }

  for (const auto &entry : response["clusters"]) {
    if (!entry.is_object() || !entry.contains("id") || !entry.contains("label")) {
      continue;
    }
    const auto &id = entry["id"];
    const auto &label = entry["label"];
    if (!id.is_number_integer() || !label.is_string()) {
      continue;
    }

    ClusterLabel cluster_label;
    cluster_label.label = label.get<std::string>();
    if (entry.contains("gaps") && entry["gaps"].is_array()) {
      for (const auto &gap : entry["gaps"]) {
        if (gap.is_string() && !gap.get<std::string>().empty()) {
          cluster_label.gaps.push_back(gap.get<std::string>());
        }
      }
    }
    labels[id.get<int>()] = std::move(cluster_label);
  }
  return labels;
}

}  // namespace lens_core
