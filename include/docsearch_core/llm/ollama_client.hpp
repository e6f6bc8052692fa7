#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "docsearch_core/llm/embedding_model.hpp"

namespace docsearch_core {

// Embeddings through a local Ollama server (/api/embed).
class OllamaClient : public EmbeddingModel {
 public:
  // Requests are split into batches of this many inputs.
  static constexpr size_t EMBED_BATCH_SIZE = 64;

  OllamaClient(const std::string &ollama_url, const std::string &embedding_model);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  void ensure_loaded() override;
  std::vector<float> encode(const std::string &text) override;
  std::vector<std::vector<float>> encode_batch(const std::vector<std::string> &texts) override;
  std::string model_name() const override {
    return embedding_model_;
  }

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  std::once_flag load_flag_;

  void load_model();
  std::vector<std::vector<float>> request_embeddings(const std::vector<std::string> &texts);
};

}  // namespace docsearch_core
