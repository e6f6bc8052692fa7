#include "docsearch_core/llm/ollama_client.hpp"

#include <algorithm>
#include <iostream>

#include "ollama.hpp"

namespace docsearch_core {

OllamaClient::OllamaClient(const std::string &ollama_url, const std::string &embedding_model)
    : ollama_url_(ollama_url), embedding_model_(embedding_model) {
  // No network traffic here; the server is contacted on first use.
  ollama::setServerURL(ollama_url_);
}

void OllamaClient::ensure_loaded() {
  // call_once leaves the flag unset when load_model() throws, so a later call retries.
  std::call_once(load_flag_, [this] { load_model(); });
}

void OllamaClient::load_model() {
  try {
    if (!ollama::is_running()) {
      throw ModelLoadError("Ollama server is not running at " + ollama_url_);
    }
  } catch (const ollama::exception &e) {
    throw ModelLoadError("Ollama server at " + ollama_url_ + " is unreachable: " + e.what());
  }

  std::cout << "Loading embedding model '" << embedding_model_ << "' from " << ollama_url_
            << std::endl;
  // Embedding-only models reject /api/generate, so a one-line embed request loads it instead.
  try {
    request_embeddings({"warm up"});
  } catch (const EncodingError &e) {
    throw ModelLoadError("Model '" + embedding_model_ + "' failed to load: " + e.what());
  }
}

std::vector<float> OllamaClient::encode(const std::string &text) {
  ensure_loaded();
  auto vectors = request_embeddings({text});
  return std::move(vectors.front());
}

std::vector<std::vector<float>> OllamaClient::encode_batch(const std::vector<std::string> &texts) {
  ensure_loaded();
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());

  for (size_t start = 0; start < texts.size(); start += EMBED_BATCH_SIZE) {
    const size_t end = std::min(texts.size(), start + EMBED_BATCH_SIZE);
    std::vector<std::string> batch(texts.begin() + start, texts.begin() + end);
    auto batch_vectors = request_embeddings(batch);
    for (auto &vector : batch_vectors) {
      if (!vectors.empty() && vector.size() != vectors.front().size()) {
        throw EncodingError("Model returned vectors of differing dimension (" +
                            std::to_string(vectors.front().size()) + " and " +
                            std::to_string(vector.size()) + ")");
      }
      vectors.push_back(std::move(vector));
    }
  }
  return vectors;
}

std::vector<std::vector<float>> OllamaClient::request_embeddings(
    const std::vector<std::string> &texts) {
  try {
    ollama::request request = ollama::request::from_embedding(embedding_model_, "");
    request["input"] = texts;
    ollama::response response = ollama::generate_embeddings(request);

    auto json_response = response.as_json();
    if (!json_response.contains("embeddings") || !json_response["embeddings"].is_array()) {
      throw EncodingError("Response does not contain an embeddings array");
    }

    auto vectors = json_response["embeddings"].get<std::vector<std::vector<float>>>();
    if (vectors.size() != texts.size()) {
      throw EncodingError("Requested " + std::to_string(texts.size()) + " embeddings, got " +
                          std::to_string(vectors.size()));
    }
    for (const auto &vector : vectors) {
      if (vector.empty()) {
        throw EncodingError("Model returned an empty embedding");
      }
    }
    return vectors;
  } catch (const ollama::exception &e) {
    throw EncodingError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw EncodingError("Malformed embedding response: " + std::string(e.what()));
  }
}

}  // namespace docsearch_core
