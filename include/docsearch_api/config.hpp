#pragma once

#include <cstddef>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

class Config {
 public:
  std::string api_base_url;
  std::string document_dir;
  std::string persist_dir;
  std::string collection_name;
  std::string ollama_url;
  std::string embedding_model;
  std::string cors_origin;
  int chunk_size;
  int chunk_overlap;
  int db_pool_size;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config root must be a JSON object");
    }
    Config config;

    // Apply defaults when keys are missing
    config.api_base_url = json_config.value("api_base_url", std::string("0.0.0.0:8000"));
    config.document_dir = json_config.value("document_dir", std::string("./document_source"));
    config.persist_dir = json_config.value("persist_dir", std::string("./vector_store"));
    config.collection_name = json_config.value("collection_name", std::string("stm32_manual_embedding"));
    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.embedding_model = json_config.value("embedding_model", std::string("all-minilm"));
    config.cors_origin = json_config.value("cors_origin", std::string("*"));

    config.chunk_size = int_or_default(json_config, "chunk_size", 1500);
    config.chunk_overlap = int_or_default(json_config, "chunk_overlap", 200);
    config.db_pool_size = int_or_default(json_config, "db_pool_size", 4);

    config.validate();
    return config;
  }

  std::string host() const {
    return api_base_url.substr(0, api_base_url.rfind(':'));
  }

  int port() const {
    return std::stoi(api_base_url.substr(api_base_url.rfind(':') + 1));
  }

 private:
  static int int_or_default(const nlohmann::json& json_config, const char* key, int fallback) {
    auto it = json_config.find(key);
    if (it == json_config.end() || !it->is_number_integer()) {
      // Fallback to default if missing or wrong type provided
      return fallback;
    }
    return it->get<int>();
  }

  void validate() const {
    if (api_base_url.empty()) {
      throw std::runtime_error("api_base_url cannot be empty");
    }
    auto colon = api_base_url.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == api_base_url.size() ||
        api_base_url.find_first_not_of("0123456789", colon + 1) != std::string::npos) {
      throw std::runtime_error("api_base_url must have the form host:port");
    }
    if (api_base_url.size() - colon - 1 > 5 || port() < 1 || port() > 65535) {
      throw std::runtime_error("api_base_url port must be between 1 and 65535");
    }
    if (document_dir.empty()) {
      throw std::runtime_error("document_dir cannot be empty");
    }
    if (persist_dir.empty()) {
      throw std::runtime_error("persist_dir cannot be empty");
    }
    if (collection_name.empty()) {
      throw std::runtime_error("collection_name cannot be empty");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (cors_origin.empty()) {
      throw std::runtime_error("cors_origin cannot be empty");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    // Zero would start every chunk with no carried text
    if (chunk_overlap <= 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be at least 1 and smaller than chunk_size");
    }
    if (db_pool_size <= 0) {
      throw std::runtime_error("db_pool_size must be greater than 0");
    }
  }
};
