#pragma once

#include <string>
#include <vector>

namespace docsearch_core {

class ModelLoadError : public std::exception {
 public:
  explicit ModelLoadError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class EncodingError : public std::exception {
 public:
  explicit EncodingError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Maps text to fixed-dimension float vectors. One instance is shared by the
// index builder and the query engine.
class EmbeddingModel {
 public:
  virtual ~EmbeddingModel() = default;

  // Loads the model once. Safe to call repeatedly; a failed load is retried
  // by the next call. Throws ModelLoadError.
  virtual void ensure_loaded() = 0;

  // Throws EncodingError.
  virtual std::vector<float> encode(const std::string &text) = 0;

  // One vector per input, in input order. Throws EncodingError.
  virtual std::vector<std::vector<float>> encode_batch(const std::vector<std::string> &texts) = 0;

  virtual std::string model_name() const = 0;
};

}  // namespace docsearch_core
