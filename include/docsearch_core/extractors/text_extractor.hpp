#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace docsearch_core {

class ExtractionError : public std::exception {
 public:
  explicit ExtractionError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class TextExtractor {
 public:
  virtual ~TextExtractor() = default;

  // Checks if this extractor can handle the given file extension
  virtual bool can_handle(const fs::path& file_path) const = 0;

  // Plain text of every page, in document order. Element i is page i + 1.
  // Throws ExtractionError when the file cannot be parsed.
  virtual std::vector<std::string> extract_pages(const fs::path& file_path) const = 0;
};

}  // namespace docsearch_core
