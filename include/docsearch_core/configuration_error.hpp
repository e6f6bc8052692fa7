#pragma once

#include <stdexcept>
#include <string>

namespace docsearch_core {

// Bad configuration values, or a document source that cannot be indexed.
class ConfigurationError : public std::exception {
 public:
  explicit ConfigurationError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

}  // namespace docsearch_core
