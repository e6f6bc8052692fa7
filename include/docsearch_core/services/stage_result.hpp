#pragma once

#include <string>
#include <utility>

namespace docsearch_core {

// Outcome of one index build stage: either a value or an error line for the report.
template <typename T>
struct StageResult {
  bool success = false;
  T value{};
  std::string error;
  std::string message;

  static StageResult success_response(T value) {
    return {true, std::move(value), "", ""};
  }

  static StageResult failure_response(const std::string &error, const std::string &message = "") {
    return {false, T{}, error, message};
  }
};

}  // namespace docsearch_core
