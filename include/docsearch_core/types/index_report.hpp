#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace docsearch_core {

struct FileReport {
  std::string filename;
  int pages = 0;
  int chunks = 0;
};

struct IndexBuildReport {
  bool success = false;
  std::string message;
  size_t total_chunks = 0;
  size_t previous_chunks = 0;
  std::vector<FileReport> files_processed;
  std::string embedding_model;
  std::string collection_name;
  std::optional<std::string> error;

  static IndexBuildReport failure_response(const std::string& error,
                                           const std::string& message = "",
                                           std::vector<FileReport> files_processed = {}) {
    IndexBuildReport report;
    report.success = false;
    report.error = error;
    report.message = message;
    report.files_processed = std::move(files_processed);
    return report;
  }
};

struct CollectionStats {
  size_t total_chunks = 0;
  std::string collection_name;
  std::string embedding_model;
  std::vector<std::string> sources;
};

}  // namespace docsearch_core
