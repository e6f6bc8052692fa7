#pragma once

#include <future>
#include <mutex>
#include <optional>
#include <string>

#include "docsearch_core/services/index_builder.hpp"
#include "docsearch_core/types/index_report.hpp"

namespace docsearch_core {

struct IndexStatus {
  bool is_running = false;
  std::optional<IndexBuildReport> last_result;
  std::optional<std::string> progress;
};

// Runs at most one index build at a time, either on a background task or on
// the calling thread, and remembers the last report.
class IndexJobRunner {
 public:
  explicit IndexJobRunner(IndexBuilder &builder);
  ~IndexJobRunner();

  IndexJobRunner(const IndexJobRunner &) = delete;
  IndexJobRunner &operator=(const IndexJobRunner &) = delete;

  // False when a build is already running.
  bool start_async();

  // std::nullopt when a build is already running.
  std::optional<IndexBuildReport> run_sync();

  IndexStatus status() const;

  // Blocks until a background build, if any, has finished.
  void wait();

 private:
  bool try_begin();
  IndexBuildReport execute();

  IndexBuilder &builder_;
  mutable std::mutex mutex_;
  bool running_ = false;
  std::optional<IndexBuildReport> last_result_;
  std::optional<std::string> progress_;
  std::future<void> future_;
};

}  // namespace docsearch_core
