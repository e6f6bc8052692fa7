#include "docsearch_core/services/index_job_runner.hpp"

#include <iostream>

namespace docsearch_core {

IndexJobRunner::IndexJobRunner(IndexBuilder &builder) : builder_(builder) {}

IndexJobRunner::~IndexJobRunner() {
  wait();
}

bool IndexJobRunner::try_begin() {
  if (running_) {
    return false;
  }
  running_ = true;
  progress_ = "Starting index build";
  return true;
}

bool IndexJobRunner::start_async() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!try_begin()) {
    return false;
  }
  // The previous task has already cleared running_, so this only reaps it.
  if (future_.valid()) {
    future_.get();
  }
  future_ = std::async(std::launch::async, [this] { execute(); });
  return true;
}

std::optional<IndexBuildReport> IndexJobRunner::run_sync() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!try_begin()) {
      return std::nullopt;
    }
  }
  return execute();
}

IndexBuildReport IndexJobRunner::execute() {
  IndexBuildReport report;
  try {
    report = builder_.build_index([this](const std::string &line) {
      std::lock_guard<std::mutex> lock(mutex_);
      progress_ = line;
    });
  } catch (const std::exception &e) {
    std::cerr << "Index build aborted: " << e.what() << std::endl;
    report = IndexBuildReport::failure_response(std::string("Index build aborted: ") + e.what());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  running_ = false;
  progress_.reset();
  last_result_ = report;
  return report;
}

IndexStatus IndexJobRunner::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {running_, last_result_, progress_};
}

void IndexJobRunner::wait() {
  std::future<void> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending = std::move(future_);
  }
  if (pending.valid()) {
    pending.get();
  }
}

}  // namespace docsearch_core
