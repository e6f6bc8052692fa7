#include "docsearch_api/server.hpp"

namespace docsearch_api {
Server::Server(const std::string &host, int port, const std::string &cors_origin)
    : host_(host), port_(port), running_(false) {
  app_.loglevel(crow::LogLevel::Warning);

  auto &cors = app_.get_middleware<crow::CORSHandler>();
  cors.global()
      .origin(cors_origin)
      .methods(crow::HTTPMethod::GET, crow::HTTPMethod::POST, crow::HTTPMethod::DELETE,
               crow::HTTPMethod::OPTIONS)
      .headers("Content-Type", "Authorization");
}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  server_thread_future_ = std::async(std::launch::async, [this] {
    app_.port(port_).bindaddr(host_).multithreaded().run();
  });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();

  if (server_thread_future_.valid()) {
    server_thread_future_.get();
  }
  running_ = false;
}
}  // namespace docsearch_api
