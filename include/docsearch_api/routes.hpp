#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "server.hpp"

// Forward declarations
namespace docsearch_core {
class QueryEngine;
class IndexJobRunner;
class DocumentService;
struct IndexBuildReport;
}  // namespace docsearch_core

namespace docsearch_api {

// Every route lives under this prefix.
inline constexpr const char *API_PREFIX = "/api/v1";

struct SearchRequest {
  std::string query;
  int k = 5;
};

class Routes {
 public:
  Routes(docsearch_core::QueryEngine &query_engine,
         docsearch_core::IndexJobRunner &index_job_runner,
         docsearch_core::DocumentService &document_service);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Validates a search body; returns the problem when it is invalid.
  static std::optional<std::string> parse_search_request(const std::string &body,
                                                         SearchRequest &out);

  static nlohmann::json report_to_json(const docsearch_core::IndexBuildReport &report);

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_search(const crow::request &req);
  crow::response handle_collection_stats(const crow::request &req);
  crow::response handle_build_index(const crow::request &req);
  crow::response handle_build_index_sync(const crow::request &req);
  crow::response handle_index_status(const crow::request &req);
  crow::response handle_list_files(const crow::request &req);
  crow::response handle_download_file(const crow::request &req, const std::string &filename);
  crow::response handle_upload_file(const crow::request &req);
  crow::response handle_delete_file(const crow::request &req, const std::string &filename);

 private:
  docsearch_core::QueryEngine &query_engine_;
  docsearch_core::IndexJobRunner &index_job_runner_;
  docsearch_core::DocumentService &document_service_;

  // Helper methods
  static nlohmann::json create_success_response(const std::string &message);
  static nlohmann::json create_error_response(const std::string &detail);
  static crow::response create_json_response(const nlohmann::json &json_data,
                                             int status_code = 200);
};

}  // namespace docsearch_api
