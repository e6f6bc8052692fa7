#include "docsearch_api/routes.hpp"

#include <crow/multipart.h>

#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

#include "docsearch_core/services/document_service.hpp"
#include "docsearch_core/services/index_job_runner.hpp"
#include "docsearch_core/services/query_engine.hpp"

namespace docsearch_api {
Routes::Routes(docsearch_core::QueryEngine &query_engine,
               docsearch_core::IndexJobRunner &index_job_runner,
               docsearch_core::DocumentService &document_service)
    : query_engine_(query_engine),
      index_job_runner_(index_job_runner),
      document_service_(document_service) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/api/v1/search").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_search(req);
  });

  CROW_ROUTE(app, "/api/v1/collection/stats")
  ([this](const crow::request &req) { return handle_collection_stats(req); });

  // Index build endpoints
  CROW_ROUTE(app, "/api/v1/index/build")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_build_index(req); });

  CROW_ROUTE(app, "/api/v1/index/build/sync")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_build_index_sync(req); });

  CROW_ROUTE(app, "/api/v1/index/status")
  ([this](const crow::request &req) { return handle_index_status(req); });

  // Document source endpoints
  CROW_ROUTE(app, "/api/v1/files")
  ([this](const crow::request &req) { return handle_list_files(req); });

  CROW_ROUTE(app, "/api/v1/files/download/<string>")
  ([this](const crow::request &req, const std::string &filename) {
    return handle_download_file(req, filename);
  });

  CROW_ROUTE(app, "/api/v1/files/upload")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_upload_file(req); });

  CROW_ROUTE(app, "/api/v1/files/<string>")
      .methods(crow::HTTPMethod::DELETE)(
          [this](const crow::request &req, const std::string &filename) {
            return handle_delete_file(req, filename);
          });

  std::cout << "All routes registered under " << API_PREFIX << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &) {
  nlohmann::json response = create_success_response("Docsearch API is running");
  response["version"] = "1.0.0";
  response["status"] = "healthy";
  return create_json_response(response);
}

std::optional<std::string> Routes::parse_search_request(const std::string &body,
                                                        SearchRequest &out) {
  nlohmann::json json_body = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (json_body.is_discarded() || !json_body.is_object()) {
    return "Request body must be a JSON object";
  }

  auto query_it = json_body.find("query");
  if (query_it == json_body.end() || !query_it->is_string()) {
    return "Field 'query' is required and must be a string";
  }
  std::string query = query_it->get<std::string>();
  if (query.empty()) {
    return "Field 'query' must be at least 1 character long";
  }

  int k = docsearch_core::QueryEngine::DEFAULT_K;
  auto k_it = json_body.find("k");
  if (k_it != json_body.end() && !k_it->is_null()) {
    if (!k_it->is_number_integer()) {
      return "Field 'k' must be an integer";
    }
    auto requested = k_it->get<long long>();
    if (requested < 1 || requested > docsearch_core::QueryEngine::MAX_K) {
      return "Field 'k' must be between 1 and " +
             std::to_string(docsearch_core::QueryEngine::MAX_K);
    }
    k = static_cast<int>(requested);
  }

  out.query = std::move(query);
  out.k = k;
  return std::nullopt;
}

crow::response Routes::handle_search(const crow::request &req) {
  SearchRequest request;
  if (auto problem = parse_search_request(req.body, request)) {
    return create_json_response(create_error_response(*problem), 422);
  }

  try {
    std::cout << "Search for: " << request.query << " with k: " << request.k << std::endl;
    auto results = query_engine_.search(request.query, request.k);

    nlohmann::json results_json = nlohmann::json::array();
    for (const auto &result : results) {
      nlohmann::json result_json;
      result_json["id"] = result.id ? nlohmann::json(*result.id) : nlohmann::json(nullptr);
      result_json["text"] = result.text;
      result_json["page"] = result.page;
      result_json["source"] = result.source;
      result_json["score"] = result.score;
      results_json.push_back(result_json);
    }

    nlohmann::json response;
    response["query"] = request.query;
    response["results"] = results_json;
    response["total_results"] = results.size();
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_search: " << e.what() << std::endl;
    return create_json_response(create_error_response(std::string("Search error: ") + e.what()),
                                500);
  }
}

crow::response Routes::handle_collection_stats(const crow::request &) {
  try {
    auto stats = query_engine_.get_collection_stats();
    nlohmann::json response;
    response["total_chunks"] = stats.total_chunks;
    response["collection_name"] = stats.collection_name;
    response["embedding_model"] = stats.embedding_model;
    response["sources"] = stats.sources;
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_collection_stats: " << e.what() << std::endl;
    return create_json_response(
        create_error_response(std::string("Error retrieving stats: ") + e.what()), 500);
  }
}

crow::response Routes::handle_build_index(const crow::request &) {
  if (!index_job_runner_.start_async()) {
    return create_json_response(create_error_response("Index build already in progress"), 409);
  }
  std::cout << "Index build started in background" << std::endl;
  return create_json_response(create_success_response("Index build started in background"));
}

crow::response Routes::handle_build_index_sync(const crow::request &) {
  auto report = index_job_runner_.run_sync();
  if (!report) {
    return create_json_response(create_error_response("Index build already in progress"), 409);
  }
  return create_json_response(report_to_json(*report));
}

crow::response Routes::handle_index_status(const crow::request &) {
  auto status = index_job_runner_.status();
  nlohmann::json response;
  response["is_running"] = status.is_running;
  response["last_result"] =
      status.last_result ? report_to_json(*status.last_result) : nlohmann::json(nullptr);
  response["progress"] = status.progress ? nlohmann::json(*status.progress) : nlohmann::json(nullptr);
  return create_json_response(response);
}

crow::response Routes::handle_list_files(const crow::request &) {
  try {
    auto documents = document_service_.list_documents();
    nlohmann::json files = nlohmann::json::array();
    for (const auto &doc : documents) {
      nlohmann::json file_info;
      file_info["filename"] = doc.filename;
      file_info["filepath"] = doc.filepath;
      file_info["size"] = doc.size;
      file_info["extension"] = doc.extension;
      files.push_back(file_info);
    }
    nlohmann::json response;
    response["files"] = files;
    response["total_files"] = documents.size();
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_list_files: " << e.what() << std::endl;
    return create_json_response(
        create_error_response(std::string("Error listing files: ") + e.what()), 500);
  }
}

crow::response Routes::handle_download_file(const crow::request &, const std::string &filename) {
  try {
    auto content = document_service_.read_document(filename);
    if (!content) {
      return create_json_response(create_error_response("File '" + filename + "' not found"),
                                  404);
    }
    const bool is_pdf = std::filesystem::path(filename).extension() == ".pdf";
    crow::response resp(200, std::move(*content));
    resp.add_header("Content-Type", is_pdf ? "application/pdf" : "application/octet-stream");
    resp.add_header("Content-Disposition", "attachment; filename=\"" + filename + "\"");
    return resp;
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_download_file: " << e.what() << std::endl;
    return create_json_response(
        create_error_response(std::string("Error downloading file: ") + e.what()), 500);
  }
}

namespace {

// The "file" form field: its client-side filename and bytes.
std::optional<std::pair<std::string, std::string>> find_uploaded_file(
    const crow::multipart::message &form) {
  for (const auto &part : form.parts) {
    auto disposition = part.headers.find("Content-Disposition");
    if (disposition == part.headers.end()) {
      continue;
    }
    const auto &params = disposition->second.params;
    auto name = params.find("name");
    auto filename = params.find("filename");
    if (name == params.end() || name->second != "file" || filename == params.end()) {
      continue;
    }
    std::string value = filename->second;
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
      value = value.substr(1, value.size() - 2);
    }
    return std::make_pair(value, part.body);
  }
  return std::nullopt;
}

}  // namespace

crow::response Routes::handle_upload_file(const crow::request &req) {
  std::optional<std::pair<std::string, std::string>> upload;
  try {
    crow::multipart::message form(req);
    upload = find_uploaded_file(form);
  } catch (const std::exception &e) {
    return create_json_response(
        create_error_response(std::string("Malformed multipart body: ") + e.what()), 400);
  }
  if (!upload || upload->first.empty()) {
    return create_json_response(create_error_response("No file provided"), 400);
  }

  const std::string &filename = upload->first;
  try {
    std::cout << "Uploading file: " << filename << " (" << upload->second.size() << " bytes)"
              << std::endl;
    auto info = document_service_.save_document(filename, upload->second);
    nlohmann::json response;
    response["message"] = "File '" + info.filename + "' uploaded successfully";
    response["filename"] = info.filename;
    response["filepath"] = info.filepath;
    response["size"] = info.size;
    return create_json_response(response);
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_upload_file: " << e.what() << std::endl;
    return create_json_response(
        create_error_response(std::string("Error uploading file: ") + e.what()), 500);
  }
}

crow::response Routes::handle_delete_file(const crow::request &, const std::string &filename) {
  try {
    std::cout << "Deleting file: " << filename << std::endl;
    if (!document_service_.delete_document(filename)) {
      return create_json_response(create_error_response("File '" + filename + "' not found"),
                                  404);
    }
    nlohmann::json response;
    response["message"] = "File '" + filename + "' deleted successfully";
    response["filename"] = filename;
    return create_json_response(response);
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_delete_file: " << e.what() << std::endl;
    return create_json_response(
        create_error_response(std::string("Error deleting file: ") + e.what()), 500);
  }
}

nlohmann::json Routes::report_to_json(const docsearch_core::IndexBuildReport &report) {
  nlohmann::json response;
  response["success"] = report.success;
  if (!report.message.empty()) {
    response["message"] = report.message;
  }
  if (report.error) {
    response["error"] = *report.error;
  }
  nlohmann::json files = nlohmann::json::array();
  for (const auto &file : report.files_processed) {
    files.push_back({{"filename", file.filename}, {"pages", file.pages}, {"chunks", file.chunks}});
  }
  response["files_processed"] = files;
  if (report.success) {
    response["total_chunks"] = report.total_chunks;
    response["previous_chunks"] = report.previous_chunks;
    response["embedding_model"] = report.embedding_model;
    response["collection_name"] = report.collection_name;
  }
  return response;
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &detail) {
  nlohmann::json response;
  response["detail"] = detail;
  return response;
}

}  // namespace docsearch_api
