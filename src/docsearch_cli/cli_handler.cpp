#include "docsearch_cli/cli_handler.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iomanip> // Required for std::fixed and std::setprecision
#include <stdexcept>

namespace docsearch_cli {

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    while (!api_base_url_.empty() && api_base_url_.back() == '/') {
        api_base_url_.pop_back();
    }
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

CliHandler::CliHandler(CliHandler&& other) noexcept
    : api_base_url_(std::move(other.api_base_url_))
    , curl_handle_(other.curl_handle_) {
    other.curl_handle_ = nullptr;
}

CliHandler& CliHandler::operator=(CliHandler&& other) noexcept {
    if (this != &other) {
        if (curl_handle_) {
            curl_easy_cleanup(curl_handle_);
        }
        api_base_url_ = std::move(other.api_base_url_);
        curl_handle_ = other.curl_handle_;
        other.curl_handle_ = nullptr;
    }
    return *this;
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "search" || command == "s") {
        options.command = Command::Search;
        for (int i = 2; i < argc; i += 2) {
            if (i + 1 >= argc) break;
            std::string flag = argv[i];
            std::string value = argv[i + 1];

            if (flag == "--query" || flag == "-q") {
                options.query = value;
            } else if (flag == "--top-k" || flag == "-k") {
                try {
                    options.top_k = std::stoi(value);
                } catch (const std::exception&) {
                    throw CliError("Invalid value for --top-k: " + value);
                }
            }
        }
        if (options.query.empty()) {
            throw CliError("Search command requires a query. Usage: search --query <query>");
        }
        if (options.top_k < 1 || options.top_k > 20) {
            throw CliError("--top-k must be between 1 and 20");
        }
    } else if (command == "stats") {
        options.command = Command::Stats;
    } else if (command == "index" || command == "i") {
        options.command = Command::Index;
        for (int i = 2; i < argc; ++i) {
            if (std::string(argv[i]) == "--async" || std::string(argv[i]) == "-a") {
                options.async_index = true;
            }
        }
    } else if (command == "status") {
        options.command = Command::Status;
    } else if (command == "files" || command == "l") {
        options.command = Command::Files;
    } else if (command == "delete" || command == "d") {
        options.command = Command::Delete;
        for (int i = 2; i < argc; i += 2) {
            if (i + 1 >= argc) break;
            std::string flag = argv[i];
            if (flag == "--file" || flag == "-f") {
                options.filename = argv[i + 1];
            }
        }
        if (options.filename.empty()) {
            throw CliError("Delete command requires a filename. Usage: delete --file <filename>");
        }
    } else if (command == "upload" || command == "u") {
        options.command = Command::Upload;
        for (int i = 2; i < argc; i += 2) {
            if (i + 1 >= argc) break;
            std::string flag = argv[i];
            if (flag == "--file" || flag == "-f") {
                options.filename = argv[i + 1];
            }
        }
        if (options.filename.empty()) {
            throw CliError("Upload command requires a file. Usage: upload --file <path>");
        }
    } else if (command == "download") {
        options.command = Command::Download;
        for (int i = 2; i < argc; i += 2) {
            if (i + 1 >= argc) break;
            std::string flag = argv[i];
            if (flag == "--file" || flag == "-f") {
                options.filename = argv[i + 1];
            } else if (flag == "--output" || flag == "-o") {
                options.output_path = argv[i + 1];
            }
        }
        if (options.filename.empty()) {
            throw CliError("Download command requires a filename. Usage: download --file <filename>");
        }
        if (options.output_path.empty()) {
            options.output_path = options.filename;
        }
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Search:
            handle_search_command(options);
            break;
        case Command::Stats:
            handle_stats_command();
            break;
        case Command::Index:
            handle_index_command(options);
            break;
        case Command::Status:
            handle_status_command();
            break;
        case Command::Files:
            handle_files_command();
            break;
        case Command::Delete:
            handle_delete_command(options);
            break;
        case Command::Upload:
            handle_upload_command(options);
            break;
        case Command::Download:
            handle_download_command(options);
            break;
        case Command::Help:
            print_help();
            break;
    }
}

void CliHandler::handle_search_command(const CliOptions& options) {
    std::cout << "Searching for: " << options.query << " (k=" << options.top_k << ")" << std::endl;
    nlohmann::json request = {{"query", options.query}, {"k", options.top_k}};
    print_search_response(make_post_request("/search", request));
}

void CliHandler::handle_stats_command() {
    nlohmann::json stats = make_get_request("/collection/stats");
    std::cout << "Collection:      " << stats.value("collection_name", "") << std::endl;
    std::cout << "Embedding model: " << stats.value("embedding_model", "") << std::endl;
    std::cout << "Total chunks:    " << stats.value("total_chunks", 0) << std::endl;
    std::cout << "Sources (sampled):" << std::endl;
    for (const auto& source : stats.value("sources", nlohmann::json::array())) {
        std::cout << "  - " << source.get<std::string>() << std::endl;
    }
}

void CliHandler::handle_index_command(const CliOptions& options) {
    if (options.async_index) {
        nlohmann::json response = make_post_request("/index/build", nlohmann::json::object());
        std::cout << response.value("message", "Index build started") << std::endl;
        return;
    }
    std::cout << "Building index, this may take a while..." << std::endl;
    print_index_report(make_post_request("/index/build/sync", nlohmann::json::object()));
}

void CliHandler::handle_status_command() {
    nlohmann::json status = make_get_request("/index/status");
    bool running = status.value("is_running", false);
    std::cout << "Index build running: " << (running ? "yes" : "no") << std::endl;
    if (status.contains("progress") && status["progress"].is_string()) {
        std::cout << "Progress: " << status["progress"].get<std::string>() << std::endl;
    }
    if (status.contains("last_result") && status["last_result"].is_object()) {
        std::cout << "Last result:" << std::endl;
        print_index_report(status["last_result"]);
    }
}

void CliHandler::handle_files_command() {
    nlohmann::json response = make_get_request("/files");
    std::cout << "Documents (" << response.value("total_files", 0) << "):" << std::endl;
    for (const auto& file : response.value("files", nlohmann::json::array())) {
        std::cout << "  - " << file.value("filename", "") << " (" << file.value("size", 0)
                  << " bytes)" << std::endl;
    }
}

std::string CliHandler::escape_path_segment(const std::string& segment) {
    char* escaped = curl_easy_escape(curl_handle_, segment.c_str(), static_cast<int>(segment.size()));
    if (!escaped) {
        throw CliError("Failed to encode filename");
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

void CliHandler::handle_delete_command(const CliOptions& options) {
    nlohmann::json response = make_delete_request("/files/" + escape_path_segment(options.filename));
    std::cout << response.value("message", "File deleted") << std::endl;
}

void CliHandler::handle_upload_command(const CliOptions& options) {
    if (!std::filesystem::is_regular_file(options.filename)) {
        throw CliError("File not found: " + options.filename);
    }
    std::cout << "Uploading: " << options.filename << std::endl;
    nlohmann::json response = make_upload_request("/files/upload", options.filename);
    std::cout << response.value("message", "File uploaded") << std::endl;
    std::cout << "  Stored at: " << response.value("filepath", "") << " ("
              << response.value("size", 0) << " bytes)" << std::endl;
    std::cout << "Run 'docsearch_cli index' to include it in search results." << std::endl;
}

void CliHandler::handle_download_command(const CliOptions& options) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }
    curl_easy_reset(curl_handle_);
    std::string content = perform_raw(build_url("/files/download/" + escape_path_segment(options.filename)));

    std::ofstream out(options.output_path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) {
        throw CliError("Failed to write " + options.output_path);
    }
    std::cout << "Saved " << options.filename << " to " << options.output_path << " ("
              << content.size() << " bytes)" << std::endl;
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }
    curl_easy_reset(curl_handle_);
    return perform(build_url(endpoint));
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const nlohmann::json& data) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string request_json = data.dump();
    curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);

    try {
        nlohmann::json response = perform(build_url(endpoint));
        curl_slist_free_all(headers);
        return response;
    } catch (const std::exception&) {
        curl_slist_free_all(headers);
        throw;
    }
}

nlohmann::json CliHandler::make_delete_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }
    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_CUSTOMREQUEST, "DELETE");
    return perform(build_url(endpoint));
}

nlohmann::json CliHandler::make_upload_request(const std::string& endpoint, const std::string& file_path) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }
    curl_easy_reset(curl_handle_);

    curl_mime* form = curl_mime_init(curl_handle_);
    curl_mimepart* field = curl_mime_addpart(form);
    curl_mime_name(field, "file");
    if (curl_mime_filedata(field, file_path.c_str()) != CURLE_OK) {
        curl_mime_free(form);
        throw CliError("Cannot read " + file_path);
    }
    curl_easy_setopt(curl_handle_, CURLOPT_MIMEPOST, form);

    try {
        nlohmann::json response = perform(build_url(endpoint));
        curl_mime_free(form);
        return response;
    } catch (const std::exception&) {
        curl_mime_free(form);
        throw;
    }
}

// Runs the request configured on the handle and returns the raw body. Non-2xx
// responses raise CliError carrying the server's "detail" when there is one.
std::string CliHandler::perform_raw(const std::string& url) {
    std::string response_buffer;
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code < 200 || http_code >= 300) {
        std::string message = "HTTP request failed with status code: " + std::to_string(http_code);
        nlohmann::json body = nlohmann::json::parse(response_buffer, nullptr, false);
        if (!body.is_discarded() && body.is_object() && body.contains("detail")) {
            message += " (" + body["detail"].dump() + ")";
        }
        throw CliError(message);
    }
    return response_buffer;
}

nlohmann::json CliHandler::perform(const std::string& url) {
    nlohmann::json body = nlohmann::json::parse(perform_raw(url), nullptr, false);
    if (body.is_discarded()) {
        throw CliError("Server returned invalid JSON");
    }
    return body;
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

std::string CliHandler::build_url(const std::string& endpoint) const {
    return api_base_url_ + API_PREFIX + endpoint;
}

void CliHandler::print_search_response(const nlohmann::json& response) {
    const auto results = response.value("results", nlohmann::json::array());
    std::cout << "\n=== Search Results (" << results.size() << ") ===" << std::endl;
    if (results.empty()) {
        std::cout << "No results found." << std::endl;
        return;
    }

    int rank = 1;
    for (const auto& result : results) {
        std::string text = result.value("text", "");
        std::cout << "\n[" << rank++ << "] " << result.value("source", "") << ", page "
                  << result.value("page", 0) << " | score: " << std::fixed
                  << std::setprecision(3) << result.value("score", 0.0) << std::endl;
        std::cout << "    " << text.substr(0, 200);
        if (text.length() > 200) {
            std::cout << "...";
        }
        std::cout << std::endl;
    }
}

void CliHandler::print_index_report(const nlohmann::json& report) {
    bool success = report.value("success", false);
    if (success) {
        std::cout << report.value("message", "Index built") << std::endl;
        std::cout << "  Total chunks:    " << report.value("total_chunks", 0) << std::endl;
        std::cout << "  Previous chunks: " << report.value("previous_chunks", 0) << std::endl;
        std::cout << "  Model:           " << report.value("embedding_model", "") << std::endl;
        std::cout << "  Collection:      " << report.value("collection_name", "") << std::endl;
    } else {
        std::cerr << "Index build failed: " << report.value("error", "unknown error") << std::endl;
        if (report.contains("message")) {
            std::cerr << "  " << report["message"].get<std::string>() << std::endl;
        }
    }
    for (const auto& file : report.value("files_processed", nlohmann::json::array())) {
        std::cout << "  - " << file.value("filename", "") << ": " << file.value("pages", 0)
                  << " pages, " << file.value("chunks", 0) << " chunks" << std::endl;
    }
}

void CliHandler::print_help() {
    std::cout << R"(
Docsearch CLI - semantic search over a PDF manual collection

Usage: docsearch_cli <command> [options]

Commands:
  search, s     Semantic search over indexed chunks
    --query, -q <query>  Search query
    --top-k, -k <num>    Number of results to return, 1-20 (default: 5)

  stats         Show collection statistics

  index, i      Rebuild the index from the document directory
    --async, -a          Start the build in the background and return

  status        Show the state of the last or running index build

  files, l      List documents in the document directory

  delete, d     Delete a document from the document directory
    --file, -f <name>    File name to delete

  upload, u     Copy a local file into the document directory
    --file, -f <path>    Local file (.pdf, .txt, .docx, .doc)

  download      Fetch a document from the document directory
    --file, -f <name>    File name to fetch
    --output, -o <path>  Where to save it (default: the file name)

  help, h       Show this help message

Environment Variables:
  DOCSEARCH_API_URL  Base URL for the Docsearch API (default: http://127.0.0.1:8000)

Examples:
  docsearch_cli search --query "GPIO configuration" --top-k 10
  docsearch_cli index --async
  docsearch_cli status
  docsearch_cli upload --file ~/manuals/RM0090.pdf
  docsearch_cli delete --file RM0090.pdf
)" << std::endl;
}

}  // namespace docsearch_cli
