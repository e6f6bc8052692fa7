#pragma once

#include <stdexcept>
#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace docsearch_cli
{

  enum class Command
  {
    Search,
    Stats,
    Index,
    Status,
    Files,
    Delete,
    Upload,
    Download,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string query;
    int top_k = 5;
    std::string filename;
    std::string output_path;
    bool async_index = false;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    static constexpr const char *API_PREFIX = "/api/v1";

    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Allow move constructor and assignment
    CliHandler(CliHandler &&) noexcept;
    CliHandler &operator=(CliHandler &&) noexcept;

    // Parse command line arguments
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command
    void execute_command(const CliOptions &options);

    std::string get_api_base_url() const;

    std::string build_url(const std::string &endpoint) const;

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    void handle_search_command(const CliOptions &options);
    void handle_stats_command();
    void handle_index_command(const CliOptions &options);
    void handle_status_command();
    void handle_files_command();
    void handle_delete_command(const CliOptions &options);
    void handle_upload_command(const CliOptions &options);
    void handle_download_command(const CliOptions &options);

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json make_delete_request(const std::string &endpoint);
    nlohmann::json make_upload_request(const std::string &endpoint, const std::string &file_path);
    nlohmann::json perform(const std::string &url);
    std::string perform_raw(const std::string &url);

    // Helper methods
    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    static void print_search_response(const nlohmann::json &response);
    static void print_index_report(const nlohmann::json &report);
    std::string escape_path_segment(const std::string &segment);
    static void print_help();
  };

}
