#include "docsearch_cli/cli_handler.hpp"
#include <iostream>
#include <cstdlib>

int main(int argc, char *argv[])
{
  try
  {
    // Get API base URL from environment variable
    const char *api_base_url = std::getenv("DOCSEARCH_API_URL");
    std::string base_url = api_base_url ? api_base_url : "http://127.0.0.1:8000";

    docsearch_cli::CliOptions options = docsearch_cli::CliHandler::parse_arguments(argc, argv);

    curl_global_init(CURL_GLOBAL_DEFAULT);
    int exit_code = 0;
    {
      docsearch_cli::CliHandler handler(base_url);
      try
      {
        handler.execute_command(options);
      }
      catch (const std::exception &e)
      {
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
      }
    }
    curl_global_cleanup();
    return exit_code;
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
