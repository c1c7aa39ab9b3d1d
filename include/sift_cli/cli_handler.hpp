#pragma once

#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace sift_cli
{

  enum class Command
  {
    Build,
    Append,
    Query,
    Verify,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string input_dir;
    std::string note;
    std::string query;
    int top_k = 5;
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
    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments
    CliOptions parse_arguments(int argc, char *argv[]) const;

    // Execute command
    void execute_command(const CliOptions &options);

    std::string get_api_base_url() const;

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    void handle_build_command(const CliOptions &options);
    void handle_append_command(const CliOptions &options);
    void handle_query_command(const CliOptions &options);
    void handle_verify_command(const CliOptions &options);

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json perform_request(const std::string &endpoint, const std::string *post_body);

    // Helper methods
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_job_response(const nlohmann::json &response);
    void print_query_response(const nlohmann::json &response);
    void print_help();
    std::string build_url(const std::string &endpoint) const;
  };

}
