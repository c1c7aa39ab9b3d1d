#include "sift_cli/cli_handler.hpp"
#include <iostream>
#include <iomanip> // Required for std::fixed and std::setprecision
#include <memory>

namespace sift_cli {

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(curl_easy_init()) {
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
    while (!api_base_url_.empty() && api_base_url_.back() == '/') {
        api_base_url_.pop_back();
    }
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

namespace {

// Walks "--flag value" pairs after the command word.
template <typename Handler>
void for_each_flag(int argc, char* argv[], const std::string& usage, Handler&& handle) {
    for (int i = 2; i < argc; i += 2) {
        if (i + 1 >= argc) {
            throw CliError(std::string("Missing value for ") + argv[i] + ". Usage: " + usage);
        }
        if (!handle(std::string(argv[i]), std::string(argv[i + 1]))) {
            throw CliError(std::string("Unknown option ") + argv[i] + ". Usage: " + usage);
        }
    }
}

int parse_top_k(const std::string& value) {
    try {
        size_t used = 0;
        int top_k = std::stoi(value, &used);
        if (used != value.size() || top_k <= 0) {
            throw CliError("--top-k must be a positive integer, got " + value);
        }
        return top_k;
    } catch (const std::logic_error&) {
        throw CliError("--top-k must be a positive integer, got " + value);
    }
}

}  // namespace

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) const {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "build" || command == "b" || command == "append" || command == "a") {
        const bool build = command == "build" || command == "b";
        options.command = build ? Command::Build : Command::Append;
        const std::string usage = std::string(build ? "build" : "append") + " --input <dir> [--note <text>]";
        for_each_flag(argc, argv, usage, [&](const std::string& flag, const std::string& value) {
            if (flag == "--input" || flag == "-i") {
                options.input_dir = value;
            } else if (flag == "--note" || flag == "-n") {
                options.note = value;
            } else {
                return false;
            }
            return true;
        });
        if (options.input_dir.empty() && options.note.empty()) {
            throw CliError("Missing input directory. Usage: " + usage);
        }
    } else if (command == "query" || command == "q") {
        options.command = Command::Query;
        const std::string usage = "query --query <text> [--top-k N]";
        for_each_flag(argc, argv, usage, [&](const std::string& flag, const std::string& value) {
            if (flag == "--query" || flag == "-q") {
                options.query = value;
            } else if (flag == "--top-k" || flag == "-k") {
                options.top_k = parse_top_k(value);
            } else {
                return false;
            }
            return true;
        });
        if (options.query.empty()) {
            throw CliError("Query command requires a query. Usage: " + usage);
        }
    } else if (command == "verify" || command == "v") {
        options.command = Command::Verify;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Build:
            handle_build_command(options);
            break;
        case Command::Append:
            handle_append_command(options);
            break;
        case Command::Query:
            handle_query_command(options);
            break;
        case Command::Verify:
            handle_verify_command(options);
            break;
        case Command::Help:
            print_help();
            break;
    }
}

void CliHandler::handle_build_command(const CliOptions& options) {
    std::cout << "Building index from: " << options.input_dir << std::endl;
    nlohmann::json request_data = {{"input_dir", options.input_dir}};
    if (!options.note.empty()) {
        request_data["note"] = options.note;
    }
    print_job_response(make_post_request("/index/build", request_data));
}

void CliHandler::handle_append_command(const CliOptions& options) {
    std::cout << "Appending to index from: " << options.input_dir << std::endl;
    nlohmann::json request_data = {{"input_dir", options.input_dir}};
    if (!options.note.empty()) {
        request_data["note"] = options.note;
    }
    print_job_response(make_post_request("/index/append", request_data));
}

void CliHandler::handle_query_command(const CliOptions& options) {
    std::cout << "Query: " << options.query << " (top_k: " << options.top_k << ")" << std::endl;
    nlohmann::json request_data = {{"query", options.query}, {"top_k", options.top_k}};
    print_query_response(make_post_request("/query", request_data));
}

void CliHandler::handle_verify_command(const CliOptions& options) {
    nlohmann::json response = make_get_request("/index/verify");
    const auto& data = response["data"];
    std::cout << (data.value("consistent", false) ? "Index is consistent" : "Index is INCONSISTENT")
              << ": " << data.value("vector_count", 0) << " vectors, "
              << data.value("metadata_count", 0) << " records, dimension "
              << data.value("dimension", 0) << std::endl;
    for (const auto& problem : data.value("problems", nlohmann::json::array())) {
        std::cout << "  - " << problem.get<std::string>() << std::endl;
    }
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    return perform_request(endpoint, nullptr);
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const nlohmann::json& data) {
    const std::string request_json = data.dump();
    return perform_request(endpoint, &request_json);
}

nlohmann::json CliHandler::perform_request(const std::string& endpoint, const std::string* post_body) {
    std::string url = build_url(endpoint);
    std::string response_buffer;
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, &curl_slist_free_all);

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);
    if (post_body) {
        headers.reset(curl_slist_append(nullptr, "Content-Type: application/json"));
        curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, post_body->c_str());
        curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());
    }

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request to " + url + " failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(response_buffer);
    } catch (const nlohmann::json::parse_error&) {
        throw CliError("HTTP " + std::to_string(http_code) + " with a non-JSON body from " + url);
    }

    // verify answers 409 with a full report for an inconsistent index
    if (http_code == 200 || (http_code == 409 && body.contains("data"))) {
        return body;
    }
    std::string message = "HTTP request failed with status code: " + std::to_string(http_code);
    if (body.contains("error")) {
        message += ": " + body["error"].get<std::string>();
    }
    if (body.contains("checkpoint_location")) {
        message += "\nCheckpoint: " + body["checkpoint_location"].get<std::string>();
    }
    throw CliError(message);
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

void CliHandler::print_job_response(const nlohmann::json& response) {
    const auto& data = response["data"];
    std::cout << response.value("message", "Done") << ": " << data.value("documents", 0)
              << " documents read, index holds " << data.value("entries", 0) << " entries" << std::endl;
}

void CliHandler::print_query_response(const nlohmann::json& response) {
    const auto& results = response["data"]["results"];
    if (!results.is_array() || results.empty()) {
        std::cout << "No results." << std::endl;
        return;
    }
    for (const auto& result : results) {
        std::cout << "\n#" << result.value("rank", 0) << "  " << result.value("title", "")
                  << "  (score: " << std::fixed << std::setprecision(3) << result.value("score", 0.0)
                  << ", vector: " << result.value("vector_score", 0.0)
                  << ", lexical: " << result.value("lexical_score", 0.0) << ")" << std::endl;
        std::string text = result.value("text", "");
        if (text.size() > 300) {
            text = text.substr(0, 300) + "...";
        }
        std::cout << text << std::endl;
    }
}

void CliHandler::print_help() {
    std::cout << "Sift CLI - document indexing and hybrid retrieval\n\n"
              << "Usage: sift <command> [options]\n\n"
              << "Commands:\n"
              << "  build,  b   --input <dir> [--note <text>]   Build a new index from a folder\n"
              << "  append, a   --input <dir> [--note <text>]   Add a folder to the saved index\n"
              << "  query,  q   --query <text> [--top-k N]      Ranked chunks for a query\n"
              << "  verify, v                                   Check vector/metadata parity\n"
              << "  help,   h                                   Show this help\n\n"
              << "The API address is read from SIFT_API_URL (default http://127.0.0.1:3040)."
              << std::endl;
}

std::string CliHandler::build_url(const std::string& endpoint) const {
    return api_base_url_ + endpoint;
}

}  // namespace sift_cli
