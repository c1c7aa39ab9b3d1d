#pragma once
#include <memory>
#include <nlohmann/json.hpp>

#include "index_registry.hpp"
#include "server.hpp"
#include "sift_core/index/index_store.hpp"

// Forward declarations
namespace sift_core {
class IndexingService;
class SearchService;
class DocumentExtractorFactory;
}  // namespace sift_core

namespace sift_api {

class Routes {
 public:
  Routes(std::shared_ptr<IndexRegistry> registry,
         std::shared_ptr<sift_core::IndexingService> indexing_service,
         std::shared_ptr<sift_core::SearchService> search_service,
         std::shared_ptr<sift_core::DocumentExtractorFactory> extractor_factory,
         sift_core::IndexStore index_store,
         int default_top_k);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_build(const crow::request &req);
  crow::response handle_append(const crow::request &req);
  crow::response handle_verify(const crow::request &req);
  crow::response handle_query(const crow::request &req);

 private:
  std::shared_ptr<IndexRegistry> registry_;
  std::shared_ptr<sift_core::IndexingService> indexing_service_;
  std::shared_ptr<sift_core::SearchService> search_service_;
  std::shared_ptr<sift_core::DocumentExtractorFactory> extractor_factory_;
  sift_core::IndexStore index_store_;
  int default_top_k_;

  enum class JobKind { Build, Append };
  crow::response run_indexing_job(const crow::request &req, JobKind kind);

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace sift_api
