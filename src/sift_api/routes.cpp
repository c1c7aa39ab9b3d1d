#include "sift_api/routes.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "sift_core/extractors/document_extractor_factory.hpp"
#include "sift_core/services/indexing_service.hpp"
#include "sift_core/services/search_service.hpp"

namespace sift_api {
Routes::Routes(std::shared_ptr<IndexRegistry> registry,
               std::shared_ptr<sift_core::IndexingService> indexing_service,
               std::shared_ptr<sift_core::SearchService> search_service,
               std::shared_ptr<sift_core::DocumentExtractorFactory> extractor_factory,
               sift_core::IndexStore index_store,
               int default_top_k)
    : registry_(registry),
      indexing_service_(indexing_service),
      search_service_(search_service),
      extractor_factory_(extractor_factory),
      index_store_(index_store),
      default_top_k_(default_top_k) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/index/build").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_build(req);
  });

  CROW_ROUTE(app, "/index/append").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_append(req);
  });

  CROW_ROUTE(app, "/index/verify")
  ([this](const crow::request &req) { return handle_verify(req); });

  CROW_ROUTE(app, "/query").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_query(req);
  });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("Sift API is running");
  response["status"] = "healthy";
  const auto handle = registry_->current();
  response["index_loaded"] = handle != nullptr;
  response["entries"] = handle ? handle->size() : 0;
  return create_json_response(response);
}

crow::response Routes::handle_build(const crow::request &req) {
  return run_indexing_job(req, JobKind::Build);
}

crow::response Routes::handle_append(const crow::request &req) {
  return run_indexing_job(req, JobKind::Append);
}

crow::response Routes::run_indexing_job(const crow::request &req, JobKind kind) {
  const char *job = kind == JobKind::Build ? "build" : "append";
  auto job_lock = registry_->try_acquire_job();
  if (!job_lock.owns_lock()) {
    return create_json_response(create_error_response("Another indexing job is running"), 409);
  }

  std::vector<sift_core::Document> documents;
  try {
    auto json_body = parse_json_body(req.body);
    const std::string input_dir = json_body.value("input_dir", "");
    const std::string note = json_body.value("note", "");
    if (input_dir.empty() && note.empty()) {
      return create_json_response(create_error_response("input_dir or note is required"), 400);
    }
    if (!input_dir.empty()) {
      documents = extractor_factory_->read_directory(input_dir);
    }
    if (!note.empty()) {
      documents.push_back(sift_core::make_manual_note(note));
    }
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(std::string("Invalid request body: ") + e.what()), 400);
  } catch (const sift_core::DocumentExtractorError &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception reading input for index " << job << ": " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 400);
  }

  std::cout << "Starting index " << job << " over " << documents.size() << " documents" << std::endl;
  try {
    sift_core::IndexHandle handle = kind == JobKind::Build ? indexing_service_->build(documents)
                                                          : indexing_service_->append(documents);
    const size_t entries = handle.size();
    registry_->publish(std::move(handle));

    nlohmann::json data;
    data["documents"] = documents.size();
    data["entries"] = entries;
    return create_json_response(create_success_response(std::string("Index ") + job + " complete", data));
  } catch (const sift_core::IndexingJobError &e) {
    nlohmann::json error_response = create_error_response(e.what());
    error_response["checkpoint_location"] = e.checkpoint_location().string();
    return create_json_response(error_response, 500);
  } catch (const std::exception &e) {
    std::cerr << "Exception in index " << job << ": " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_verify(const crow::request &req) {
  const auto handle = registry_->current();
  if (!handle) {
    return create_json_response(create_error_response("No index is loaded"), 404);
  }
  const sift_core::VerifyReport report = index_store_.verify_report(*handle);
  nlohmann::json data;
  data["consistent"] = report.consistent;
  data["vector_count"] = report.vector_count;
  data["metadata_count"] = report.metadata_count;
  data["dimension"] = report.dimension;
  data["problems"] = report.problems;
  nlohmann::json response = create_success_response(
      report.consistent ? "Index is consistent" : "Index is inconsistent", data);
  return create_json_response(response, report.consistent ? 200 : 409);
}

crow::response Routes::handle_query(const crow::request &req) {
  std::string query;
  int top_k = default_top_k_;
  try {
    auto json_body = parse_json_body(req.body);
    query = json_body.value("query", "");
    top_k = json_body.value("top_k", default_top_k_);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(std::string("Invalid request body: ") + e.what()), 400);
  }
  if (query.empty()) {
    return create_json_response(create_error_response("query is required"), 400);
  }
  if (top_k <= 0) {
    return create_json_response(create_error_response("top_k must be greater than 0"), 400);
  }

  const auto handle = registry_->current();
  if (!handle) {
    return create_json_response(create_error_response("No index is loaded"), 404);
  }

  std::cout << "Query: " << query << " with top_k: " << top_k << std::endl;
  try {
    const auto results = search_service_->query(*handle, query, top_k);
    nlohmann::json results_json = nlohmann::json::array();
    for (const auto &result : results) {
      nlohmann::json result_json;
      result_json["rank"] = result.rank;
      result_json["score"] = result.score;
      result_json["vector_score"] = result.vector_score;
      result_json["lexical_score"] = result.lexical_score;
      result_json["position"] = result.position;
      result_json["title"] = result.record.title;
      result_json["source_id"] = result.record.source_id;
      result_json["type"] = sift_core::to_string(result.record.type);
      result_json["chunk_id"] = result.record.chunk_id;
      result_json["text"] = result.record.text;
      results_json.push_back(result_json);
    }
    nlohmann::json data;
    data["results"] = results_json;
    data["count"] = results_json.size();
    return create_json_response(create_success_response("Query complete", data));
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_query: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message, const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

}  // namespace sift_api
