#pragma once
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>

#include "server.hpp"
#include "sift_core/errors.hpp"
#include "sift_core/services/ingestion_service.hpp"
#include "sift_core/types/search.hpp"

// Forward declarations
namespace sift_core {
class RetrievalService;
class DocumentService;
}  // namespace sift_core

namespace sift_api {

class Routes {
 public:
  Routes(std::shared_ptr<sift_core::IngestionService> ingestion_service,
         std::shared_ptr<sift_core::RetrievalService> retrieval_service,
         std::shared_ptr<sift_core::DocumentService> document_service,
         std::chrono::hours purge_retention);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Allow move constructor and assignment
  Routes(Routes &&) noexcept = default;
  Routes &operator=(Routes &&) noexcept = default;

  // Register all routes with the server
  void register_routes(Server &server);

  // Request parsing and error mapping, shared by the handlers
  static sift_core::IngestRequest parse_ingest_request(const nlohmann::json &body);
  static sift_core::SearchRequest parse_search_request(const nlohmann::json &body);
  static int status_for(sift_core::ErrorCode code);
  static nlohmann::json search_response_to_json(const sift_core::SearchResponse &response);
  static nlohmann::json job_to_json(const sift_core::Job &job);

 private:
  std::shared_ptr<sift_core::IngestionService> ingestion_service_;
  std::shared_ptr<sift_core::RetrievalService> retrieval_service_;
  std::shared_ptr<sift_core::DocumentService> document_service_;
  std::chrono::hours purge_retention_;

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_ingest(const crow::request &req);
  crow::response handle_list_jobs(const crow::request &req);
  crow::response handle_get_job(const crow::request &req, const std::string &job_id);
  crow::response handle_cancel_job(const crow::request &req, const std::string &job_id);
  crow::response handle_search(const crow::request &req);

  // Document management endpoints
  crow::response handle_list_documents(const crow::request &req);
  crow::response handle_get_document(const crow::request &req, const std::string &document_id);
  crow::response handle_delete_document(const crow::request &req, const std::string &document_id);
  crow::response handle_delete_by_prefix(const crow::request &req);
  crow::response handle_purge(const crow::request &req);

  // Helper methods
  static nlohmann::json parse_json_body(const std::string &body);
  static long long parse_id(const std::string &text, const std::string &what);
  // Maps SiftError codes to HTTP statuses; JSON errors are 400, anything else 500.
  static crow::response error_response(const std::string &handler, const std::exception &e);
  static nlohmann::json create_success_response(const std::string &message,
                                                const nlohmann::json &data = nlohmann::json{});
  static nlohmann::json create_error_response(const std::string &error,
                                              const std::string &code);
  static crow::response create_json_response(const nlohmann::json &json_data,
                                             int status_code = 200);
};

}  // namespace sift_api
