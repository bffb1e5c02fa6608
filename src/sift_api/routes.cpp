#include "sift_api/routes.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "sift_core/db/time_utils.hpp"
#include "sift_core/services/document_service.hpp"
#include "sift_core/services/retrieval_service.hpp"

namespace sift_api {

namespace {

nlohmann::json attributes_json(const sift_core::ChunkAttributes &attributes) {
  nlohmann::json json;
  if (!attributes.node_kind.empty()) json["node_kind"] = attributes.node_kind;
  if (!attributes.symbol_name.empty()) json["symbol_name"] = attributes.symbol_name;
  if (!attributes.table_header.empty()) json["table_header"] = attributes.table_header;
  json["line_start"] = attributes.line_start;
  json["line_end"] = attributes.line_end;
  return json;
}

nlohmann::json chunk_json(const sift_core::StoredChunk &chunk) {
  nlohmann::json json;
  json["chunk_id"] = chunk.id;
  json["document_id"] = chunk.document_id;
  json["version"] = chunk.version;
  json["chunk_index"] = chunk.chunk_index;
  json["origin"] = chunk.origin;
  json["content"] = chunk.content;
  json["start_offset"] = chunk.start_offset;
  json["end_offset"] = chunk.end_offset;
  json["token_count"] = chunk.token_count;
  json["doc_class"] = sift_core::to_string(chunk.doc_class);
  json["language"] = chunk.language;
  json["attributes"] = attributes_json(chunk.attributes);
  return json;
}

nlohmann::json document_json(const sift_core::DocumentRecord &document) {
  nlohmann::json json;
  json["id"] = document.id;
  json["origin"] = document.origin;
  json["knowledge_base"] = document.knowledge_base;
  json["content_hash"] = document.content_hash;
  json["doc_class"] = sift_core::to_string(document.doc_class);
  json["current_version"] = document.current_version;
  json["created_at"] = sift_core::time_point_to_string(document.created_at);
  json["updated_at"] = sift_core::time_point_to_string(document.updated_at);
  return json;
}

std::vector<std::string> string_list(const nlohmann::json &filters, const char *key) {
  if (!filters.contains(key)) {
    return {};
  }
  return filters.at(key).get<std::vector<std::string>>();
}

std::chrono::system_clock::time_point parse_time(const std::string &text, const char *field) {
  try {
    return sift_core::string_to_time_point(text);
  } catch (const std::runtime_error &) {
    throw sift_core::ValidationError(std::string(field) +
                                     " must use the format YYYY-MM-DD HH:MM:SS");
  }
}

}  // namespace

Routes::Routes(std::shared_ptr<sift_core::IngestionService> ingestion_service,
               std::shared_ptr<sift_core::RetrievalService> retrieval_service,
               std::shared_ptr<sift_core::DocumentService> document_service,
               std::chrono::hours purge_retention)
    : ingestion_service_(ingestion_service),
      retrieval_service_(retrieval_service),
      document_service_(document_service),
      purge_retention_(purge_retention) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/ingest").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_ingest(req);
  });

  // Job endpoints
  CROW_ROUTE(app, "/jobs")
  ([this](const crow::request &req) { return handle_list_jobs(req); });

  CROW_ROUTE(app, "/jobs/<string>")
  ([this](const crow::request &req, const std::string &job_id) {
    return handle_get_job(req, job_id);
  });

  CROW_ROUTE(app, "/jobs/<string>/cancel")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &job_id) {
        return handle_cancel_job(req, job_id);
      });

  CROW_ROUTE(app, "/search").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_search(req);
  });

  // Document endpoints
  CROW_ROUTE(app, "/documents")
      .methods(crow::HTTPMethod::GET, crow::HTTPMethod::DELETE)([this](const crow::request &req) {
        if (req.method == crow::HTTPMethod::DELETE) {
          return handle_delete_by_prefix(req);
        }
        return handle_list_documents(req);
      });

  CROW_ROUTE(app, "/documents/<string>")
      .methods(crow::HTTPMethod::GET, crow::HTTPMethod::DELETE)(
          [this](const crow::request &req, const std::string &document_id) {
            if (req.method == crow::HTTPMethod::DELETE) {
              return handle_delete_document(req, document_id);
            }
            return handle_get_document(req, document_id);
          });

  CROW_ROUTE(app, "/maintenance/purge")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req) { return handle_purge(req); });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("Sift API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  return create_json_response(response);
}

crow::response Routes::handle_ingest(const crow::request &req) {
  try {
    sift_core::IngestRequest request = parse_ingest_request(parse_json_body(req.body));
    std::cout << "Ingest requested for: " << request.origin << " (" << request.content.size()
              << " bytes)" << std::endl;
    long long job_id = ingestion_service_->submit(request);

    nlohmann::json data;
    data["job_id"] = job_id;
    return create_json_response(create_success_response("Ingestion queued", data), 202);
  } catch (const std::exception &e) {
    return error_response("handle_ingest", e);
  }
}

crow::response Routes::handle_list_jobs(const crow::request &req) {
  try {
    std::optional<sift_core::JobStatus> status_filter;
    if (const char *status = req.url_params.get("status")) {
      try {
        status_filter = sift_core::job_status_from_string(status);
      } catch (const std::invalid_argument &) {
        throw sift_core::ValidationError(std::string("Invalid status filter: ") + status);
      }
    }
    int limit = 100;
    if (const char *limit_param = req.url_params.get("limit")) {
      limit = static_cast<int>(parse_id(limit_param, "limit"));
    }

    nlohmann::json jobs_json = nlohmann::json::array();
    for (const auto &job : ingestion_service_->list_jobs(status_filter, limit)) {
      jobs_json.push_back(job_to_json(job));
    }
    nlohmann::json data;
    data["jobs"] = jobs_json;
    data["count"] = jobs_json.size();
    return create_json_response(create_success_response("Jobs retrieved successfully", data));
  } catch (const std::exception &e) {
    return error_response("handle_list_jobs", e);
  }
}

crow::response Routes::handle_get_job(const crow::request &req, const std::string &job_id) {
  try {
    sift_core::Job job = ingestion_service_->get_job_status(parse_id(job_id, "job id"));
    return create_json_response(
        create_success_response("Job status retrieved successfully", job_to_json(job)));
  } catch (const std::exception &e) {
    return error_response("handle_get_job", e);
  }
}

crow::response Routes::handle_cancel_job(const crow::request &req, const std::string &job_id) {
  try {
    long long id = parse_id(job_id, "job id");
    std::cout << "Cancelling job " << id << std::endl;
    bool cancelled = ingestion_service_->cancel(id);

    nlohmann::json data;
    data["job_id"] = id;
    data["cancelled"] = cancelled;
    return create_json_response(create_success_response(
        cancelled ? "Cancellation requested" : "Job already finished", data));
  } catch (const std::exception &e) {
    return error_response("handle_cancel_job", e);
  }
}

crow::response Routes::handle_search(const crow::request &req) {
  try {
    sift_core::SearchRequest request = parse_search_request(parse_json_body(req.body));
    std::cout << "Search for: " << request.query << std::endl;

    sift_core::SearchResponse response = retrieval_service_->search(request);
    std::cout << "Search returned " << response.results.size() << " results"
              << (response.degraded ? " (degraded)" : "")
              << (response.timed_out ? " (timed out)" : "") << std::endl;
    return create_json_response(
        create_success_response("Search completed", search_response_to_json(response)));
  } catch (const std::exception &e) {
    return error_response("handle_search", e);
  }
}

crow::response Routes::handle_list_documents(const crow::request &req) {
  try {
    std::optional<std::string> knowledge_base;
    if (const char *kb = req.url_params.get("knowledge_base")) {
      knowledge_base = kb;
    }
    nlohmann::json documents = nlohmann::json::array();
    for (const auto &document : document_service_->list_documents(knowledge_base)) {
      documents.push_back(document_json(document));
    }
    nlohmann::json data;
    data["documents"] = documents;
    data["count"] = documents.size();
    return create_json_response(create_success_response("Documents retrieved successfully", data));
  } catch (const std::exception &e) {
    return error_response("handle_list_documents", e);
  }
}

crow::response Routes::handle_get_document(const crow::request &req,
                                           const std::string &document_id) {
  try {
    sift_core::DocumentDetails details =
        document_service_->get_document(parse_id(document_id, "document id"));

    nlohmann::json data = document_json(details.document);
    nlohmann::json versions = nlohmann::json::array();
    for (const auto &version : details.versions) {
      nlohmann::json version_json;
      version_json["version"] = version.version;
      version_json["content_hash"] = version.content_hash;
      version_json["created_at"] = sift_core::time_point_to_string(version.created_at);
      versions.push_back(version_json);
    }
    data["versions"] = versions;
    data["live_chunks"] = details.live_chunks;
    return create_json_response(create_success_response("Document retrieved successfully", data));
  } catch (const std::exception &e) {
    return error_response("handle_get_document", e);
  }
}

crow::response Routes::handle_delete_document(const crow::request &req,
                                              const std::string &document_id) {
  try {
    long long id = parse_id(document_id, "document id");
    std::cout << "Deleting document " << id << std::endl;
    size_t removed = document_service_->remove_document(id);

    nlohmann::json data;
    data["document_id"] = id;
    data["removed_chunks"] = removed;
    return create_json_response(create_success_response("Document deleted successfully", data));
  } catch (const std::exception &e) {
    return error_response("handle_delete_document", e);
  }
}

crow::response Routes::handle_delete_by_prefix(const crow::request &req) {
  try {
    const char *prefix = req.url_params.get("origin_prefix");
    if (!prefix) {
      throw sift_core::ValidationError("origin_prefix query parameter is required");
    }
    const char *kb = req.url_params.get("knowledge_base");
    std::string knowledge_base = kb ? kb : sift_core::DEFAULT_KNOWLEDGE_BASE;
    std::cout << "Deleting documents under " << knowledge_base << ":" << prefix << std::endl;
    size_t removed = document_service_->remove_by_origin_prefix(knowledge_base, prefix);

    nlohmann::json data;
    data["removed_documents"] = removed;
    return create_json_response(create_success_response("Documents deleted successfully", data));
  } catch (const std::exception &e) {
    return error_response("handle_delete_by_prefix", e);
  }
}

crow::response Routes::handle_purge(const crow::request &req) {
  try {
    std::chrono::hours retention = purge_retention_;
    if (!req.body.empty()) {
      nlohmann::json body = parse_json_body(req.body);
      if (body.contains("retention_hours")) {
        long long hours = body.at("retention_hours").get<long long>();
        if (hours < 0) {
          throw sift_core::ValidationError("retention_hours cannot be negative");
        }
        retention = std::chrono::hours(hours);
      }
    }
    size_t purged = document_service_->purge_deleted(retention);

    nlohmann::json data;
    data["purged_chunks"] = purged;
    return create_json_response(create_success_response("Purge completed", data));
  } catch (const std::exception &e) {
    return error_response("handle_purge", e);
  }
}

// ============================================================================
// Request parsing
// ============================================================================

sift_core::IngestRequest Routes::parse_ingest_request(const nlohmann::json &body) {
  if (!body.is_object()) {
    throw sift_core::ValidationError("Request body must be a JSON object");
  }
  sift_core::IngestRequest request;
  request.content = body.value("content", "");
  request.origin = body.value("origin", "");
  if (body.contains("knowledge_base")) {
    request.knowledge_base = body.at("knowledge_base").get<std::string>();
  }
  if (body.contains("content_hash")) {
    request.content_hash = body.at("content_hash").get<std::string>();
  }
  if (body.contains("class_hint")) {
    const std::string hint = body.at("class_hint").get<std::string>();
    try {
      request.class_hint = sift_core::document_class_from_string(hint);
    } catch (const std::invalid_argument &) {
      throw sift_core::ValidationError("Unknown class_hint: " + hint);
    }
  }
  return request;
}

sift_core::SearchRequest Routes::parse_search_request(const nlohmann::json &body) {
  if (!body.is_object()) {
    throw sift_core::ValidationError("Request body must be a JSON object");
  }
  sift_core::SearchRequest request;
  request.query = body.value("query", "");
  if (body.contains("top_k")) {
    request.top_k = body.at("top_k").get<int>();
  }
  request.include_context = body.value("include_context", false);
  if (body.contains("rerank")) {
    request.rerank = body.at("rerank").get<bool>();
  }
  if (body.contains("timeout_ms")) {
    request.timeout = std::chrono::milliseconds(body.at("timeout_ms").get<long long>());
  }

  const nlohmann::json filters = body.value("filters", nlohmann::json::object());
  for (const auto &name : string_list(filters, "classes")) {
    try {
      request.filters.classes.push_back(sift_core::document_class_from_string(name));
    } catch (const std::invalid_argument &) {
      throw sift_core::ValidationError("Unknown class filter: " + name);
    }
  }
  request.filters.languages = string_list(filters, "languages");
  if (filters.contains("document_ids")) {
    request.filters.document_ids = filters.at("document_ids").get<std::vector<int64_t>>();
  }
  if (filters.contains("created_from")) {
    request.filters.created_from =
        parse_time(filters.at("created_from").get<std::string>(), "created_from");
  }
  if (filters.contains("created_to")) {
    request.filters.created_to =
        parse_time(filters.at("created_to").get<std::string>(), "created_to");
  }
  if (filters.contains("knowledge_base")) {
    request.filters.knowledge_base = filters.at("knowledge_base").get<std::string>();
  }
  return request;
}

// ============================================================================
// Serialization
// ============================================================================

nlohmann::json Routes::job_to_json(const sift_core::Job &job) {
  nlohmann::json json;
  json["id"] = job.id;
  json["document_id"] = job.document_id ? nlohmann::json(*job.document_id) : nlohmann::json();
  json["knowledge_base"] = job.knowledge_base;
  json["origin"] = job.origin;
  json["content_hash"] = job.content_hash;
  if (job.class_hint) {
    json["class_hint"] = sift_core::to_string(*job.class_hint);
  }
  json["status"] = sift_core::to_string(job.status);
  json["stage"] = sift_core::to_string(job.stage);
  json["progress"] = job.progress;
  json["error_message"] = job.error_message;
  json["cancel_requested"] = job.cancel_requested;
  json["created_at"] = sift_core::time_point_to_string(job.created_at);
  json["updated_at"] = sift_core::time_point_to_string(job.updated_at);
  return json;
}

nlohmann::json Routes::search_response_to_json(const sift_core::SearchResponse &response) {
  nlohmann::json results = nlohmann::json::array();
  for (const auto &result : response.results) {
    nlohmann::json result_json = chunk_json(result.chunk);
    result_json["score"] = result.score;
    result_json["vector_contribution"] = result.vector_contribution;
    result_json["lexical_contribution"] = result.lexical_contribution;
    if (result.vector_rank) result_json["vector_rank"] = *result.vector_rank;
    if (result.lexical_rank) result_json["lexical_rank"] = *result.lexical_rank;
    if (result.rerank_score) result_json["rerank_score"] = *result.rerank_score;
    if (result.previous || result.next) {
      nlohmann::json context;
      context["previous"] = result.previous ? chunk_json(*result.previous) : nlohmann::json();
      context["next"] = result.next ? chunk_json(*result.next) : nlohmann::json();
      result_json["context"] = context;
    }
    results.push_back(result_json);
  }

  nlohmann::json data;
  data["results"] = results;
  data["count"] = results.size();
  data["reranked"] = response.reranked;
  data["degraded"] = response.degraded;
  data["timed_out"] = response.timed_out;
  return data;
}

// ============================================================================
// Helpers
// ============================================================================

int Routes::status_for(sift_core::ErrorCode code) {
  switch (code) {
    case sift_core::ErrorCode::Validation: return 400;
    case sift_core::ErrorCode::Provider: return 502;
    case sift_core::ErrorCode::Storage: return 500;
    case sift_core::ErrorCode::NotFound: return 404;
    case sift_core::ErrorCode::Configuration: return 500;
    case sift_core::ErrorCode::Cancelled: return 409;
  }
  return 500;
}

crow::response Routes::error_response(const std::string &handler, const std::exception &e) {
  if (const auto *sift_error = dynamic_cast<const sift_core::SiftError *>(&e)) {
    const int status = status_for(sift_error->code());
    if (status >= 500) {
      std::cerr << "Exception in " << handler << ": " << e.what() << std::endl;
    }
    return create_json_response(
        create_error_response(e.what(), sift_core::to_string(sift_error->code())), status);
  }
  if (dynamic_cast<const nlohmann::json::exception *>(&e)) {
    return create_json_response(
        create_error_response(std::string("Malformed request: ") + e.what(),
                              sift_core::to_string(sift_core::ErrorCode::Validation)),
        400);
  }
  std::cerr << "Exception in " << handler << ": " << e.what() << std::endl;
  return create_json_response(create_error_response(e.what(), "internal_error"), 500);
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error, const std::string &code) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  response["code"] = code;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

long long Routes::parse_id(const std::string &text, const std::string &what) {
  size_t consumed = 0;
  long long value = 0;
  try {
    value = std::stoll(text, &consumed);
  } catch (const std::logic_error &) {
    throw sift_core::ValidationError("Invalid " + what + ": " + text);
  }
  if (consumed != text.size() || value <= 0) {
    throw sift_core::ValidationError("Invalid " + what + ": " + text);
  }
  return value;
}

}  // namespace sift_api
