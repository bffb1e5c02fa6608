#pragma once

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sift_core/settings.hpp"

class Config {
 public:
  std::string api_base_url;
  std::string metadata_db_path;
  // Name of the environment variable holding the SQLCipher key
  std::string db_key_env;
  int num_workers;
  int db_pool_size;
  // How long a caller waits for a pooled connection before failing
  std::chrono::milliseconds db_acquire_timeout;

  std::string ollama_url;

  sift_core::EmbedderSettings embedding;
  sift_core::ClassifierSettings classifier;
  sift_core::RerankerSettings reranker;
  sift_core::RetrievalSettings retrieval;
  sift_core::ChunkingSettings chunking;
  sift_core::IngestionSettings ingestion;
  sift_core::MaintenanceSettings maintenance;
  bool maintenance_enabled;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;
    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
      config.metadata_db_path =
          json_config.value("metadata_db_path", std::string("./data/sift.db"));
      config.db_key_env = json_config.value("db_key_env", std::string("SIFT_DB_KEY"));
      config.num_workers = json_config.value("num_workers", 2);
      // Workers hold a connection each; request handlers share the rest
      config.db_pool_size = json_config.value("db_pool_size", config.num_workers + 4);
      config.db_acquire_timeout =
          std::chrono::milliseconds(json_config.value("db_acquire_timeout_ms", 10000));
      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));

      const nlohmann::json embedding = json_config.value("embedding", nlohmann::json::object());
      config.embedding.provider = embedding.value("provider", config.embedding.provider);
      config.embedding.model = embedding.value("model", config.embedding.model);
      config.embedding.dimensions = embedding.value("dimensions", config.embedding.dimensions);
      config.embedding.batch_size = embedding.value("batch_size", config.embedding.batch_size);
      config.embedding.max_concurrency =
          embedding.value("max_concurrency", config.embedding.max_concurrency);
      config.embedding.retry_backoff = std::chrono::milliseconds(
          embedding.value("retry_backoff_ms", config.embedding.retry_backoff.count()));

      const nlohmann::json classifier = json_config.value("classifier", nlohmann::json::object());
      config.classifier.backend = classifier.value("backend", config.classifier.backend);
      config.classifier.model = classifier.value("model", config.classifier.model);
      config.classifier.sample_bytes =
          classifier.value("sample_bytes", config.classifier.sample_bytes);
      config.classifier.retry_backoff = std::chrono::milliseconds(
          classifier.value("retry_backoff_ms", config.classifier.retry_backoff.count()));

      const nlohmann::json reranker = json_config.value("reranker", nlohmann::json::object());
      config.reranker.enabled = reranker.value("enabled", config.reranker.enabled);
      config.reranker.model = reranker.value("model", config.reranker.model);
      config.reranker.max_concurrency =
          reranker.value("max_concurrency", config.reranker.max_concurrency);
      config.reranker.retry_backoff = std::chrono::milliseconds(
          reranker.value("retry_backoff_ms", config.reranker.retry_backoff.count()));

      const nlohmann::json retrieval = json_config.value("retrieval", nlohmann::json::object());
      config.retrieval.rrf_k = retrieval.value("rrf_k", config.retrieval.rrf_k);
      config.retrieval.candidate_multiplier =
          retrieval.value("candidate_multiplier", config.retrieval.candidate_multiplier);
      config.retrieval.rerank_fan_out =
          retrieval.value("rerank_fan_out", config.retrieval.rerank_fan_out);
      config.retrieval.default_top_k =
          retrieval.value("default_top_k", config.retrieval.default_top_k);
      config.retrieval.max_top_k = retrieval.value("max_top_k", config.retrieval.max_top_k);
      config.retrieval.timeout = std::chrono::milliseconds(
          retrieval.value("timeout_ms", config.retrieval.timeout.count()));
      config.retrieval.query_threads =
          retrieval.value("query_threads", config.retrieval.query_threads);

      const nlohmann::json chunking = json_config.value("chunking", nlohmann::json::object());
      read_sizing(chunking, "text", config.chunking.text);
      read_sizing(chunking, "markdown", config.chunking.markdown);
      read_sizing(chunking, "table", config.chunking.table);
      read_sizing(chunking, "config", config.chunking.config);
      read_sizing(chunking, "log", config.chunking.log);
      read_sizing(chunking, "code", config.chunking.code);
      read_sizing(chunking, "fixed", config.chunking.fixed);
      config.chunking.min_fragment_tokens =
          chunking.value("min_fragment_tokens", config.chunking.min_fragment_tokens);
      config.chunking.grammar_dirs =
          chunking.value("grammar_dirs", std::vector<std::string>{});

      const nlohmann::json ingestion = json_config.value("ingestion", nlohmann::json::object());
      config.ingestion.embed_group_size =
          ingestion.value("embed_group_size", config.ingestion.embed_group_size);
      config.ingestion.max_content_bytes =
          ingestion.value("max_content_bytes", config.ingestion.max_content_bytes);
      config.ingestion.poll_interval = std::chrono::milliseconds(
          ingestion.value("poll_interval_ms", config.ingestion.poll_interval.count()));

      const nlohmann::json maintenance =
          json_config.value("maintenance", nlohmann::json::object());
      config.maintenance_enabled = maintenance.value("enabled", true);
      config.maintenance.retention =
          std::chrono::hours(maintenance.value("retention_hours", config.maintenance.retention.count()));
      config.maintenance.interval = std::chrono::minutes(
          maintenance.value("interval_minutes", config.maintenance.interval.count()));
      config.maintenance.finished_job_retention_days = maintenance.value(
          "finished_job_retention_days", config.maintenance.finished_job_retention_days);
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid configuration value: ") + e.what());
    }

    config.validate();
    return config;
  }

 private:
  static void read_sizing(const nlohmann::json& chunking,
                          const char* name,
                          sift_core::ChunkSizing& sizing) {
    if (!chunking.contains(name)) {
      return;
    }
    const nlohmann::json& entry = chunking.at(name);
    sizing.min_tokens = entry.value("min_tokens", sizing.min_tokens);
    sizing.max_tokens = entry.value("max_tokens", sizing.max_tokens);
    sizing.overlap_tokens = entry.value("overlap_tokens", sizing.overlap_tokens);
    sizing.overlap_units = entry.value("overlap_units", sizing.overlap_units);
  }

  static void validate_sizing(const char* name, const sift_core::ChunkSizing& sizing) {
    if (sizing.max_tokens == 0) {
      throw std::runtime_error(std::string("chunking.") + name + ".max_tokens must be greater than 0");
    }
    if (sizing.min_tokens > sizing.max_tokens) {
      throw std::runtime_error(std::string("chunking.") + name +
                               ".min_tokens cannot exceed max_tokens");
    }
    if (sizing.overlap_tokens >= sizing.max_tokens) {
      throw std::runtime_error(std::string("chunking.") + name +
                               ".overlap_tokens must be smaller than max_tokens");
    }
  }

  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must have the form host:port");
    }
    if (metadata_db_path.empty()) {
      throw std::runtime_error("metadata_db_path cannot be empty");
    }
    if (db_key_env.empty()) {
      throw std::runtime_error("db_key_env cannot be empty");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (num_workers <= 0) {
      throw std::runtime_error("num_workers must be greater than 0");
    }
    if (db_pool_size <= num_workers) {
      throw std::runtime_error("db_pool_size must be greater than num_workers");
    }
    if (db_acquire_timeout.count() <= 0) {
      throw std::runtime_error("db_acquire_timeout_ms must be greater than 0");
    }
    if (embedding.model.empty()) {
      throw std::runtime_error("embedding.model cannot be empty");
    }
    if (embedding.dimensions <= 0) {
      throw std::runtime_error("embedding.dimensions must be greater than 0");
    }
    if (embedding.batch_size == 0 || embedding.max_concurrency == 0) {
      throw std::runtime_error("embedding.batch_size and embedding.max_concurrency must be positive");
    }
    if (classifier.backend != "heuristic" && classifier.backend != "llm") {
      throw std::runtime_error("classifier.backend must be \"heuristic\" or \"llm\"");
    }
    if (classifier.sample_bytes == 0) {
      throw std::runtime_error("classifier.sample_bytes must be greater than 0");
    }
    if (reranker.enabled && reranker.model.empty()) {
      throw std::runtime_error("reranker.model cannot be empty when the reranker is enabled");
    }
    if (reranker.max_concurrency == 0) {
      throw std::runtime_error("reranker.max_concurrency must be greater than 0");
    }
    if (retrieval.rrf_k <= 0) {
      throw std::runtime_error("retrieval.rrf_k must be greater than 0");
    }
    if (retrieval.candidate_multiplier < 1 || retrieval.rerank_fan_out < 1) {
      throw std::runtime_error(
          "retrieval.candidate_multiplier and retrieval.rerank_fan_out must be at least 1");
    }
    if (retrieval.default_top_k <= 0 || retrieval.default_top_k > retrieval.max_top_k) {
      throw std::runtime_error("retrieval.default_top_k must be within [1, max_top_k]");
    }
    if (retrieval.timeout.count() <= 0) {
      throw std::runtime_error("retrieval.timeout_ms must be greater than 0");
    }
    if (retrieval.query_threads <= 0) {
      throw std::runtime_error("retrieval.query_threads must be greater than 0");
    }
    validate_sizing("text", chunking.text);
    validate_sizing("markdown", chunking.markdown);
    validate_sizing("table", chunking.table);
    validate_sizing("config", chunking.config);
    validate_sizing("log", chunking.log);
    validate_sizing("code", chunking.code);
    validate_sizing("fixed", chunking.fixed);
    if (ingestion.embed_group_size == 0) {
      throw std::runtime_error("ingestion.embed_group_size must be greater than 0");
    }
    if (ingestion.poll_interval.count() < 10) {
      throw std::runtime_error("ingestion.poll_interval_ms must be at least 10ms");
    }
    if (maintenance.interval.count() < 1) {
      throw std::runtime_error("maintenance.interval_minutes must be at least 1 minute");
    }
    if (maintenance.retention.count() < 0 || maintenance.finished_job_retention_days < 0) {
      throw std::runtime_error("maintenance retention periods cannot be negative");
    }
  }
};
