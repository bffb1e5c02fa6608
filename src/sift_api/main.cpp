#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>

#include "sift_api/config.hpp"
#include "sift_api/routes.hpp"
#include "sift_api/server.hpp"
#include "sift_core/async/service_provider.hpp"
#include "sift_core/async/worker_pool.hpp"
#include "sift_core/chunking/chunker.hpp"
#include "sift_core/classify/classifier_factory.hpp"
#include "sift_core/db/database_manager.hpp"
#include "sift_core/db/job_repo.hpp"
#include "sift_core/db/metadata_store.hpp"
#include "sift_core/embedding/ollama_embedder.hpp"
#include "sift_core/llm/concurrency_limiter.hpp"
#include "sift_core/llm/ollama_client.hpp"
#include "sift_core/rerank/ollama_reranker.hpp"
#include "sift_core/services/background/maintenance_service.hpp"
#include "sift_core/services/document_service.hpp"
#include "sift_core/services/ingestion_service.hpp"
#include "sift_core/services/retrieval_service.hpp"
#include "sift_core/services/storage_service.hpp"
#include "sift_core/vector/vector_store.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

int main(int argc, char **argv) {
  try {
    const std::string config_path = argc > 1 ? argv[1] : "siftrc.json";
    Config config = Config::from_file(config_path);

    const char *db_key_value = std::getenv(config.db_key_env.c_str());
    if (!db_key_value || std::string(db_key_value).empty()) {
      std::cerr << "Error: environment variable " << config.db_key_env
                << " must hold the database key" << std::endl;
      return 1;
    }
    std::string db_key = db_key_value;

    std::cout << "Starting Sift API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Metadata DB Path: " << config.metadata_db_path << std::endl;
    std::cout << "Workers: " << config.num_workers << " (pool size " << config.db_pool_size << ")"
              << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding.model << " ("
              << config.embedding.dimensions << " dimensions)" << std::endl;
    std::cout << "Classifier: " << config.classifier.backend << std::endl;
    std::cout << "Reranker Enabled: " << (config.reranker.enabled ? "Yes" : "No") << std::endl;
    if (config.reranker.enabled) {
      std::cout << "Reranker Model: " << config.reranker.model << std::endl;
    }
    std::cout << "RRF k: " << config.retrieval.rrf_k
              << ", default top_k: " << config.retrieval.default_top_k
              << ", timeout: " << config.retrieval.timeout.count() << "ms"
              << ", query threads: " << config.retrieval.query_threads << std::endl;
    std::cout << "Maintenance Enabled: " << (config.maintenance_enabled ? "Yes" : "No")
              << std::endl;

    std::error_code ec;
    std::filesystem::path db_parent = std::filesystem::path(config.metadata_db_path).parent_path();
    if (!db_parent.empty()) {
      std::filesystem::create_directories(db_parent, ec);
      if (ec) {
        std::cerr << "Warning: Failed to create database directory: " << ec.message() << std::endl;
      }
    }

    // --- 1. INITIALIZE CORE COMPONENTS ---
    auto &db_manager = sift_core::DatabaseManager::get_instance();
    db_manager.initialize(config.metadata_db_path, db_key, config.db_pool_size,
                          config.db_acquire_timeout);
    auto metadata_store = std::make_shared<sift_core::MetadataStore>(db_manager);
    auto job_repo = std::make_shared<sift_core::JobRepo>(db_manager);
    auto vector_store = std::make_shared<sift_core::VectorStore>(config.embedding.dimensions);
    auto storage = std::make_shared<sift_core::StorageService>(metadata_store, vector_store);
    storage->initialize();

    int requeued = job_repo->requeue_interrupted_jobs();
    if (requeued > 0) {
      std::cout << "Requeued " << requeued << " interrupted job(s)" << std::endl;
    }

    auto ollama_client =
        std::make_shared<sift_core::OllamaClient>(config.ollama_url, config.embedding.model);
    auto embed_limiter =
        std::make_shared<sift_core::ConcurrencyLimiter>(config.embedding.max_concurrency);
    sift_core::EmbedderPtr embedder =
        sift_core::make_embedder(config.embedding, ollama_client, embed_limiter);
    try {
      sift_core::verify_dimensions(*embedder, vector_store->dimensions());
    } catch (const sift_core::ProviderError &e) {
      // The provider may come up later; ingestion and vector search retry per request
      std::cerr << "Warning: Could not verify embedding dimensions: " << e.what() << std::endl;
    }

    sift_core::ClassifierPtr classifier =
        sift_core::make_classifier(config.classifier, ollama_client);
    auto chunker = std::make_shared<sift_core::Chunker>(config.chunking);

    sift_core::RerankerPtr reranker;
    if (config.reranker.enabled) {
      auto rerank_limiter =
          std::make_shared<sift_core::ConcurrencyLimiter>(config.reranker.max_concurrency);
      reranker = std::make_shared<sift_core::OllamaReranker>(ollama_client, config.reranker,
                                                             rerank_limiter);
    }

    auto ingestion_service = std::make_shared<sift_core::IngestionService>(job_repo, config.ingestion);
    auto retrieval_service = std::make_shared<sift_core::RetrievalService>(
        storage, embedder, reranker, config.retrieval, config.reranker.enabled);
    auto document_service = std::make_shared<sift_core::DocumentService>(storage);

    auto services = std::make_shared<sift_core::ServiceProvider>(
        storage, job_repo, classifier, chunker, embedder, config.ingestion,
        config.classifier.sample_bytes);
    auto worker_pool = std::make_shared<sift_core::async::WorkerPool>(
        config.num_workers, services, config.ingestion.poll_interval);

    std::unique_ptr<sift_core::background::MaintenanceService> maintenance;
    if (config.maintenance_enabled) {
      maintenance = std::make_unique<sift_core::background::MaintenanceService>(
          storage, job_repo, config.maintenance);
    }

    sift_api::Server server(config.api_base_url);
    sift_api::Routes routes(ingestion_service, retrieval_service, document_service,
                            config.maintenance.retention);
    routes.register_routes(server);

    // --- 2. START BACKGROUND SERVICES ---
    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    worker_pool->start();

    if (maintenance) {
      std::cout << "Starting maintenance service..." << std::endl;
      maintenance->start();
    }

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    // --- 3. WAIT FOR SHUTDOWN SIGNAL ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- 4. GRACEFUL SHUTDOWN SEQUENCE ---
    std::cout << "[1/4] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/4] Stopping maintenance service..." << std::endl;
    if (maintenance) {
      maintenance->stop();
    }

    std::cout << "[3/4] Stopping worker pool to finish processing..." << std::endl;
    worker_pool->stop();
    worker_pool.reset();  // Joins the worker threads

    std::cout << "[4/4] Shutting down database connections..." << std::endl;
    db_manager.shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const sift_core::ConfigurationError &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
