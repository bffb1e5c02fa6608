#pragma once

#include <memory>

#include "sift_core/settings.hpp"

namespace sift_core {
class StorageService;
class JobRepo;
class Classifier;
class Chunker;
class Embedder;

class ServiceProvider {
 public:
  ServiceProvider(std::shared_ptr<StorageService> storage,
                  std::shared_ptr<JobRepo> job_repo,
                  std::shared_ptr<Classifier> classifier,
                  std::shared_ptr<Chunker> chunker,
                  std::shared_ptr<Embedder> embedder,
                  IngestionSettings ingestion_settings = {},
                  size_t classifier_sample_bytes = 4096)
      : storage_(storage),
        job_repo_(job_repo),
        classifier_(classifier),
        chunker_(chunker),
        embedder_(embedder),
        ingestion_settings_(ingestion_settings),
        classifier_sample_bytes_(classifier_sample_bytes) {}

  // Public getters for each service
  StorageService& get_storage() {
    return *storage_;
  }
  JobRepo& get_job_repo() {
    return *job_repo_;
  }
  Classifier& get_classifier() {
    return *classifier_;
  }
  Chunker& get_chunker() {
    return *chunker_;
  }
  Embedder& get_embedder() {
    return *embedder_;
  }
  const IngestionSettings& get_ingestion_settings() const {
    return ingestion_settings_;
  }
  size_t get_classifier_sample_bytes() const {
    return classifier_sample_bytes_;
  }

 private:
  std::shared_ptr<StorageService> storage_;
  std::shared_ptr<JobRepo> job_repo_;
  std::shared_ptr<Classifier> classifier_;
  std::shared_ptr<Chunker> chunker_;
  std::shared_ptr<Embedder> embedder_;
  IngestionSettings ingestion_settings_;
  size_t classifier_sample_bytes_;
};

}  // namespace sift_core
