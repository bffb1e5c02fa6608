#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace sift_core {

// Token bounds for one document class. Tokens are estimated from codepoints.
struct ChunkSizing {
  size_t min_tokens = 512;
  size_t max_tokens = 1024;
  size_t overlap_tokens = 64;
  size_t overlap_units = 0;  // rows for tables, lines for logs
};

struct ChunkingSettings {
  ChunkSizing text{512, 1024, 64, 0};
  ChunkSizing markdown{512, 1024, 64, 0};
  ChunkSizing table{256, 512, 0, 1};
  ChunkSizing config{256, 512, 0, 0};
  ChunkSizing log{128, 256, 0, 2};
  ChunkSizing code{0, 1024, 0, 0};
  ChunkSizing fixed{384, 384, 50, 0};
  // Trailing chunks below this size merge into their predecessor.
  size_t min_fragment_tokens = 32;
  // Extra directories searched for libtree-sitter-<lang>.so grammars.
  std::vector<std::string> grammar_dirs;
};

struct EmbedderSettings {
  std::string provider = "ollama";
  std::string model = "mxbai-embed-large";
  int dimensions = 1024;
  size_t batch_size = 16;
  size_t max_concurrency = 4;
  std::chrono::milliseconds retry_backoff{250};
};

struct ClassifierSettings {
  std::string backend = "heuristic";
  std::string model = "llama3.2";
  size_t sample_bytes = 4096;
  std::chrono::milliseconds retry_backoff{250};
};

struct RerankerSettings {
  bool enabled = false;
  std::string model = "llama3.2";
  size_t max_concurrency = 4;
  std::chrono::milliseconds retry_backoff{250};
};

struct RetrievalSettings {
  int rrf_k = 60;
  int candidate_multiplier = 3;
  int rerank_fan_out = 3;
  int default_top_k = 10;
  int max_top_k = 100;
  std::chrono::milliseconds timeout{5000};
  // Threads shared by every search for embedding, index lookups and chunk loading.
  int query_threads = 4;
};

struct IngestionSettings {
  // Chunks handed to the embedder per progress step.
  size_t embed_group_size = 64;
  size_t max_content_bytes = 32 * 1024 * 1024;
  std::chrono::milliseconds poll_interval{500};
};

struct MaintenanceSettings {
  std::chrono::hours retention{24 * 7};
  std::chrono::minutes interval{60};
  int finished_job_retention_days = 7;
};

}  // namespace sift_core
