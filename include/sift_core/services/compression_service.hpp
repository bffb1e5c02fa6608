#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sift_core {

// Chunk text and queued ingestion payloads are stored as single zstd frames.
class CompressionService {
 public:
  // Frames claiming more than this are treated as corrupt before any buffer is allocated.
  static constexpr size_t MAX_DECOMPRESSED_BYTES = 256 * 1024 * 1024;

  /**
   * @brief Compresses data into one zstd frame that records its content size.
   * @return Empty for empty input.
   * @throw StorageError if zstd reports an error.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = 3);

  /**
   * @brief Decompresses exactly one frame written by compress().
   * @throw StorageError for data that is not a complete frame (truncated, trailing bytes, bad
   * magic), a frame without a content size, or one larger than max_size.
   */
  static std::string decompress(const std::vector<char> &frame,
                                size_t max_size = MAX_DECOMPRESSED_BYTES);
};

}  // namespace sift_core
