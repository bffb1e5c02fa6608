#include "sift_core/services/compression_service.hpp"

#include <zstd.h>

#include "sift_core/errors.hpp"

namespace sift_core {

std::vector<char> CompressionService::compress(std::string_view data, int compression_level) {
  if (data.empty()) {
    return {};
  }
  std::vector<char> frame(ZSTD_compressBound(data.size()));
  const size_t written =
      ZSTD_compress(frame.data(), frame.size(), data.data(), data.size(), compression_level);
  if (ZSTD_isError(written)) {
    throw StorageError("zstd compression of " + std::to_string(data.size()) +
                       " bytes failed: " + ZSTD_getErrorName(written));
  }
  frame.resize(written);
  return frame;
}

std::string CompressionService::decompress(const std::vector<char> &frame, size_t max_size) {
  if (frame.empty()) {
    return "";
  }

  const size_t frame_size = ZSTD_findFrameCompressedSize(frame.data(), frame.size());
  if (ZSTD_isError(frame_size)) {
    throw StorageError(std::string("Stored blob is not a complete zstd frame: ") +
                       ZSTD_getErrorName(frame_size));
  }
  if (frame_size != frame.size()) {
    throw StorageError("Stored blob has " + std::to_string(frame.size() - frame_size) +
                       " bytes after its zstd frame");
  }

  const unsigned long long content_size = ZSTD_getFrameContentSize(frame.data(), frame.size());
  if (content_size == ZSTD_CONTENTSIZE_ERROR || content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw StorageError("zstd frame does not record its content size");
  }
  if (content_size > max_size) {
    throw StorageError("zstd frame claims " + std::to_string(content_size) +
                       " bytes, more than the " + std::to_string(max_size) + " allowed");
  }

  std::string content(static_cast<size_t>(content_size), '\0');
  const size_t read = ZSTD_decompress(content.data(), content.size(), frame.data(), frame.size());
  if (ZSTD_isError(read)) {
    throw StorageError(std::string("zstd decompression failed: ") + ZSTD_getErrorName(read));
  }
  if (read != content.size()) {
    throw StorageError("zstd frame decompressed to " + std::to_string(read) + " bytes, expected " +
                       std::to_string(content.size()));
  }
  return content;
}

}  // namespace sift_core
