#include "docsearch_core/db/compression_service.hpp"

#include <zstd.h>

#include <stdexcept>

namespace docsearch_core {

std::vector<char> CompressionService::compress(std::string_view text, int compression_level) {
  if (text.empty()) {
    return {};
  }

  std::vector<char> frame(ZSTD_compressBound(text.size()));
  const size_t written =
      ZSTD_compress(frame.data(), frame.size(), text.data(), text.size(), compression_level);
  if (ZSTD_isError(written)) {
    throw std::runtime_error("ZSTD compression failed: " + std::string(ZSTD_getErrorName(written)));
  }

  frame.resize(written);
  return frame;
}

std::string CompressionService::decompress(const std::vector<char>& frame) {
  if (frame.empty()) {
    return "";
  }

  const unsigned long long content_size = ZSTD_getFrameContentSize(frame.data(), frame.size());
  if (content_size == ZSTD_CONTENTSIZE_ERROR || content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw std::runtime_error("Stored chunk content is not a sized zstd frame.");
  }

  std::string text(content_size, '\0');
  const size_t read = ZSTD_decompress(text.data(), text.size(), frame.data(), frame.size());
  if (ZSTD_isError(read)) {
    throw std::runtime_error("ZSTD decompression failed: " + std::string(ZSTD_getErrorName(read)));
  }
  if (read != content_size) {
    throw std::runtime_error("ZSTD decompression produced " + std::to_string(read) +
                             " bytes, frame header declared " + std::to_string(content_size));
  }
  return text;
}

}  // namespace docsearch_core
