#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docsearch_core {

// zstd framing for chunk text stored in the chunks.content column.
class CompressionService {
 public:
  static constexpr int DEFAULT_LEVEL = 3;

  /**
   * @brief Compresses chunk text with Zstandard.
   * @return The compressed frame. Empty input yields an empty buffer.
   */
  static std::vector<char> compress(std::string_view text, int compression_level = DEFAULT_LEVEL);

  /**
   * @brief Inverse of compress(). Throws std::runtime_error on a corrupt frame.
   */
  static std::string decompress(const std::vector<char>& frame);
};

}  // namespace docsearch_core
