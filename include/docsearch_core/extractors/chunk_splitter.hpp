#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docsearch_core {

/**
 * @brief Paragraph-packing splitter for page text.
 *
 * Lines are trimmed and blank ones dropped. Paragraphs are packed into an
 * accumulator; when adding the next one would exceed max_chars, the
 * accumulator is emitted and restarted from its last `overlap` characters.
 * The overlap is a raw character slice and may cut a word in half.
 * max_chars is checked before a paragraph is added, so a single paragraph
 * longer than max_chars becomes one oversized chunk.
 *
 * Lengths count Unicode code points of the UTF-8 input.
 */
class ChunkSplitter {
 public:
  static constexpr size_t DEFAULT_MAX_CHARS = 1500;
  // An overlap of 0 carries nothing forward: the next chunk starts "\n" + paragraph.
  // Config::validate therefore requires an overlap of at least 1.
  static constexpr size_t DEFAULT_OVERLAP = 200;

  static std::vector<std::string> split(const std::string& page_text,
                                        size_t max_chars = DEFAULT_MAX_CHARS,
                                        size_t overlap = DEFAULT_OVERLAP);

  // Non-empty trimmed lines of the text, in order.
  static std::vector<std::string> paragraphs(const std::string& page_text);

 private:
  static std::string trim(const std::string& line);
  static std::string tail(const std::string& text, size_t count);
  static size_t length(const std::string& text);
};

}  // namespace docsearch_core
