#include "docsearch_core/extractors/chunk_splitter.hpp"

#include <utf8.h>

#include <cstdint>
#include <iterator>
#include <sstream>

namespace docsearch_core {

namespace {

// ASCII controls, separators and Unicode space characters.
bool is_space(uint32_t cp) {
  switch (cp) {
    case 0x09: case 0x0A: case 0x0B: case 0x0C: case 0x0D:
    case 0x1C: case 0x1D: case 0x1E: case 0x1F: case 0x20:
    case 0x85: case 0xA0: case 0x1680:
    case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
      return true;
    default:
      return cp >= 0x2000 && cp <= 0x200A;
  }
}

}  // namespace

std::vector<std::string> ChunkSplitter::split(const std::string& page_text,
                                              size_t max_chars,
                                              size_t overlap) {
  std::vector<std::string> chunks;
  std::string current;
  size_t current_length = 0;

  for (const std::string& paragraph : paragraphs(page_text)) {
    const size_t paragraph_length = length(paragraph);

    if (!current.empty() && current_length + paragraph_length + 1 > max_chars) {
      chunks.push_back(current);
      std::string carried = tail(current, overlap);
      current_length = length(carried) + 1 + paragraph_length;
      current = std::move(carried);
      current += '\n';
      current += paragraph;
    } else if (current.empty()) {
      current = paragraph;
      current_length = paragraph_length;
    } else {
      current += '\n';
      current += paragraph;
      current_length += 1 + paragraph_length;
    }
  }

  if (!current.empty()) {
    chunks.push_back(std::move(current));
  }
  return chunks;
}

std::vector<std::string> ChunkSplitter::paragraphs(const std::string& page_text) {
  std::string text = page_text;
  if (!utf8::is_valid(text.begin(), text.end())) {
    std::string repaired;
    utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(repaired));
    text = std::move(repaired);
  }

  std::vector<std::string> out;
  std::stringstream stream(text);
  std::string line;
  while (std::getline(stream, line, '\n')) {
    std::string trimmed = trim(line);
    if (!trimmed.empty()) {
      out.push_back(std::move(trimmed));
    }
  }
  return out;
}

std::string ChunkSplitter::trim(const std::string& line) {
  auto begin = line.begin();
  while (begin != line.end()) {
    auto next = begin;
    if (!is_space(utf8::next(next, line.end()))) {
      break;
    }
    begin = next;
  }

  auto end = line.end();
  while (end != begin) {
    auto prev = end;
    if (!is_space(utf8::prior(prev, begin))) {
      break;
    }
    end = prev;
  }
  return std::string(begin, end);
}

std::string ChunkSplitter::tail(const std::string& text, size_t count) {
  auto start = text.end();
  for (size_t i = 0; i < count && start != text.begin(); ++i) {
    utf8::prior(start, text.begin());
  }
  return std::string(start, text.end());
}

size_t ChunkSplitter::length(const std::string& text) {
  return static_cast<size_t>(utf8::distance(text.begin(), text.end()));
}

}  // namespace docsearch_core
