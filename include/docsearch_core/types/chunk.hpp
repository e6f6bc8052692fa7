#pragma once

#include <optional>
#include <string>
#include <vector>

namespace docsearch_core {

// A span of page text produced by the index builder. Immutable once stored.
struct Chunk {
  std::string id;
  std::string text;
  int page = 1;
  std::string source;
  std::string file_path;
};

// What the vector store hands back. Metadata columns are nullable in the
// database, so every field past the text may be missing.
struct StoredChunk {
  std::string id;
  std::string text;
  std::optional<int> page;
  std::optional<std::string> source;
  std::optional<std::string> file_path;
};

struct ChunkHit {
  StoredChunk chunk;
  float distance = 0.0f;
};

struct SearchResult {
  std::optional<std::string> id;
  std::string text;
  int page = 0;
  std::string source;
  float score = 0.0f;
};

}  // namespace docsearch_core
