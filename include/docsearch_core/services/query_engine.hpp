#pragma once

#include <string>
#include <vector>

#include "docsearch_core/db/vector_store.hpp"
#include "docsearch_core/llm/embedding_model.hpp"
#include "docsearch_core/types/chunk.hpp"
#include "docsearch_core/types/index_report.hpp"

namespace docsearch_core {

// Read path over a collection. Errors from the model or the store propagate
// to the caller unchanged.
class QueryEngine {
 public:
  static constexpr int DEFAULT_K = 5;
  static constexpr int MAX_K = 20;
  // Number of stored chunks inspected when listing sources.
  static constexpr int SOURCE_SAMPLE_SIZE = 100;

  QueryEngine(EmbeddingModel &embedding_model, VectorStore &vector_store);

  void warm_up();

  // At most k results ordered by ascending score (squared L2 distance).
  // Throws std::invalid_argument when k is outside [1, MAX_K].
  std::vector<SearchResult> search(const std::string &query, int k = DEFAULT_K);

  // total_chunks is exact; sources only covers the first SOURCE_SAMPLE_SIZE
  // chunks and may miss documents in larger collections.
  CollectionStats get_collection_stats();

 private:
  EmbeddingModel &embedding_model_;
  VectorStore &vector_store_;
};

}  // namespace docsearch_core
