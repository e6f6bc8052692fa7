#include "docsearch_core/services/query_engine.hpp"

#include <set>
#include <stdexcept>

namespace docsearch_core {

QueryEngine::QueryEngine(EmbeddingModel &embedding_model, VectorStore &vector_store)
    : embedding_model_(embedding_model), vector_store_(vector_store) {}

void QueryEngine::warm_up() {
  embedding_model_.ensure_loaded();
}

std::vector<SearchResult> QueryEngine::search(const std::string &query, int k) {
  if (k < 1 || k > MAX_K) {
    throw std::invalid_argument("k must be between 1 and " + std::to_string(MAX_K));
  }

  embedding_model_.ensure_loaded();
  std::vector<float> query_vector = embedding_model_.encode(query);
  auto hits = vector_store_.query(query_vector, k);

  std::vector<SearchResult> results;
  results.reserve(hits.size());
  for (auto &hit : hits) {
    SearchResult result;
    result.id = hit.chunk.id;
    result.text = std::move(hit.chunk.text);
    result.page = hit.chunk.page.value_or(0);
    result.source = hit.chunk.source.value_or("");
    result.score = hit.distance;
    results.push_back(std::move(result));
  }
  return results;
}

CollectionStats QueryEngine::get_collection_stats() {
  CollectionStats stats;
  stats.total_chunks = vector_store_.count();
  stats.collection_name = vector_store_.collection_name();
  stats.embedding_model = embedding_model_.model_name();

  std::set<std::string> sources;
  for (const auto &chunk : vector_store_.peek(SOURCE_SAMPLE_SIZE)) {
    if (chunk.source) {
      sources.insert(*chunk.source);
    }
  }
  stats.sources.assign(sources.begin(), sources.end());
  return stats;
}

}  // namespace docsearch_core
