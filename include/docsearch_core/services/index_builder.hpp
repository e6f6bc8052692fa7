#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "docsearch_core/db/vector_store.hpp"
#include "docsearch_core/extractors/chunk_splitter.hpp"
#include "docsearch_core/extractors/text_extractor.hpp"
#include "docsearch_core/llm/embedding_model.hpp"
#include "docsearch_core/services/stage_result.hpp"
#include "docsearch_core/types/chunk.hpp"
#include "docsearch_core/types/index_report.hpp"

namespace docsearch_core {

struct IndexSettings {
  std::filesystem::path document_dir = "./document_source";
  size_t chunk_size = ChunkSplitter::DEFAULT_MAX_CHARS;
  size_t chunk_overlap = ChunkSplitter::DEFAULT_OVERLAP;
};

/*
 * Rebuilds a collection from every document in the source directory.
 *
 * Stages run in order and the first failing one ends the build: discover,
 * extract + split, load model, encode, replace. build_index() never throws;
 * failures come back as an unsuccessful IndexBuildReport. The replace stage
 * deletes and inserts in two separate commits, so a crash between them leaves
 * the collection empty.
 */
class IndexBuilder {
 public:
  using ProgressCallback = std::function<void(const std::string &)>;

  // Throws ConfigurationError for a zero chunk size or an overlap that is not
  // smaller than the chunk size.
  IndexBuilder(IndexSettings settings,
               const TextExtractor &extractor,
               EmbeddingModel &embedding_model,
               VectorStore &vector_store);

  IndexBuildReport build_index(const ProgressCallback &on_progress = {});

  const IndexSettings &settings() const {
    return settings_;
  }

 private:
  struct ReplaceOutcome {
    size_t previous_chunks = 0;
    size_t total_chunks = 0;
  };

  StageResult<std::vector<std::filesystem::path>> discover_documents() const;
  StageResult<std::vector<Chunk>> collect_chunks(const std::vector<std::filesystem::path> &files,
                                                 std::vector<FileReport> &files_processed,
                                                 const ProgressCallback &on_progress) const;
  StageResult<bool> load_model();
  StageResult<std::vector<std::vector<float>>> encode_chunks(const std::vector<Chunk> &chunks);
  StageResult<ReplaceOutcome> replace_collection(
      const std::vector<Chunk> &chunks, const std::vector<std::vector<float>> &embeddings);

  IndexSettings settings_;
  const TextExtractor &extractor_;
  EmbeddingModel &embedding_model_;
  VectorStore &vector_store_;
};

}  // namespace docsearch_core
