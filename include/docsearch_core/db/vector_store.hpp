#pragma once
#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>
#include <sqlite_modern_cpp.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "docsearch_core/db/database_manager.hpp"
#include "docsearch_core/types/chunk.hpp"

namespace docsearch_core {

class StoreError : public std::exception {
 public:
  explicit StoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/*
 * A named collection of chunks and their embeddings.
 *
 * Rows live in SQLite (chunks table, keyed by collection); an exact L2 Faiss
 * index mirrors the vectors in memory and is rebuilt from the database on
 * construction. The collection row is created on first use. The vector
 * dimension is fixed by the first insert into an empty collection.
 */
class VectorStore {
 public:
  VectorStore(DatabaseManager &db_manager, const std::string &collection_name);
  virtual ~VectorStore();

  VectorStore(const VectorStore &) = delete;
  VectorStore &operator=(const VectorStore &) = delete;
  VectorStore(VectorStore &&) = delete;
  VectorStore &operator=(VectorStore &&) = delete;

  const std::string &collection_name() const {
    return collection_name_;
  }

  // Exact number of stored chunks.
  virtual size_t count();

  // Removes every chunk of the collection and returns how many were removed.
  virtual size_t delete_all();

  // Inserts chunks with their embeddings in one transaction. Sizes must match
  // and every vector must have the collection dimension.
  virtual void add(const std::vector<Chunk> &chunks,
                   const std::vector<std::vector<float>> &embeddings);

  // k nearest chunks by squared L2 distance, closest first. Fewer than k hits
  // when the collection is smaller; none when it is empty.
  virtual std::vector<ChunkHit> query(const std::vector<float> &query_vector, int k);

  // First `limit` stored chunks in insertion order.
  virtual std::vector<StoredChunk> peek(int limit);

  std::optional<int> dimension() const;

  void rebuild_faiss_index();

 private:
  DatabaseManager &db_manager_;
  std::string collection_name_;
  int collection_id_ = -1;
  std::optional<int> dimension_;

  mutable std::mutex index_mutex_;
  std::unique_ptr<faiss::IndexIDMap> faiss_index_;

  void ensure_collection();
  void set_dimension(int dimension);
  static std::unique_ptr<faiss::IndexIDMap> create_base_index(int dimension);
  std::unordered_map<int64_t, StoredChunk> fetch_chunks(const std::vector<int64_t> &row_ids);
  static std::string id_list(const std::vector<int64_t> &ids);
};

}  // namespace docsearch_core
