#include "docsearch_core/db/vector_store.hpp"

#include <faiss/impl/FaissException.h>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <sstream>

#include "docsearch_core/db/compression_service.hpp"
#include "docsearch_core/db/pooled_connection.hpp"
#include "docsearch_core/db/sqlite_error_utils.hpp"
#include "docsearch_core/db/write_transaction.hpp"

namespace docsearch_core {

namespace {

std::vector<char> vector_to_blob(const std::vector<float> &vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  std::memcpy(blob.data(), vector.data(), blob.size());
  return blob;
}

}  // namespace

VectorStore::VectorStore(DatabaseManager &db_manager, const std::string &collection_name)
    : db_manager_(db_manager), collection_name_(collection_name) {
  if (collection_name_.empty()) {
    throw StoreError("Collection name cannot be empty");
  }
  ensure_collection();
  rebuild_faiss_index();
}

VectorStore::~VectorStore() = default;

void VectorStore::ensure_collection() {
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT OR IGNORE INTO collections (name, created_at) VALUES (?, datetime('now'))"
          << collection_name_;
    *conn << "SELECT id, dimension FROM collections WHERE name = ?" << collection_name_ >>
        [&](int id, std::optional<int> dimension) {
          collection_id_ = id;
          dimension_ = dimension;
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw StoreError(format_db_error("create collection", collection_name_, e));
  }
  if (collection_id_ == -1) {
    throw StoreError("Collection '" + collection_name_ + "' could not be created");
  }
}

std::optional<int> VectorStore::dimension() const {
  std::lock_guard<std::mutex> lock(index_mutex_);
  return dimension_;
}

void VectorStore::set_dimension(int dimension) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE collections SET dimension = ? WHERE id = ?" << dimension << collection_id_;
  } catch (const sqlite::sqlite_exception &e) {
    throw StoreError(format_db_error("set dimension", collection_name_, e));
  }

  std::lock_guard<std::mutex> lock(index_mutex_);
  dimension_ = dimension;
  faiss_index_ = create_base_index(dimension);
}

void VectorStore::rebuild_faiss_index() {
  std::optional<int> dimension = this->dimension();
  if (!dimension) {
    // Nothing was ever inserted; queries return no hits until the first add().
    std::lock_guard<std::mutex> lock(index_mutex_);
    faiss_index_.reset();
    return;
  }

  const size_t expected_bytes = static_cast<size_t>(*dimension) * sizeof(float);
  std::vector<faiss::idx_t> faiss_ids;
  std::vector<float> all_vectors_flat;

  try {
    // Scope the connection strictly to the DB fetch
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, vector_blob FROM chunks WHERE collection_id = ? ORDER BY id"
          << collection_id_ >>
        [&](int64_t id, std::vector<char> vector_blob) {
          if (vector_blob.size() == expected_bytes) {
            faiss_ids.push_back(id);
            const float *vec_ptr = reinterpret_cast<const float *>(vector_blob.data());
            all_vectors_flat.insert(all_vectors_flat.end(), vec_ptr, vec_ptr + *dimension);
          } else {
            std::cerr << "Warning: Skipping chunk row " << id << " of collection '"
                      << collection_name_ << "' during index rebuild. Expected " << expected_bytes
                      << " bytes, got " << vector_blob.size() << " bytes." << std::endl;
          }
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw StoreError(format_db_error("rebuild index", collection_name_, e));
  }

  auto index = create_base_index(*dimension);
  try {
    if (!faiss_ids.empty()) {
      index->add_with_ids(static_cast<faiss::idx_t>(faiss_ids.size()), all_vectors_flat.data(),
                          faiss_ids.data());
    }
  } catch (const faiss::FaissException &e) {
    throw StoreError("Failed to load vectors of '" + collection_name_ + "': " + e.what());
  }

  std::cout << "Collection '" << collection_name_ << "' loaded with " << faiss_ids.size()
            << " vectors (dimension " << *dimension << ")" << std::endl;

  std::lock_guard<std::mutex> lock(index_mutex_);
  faiss_index_ = std::move(index);
}

size_t VectorStore::count() {
  try {
    int64_t total = 0;
    PooledConnection conn(db_manager_);
    *conn << "SELECT COUNT(*) FROM chunks WHERE collection_id = ?" << collection_id_ >> total;
    return static_cast<size_t>(total);
  } catch (const sqlite::sqlite_exception &e) {
    throw StoreError(format_db_error("count", collection_name_, e));
  }
}

size_t VectorStore::delete_all() {
  int64_t removed = 0;
  try {
    PooledConnection conn(db_manager_);
    WriteTransaction tx(*conn);
    *conn << "SELECT COUNT(*) FROM chunks WHERE collection_id = ?" << collection_id_ >> removed;
    *conn << "DELETE FROM chunks WHERE collection_id = ?" << collection_id_;
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw StoreError(format_db_error("delete", collection_name_, e));
  }

  std::lock_guard<std::mutex> lock(index_mutex_);
  if (faiss_index_) {
    faiss_index_->reset();
  }
  return static_cast<size_t>(removed);
}

void VectorStore::add(const std::vector<Chunk> &chunks,
                      const std::vector<std::vector<float>> &embeddings) {
  if (chunks.size() != embeddings.size()) {
    throw StoreError("Got " + std::to_string(chunks.size()) + " chunks but " +
                     std::to_string(embeddings.size()) + " embeddings");
  }
  if (chunks.empty()) {
    return;
  }

  const int dimension = static_cast<int>(embeddings.front().size());
  if (dimension == 0) {
    throw StoreError("Cannot store zero-length embedding vectors");
  }
  for (const auto &embedding : embeddings) {
    if (static_cast<int>(embedding.size()) != dimension) {
      throw StoreError("Embeddings in one batch must share a dimension. Expected " +
                       std::to_string(dimension) + ", got " + std::to_string(embedding.size()));
    }
  }

  // An empty collection adopts whatever dimension the current model produces.
  std::optional<int> current = this->dimension();
  if (!current || count() == 0) {
    if (current != dimension) {
      set_dimension(dimension);
    }
  } else if (*current != dimension) {
    throw StoreError("Vector dimension mismatch for collection '" + collection_name_ +
                     "'. Expected " + std::to_string(*current) + ", got " +
                     std::to_string(dimension));
  }

  std::vector<faiss::idx_t> row_ids;
  row_ids.reserve(chunks.size());
  try {
    PooledConnection conn(db_manager_);
    WriteTransaction tx(*conn);
    for (size_t i = 0; i < chunks.size(); ++i) {
      const Chunk &chunk = chunks[i];
      *conn << "INSERT INTO chunks (collection_id, chunk_id, source, file_path, page, content, "
               "vector_blob) VALUES (?, ?, ?, ?, ?, ?, ?)"
            << collection_id_ << chunk.id << chunk.source << chunk.file_path << chunk.page
            << CompressionService::compress(chunk.text) << vector_to_blob(embeddings[i]);
      row_ids.push_back(conn->last_insert_rowid());
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw StoreError(format_db_error("insert", collection_name_, e));
  }

  std::vector<float> flat;
  flat.reserve(chunks.size() * static_cast<size_t>(dimension));
  for (const auto &embedding : embeddings) {
    flat.insert(flat.end(), embedding.begin(), embedding.end());
  }

  std::lock_guard<std::mutex> lock(index_mutex_);
  try {
    faiss_index_->add_with_ids(static_cast<faiss::idx_t>(row_ids.size()), flat.data(),
                               row_ids.data());
  } catch (const faiss::FaissException &e) {
    throw StoreError("Failed to index vectors of '" + collection_name_ + "': " + e.what());
  }
}

std::vector<ChunkHit> VectorStore::query(const std::vector<float> &query_vector, int k) {
  std::vector<float> distances;
  std::vector<faiss::idx_t> labels;
  {
    std::lock_guard<std::mutex> lock(index_mutex_);
    if (!faiss_index_ || faiss_index_->ntotal == 0 || k <= 0) {
      return {};
    }
    if (static_cast<faiss::idx_t>(query_vector.size()) != faiss_index_->d) {
      throw StoreError("Query vector dimension mismatch. Expected " +
                       std::to_string(faiss_index_->d) + ", got " +
                       std::to_string(query_vector.size()));
    }

    const faiss::idx_t actual_k = std::min<faiss::idx_t>(k, faiss_index_->ntotal);
    distances.resize(actual_k);
    labels.resize(actual_k);
    try {
      faiss_index_->search(1, query_vector.data(), actual_k, distances.data(), labels.data());
    } catch (const faiss::FaissException &e) {
      throw StoreError("Search in '" + collection_name_ + "' failed: " + e.what());
    }
  }

  std::vector<int64_t> row_ids;
  row_ids.reserve(labels.size());
  for (faiss::idx_t label : labels) {
    if (label != -1) {
      row_ids.push_back(label);
    }
  }
  if (row_ids.empty()) {
    return {};
  }

  auto id_to_chunk = fetch_chunks(row_ids);

  // Assemble in Faiss order: closest first
  std::vector<ChunkHit> hits;
  hits.reserve(row_ids.size());
  for (size_t i = 0; i < labels.size(); ++i) {
    if (labels[i] == -1) {
      continue;
    }
    auto it = id_to_chunk.find(labels[i]);
    if (it == id_to_chunk.end()) {
      // Deleted between the index search and the row fetch (concurrent rebuild).
      std::cerr << "Warning: Faiss returned row " << labels[i]
                << " but no corresponding chunk found in DB." << std::endl;
      continue;
    }
    hits.push_back({std::move(it->second), distances[i]});
  }
  return hits;
}

std::vector<StoredChunk> VectorStore::peek(int limit) {
  std::vector<StoredChunk> chunks;
  if (limit <= 0) {
    return chunks;
  }

  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT chunk_id, content, page, source, file_path FROM chunks "
             "WHERE collection_id = ? ORDER BY id LIMIT ?"
          << collection_id_ << limit >>
        [&](std::string chunk_id, std::vector<char> content, std::optional<int> page,
            std::optional<std::string> source, std::optional<std::string> file_path) {
          chunks.push_back({std::move(chunk_id), CompressionService::decompress(content), page,
                            std::move(source), std::move(file_path)});
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw StoreError(format_db_error("peek", collection_name_, e));
  } catch (const std::runtime_error &e) {
    throw StoreError("Corrupt chunk content in '" + collection_name_ + "': " + e.what());
  }
  return chunks;
}

std::unordered_map<int64_t, StoredChunk> VectorStore::fetch_chunks(
    const std::vector<int64_t> &row_ids) {
  std::unordered_map<int64_t, StoredChunk> id_to_chunk;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, chunk_id, content, page, source, file_path FROM chunks WHERE id IN (" +
                 id_list(row_ids) + ")" >>
        [&](int64_t id, std::string chunk_id, std::vector<char> content, std::optional<int> page,
            std::optional<std::string> source, std::optional<std::string> file_path) {
          id_to_chunk[id] = {std::move(chunk_id), CompressionService::decompress(content), page,
                             std::move(source), std::move(file_path)};
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw StoreError(format_db_error("fetch chunks", collection_name_, e));
  } catch (const std::runtime_error &e) {
    throw StoreError("Corrupt chunk content in '" + collection_name_ + "': " + e.what());
  }
  return id_to_chunk;
}

std::unique_ptr<faiss::IndexIDMap> VectorStore::create_base_index(int dimension) {
  // Exact search so distances match a brute-force scan of the collection
  auto index = std::make_unique<faiss::IndexIDMap>(new faiss::IndexFlatL2(dimension));
  index->own_fields = true;
  return index;
}

std::string VectorStore::id_list(const std::vector<int64_t> &ids) {
  std::stringstream ss;
  for (size_t i = 0; i < ids.size(); ++i) {
    ss << ids[i];
    if (i < ids.size() - 1)
      ss << ",";
  }
  return ss.str();
}

}  // namespace docsearch_core
