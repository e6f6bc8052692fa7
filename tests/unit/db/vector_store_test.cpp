#include <gtest/gtest.h>

#include <vector>

#include "docsearch_core/db/vector_store.hpp"
#include "../../common/utilities_test.hpp"

namespace docsearch_core {

using docsearch_tests::TestUtilities;

class VectorStoreTest : public docsearch_tests::VectorStoreTestBase {
 protected:
  // Three chunks placed on separate axes so nearest-neighbour order is obvious
  void add_axis_chunks() {
    std::vector<Chunk> chunks = TestUtilities::create_test_chunks(3);
    std::vector<std::vector<float>> vectors = {TestUtilities::axis_vector(0),
                                               TestUtilities::axis_vector(1),
                                               TestUtilities::axis_vector(2)};
    vector_store_->add(chunks, vectors);
  }
};

TEST_F(VectorStoreTest, NewCollectionIsEmpty) {
  EXPECT_EQ(vector_store_->collection_name(), kCollection);
  EXPECT_EQ(vector_store_->count(), 0u);
  EXPECT_FALSE(vector_store_->dimension().has_value());
  EXPECT_TRUE(vector_store_->peek(100).empty());
  EXPECT_TRUE(vector_store_->query(TestUtilities::axis_vector(0), 5).empty());
}

TEST_F(VectorStoreTest, EmptyCollectionNameIsRejected) {
  EXPECT_THROW({ VectorStore store(*db_manager_, ""); }, StoreError);
}

TEST_F(VectorStoreTest, AddStoresChunksAndAdoptsDimension) {
  auto chunks = TestUtilities::create_test_chunks(5);
  vector_store_->add(chunks, TestUtilities::create_test_vectors(5, 8));

  EXPECT_EQ(vector_store_->count(), 5u);
  ASSERT_TRUE(vector_store_->dimension().has_value());
  EXPECT_EQ(*vector_store_->dimension(), 8);
}

TEST_F(VectorStoreTest, AddWithMismatchedSizesThrows) {
  auto chunks = TestUtilities::create_test_chunks(3);
  EXPECT_THROW(vector_store_->add(chunks, TestUtilities::create_test_vectors(2)), StoreError);
  EXPECT_EQ(vector_store_->count(), 0u);
}

TEST_F(VectorStoreTest, AddWithMixedDimensionsThrows) {
  auto chunks = TestUtilities::create_test_chunks(2);
  std::vector<std::vector<float>> vectors = {TestUtilities::create_test_vector("a", 8),
                                             TestUtilities::create_test_vector("b", 4)};
  EXPECT_THROW(vector_store_->add(chunks, vectors), StoreError);
}

TEST_F(VectorStoreTest, AddWithDifferentDimensionToNonEmptyCollectionThrows) {
  vector_store_->add(TestUtilities::create_test_chunks(2), TestUtilities::create_test_vectors(2, 8));

  std::vector<Chunk> more = {TestUtilities::create_test_chunk(10)};
  EXPECT_THROW(vector_store_->add(more, {TestUtilities::create_test_vector("x", 16)}), StoreError);
  EXPECT_EQ(vector_store_->count(), 2u);
}

TEST_F(VectorStoreTest, DuplicateChunkIdFailsWholeBatch) {
  vector_store_->add({TestUtilities::create_test_chunk(0)}, {TestUtilities::axis_vector(0)});

  std::vector<Chunk> batch = {TestUtilities::create_test_chunk(1), TestUtilities::create_test_chunk(0)};
  EXPECT_THROW(vector_store_->add(batch, TestUtilities::create_test_vectors(2)), StoreError);
  EXPECT_EQ(vector_store_->count(), 1u);
}

TEST_F(VectorStoreTest, QueryReturnsNearestFirst) {
  add_axis_chunks();

  auto hits = vector_store_->query(TestUtilities::axis_vector(1, 0.9f), 3);

  ASSERT_EQ(hits.size(), 3u);
  EXPECT_EQ(hits[0].chunk.id, "chunk_1");
  for (size_t i = 1; i < hits.size(); ++i) {
    EXPECT_LE(hits[i - 1].distance, hits[i].distance);
  }
}

TEST_F(VectorStoreTest, QueryDistanceIsSquaredL2) {
  vector_store_->add({TestUtilities::create_test_chunk(0)}, {TestUtilities::axis_vector(0, 2.0f)});

  auto hits = vector_store_->query(std::vector<float>(8, 0.0f), 1);

  ASSERT_EQ(hits.size(), 1u);
  EXPECT_FLOAT_EQ(hits[0].distance, 4.0f);
}

TEST_F(VectorStoreTest, QueryReturnsAtMostCollectionSize) {
  add_axis_chunks();
  EXPECT_EQ(vector_store_->query(TestUtilities::axis_vector(0), 20).size(), 3u);
  EXPECT_EQ(vector_store_->query(TestUtilities::axis_vector(0), 2).size(), 2u);
  EXPECT_TRUE(vector_store_->query(TestUtilities::axis_vector(0), 0).empty());
}

TEST_F(VectorStoreTest, QueryHitsCarryMetadataAndText) {
  auto chunks = TestUtilities::create_test_chunks(3, "RM0090.pdf");
  vector_store_->add(chunks, {TestUtilities::axis_vector(0), TestUtilities::axis_vector(1),
                              TestUtilities::axis_vector(2)});

  auto hits = vector_store_->query(TestUtilities::axis_vector(2), 1);

  ASSERT_EQ(hits.size(), 1u);
  const StoredChunk& stored = hits[0].chunk;
  EXPECT_EQ(stored.id, chunks[2].id);
  EXPECT_EQ(stored.text, chunks[2].text);
  EXPECT_EQ(stored.page, 3);
  EXPECT_EQ(stored.source, "RM0090.pdf");
  EXPECT_EQ(stored.file_path, "./document_source/RM0090.pdf");
}

TEST_F(VectorStoreTest, QueryWithWrongDimensionThrows) {
  add_axis_chunks();
  EXPECT_THROW(vector_store_->query(std::vector<float>(4, 0.0f), 3), StoreError);
}

TEST_F(VectorStoreTest, DeleteAllReturnsRemovedCount) {
  add_axis_chunks();

  EXPECT_EQ(vector_store_->delete_all(), 3u);
  EXPECT_EQ(vector_store_->count(), 0u);
  EXPECT_TRUE(vector_store_->query(TestUtilities::axis_vector(0), 3).empty());
  EXPECT_EQ(vector_store_->delete_all(), 0u);
}

TEST_F(VectorStoreTest, EmptiedCollectionAcceptsNewDimension) {
  add_axis_chunks();
  vector_store_->delete_all();

  vector_store_->add({TestUtilities::create_test_chunk(0)}, {std::vector<float>(16, 0.25f)});

  EXPECT_EQ(*vector_store_->dimension(), 16);
  EXPECT_EQ(vector_store_->query(std::vector<float>(16, 0.25f), 1).size(), 1u);
}

TEST_F(VectorStoreTest, PeekReturnsInsertionOrderUpToLimit) {
  vector_store_->add(TestUtilities::create_test_chunks(10), TestUtilities::create_test_vectors(10));

  auto first = vector_store_->peek(4);
  ASSERT_EQ(first.size(), 4u);
  for (int i = 0; i < 4; ++i) {
    EXPECT_EQ(first[i].id, "chunk_" + std::to_string(i));
  }
  EXPECT_EQ(vector_store_->peek(100).size(), 10u);
  EXPECT_TRUE(vector_store_->peek(0).empty());
}

TEST_F(VectorStoreTest, ReopenedStoreRebuildsIndexFromDatabase) {
  add_axis_chunks();

  reopen_store();

  EXPECT_EQ(vector_store_->count(), 3u);
  EXPECT_EQ(*vector_store_->dimension(), 8);
  auto hits = vector_store_->query(TestUtilities::axis_vector(2), 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].chunk.id, "chunk_2");
}

TEST_F(VectorStoreTest, RebuildSkipsRowsWithWrongVectorSize) {
  add_axis_chunks();
  {
    PooledConnection conn(*db_manager_);
    int collection_id = 0;
    *conn << "SELECT id FROM collections WHERE name = ?" << std::string(kCollection) >> collection_id;
    std::vector<char> short_blob(3 * sizeof(float), 0);
    std::vector<char> content = {'x'};
    *conn << "INSERT INTO chunks (collection_id, chunk_id, content, vector_blob) VALUES (?, ?, ?, ?)"
          << collection_id << std::string("broken") << content << short_blob;
  }

  reopen_store();

  EXPECT_EQ(vector_store_->count(), 4u);
  auto hits = vector_store_->query(TestUtilities::axis_vector(0), 10);
  EXPECT_EQ(hits.size(), 3u);
  for (const auto& hit : hits) {
    EXPECT_NE(hit.chunk.id, "broken");
  }
}

TEST_F(VectorStoreTest, MissingMetadataColumnsReadBackAsEmpty) {
  vector_store_->add({TestUtilities::create_test_chunk(0)}, {TestUtilities::axis_vector(0)});
  {
    PooledConnection conn(*db_manager_);
    *conn << "UPDATE chunks SET page = NULL, source = NULL, file_path = NULL";
  }

  auto stored = vector_store_->peek(1);
  ASSERT_EQ(stored.size(), 1u);
  EXPECT_FALSE(stored[0].page.has_value());
  EXPECT_FALSE(stored[0].source.has_value());
  EXPECT_FALSE(stored[0].file_path.has_value());
}

TEST_F(VectorStoreTest, CollectionsAreIsolated) {
  add_axis_chunks();

  VectorStore other(*db_manager_, "other_collection");
  EXPECT_EQ(other.count(), 0u);
  other.add({TestUtilities::create_test_chunk(0, "other.pdf")}, {TestUtilities::axis_vector(5)});

  EXPECT_EQ(other.count(), 1u);
  EXPECT_EQ(vector_store_->count(), 3u);
  EXPECT_EQ(other.delete_all(), 1u);
  EXPECT_EQ(vector_store_->count(), 3u);
}

}  // namespace docsearch_core
