#include "utilities_test.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <stdexcept>

namespace docsearch_tests {

std::filesystem::path TestUtilities::create_temp_dir(const std::string& prefix) {
  static std::atomic<int> counter{0};

  // Generate unique directory name using timestamp and a process-wide counter
  auto now = std::chrono::system_clock::now();
  auto timestamp =
      std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();

  auto dir = std::filesystem::temp_directory_path() /
             (prefix + "_" + std::to_string(timestamp) + "_" + std::to_string(counter++));
  std::filesystem::create_directories(dir);
  return dir;
}

void TestUtilities::cleanup_temp_dir(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

void TestUtilities::write_file(const std::filesystem::path& path, const std::string& contents) {
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    throw std::runtime_error("Failed to create test file: " + path.string());
  }
  out << contents;
}

std::vector<float> TestUtilities::create_test_vector(const std::string& seed_text, int dimension) {
  std::vector<float> vec(dimension);
  size_t seed = std::hash<std::string>{}(seed_text);
  for (int i = 0; i < dimension; ++i) {
    seed = seed * 6364136223846793005ULL + 1442695040888963407ULL;
    vec[i] = static_cast<float>((seed >> 33) % 1000) / 1000.0f;
  }
  return vec;
}

std::vector<float> TestUtilities::axis_vector(int axis, float value, int dimension) {
  std::vector<float> vec(dimension, 0.0f);
  vec[axis % dimension] = value;
  return vec;
}

docsearch_core::Chunk TestUtilities::create_test_chunk(int index, const std::string& source,
                                                       int page) {
  docsearch_core::Chunk chunk;
  chunk.id = "chunk_" + std::to_string(index);
  chunk.text = "Test chunk " + std::to_string(index) + " about GPIO and clock configuration.";
  chunk.page = page;
  chunk.source = source;
  chunk.file_path = "./document_source/" + source;
  return chunk;
}

std::vector<docsearch_core::Chunk> TestUtilities::create_test_chunks(int count,
                                                                     const std::string& source) {
  std::vector<docsearch_core::Chunk> chunks;
  chunks.reserve(count);
  for (int i = 0; i < count; ++i) {
    chunks.push_back(create_test_chunk(i, source, i + 1));
  }
  return chunks;
}

std::vector<std::vector<float>> TestUtilities::create_test_vectors(int count, int dimension) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(count);
  for (int i = 0; i < count; ++i) {
    vectors.push_back(create_test_vector("vector_" + std::to_string(i), dimension));
  }
  return vectors;
}

}  // namespace docsearch_tests
