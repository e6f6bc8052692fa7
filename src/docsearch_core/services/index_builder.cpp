#include "docsearch_core/services/index_builder.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>

#include "docsearch_core/configuration_error.hpp"

namespace docsearch_core {

namespace {

void report_progress(const IndexBuilder::ProgressCallback &on_progress, const std::string &line) {
  std::cout << "[index] " << line << std::endl;
  if (on_progress) {
    on_progress(line);
  }
}

IndexBuildReport to_report(const std::string &error,
                           const std::string &message,
                           std::vector<FileReport> files_processed) {
  std::cerr << "Index build failed: " << error << std::endl;
  return IndexBuildReport::failure_response(error, message, std::move(files_processed));
}

}  // namespace

IndexBuilder::IndexBuilder(IndexSettings settings,
                           const TextExtractor &extractor,
                           EmbeddingModel &embedding_model,
                           VectorStore &vector_store)
    : settings_(std::move(settings)),
      extractor_(extractor),
      embedding_model_(embedding_model),
      vector_store_(vector_store) {
  if (settings_.chunk_size == 0) {
    throw ConfigurationError("chunk_size must be greater than zero");
  }
  if (settings_.chunk_overlap >= settings_.chunk_size) {
    throw ConfigurationError("chunk_overlap must be smaller than chunk_size");
  }
}

IndexBuildReport IndexBuilder::build_index(const ProgressCallback &on_progress) {
  std::vector<FileReport> files_processed;

  report_progress(on_progress, "Scanning " + settings_.document_dir.string());
  auto discovered = discover_documents();
  if (!discovered.success) {
    return to_report(discovered.error, discovered.message, {});
  }

  auto collected = collect_chunks(discovered.value, files_processed, on_progress);
  if (!collected.success) {
    return to_report(collected.error, collected.message, std::move(files_processed));
  }
  const std::vector<Chunk> &chunks = collected.value;

  report_progress(on_progress, "Loading embedding model " + embedding_model_.model_name());
  auto loaded = load_model();
  if (!loaded.success) {
    return to_report(loaded.error, loaded.message, std::move(files_processed));
  }

  report_progress(on_progress, "Encoding " + std::to_string(chunks.size()) + " chunks");
  auto encoded = encode_chunks(chunks);
  if (!encoded.success) {
    return to_report(encoded.error, encoded.message, std::move(files_processed));
  }

  report_progress(on_progress, "Replacing collection '" + vector_store_.collection_name() + "'");
  auto replaced = replace_collection(chunks, encoded.value);
  if (!replaced.success) {
    return to_report(replaced.error, replaced.message, std::move(files_processed));
  }

  IndexBuildReport report;
  report.success = true;
  report.message = "Index built successfully";
  report.total_chunks = replaced.value.total_chunks;
  report.previous_chunks = replaced.value.previous_chunks;
  report.files_processed = std::move(files_processed);
  report.embedding_model = embedding_model_.model_name();
  report.collection_name = vector_store_.collection_name();

  report_progress(on_progress, "Indexed " + std::to_string(report.total_chunks) + " chunks (" +
                                   std::to_string(report.previous_chunks) + " replaced)");
  return report;
}

StageResult<std::vector<std::filesystem::path>> IndexBuilder::discover_documents() const {
  using Result = StageResult<std::vector<std::filesystem::path>>;
  const std::string dir = settings_.document_dir.string();

  std::error_code ec;
  if (!std::filesystem::is_directory(settings_.document_dir, ec)) {
    return Result::failure_response("Document directory '" + dir + "' not found.",
                                    "Please create the directory and add PDF files.");
  }

  std::vector<std::filesystem::path> files;
  std::filesystem::directory_iterator it(settings_.document_dir, ec);
  if (ec) {
    return Result::failure_response("Could not read document directory '" + dir +
                                    "': " + ec.message());
  }
  for (const std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    const auto &entry = *it;
    // Hidden files and AppleDouble "._" companions are not documents
    if (entry.path().filename().string().rfind('.', 0) == 0) {
      continue;
    }
    std::error_code type_ec;
    if (entry.is_regular_file(type_ec) && extractor_.can_handle(entry.path())) {
      files.push_back(entry.path());
    }
  }
  if (ec) {
    return Result::failure_response("Could not read document directory '" + dir +
                                    "': " + ec.message());
  }

  if (files.empty()) {
    return Result::failure_response("No PDF files found in '" + dir + "'.",
                                    "Please add PDF files to the document_source directory.");
  }

  std::sort(files.begin(), files.end(),
            [](const std::filesystem::path &a, const std::filesystem::path &b) {
              return a.filename().string() < b.filename().string();
            });
  return Result::success_response(std::move(files));
}

StageResult<std::vector<Chunk>> IndexBuilder::collect_chunks(
    const std::vector<std::filesystem::path> &files,
    std::vector<FileReport> &files_processed,
    const ProgressCallback &on_progress) const {
  using Result = StageResult<std::vector<Chunk>>;
  std::vector<Chunk> chunks;
  size_t counter = 0;

  for (size_t i = 0; i < files.size(); ++i) {
    const auto &path = files[i];
    const std::string filename = path.filename().string();
    report_progress(on_progress, "Processing " + filename + " (" + std::to_string(i + 1) + "/" +
                                     std::to_string(files.size()) + ")");

    std::vector<std::string> pages;
    try {
      pages = extractor_.extract_pages(path);
    } catch (const std::exception &e) {
      return Result::failure_response("Error processing " + filename + ": " + e.what());
    }

    int file_chunks = 0;
    for (size_t page = 0; page < pages.size(); ++page) {
      for (auto &text :
           ChunkSplitter::split(pages[page], settings_.chunk_size, settings_.chunk_overlap)) {
        Chunk chunk;
        chunk.id = "chunk_" + std::to_string(counter++);
        chunk.text = std::move(text);
        chunk.page = static_cast<int>(page) + 1;
        chunk.source = filename;
        chunk.file_path = path.string();
        chunks.push_back(std::move(chunk));
        ++file_chunks;
      }
    }
    files_processed.push_back({filename, static_cast<int>(pages.size()), file_chunks});
  }

  if (chunks.empty()) {
    return Result::failure_response("No text chunks collected from PDFs.",
                                    "PDFs may be empty or unreadable.");
  }
  return Result::success_response(std::move(chunks));
}

StageResult<bool> IndexBuilder::load_model() {
  try {
    embedding_model_.ensure_loaded();
  } catch (const std::exception &e) {
    return StageResult<bool>::failure_response(std::string("Failed to load embedding model: ") +
                                               e.what());
  }
  return StageResult<bool>::success_response(true);
}

StageResult<std::vector<std::vector<float>>> IndexBuilder::encode_chunks(
    const std::vector<Chunk> &chunks) {
  using Result = StageResult<std::vector<std::vector<float>>>;
  std::vector<std::string> texts;
  texts.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    texts.push_back(chunk.text);
  }

  std::vector<std::vector<float>> embeddings;
  try {
    embeddings = embedding_model_.encode_batch(texts);
  } catch (const std::exception &e) {
    return Result::failure_response(std::string("Failed to encode documents: ") + e.what());
  }
  if (embeddings.size() != chunks.size()) {
    return Result::failure_response("Failed to encode documents: expected " +
                                    std::to_string(chunks.size()) + " vectors, got " +
                                    std::to_string(embeddings.size()));
  }
  return Result::success_response(std::move(embeddings));
}

StageResult<IndexBuilder::ReplaceOutcome> IndexBuilder::replace_collection(
    const std::vector<Chunk> &chunks, const std::vector<std::vector<float>> &embeddings) {
  using Result = StageResult<ReplaceOutcome>;
  ReplaceOutcome outcome;
  try {
    if (vector_store_.count() > 0) {
      outcome.previous_chunks = vector_store_.delete_all();
    }
    vector_store_.add(chunks, embeddings);
    outcome.total_chunks = vector_store_.count();
  } catch (const std::exception &e) {
    return Result::failure_response(std::string("Failed to update vector store collection: ") +
                                    e.what());
  }
  return Result::success_response(outcome);
}

}  // namespace docsearch_core
