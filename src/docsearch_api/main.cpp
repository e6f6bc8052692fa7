#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mutex>

#include "docsearch_api/config.hpp"
#include "docsearch_api/routes.hpp"
#include "docsearch_api/server.hpp"
#include "docsearch_core/db/database_manager.hpp"
#include "docsearch_core/db/vector_store.hpp"
#include "docsearch_core/extractors/pdf_text_extractor.hpp"
#include "docsearch_core/llm/ollama_client.hpp"
#include "docsearch_core/services/document_service.hpp"
#include "docsearch_core/services/index_builder.hpp"
#include "docsearch_core/services/index_job_runner.hpp"
#include "docsearch_core/services/query_engine.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

int main(int argc, char *argv[]) {
  try {
    const std::string config_path = argc > 1 ? argv[1] : "docsearchrc.json";
    Config config = Config::from_file(config_path);

    const std::filesystem::path db_path = std::filesystem::path(config.persist_dir) / "vectors.db";
    std::cout << "Starting Docsearch API Server..." << std::endl;
    std::cout << "Config File: " << config_path << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Document Directory: " << config.document_dir << std::endl;
    std::cout << "Vector DB Path: " << db_path.string() << std::endl;
    std::cout << "Collection: " << config.collection_name << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Chunking: " << config.chunk_size << " chars, " << config.chunk_overlap
              << " overlap" << std::endl;

    // Initialize core components
    docsearch_core::DatabaseManager db_manager(db_path, config.db_pool_size);
    docsearch_core::VectorStore vector_store(db_manager, config.collection_name);
    docsearch_core::OllamaClient embedding_model(config.ollama_url, config.embedding_model);
    docsearch_core::PdfTextExtractor pdf_extractor;

    docsearch_core::IndexSettings settings;
    settings.document_dir = config.document_dir;
    settings.chunk_size = static_cast<size_t>(config.chunk_size);
    settings.chunk_overlap = static_cast<size_t>(config.chunk_overlap);

    docsearch_core::IndexBuilder index_builder(settings, pdf_extractor, embedding_model,
                                               vector_store);
    docsearch_core::QueryEngine query_engine(embedding_model, vector_store);
    docsearch_core::IndexJobRunner index_job_runner(index_builder);
    docsearch_core::DocumentService document_service(config.document_dir);

    std::cout << "Collection '" << config.collection_name << "' holds " << vector_store.count()
              << " chunks" << std::endl;

    try {
      query_engine.warm_up();
      std::cout << "Embedding model ready." << std::endl;
    } catch (const docsearch_core::ModelLoadError &e) {
      std::cerr << "Warning: embedding model not loaded yet: " << e.what() << std::endl;
    }

    docsearch_api::Server server(config.host(), config.port(), config.cors_origin);
    docsearch_api::Routes routes(query_engine, index_job_runner, document_service);
    routes.register_routes(server);

    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    // --- WAIT FOR SHUTDOWN SIGNAL ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- GRACEFUL SHUTDOWN SEQUENCE ---
    std::cout << "[1/3] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/3] Waiting for a running index build..." << std::endl;
    index_job_runner.wait();

    std::cout << "[3/3] Shutting down database connections..." << std::endl;
    db_manager.shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
