#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace docsearch_core {

struct DocumentInfo {
  std::string filename;
  std::string filepath;
  std::uintmax_t size = 0;
  std::string extension;
};

// Lists, reads, stores and removes files in the document source directory.
// The index is not touched; a rebuild picks up the change.
class DocumentService {
 public:
  explicit DocumentService(std::filesystem::path document_dir);

  // Regular, non-hidden files sorted by name. Empty when the directory does
  // not exist.
  std::vector<DocumentInfo> list_documents() const;

  // False when no such file exists. Throws std::invalid_argument for names
  // that are empty or would leave the directory.
  bool delete_document(const std::string &filename) const;

  // File contents, or std::nullopt when no such file exists.
  std::optional<std::string> read_document(const std::string &filename) const;

  // Writes the file, replacing any existing one, and creates the directory
  // if needed. Throws std::invalid_argument for bad names or extensions.
  DocumentInfo save_document(const std::string &filename, const std::string &content) const;

  static bool is_supported_upload(const std::string &filename);

  const std::filesystem::path &document_dir() const {
    return document_dir_;
  }

 private:
  std::filesystem::path document_dir_;

  static DocumentInfo describe(const std::filesystem::path &path, std::uintmax_t size);
  static void validate_filename(const std::string &filename);
};

}  // namespace docsearch_core
