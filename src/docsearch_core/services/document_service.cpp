#include "docsearch_core/services/document_service.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace docsearch_core {

namespace {

// Types the document manager accepts. Only PDFs are indexed.
constexpr std::array<const char *, 4> kUploadExtensions = {".pdf", ".txt", ".docx", ".doc"};

}  // namespace

DocumentService::DocumentService(std::filesystem::path document_dir)
    : document_dir_(std::move(document_dir)) {}

std::vector<DocumentInfo> DocumentService::list_documents() const {
  std::vector<DocumentInfo> documents;
  std::error_code ec;
  if (!std::filesystem::is_directory(document_dir_, ec)) {
    return documents;
  }

  for (const auto &entry : std::filesystem::directory_iterator(document_dir_)) {
    if (!entry.is_regular_file(ec) || entry.path().filename().string().rfind('.', 0) == 0) {
      continue;
    }
    std::uintmax_t size = entry.file_size(ec);
    if (ec) {
      std::cerr << "Could not stat " << entry.path().string() << ": " << ec.message() << std::endl;
      size = 0;
    }
    documents.push_back(describe(entry.path(), size));
  }

  std::sort(documents.begin(), documents.end(),
            [](const DocumentInfo &a, const DocumentInfo &b) { return a.filename < b.filename; });
  return documents;
}

DocumentInfo DocumentService::describe(const std::filesystem::path &path, std::uintmax_t size) {
  DocumentInfo info;
  info.filename = path.filename().string();
  info.filepath = path.string();
  info.size = size;
  info.extension = path.extension().string();
  return info;
}

void DocumentService::validate_filename(const std::string &filename) {
  if (filename.empty() || filename == "." || filename == "..") {
    throw std::invalid_argument("Invalid filename");
  }
  if (filename.find('/') != std::string::npos || filename.find('\\') != std::string::npos) {
    throw std::invalid_argument("Filename must not contain path separators");
  }
}

bool DocumentService::delete_document(const std::string &filename) const {
  validate_filename(filename);

  const std::filesystem::path target = document_dir_ / filename;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(target, ec)) {
    return false;
  }
  // filesystem_error propagates when the file exists but cannot be removed.
  bool removed = std::filesystem::remove(target);
  if (removed) {
    std::cout << "Deleted document " << target.string() << std::endl;
  }
  return removed;
}

std::optional<std::string> DocumentService::read_document(const std::string &filename) const {
  validate_filename(filename);

  const std::filesystem::path target = document_dir_ / filename;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(target, ec)) {
    return std::nullopt;
  }
  std::ifstream in(target, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Could not open " + target.string());
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bool DocumentService::is_supported_upload(const std::string &filename) {
  std::string extension = std::filesystem::path(filename).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return std::find(kUploadExtensions.begin(), kUploadExtensions.end(), extension) !=
         kUploadExtensions.end();
}

DocumentInfo DocumentService::save_document(const std::string &filename,
                                            const std::string &content) const {
  validate_filename(filename);
  if (!is_supported_upload(filename)) {
    throw std::invalid_argument("Unsupported file type. Allowed: .pdf, .txt, .docx, .doc");
  }

  std::filesystem::create_directories(document_dir_);
  const std::filesystem::path target = document_dir_ / filename;
  // Staged under a hidden name, then renamed into place
  const std::filesystem::path partial = document_dir_ / ("." + filename + ".part");
  {
    std::ofstream out(partial, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) {
      std::error_code ignored;
      std::filesystem::remove(partial, ignored);
      throw std::runtime_error("Could not write " + target.string());
    }
  }
  std::filesystem::rename(partial, target);

  std::cout << "Stored document " << target.string() << " (" << content.size() << " bytes)"
            << std::endl;
  return describe(target, content.size());
}

}  // namespace docsearch_core
