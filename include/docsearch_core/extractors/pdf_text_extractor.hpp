#pragma once

#include "text_extractor.hpp"

namespace docsearch_core {

// poppler-cpp backed extractor for .pdf files.
class PdfTextExtractor : public TextExtractor {
 public:
  PdfTextExtractor();

  bool can_handle(const fs::path& file_path) const override;

  std::vector<std::string> extract_pages(const fs::path& file_path) const override;
};

}  // namespace docsearch_core
