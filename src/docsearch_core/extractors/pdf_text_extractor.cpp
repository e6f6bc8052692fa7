#include "docsearch_core/extractors/pdf_text_extractor.hpp"

#include <poppler-document.h>
#include <poppler-global.h>
#include <poppler-page.h>

#include <iostream>
#include <memory>

namespace docsearch_core {

namespace {

void forward_poppler_diagnostic(const std::string& message, void* /*closure*/) {
  std::cerr << "poppler: " << message << std::endl;
}

}  // namespace

PdfTextExtractor::PdfTextExtractor() {
  // poppler prints to stderr on its own; route it through our format instead.
  poppler::set_debug_error_function(forward_poppler_diagnostic, nullptr);
}

bool PdfTextExtractor::can_handle(const fs::path& file_path) const {
  return file_path.extension() == ".pdf";
}

std::vector<std::string> PdfTextExtractor::extract_pages(const fs::path& file_path) const {
  if (!fs::is_regular_file(file_path)) {
    throw ExtractionError("File not found: " + file_path.string());
  }

  std::unique_ptr<poppler::document> doc(poppler::document::load_from_file(file_path.string()));
  if (!doc) {
    throw ExtractionError("Could not open PDF: " + file_path.string());
  }
  if (doc->is_locked()) {
    throw ExtractionError("PDF is password protected: " + file_path.string());
  }

  std::vector<std::string> pages;
  pages.reserve(doc->pages());
  for (int i = 0; i < doc->pages(); ++i) {
    std::unique_ptr<poppler::page> page(doc->create_page(i));
    if (!page) {
      // Keep numbering aligned with the document; an unreadable page has no text.
      pages.emplace_back();
      continue;
    }
    poppler::byte_array utf8 = page->text().to_utf8();
    pages.emplace_back(utf8.begin(), utf8.end());
  }
  return pages;
}

}  // namespace docsearch_core
