#include "document.hpp"

#include "pdf_text.hpp"
#include "table_extractor.hpp"

#include <algorithm>
#include <exception>
#include <string>

#include <spdlog/spdlog.h>

Document loadPdfDocument(const std::string& pdfPath) {
  std::vector<std::string> texts = extractPdfPageTexts(pdfPath);
  std::vector<Table> tables = extractTablesFromPdf(pdfPath);

  int pageCount = static_cast<int>(texts.size());
  for (const auto& t : tables) pageCount = std::max(pageCount, t.pageNumber);

  Document doc;
  doc.path = pdfPath;
  doc.pages.resize(static_cast<size_t>(pageCount));
  for (int i = 0; i < pageCount; ++i) {
    doc.pages[i].number = i + 1;
    if (static_cast<size_t>(i) < texts.size()) doc.pages[i].text = std::move(texts[i]);
  }
  for (auto& t : tables) {
    if (t.pageNumber >= 1) doc.pages[t.pageNumber - 1].tables.push_back(std::move(t));
  }

  spdlog::debug("Loaded '{}': {} page(s), {} table(s)", pdfPath, doc.pages.size(), tables.size());
  return doc;
}

std::optional<Document> tryLoadPdfDocument(const std::string& pdfPath) {
  try {
    return loadPdfDocument(pdfPath);
  } catch (const std::exception& ex) {
    spdlog::error("Cannot read '{}': {}", pdfPath, ex.what());
    return std::nullopt;
  }
}
