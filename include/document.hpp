#pragma once

#include <optional>
#include <string>
#include <vector>

using Row = std::vector<std::string>;

// A table recovered from one page. rows[0] is the header row.
struct Table {
  int pageNumber = 0;
  std::vector<Row> rows;
};

struct Page {
  int number = 0;
  std::vector<Table> tables;
  std::string text;
};

struct Document {
  std::string path;
  std::vector<Page> pages;
};

// Loads page text and tables of a PDF through poppler-utils' pdftotext.
// Throws std::runtime_error if pdftotext is unavailable or fails on the file.
Document loadPdfDocument(const std::string& pdfPath);

// loadPdfDocument that logs a failure and returns nullopt instead of throwing.
std::optional<Document> tryLoadPdfDocument(const std::string& pdfPath);
