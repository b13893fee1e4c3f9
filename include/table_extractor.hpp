#pragma once

#include "document.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

// A word and its bounding box in page coordinates (y grows downwards).
struct WordBox {
  double left = 0;
  double top = 0;
  double right = 0;
  double bottom = 0;
  std::string text;
};

// Extract tables by invoking `pdftotext -bbox-layout` to get word bounding boxes,
// then clustering words into rows/columns heuristically.
// Throws std::runtime_error when pdftotext is unavailable or fails.
std::vector<Table> extractTablesFromPdf(const std::string& pdfPath);

// Groups one page's words into lines, cuts the page into blocks of dense lines
// and lays out every block on its own column grid, so titles and footers do
// not add columns to the item table.
std::vector<Table> tablesFromWords(int pageNumber, std::vector<WordBox> words);

// [begin, end) ranges of at least two consecutive rows that each have two or
// more non-empty cells.
std::vector<std::pair<size_t, size_t>> denseRowRanges(const std::vector<Row>& grid);

// One table per dense row range of the grid.
std::vector<Table> splitGridIntoTables(int pageNumber, const std::vector<Row>& grid);

// Write tables into CSV files in outDir as table_<page>_<index>.csv
// Throws std::runtime_error if a file cannot be written.
void writeTablesAsCsv(const std::vector<Table>& tables, const std::string& outDir);

// "<outDir>/<index>_<file stem>"; the index keeps inputs with the same file
// name apart.
std::string tableDumpDirectory(const std::string& outDir, size_t documentIndex, const std::string& pdfPath);
