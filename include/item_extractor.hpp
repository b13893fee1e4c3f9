#pragma once

#include "document.hpp"
#include "item.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class ExtractionMethod {
  TableOnly,
  TextOnly,
  Both
};

enum class ColumnRole {
  ItemCode,
  Description,
  Quantity,
  UnitPrice,
  TotalPrice
};

// One entry of the header vocabulary: a header cell containing any keyword
// (case-insensitive) takes the role. defaultIndex is used when no header does.
struct ColumnRule {
  ColumnRole role;
  std::vector<std::string> keywords;
  size_t defaultIndex;
};

// Ordered by priority: the first rule that matches a header cell wins.
const std::vector<ColumnRule>& columnVocabulary();

using ColumnMap = std::map<ColumnRole, size_t>;

// Assigns each header cell the first role it matches. When several columns
// match the same role the rightmost one keeps it, so "Unit | Unit Price"
// maps the price to "Unit Price". Only matched roles are present in the result.
ColumnMap identifyColumns(const Row& header);

// Parses a data row. Returns nullopt when the item code is empty or the
// quantity or unit price cell holds no number. A missing total is derived
// as quantity * unit price. Roles absent from `columns` use their default index.
std::optional<Item> itemFromRow(const Row& row, const ColumnMap& columns);

// Treats rows[0] as the header. A header that matches no role yields nothing.
std::vector<Item> itemsFromTable(const Table& table);

// Single-line pattern "<CODE> <DESCRIPTION> <QUANTITY> <UNIT_PRICE>", tuned to
// one invoice layout; not a general parser.
// May throw std::regex_error on pathological input.
std::vector<Item> itemsFromText(const std::string& text);

// Runs the selected strategies page by page and concatenates their items.
// Items found by both strategies appear twice; aggregation resolves them.
std::vector<Item> extractItems(const Document& document, ExtractionMethod method);

// Loads and extracts a PDF. A document that cannot be loaded yields no items.
std::vector<Item> extractItemsFromPdf(const std::string& pdfPath, ExtractionMethod method);
