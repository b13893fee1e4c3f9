#include "item_extractor.hpp"

#include "numeric_normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <string>

#include <spdlog/spdlog.h>

namespace {

std::string trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string cellAt(const Row& row, size_t index) {
  return index < row.size() ? trim(row[index]) : std::string();
}

size_t columnFor(ColumnRole role, const ColumnMap& columns) {
  auto it = columns.find(role);
  if (it != columns.end()) return it->second;
  for (const auto& rule : columnVocabulary()) {
    if (rule.role == role) return rule.defaultIndex;
  }
  return 0;
}

} // namespace

const std::vector<ColumnRule>& columnVocabulary() {
  static const std::vector<ColumnRule> vocabulary = {
    {ColumnRole::ItemCode, {"item", "code", "article"}, 0},
    {ColumnRole::Description, {"desc", "description", "product"}, 1},
    {ColumnRole::Quantity, {"qty", "quantity", "amount"}, 2},
    {ColumnRole::UnitPrice, {"price", "unit"}, 3},
    {ColumnRole::TotalPrice, {"total", "sum"}, 4},
  };
  return vocabulary;
}

ColumnMap identifyColumns(const Row& header) {
  ColumnMap columns;
  for (size_t i = 0; i < header.size(); ++i) {
    std::string cell = toLower(header[i]);
    for (const auto& rule : columnVocabulary()) {
      bool hit = std::any_of(rule.keywords.begin(), rule.keywords.end(),
                             [&cell](const std::string& kw) { return cell.find(kw) != std::string::npos; });
      if (hit) {
        columns[rule.role] = i;
        break;
      }
    }
  }
  return columns;
}

std::optional<Item> itemFromRow(const Row& row, const ColumnMap& columns) {
  std::string code = cellAt(row, columnFor(ColumnRole::ItemCode, columns));
  if (code.empty()) return std::nullopt;

  NormalizedNumber quantity = normalizeNumber(cellAt(row, columnFor(ColumnRole::Quantity, columns)));
  NormalizedNumber unitPrice = normalizeNumber(cellAt(row, columnFor(ColumnRole::UnitPrice, columns)));
  if (quantity.lossy || unitPrice.lossy) return std::nullopt;

  NormalizedNumber total = normalizeNumber(cellAt(row, columnFor(ColumnRole::TotalPrice, columns)));

  Item item;
  item.itemCode = code;
  item.description = cellAt(row, columnFor(ColumnRole::Description, columns));
  item.quantity = quantity.value;
  item.unitPrice = unitPrice.value;
  item.totalPrice = total.lossy ? item.lineTotal() : total.value;
  return item;
}

std::vector<Item> itemsFromTable(const Table& table) {
  std::vector<Item> items;
  if (table.rows.empty()) return items;

  ColumnMap columns = identifyColumns(table.rows.front());
  if (columns.empty()) {
    spdlog::debug("Page {}: table header matches no item column, skipped", table.pageNumber);
    return items;
  }

  for (size_t r = 1; r < table.rows.size(); ++r) {
    std::optional<Item> item = itemFromRow(table.rows[r], columns);
    if (item) items.push_back(std::move(*item));
  }
  return items;
}

std::vector<Item> itemsFromText(const std::string& text) {
  static const std::regex itemLine(
    "([A-Z0-9-]+)[ \\t]+"
    "([^0-9\\n]+)[ \\t]+"
    "([0-9]+(?:\\.[0-9]+)?)[ \\t]+"
    "([0-9]+(?:\\.[0-9]+)?)");

  std::vector<Item> items;
  auto begin = std::sregex_iterator(text.begin(), text.end(), itemLine);
  auto end = std::sregex_iterator();
  for (auto it = begin; it != end; ++it) {
    const std::smatch& m = *it;
    Item item;
    item.itemCode = m[1].str();
    item.description = trim(m[2].str());
    item.quantity = Decimal::fromString(m[3].str());
    item.unitPrice = Decimal::fromString(m[4].str());
    item.totalPrice = item.lineTotal();
    items.push_back(std::move(item));
  }
  return items;
}

std::vector<Item> extractItems(const Document& document, ExtractionMethod method) {
  const bool useTables = method != ExtractionMethod::TextOnly;
  const bool useText = method != ExtractionMethod::TableOnly;

  std::vector<Item> items;
  for (const auto& page : document.pages) {
    if (useTables) {
      for (const auto& table : page.tables) {
        std::vector<Item> found = itemsFromTable(table);
        items.insert(items.end(), found.begin(), found.end());
      }
    }
    if (useText) {
      try {
        std::vector<Item> found = itemsFromText(page.text);
        items.insert(items.end(), found.begin(), found.end());
      } catch (const std::regex_error& ex) {
        spdlog::warn("{}: page {} text skipped: {}", document.path, page.number, ex.what());
      }
    }
  }

  spdlog::debug("{}: extracted {} item(s) from {} page(s)", document.path, items.size(), document.pages.size());
  return items;
}

std::vector<Item> extractItemsFromPdf(const std::string& pdfPath, ExtractionMethod method) {
  std::optional<Document> document = tryLoadPdfDocument(pdfPath);
  if (!document) return {};
  return extractItems(*document, method);
}
