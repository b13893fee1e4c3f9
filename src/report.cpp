#include "report.hpp"

#include "csv.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

std::string fileName(const std::string& path) {
  return std::filesystem::path(path).filename().string();
}

std::string jsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (char ch : s) {
    switch (ch) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(ch));
          out += buf;
        } else {
          out.push_back(ch);
        }
    }
  }
  return out;
}

std::string quoted(const std::string& s) {
  return "\"" + jsonEscape(s) + "\"";
}

} // namespace

std::string formatAmount(const Decimal& amount) {
  const Decimal rounded = amount.rescaled(2);
  std::string text = rounded.abs().toString();
  size_t point = text.find('.');
  std::string whole = text.substr(0, point);
  std::string frac = point == std::string::npos ? "00" : text.substr(point + 1);

  std::string grouped;
  for (size_t i = 0; i < whole.size(); ++i) {
    if (i > 0 && (whole.size() - i) % 3 == 0) grouped.push_back(',');
    grouped.push_back(whole[i]);
  }
  return (rounded.isNegative() ? "-" : "") + grouped + "." + frac;
}

std::string formatSummaryText(const Summary& summary) {
  std::ostringstream out;
  out << (summary.allMatched() ? "[OK] " : "[!!] ") << "Summary\n";
  out << "  Total Items: " << summary.totalItems << "\n";
  out << "  Matches: " << summary.matches << "\n";
  if (summary.quantityMismatches > 0) {
    out << "  Quantity Mismatches: " << summary.quantityMismatches << "\n";
    out << "    Total Quantity Difference: " << summary.totalQuantityDifference << "\n";
  }
  if (summary.priceMismatches > 0) {
    out << "  Price Mismatches: " << summary.priceMismatches << "\n";
    out << "    Total Price Difference: " << formatAmount(summary.totalPriceDifference) << "\n";
  }
  if (summary.missingItems > 0) out << "  Missing Items: " << summary.missingItems << "\n";
  if (summary.extraItems > 0) out << "  Extra Items: " << summary.extraItems << "\n";
  return out.str();
}

std::string formatDiscrepancy(const ComparisonResult& result) {
  std::ostringstream out;
  out << "[" << toString(result.status) << "] " << result.itemCode;
  if (!result.description.empty()) out << " - " << result.description;
  out << "\n";

  switch (result.status) {
    case ComparisonStatus::QuantityMismatch:
      out << "  Offered: " << result.offerQuantity << "\n";
      out << "  Delivered: " << result.deliveredQuantity << "\n";
      out << "  Difference: " << result.quantityDifference.abs() << "\n";
      break;
    case ComparisonStatus::PriceMismatch:
      out << "  Offered Price: " << formatAmount(result.offerPrice) << "\n";
      out << "  Invoiced Price: " << formatAmount(result.invoicedPrice) << "\n";
      out << "  Difference: " << formatAmount(result.priceDifference.abs()) << "\n";
      break;
    case ComparisonStatus::Missing:
      out << "  Missing from invoices\n";
      out << "  Expected Quantity: " << result.offerQuantity << "\n";
      break;
    case ComparisonStatus::ExtraItem:
      out << "  Not in original offer\n";
      out << "  Delivered Quantity: " << result.deliveredQuantity << "\n";
      break;
    case ComparisonStatus::Match:
      break;
  }
  return out.str();
}

void printRunReport(std::ostream& out, const ComparisonRun& run) {
  out << "Offer:    " << fileName(run.offerPath) << "\n";
  out << "Invoices:\n";
  for (const auto& p : run.invoicePaths) out << "  - " << fileName(p) << "\n";
  out << "\n" << formatSummaryText(run.summary);

  if (run.summary.discrepancies() == 0) return;
  out << "\nDiscrepancies:\n";
  for (const auto& r : run.results) {
    if (r.status != ComparisonStatus::Match) out << formatDiscrepancy(r);
  }
}

std::string formatRunJson(const ComparisonRun& run) {
  std::ostringstream out;
  out << "{\n";
  out << "  \"offerPath\": " << quoted(run.offerPath) << ",\n";
  out << "  \"invoicePaths\": [";
  for (size_t i = 0; i < run.invoicePaths.size(); ++i) {
    out << quoted(run.invoicePaths[i]) << (i + 1 == run.invoicePaths.size() ? "" : ", ");
  }
  out << "],\n";

  const Summary& s = run.summary;
  out << "  \"summary\": {\n";
  out << "    \"totalItems\": " << s.totalItems << ",\n";
  out << "    \"matches\": " << s.matches << ",\n";
  out << "    \"quantityMismatches\": " << s.quantityMismatches << ",\n";
  out << "    \"priceMismatches\": " << s.priceMismatches << ",\n";
  out << "    \"missingItems\": " << s.missingItems << ",\n";
  out << "    \"extraItems\": " << s.extraItems << ",\n";
  out << "    \"totalQuantityDifference\": " << quoted(s.totalQuantityDifference.toString()) << ",\n";
  out << "    \"totalPriceDifference\": " << quoted(s.totalPriceDifference.toString()) << "\n";
  out << "  },\n";

  out << "  \"results\": [";
  for (size_t i = 0; i < run.results.size(); ++i) {
    const ComparisonResult& r = run.results[i];
    out << (i == 0 ? "\n" : ",\n");
    out << "    {"
        << "\"itemCode\": " << quoted(r.itemCode)
        << ", \"description\": " << quoted(r.description)
        << ", \"offerQuantity\": " << quoted(r.offerQuantity.toString())
        << ", \"deliveredQuantity\": " << quoted(r.deliveredQuantity.toString())
        << ", \"offerPrice\": " << quoted(r.offerPrice.toString())
        << ", \"invoicedPrice\": " << quoted(r.invoicedPrice.toString())
        << ", \"quantityDifference\": " << quoted(r.quantityDifference.toString())
        << ", \"priceDifference\": " << quoted(r.priceDifference.toString())
        << ", \"status\": " << quoted(toString(r.status))
        << "}";
  }
  out << (run.results.empty() ? "]\n" : "\n  ]\n");
  out << "}\n";
  return out.str();
}

void writeResultsCsv(const std::vector<ComparisonResult>& results, const std::string& path) {
  std::ofstream ofs(path);
  if (!ofs) throw std::runtime_error("Cannot write " + path);

  writeCsvRow(ofs, {"item_code", "description", "offer_quantity", "delivered_quantity", "offer_price",
                    "invoiced_price", "quantity_difference", "price_difference", "status"});
  for (const auto& r : results) {
    writeCsvRow(ofs, {r.itemCode, r.description, r.offerQuantity.toString(), r.deliveredQuantity.toString(),
                      r.offerPrice.toString(), r.invoicedPrice.toString(), r.quantityDifference.toString(),
                      r.priceDifference.toString(), toString(r.status)});
  }
}
