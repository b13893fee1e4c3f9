#include "csv.hpp"

std::string csvEscape(const std::string& cell) {
  bool needQuotes = cell.find(',') != std::string::npos || cell.find('"') != std::string::npos ||
                    cell.find('\n') != std::string::npos || cell.find('\r') != std::string::npos;
  if (!needQuotes) return cell;

  std::string escaped = "\"";
  for (char ch : cell) {
    if (ch == '"') escaped += '"';
    escaped += ch;
  }
  escaped += '"';
  return escaped;
}

void writeCsvRow(std::ostream& out, const std::vector<std::string>& row) {
  for (size_t i = 0; i < row.size(); ++i) {
    out << csvEscape(row[i]);
    if (i + 1 < row.size()) out << ',';
  }
  out << "\n";
}
