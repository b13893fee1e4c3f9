#pragma once

#include "item.hpp"
#include "summary.hpp"

#include <ostream>
#include <string>
#include <vector>

struct ComparisonRun {
  std::string offerPath;
  std::vector<std::string> invoicePaths;
  std::vector<ComparisonResult> results;
  Summary summary;
};

// Two decimals with thousands grouping, e.g. "1,234.50". Display only.
std::string formatAmount(const Decimal& amount);

std::string formatSummaryText(const Summary& summary);

// Multi-line description of one non-matching result.
std::string formatDiscrepancy(const ComparisonResult& result);

void printRunReport(std::ostream& out, const ComparisonRun& run);

// Decimals are written as JSON strings holding their exact value.
std::string formatRunJson(const ComparisonRun& run);

// Throws std::runtime_error if the file cannot be opened.
void writeResultsCsv(const std::vector<ComparisonResult>& results, const std::string& path);
