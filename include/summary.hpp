#pragma once

#include "decimal.hpp"
#include "item.hpp"

#include <cstddef>
#include <vector>

struct Summary {
  size_t totalItems = 0;
  size_t matches = 0;
  size_t quantityMismatches = 0;
  size_t priceMismatches = 0;
  size_t missingItems = 0;
  size_t extraItems = 0;
  Decimal totalQuantityDifference;
  Decimal totalPriceDifference;

  size_t discrepancies() const { return totalItems - matches; }
  bool allMatched() const { return totalItems > 0 && matches == totalItems; }
};

// Counts results per status and sums the absolute differences of all results.
Summary summarize(const std::vector<ComparisonResult>& results);
