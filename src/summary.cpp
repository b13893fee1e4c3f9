#include "summary.hpp"

Summary summarize(const std::vector<ComparisonResult>& results) {
  Summary summary;
  summary.totalItems = results.size();

  for (const auto& r : results) {
    switch (r.status) {
      case ComparisonStatus::Match: summary.matches++; break;
      case ComparisonStatus::QuantityMismatch: summary.quantityMismatches++; break;
      case ComparisonStatus::PriceMismatch: summary.priceMismatches++; break;
      case ComparisonStatus::Missing: summary.missingItems++; break;
      case ComparisonStatus::ExtraItem: summary.extraItems++; break;
    }
    summary.totalQuantityDifference += r.quantityDifference.abs();
    summary.totalPriceDifference += r.priceDifference.abs();
  }

  return summary;
}
