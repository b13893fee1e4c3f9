#include "item.hpp"

const char* toString(ComparisonStatus status) {
  switch (status) {
    case ComparisonStatus::Match: return "match";
    case ComparisonStatus::QuantityMismatch: return "quantity_mismatch";
    case ComparisonStatus::PriceMismatch: return "price_mismatch";
    case ComparisonStatus::Missing: return "missing";
    case ComparisonStatus::ExtraItem: return "extra_item";
  }
  return "unknown";
}
