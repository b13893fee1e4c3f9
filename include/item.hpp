#pragma once

#include "decimal.hpp"

#include <string>

// A line entry of an offer or an invoice.
struct Item {
  std::string itemCode;
  std::string description;
  Decimal quantity;
  Decimal unitPrice;
  Decimal totalPrice;

  // quantity * unitPrice, independent of the stated totalPrice.
  Decimal lineTotal() const { return quantity * unitPrice; }
};

enum class ComparisonStatus {
  Match,
  QuantityMismatch,
  PriceMismatch,
  Missing,
  ExtraItem
};

// "match", "quantity_mismatch", "price_mismatch", "missing", "extra_item"
const char* toString(ComparisonStatus status);

struct ComparisonResult {
  std::string itemCode;
  std::string description;
  Decimal offerQuantity;
  Decimal deliveredQuantity;
  Decimal offerPrice;
  Decimal invoicedPrice;
  Decimal quantityDifference; // offer - delivered
  Decimal priceDifference;    // offer - invoiced
  ComparisonStatus status = ComparisonStatus::Match;
};
