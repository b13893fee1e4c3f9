#pragma once

#include "decimal.hpp"

#include <string>

// Result of normalizing a free-form number. `lossy` is set when the text held
// no usable number (empty, no digits, malformed); `value` is then zero.
struct NormalizedNumber {
  Decimal value;
  bool lossy = false;
};

// Strips currency symbols and other noise, resolves thousands/decimal
// separators and parses the rest. Never throws.
//   "1,234.56", "1.234,56", "€1,234.56" -> 1234.56
//   "1234,56" -> 1234.56
NormalizedNumber normalizeNumber(const std::string& text);

// normalizeNumber(text).value
Decimal parseDecimal(const std::string& text);
