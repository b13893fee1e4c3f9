#include "numeric_normalizer.hpp"

#include <cctype>
#include <regex>
#include <string>

namespace {

std::string keepNumericChars(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char ch : text) {
    if (std::isdigit(static_cast<unsigned char>(ch)) || ch == '.' || ch == ',' || ch == '-') {
      out.push_back(ch);
    }
  }
  return out;
}

std::string removeAll(const std::string& s, char ch) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c != ch) out.push_back(c);
  }
  return out;
}

// The separator that occurs last is the decimal point; the other one groups thousands.
std::string resolveSeparators(const std::string& s) {
  const size_t lastDot = s.rfind('.');
  const size_t lastComma = s.rfind(',');
  const bool hasDot = lastDot != std::string::npos;
  const bool hasComma = lastComma != std::string::npos;

  if (hasDot && hasComma) {
    if (lastDot > lastComma) return removeAll(s, ',');
    std::string out = removeAll(s, '.');
    for (char& c : out) {
      if (c == ',') c = '.';
    }
    return out;
  }
  if (hasComma) {
    std::string out = s;
    for (char& c : out) {
      if (c == ',') c = '.';
    }
    return out;
  }
  return s;
}

bool isDecimalLiteral(const std::string& s) {
  static const std::regex literal("-?(?:[0-9]+(?:\\.[0-9]*)?|\\.[0-9]+)");
  return std::regex_match(s, literal);
}

} // namespace

NormalizedNumber normalizeNumber(const std::string& text) {
  NormalizedNumber result;
  std::string cleaned = resolveSeparators(keepNumericChars(text));
  if (!isDecimalLiteral(cleaned)) {
    result.lossy = true;
    return result;
  }
  // mpdecimal rejects a trailing point such as "12."
  if (cleaned.back() == '.') cleaned.pop_back();
  result.value = Decimal::fromString(cleaned);
  return result;
}

Decimal parseDecimal(const std::string& text) {
  return normalizeNumber(text).value;
}
