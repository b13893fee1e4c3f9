#include <catch2/catch_all.hpp>

#include "numeric_normalizer.hpp"

#include <string>

TEST_CASE("parseDecimal handles thousands and decimal separators", "[normalizer]") {
  const Decimal expected = Decimal::fromString("1234.56");

  REQUIRE(parseDecimal("1234.56") == expected);
  REQUIRE(parseDecimal("1,234.56") == expected);
  REQUIRE(parseDecimal("1.234,56") == expected);
  REQUIRE(parseDecimal("€1,234.56") == expected);
  REQUIRE(parseDecimal("$1,234.56") == expected);
  REQUIRE(parseDecimal("1234,56") == expected);
  REQUIRE(parseDecimal("EUR 1.234.567,89") == Decimal::fromString("1234567.89"));
  REQUIRE(parseDecimal("1,234,567.89") == Decimal::fromString("1234567.89"));
}

TEST_CASE("parseDecimal returns zero for unusable text", "[normalizer]") {
  REQUIRE(parseDecimal("invalid") == Decimal());
  REQUIRE(parseDecimal("") == Decimal());
  REQUIRE(parseDecimal("-") == Decimal());
  REQUIRE(parseDecimal("1.2.3") == Decimal());
  REQUIRE(parseDecimal("12-5") == Decimal());
}

TEST_CASE("normalizeNumber flags lossy results", "[normalizer]") {
  NormalizedNumber zero = normalizeNumber("0");
  REQUIRE_FALSE(zero.lossy);
  REQUIRE(zero.value.isZero());

  NormalizedNumber empty = normalizeNumber("  ");
  REQUIRE(empty.lossy);
  REQUIRE(empty.value.isZero());

  REQUIRE(normalizeNumber("n/a").lossy);
  REQUIRE(normalizeNumber("1.2.3").lossy);

  NormalizedNumber units = normalizeNumber("10 Units");
  REQUIRE_FALSE(units.lossy);
  REQUIRE(units.value == Decimal(10));
}

TEST_CASE("normalizeNumber keeps signs and bare fractions", "[normalizer]") {
  REQUIRE(parseDecimal("-12,50 €") == Decimal::fromString("-12.5"));
  REQUIRE(parseDecimal(".5") == Decimal::fromString("0.5"));
  REQUIRE(parseDecimal("12.") == Decimal(12));
}
