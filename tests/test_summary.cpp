#include <catch2/catch_all.hpp>

#include "reconciler.hpp"
#include "summary.hpp"

#include <vector>

namespace {

ComparisonResult makeResult(ComparisonStatus status, const char* qtyDiff, const char* priceDiff) {
  ComparisonResult r;
  r.itemCode = "X";
  r.status = status;
  r.quantityDifference = Decimal::fromString(qtyDiff);
  r.priceDifference = Decimal::fromString(priceDiff);
  return r;
}

} // namespace

TEST_CASE("summarize of no results is all zero", "[summary]") {
  Summary s = summarize({});
  REQUIRE(s.totalItems == 0);
  REQUIRE(s.matches == 0);
  REQUIRE(s.quantityMismatches == 0);
  REQUIRE(s.priceMismatches == 0);
  REQUIRE(s.missingItems == 0);
  REQUIRE(s.extraItems == 0);
  REQUIRE(s.totalQuantityDifference.isZero());
  REQUIRE(s.totalPriceDifference.isZero());
  REQUIRE_FALSE(s.allMatched());
}

TEST_CASE("summarize counts statuses and sums absolute differences", "[summary]") {
  std::vector<ComparisonResult> results = {
    makeResult(ComparisonStatus::Match, "0", "0"),
    makeResult(ComparisonStatus::QuantityMismatch, "2", "0"),
    makeResult(ComparisonStatus::PriceMismatch, "0", "-1.00"),
    makeResult(ComparisonStatus::Missing, "2", "0"),
    makeResult(ComparisonStatus::ExtraItem, "-1", "-75.00"),
  };

  Summary s = summarize(results);
  REQUIRE(s.totalItems == 5);
  REQUIRE(s.matches == 1);
  REQUIRE(s.quantityMismatches == 1);
  REQUIRE(s.priceMismatches == 1);
  REQUIRE(s.missingItems == 1);
  REQUIRE(s.extraItems == 1);
  REQUIRE(s.totalQuantityDifference == Decimal(5));
  REQUIRE(s.totalPriceDifference == Decimal::fromString("76.00"));
  REQUIRE(s.discrepancies() == 4);
  REQUIRE_FALSE(s.allMatched());
}

TEST_CASE("summarize reports a full match", "[summary]") {
  Item item;
  item.itemCode = "A";
  item.quantity = Decimal(1);
  item.unitPrice = Decimal::fromString("9.99");
  item.totalPrice = item.lineTotal();

  Summary s = summarize(reconcile({item}, {{item}}));
  REQUIRE(s.totalItems == 1);
  REQUIRE(s.allMatched());
  REQUIRE(s.discrepancies() == 0);
}
