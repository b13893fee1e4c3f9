#include <catch2/catch_all.hpp>

#include "reconciler.hpp"

#include <string>
#include <vector>

namespace {

Item makeItem(const std::string& code, const std::string& qty, const std::string& price,
              const std::string& description = "") {
  Item item;
  item.itemCode = code;
  item.description = description.empty() ? "Item " + code : description;
  item.quantity = Decimal::fromString(qty);
  item.unitPrice = Decimal::fromString(price);
  item.totalPrice = item.lineTotal();
  return item;
}

std::vector<Item> sampleOffer() {
  return {
    makeItem("A123", "10", "15.50", "Test Item 1"),
    makeItem("B456", "5", "25.00", "Test Item 2"),
    makeItem("C789", "2", "50.00", "Test Item 3"),
  };
}

} // namespace

TEST_CASE("aggregateItems sums repeated codes and keeps the first occurrence", "[reconciler]") {
  Item first = makeItem("X", "6", "2.00", "First");
  Item second = makeItem("X", "4", "2.50", "Second");
  Item other = makeItem("Y", "1", "9.00");

  std::vector<Item> merged = aggregateItems({{first, other}, {second}});
  REQUIRE(merged.size() == 2);
  REQUIRE(merged[0].itemCode == "X");
  REQUIRE(merged[0].quantity == Decimal(10));
  REQUIRE(merged[0].totalPrice == Decimal::fromString("22.00"));
  REQUIRE(merged[0].unitPrice == Decimal::fromString("2.00"));
  REQUIRE(merged[0].description == "First");
  REQUIRE(merged[1].itemCode == "Y");

  // sources are untouched
  REQUIRE(first.quantity == Decimal(6));
}

TEST_CASE("reconcile without invoices reports every offer item missing", "[reconciler]") {
  std::vector<ComparisonResult> results = reconcile(sampleOffer(), {});
  REQUIRE(results.size() == 3);
  REQUIRE(results[0].itemCode == "A123");
  REQUIRE(results[1].itemCode == "B456");
  REQUIRE(results[2].itemCode == "C789");
  for (const auto& r : results) {
    REQUIRE(r.status == ComparisonStatus::Missing);
    REQUIRE(r.deliveredQuantity.isZero());
    REQUIRE(r.invoicedPrice.isZero());
    REQUIRE(r.quantityDifference == r.offerQuantity);
    REQUIRE(r.priceDifference.isZero());
  }
}

TEST_CASE("reconcile without an offer reports every invoice code as extra", "[reconciler]") {
  std::vector<std::vector<Item>> invoices = {
    {makeItem("D012", "1", "75.00"), makeItem("A123", "3", "15.50")},
    {makeItem("D012", "2", "75.00")},
  };
  std::vector<ComparisonResult> results = reconcile({}, invoices);
  REQUIRE(results.size() == 2);
  REQUIRE(results[0].itemCode == "D012");
  REQUIRE(results[0].status == ComparisonStatus::ExtraItem);
  REQUIRE(results[0].deliveredQuantity == Decimal(3));
  REQUIRE(results[0].quantityDifference == Decimal(-3));
  REQUIRE(results[0].priceDifference == Decimal::fromString("-75.00"));
  REQUIRE(results[0].offerQuantity.isZero());
  REQUIRE(results[0].offerPrice.isZero());
  REQUIRE(results[1].itemCode == "A123");
  REQUIRE(results[1].status == ComparisonStatus::ExtraItem);
}

TEST_CASE("reconcile matches identical documents", "[reconciler]") {
  std::vector<ComparisonResult> results = reconcile(sampleOffer(), {sampleOffer()});
  REQUIRE(results.size() == 3);
  for (const auto& r : results) {
    REQUIRE(r.status == ComparisonStatus::Match);
    REQUIRE(r.quantityDifference.isZero());
    REQUIRE(r.priceDifference.isZero());
  }
}

TEST_CASE("reconcile classifies mismatches, missing and extra items", "[reconciler]") {
  std::vector<Item> invoice = {
    makeItem("A123", "8", "15.50"),
    makeItem("B456", "5", "26.00"),
    makeItem("D012", "1", "75.00"),
  };

  std::vector<ComparisonResult> results = reconcile(sampleOffer(), {invoice}, Decimal::fromString("0.02"));
  REQUIRE(results.size() == 4);

  REQUIRE(results[0].itemCode == "A123");
  REQUIRE(results[0].status == ComparisonStatus::QuantityMismatch);
  REQUIRE(results[0].quantityDifference == Decimal(2));
  REQUIRE(results[0].priceDifference.isZero());

  REQUIRE(results[1].itemCode == "B456");
  REQUIRE(results[1].status == ComparisonStatus::PriceMismatch);
  REQUIRE(results[1].priceDifference == Decimal::fromString("-1.00"));

  REQUIRE(results[2].itemCode == "C789");
  REQUIRE(results[2].status == ComparisonStatus::Missing);

  REQUIRE(results[3].itemCode == "D012");
  REQUIRE(results[3].status == ComparisonStatus::ExtraItem);
}

TEST_CASE("quantity mismatch takes priority over price mismatch", "[reconciler]") {
  std::vector<ComparisonResult> results =
    reconcile({makeItem("A", "10", "10.00")}, {{makeItem("A", "9", "20.00")}});
  REQUIRE(results.size() == 1);
  REQUIRE(results[0].status == ComparisonStatus::QuantityMismatch);
  REQUIRE(results[0].priceDifference == Decimal::fromString("-10.00"));
}

TEST_CASE("price tolerance boundary is exclusive", "[reconciler]") {
  const Decimal tolerance = Decimal::fromString("0.02");
  std::vector<Item> offer = {makeItem("B456", "5", "25.00")};

  SECTION("ratio equal to tolerance matches") {
    auto results = reconcile(offer, {{makeItem("B456", "5", "25.50")}}, tolerance);
    REQUIRE(results[0].status == ComparisonStatus::Match);
    REQUIRE(results[0].priceDifference == Decimal::fromString("-0.50"));
  }
  SECTION("cheaper by exactly the tolerance matches") {
    auto results = reconcile(offer, {{makeItem("B456", "5", "24.50")}}, tolerance);
    REQUIRE(results[0].status == ComparisonStatus::Match);
  }
  SECTION("one cent above tolerance is a mismatch") {
    auto results = reconcile(offer, {{makeItem("B456", "5", "25.51")}}, tolerance);
    REQUIRE(results[0].status == ComparisonStatus::PriceMismatch);
  }
  SECTION("a wider tolerance accepts the same price") {
    auto results = reconcile(offer, {{makeItem("B456", "5", "26.00")}}, Decimal::fromString("0.05"));
    REQUIRE(results[0].status == ComparisonStatus::Match);
  }
}

TEST_CASE("zero offer price never yields a price mismatch", "[reconciler]") {
  auto results = reconcile({makeItem("FREE", "1", "0")}, {{makeItem("FREE", "1", "12.00")}});
  REQUIRE(results.size() == 1);
  REQUIRE(results[0].status == ComparisonStatus::Match);
  REQUIRE(results[0].priceDifference == Decimal::fromString("-12.00"));
}

TEST_CASE("partial deliveries across invoices add up", "[reconciler]") {
  std::vector<ComparisonResult> results = reconcile(
    {makeItem("X", "10", "3.00")},
    {{makeItem("X", "6", "3.00")}, {makeItem("X", "4", "3.00")}});
  REQUIRE(results.size() == 1);
  REQUIRE(results[0].deliveredQuantity == Decimal(10));
  REQUIRE(results[0].status == ComparisonStatus::Match);
}

TEST_CASE("duplicate offer rows collapse into one result", "[reconciler]") {
  std::vector<Item> offer = {makeItem("A", "2", "5.00"), makeItem("B", "1", "1.00"), makeItem("A", "2", "5.00")};
  std::vector<ComparisonResult> results = reconcile(offer, {{makeItem("A", "4", "5.00")}});
  REQUIRE(results.size() == 2);
  REQUIRE(results[0].itemCode == "A");
  REQUIRE(results[0].offerQuantity == Decimal(4));
  REQUIRE(results[0].status == ComparisonStatus::Match);
  REQUIRE(results[1].itemCode == "B");
  REQUIRE(results[1].status == ComparisonStatus::Missing);
}

TEST_CASE("item codes are case sensitive", "[reconciler]") {
  auto results = reconcile({makeItem("abc", "1", "1")}, {{makeItem("ABC", "1", "1")}});
  REQUIRE(results.size() == 2);
  REQUIRE(results[0].status == ComparisonStatus::Missing);
  REQUIRE(results[1].status == ComparisonStatus::ExtraItem);
}

TEST_CASE("reconcile output is stable for identical inputs", "[reconciler]") {
  std::vector<std::vector<Item>> invoices = {
    {makeItem("Z9", "1", "1.00"), makeItem("A123", "10", "15.50")},
    {makeItem("M5", "2", "3.00")},
  };
  auto first = reconcile(sampleOffer(), invoices);
  auto second = reconcile(sampleOffer(), invoices);
  REQUIRE(first.size() == second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    REQUIRE(first[i].itemCode == second[i].itemCode);
    REQUIRE(first[i].status == second[i].status);
  }
  REQUIRE(first[3].itemCode == "Z9");
  REQUIRE(first[4].itemCode == "M5");
}
