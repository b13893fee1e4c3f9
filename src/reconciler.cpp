#include "reconciler.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>

namespace {

ComparisonStatus classify(const Decimal& quantityDifference,
                          const Decimal& priceDifference,
                          const Decimal& offerPrice,
                          const Decimal& tolerance) {
  if (!quantityDifference.isZero()) return ComparisonStatus::QuantityMismatch;
  // |diff / offer| > tolerance, multiplied through by |offer| to stay exact.
  // A zero offer price cannot produce a price mismatch.
  if (!offerPrice.isZero() && priceDifference.abs() > tolerance * offerPrice.abs()) {
    return ComparisonStatus::PriceMismatch;
  }
  return ComparisonStatus::Match;
}

} // namespace

Decimal defaultPriceTolerance() {
  return Decimal::fromString("0.02");
}

std::vector<Item> aggregateItems(const std::vector<std::vector<Item>>& itemLists) {
  std::vector<Item> merged;
  std::unordered_map<std::string, size_t> indexByCode;

  for (const auto& list : itemLists) {
    for (const auto& item : list) {
      auto it = indexByCode.find(item.itemCode);
      if (it == indexByCode.end()) {
        indexByCode.emplace(item.itemCode, merged.size());
        merged.push_back(item);
        continue;
      }
      Item& existing = merged[it->second];
      existing.quantity += item.quantity;
      existing.totalPrice += item.totalPrice;
    }
  }
  return merged;
}

std::vector<ComparisonResult> reconcile(const std::vector<Item>& offerItems,
                                        const std::vector<std::vector<Item>>& invoiceItemLists,
                                        const Decimal& priceTolerance) {
  const std::vector<Item> offer = aggregateItems({offerItems});
  const std::vector<Item> delivered = aggregateItems(invoiceItemLists);

  std::unordered_map<std::string, const Item*> deliveredByCode;
  for (const auto& item : delivered) deliveredByCode.emplace(item.itemCode, &item);

  std::vector<ComparisonResult> results;
  results.reserve(offer.size() + delivered.size());
  std::unordered_set<std::string> offerCodes;

  for (const auto& offered : offer) {
    offerCodes.insert(offered.itemCode);

    ComparisonResult r;
    r.itemCode = offered.itemCode;
    r.description = offered.description;
    r.offerQuantity = offered.quantity;
    r.offerPrice = offered.unitPrice;

    auto it = deliveredByCode.find(offered.itemCode);
    if (it == deliveredByCode.end()) {
      r.quantityDifference = offered.quantity;
      r.status = ComparisonStatus::Missing;
      results.push_back(r);
      continue;
    }

    const Item& invoiced = *it->second;
    r.deliveredQuantity = invoiced.quantity;
    r.invoicedPrice = invoiced.unitPrice;
    r.quantityDifference = offered.quantity - invoiced.quantity;
    r.priceDifference = offered.unitPrice - invoiced.unitPrice;
    r.status = classify(r.quantityDifference, r.priceDifference, offered.unitPrice, priceTolerance);
    results.push_back(r);
  }

  for (const auto& invoiced : delivered) {
    if (offerCodes.count(invoiced.itemCode)) continue;

    ComparisonResult r;
    r.itemCode = invoiced.itemCode;
    r.description = invoiced.description;
    r.deliveredQuantity = invoiced.quantity;
    r.invoicedPrice = invoiced.unitPrice;
    r.quantityDifference = -invoiced.quantity;
    r.priceDifference = -invoiced.unitPrice;
    r.status = ComparisonStatus::ExtraItem;
    results.push_back(r);
  }

  return results;
}
