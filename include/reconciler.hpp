#pragma once

#include "decimal.hpp"
#include "item.hpp"

#include <vector>

// 0.02, i.e. 2 % relative price deviation.
Decimal defaultPriceTolerance();

// Merges items sharing an item code across all lists: quantities and totals are
// summed, unit price and description come from the first occurrence. The
// result is ordered by first appearance.
std::vector<Item> aggregateItems(const std::vector<std::vector<Item>>& itemLists);

// Compares offer items against the aggregated invoice items.
// Results hold one entry per distinct item code: offer codes first in offer
// order, then invoice-only codes in order of first appearance.
// A pure function; safe to call concurrently.
std::vector<ComparisonResult> reconcile(const std::vector<Item>& offerItems,
                                        const std::vector<std::vector<Item>>& invoiceItemLists,
                                        const Decimal& priceTolerance = defaultPriceTolerance());
