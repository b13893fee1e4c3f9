#pragma once

#include <ostream>
#include <string>
#include <vector>

// Quotes a cell when it contains a comma, quote or line break; doubles embedded quotes.
std::string csvEscape(const std::string& cell);

void writeCsvRow(std::ostream& out, const std::vector<std::string>& row);
