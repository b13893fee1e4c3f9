#pragma once

#include "decimal.hpp"
#include "item_extractor.hpp"
#include "reconciler.hpp"

#include <string>
#include <vector>

#include <spdlog/common.h>

struct EngineConfig {
  Decimal priceTolerance = defaultPriceTolerance();
  ExtractionMethod extractionMethod = ExtractionMethod::Both;
};

struct CommandLineOptions {
  EngineConfig engine;
  std::string offerPath;
  std::vector<std::string> invoicePaths;
  std::string csvPath;
  std::string tablesOutDir;
  bool json = false;
  bool showHelp = false;
  spdlog::level::level_enum logLevel = spdlog::level::warn;
};

// Accepts "both", "table", "text", "table-only", "text-only".
// Throws std::invalid_argument otherwise.
ExtractionMethod parseExtractionMethod(const std::string& text);

const char* toString(ExtractionMethod method);

// Non-negative decimal fraction. Throws std::invalid_argument otherwise.
Decimal parseTolerance(const std::string& text);

// Parses arguments without the program name.
// Throws std::invalid_argument on unknown options, bad values, or when the
// offer or every invoice is missing (unless help was requested).
CommandLineOptions parseCommandLine(const std::vector<std::string>& args);

std::string usage(const std::string& program);
