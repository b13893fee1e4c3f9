#include "config.hpp"

#include <stdexcept>
#include <string>

namespace {

bool takeValue(const std::string& arg, const std::string& prefix, std::string& value) {
  if (arg.rfind(prefix, 0) != 0) return false;
  value = arg.substr(prefix.size());
  return true;
}

spdlog::level::level_enum parseLogLevel(const std::string& text) {
  if (text == "trace") return spdlog::level::trace;
  if (text == "debug") return spdlog::level::debug;
  if (text == "info") return spdlog::level::info;
  if (text == "warn") return spdlog::level::warn;
  if (text == "error") return spdlog::level::err;
  if (text == "off") return spdlog::level::off;
  throw std::invalid_argument("unknown log level '" + text + "'");
}

} // namespace

ExtractionMethod parseExtractionMethod(const std::string& text) {
  if (text == "both") return ExtractionMethod::Both;
  if (text == "table" || text == "table-only") return ExtractionMethod::TableOnly;
  if (text == "text" || text == "text-only") return ExtractionMethod::TextOnly;
  throw std::invalid_argument("unknown extraction method '" + text + "' (expected both, table or text)");
}

const char* toString(ExtractionMethod method) {
  switch (method) {
    case ExtractionMethod::TableOnly: return "table-only";
    case ExtractionMethod::TextOnly: return "text-only";
    case ExtractionMethod::Both: return "both";
  }
  return "both";
}

Decimal parseTolerance(const std::string& text) {
  Decimal tolerance;
  try {
    tolerance = Decimal::fromString(text);
  } catch (const std::invalid_argument&) {
    throw std::invalid_argument("price tolerance must be a decimal fraction, got '" + text + "'");
  }
  if (tolerance.isNegative()) {
    throw std::invalid_argument("price tolerance must not be negative, got '" + text + "'");
  }
  return tolerance;
}

CommandLineOptions parseCommandLine(const std::vector<std::string>& args) {
  CommandLineOptions options;
  std::vector<std::string> positional;

  for (const auto& arg : args) {
    std::string value;
    if (arg == "-h" || arg == "--help") {
      options.showHelp = true;
    } else if (arg == "--json") {
      options.json = true;
    } else if (takeValue(arg, "--tolerance=", value)) {
      options.engine.priceTolerance = parseTolerance(value);
    } else if (takeValue(arg, "--method=", value)) {
      options.engine.extractionMethod = parseExtractionMethod(value);
    } else if (takeValue(arg, "--csv=", value)) {
      options.csvPath = value;
    } else if (takeValue(arg, "--dump-tables=", value)) {
      options.tablesOutDir = value;
    } else if (takeValue(arg, "--log-level=", value)) {
      options.logLevel = parseLogLevel(value);
    } else if (arg.rfind("-", 0) == 0 && arg.size() > 1) {
      throw std::invalid_argument("unknown option '" + arg + "'");
    } else {
      positional.push_back(arg);
    }
  }

  if (options.showHelp) return options;
  if (positional.size() < 2) {
    throw std::invalid_argument("an offer PDF and at least one invoice PDF are required");
  }
  options.offerPath = positional.front();
  options.invoicePaths.assign(positional.begin() + 1, positional.end());
  return options;
}

std::string usage(const std::string& program) {
  return "Usage: " + program + " [options] <offer.pdf> <invoice.pdf> [<invoice.pdf>...]\n"
         "  --tolerance=<fraction>   relative price tolerance (default 0.02)\n"
         "  --method=<both|table|text>  extraction strategies (default both)\n"
         "  --csv=<file>             write results as CSV\n"
         "  --json                   print the run as JSON\n"
         "  --dump-tables=<dir>      write recovered tables as CSV per document\n"
         "  --log-level=<level>      trace, debug, info, warn, error or off (default warn)\n"
         "  -h, --help               show this help\n";
}
