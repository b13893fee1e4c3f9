#include "config.hpp"
#include "document.hpp"
#include "item_extractor.hpp"
#include "reconciler.hpp"
#include "report.hpp"
#include "summary.hpp"
#include "table_extractor.hpp"

#include <cstddef>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

std::vector<Item> extractDocument(const std::string& pdfPath, size_t documentIndex, const CommandLineOptions& options) {
  if (options.tablesOutDir.empty()) {
    return extractItemsFromPdf(pdfPath, options.engine.extractionMethod);
  }

  std::optional<Document> document = tryLoadPdfDocument(pdfPath);
  if (!document) return {};

  std::vector<Table> tables;
  for (const auto& page : document->pages) tables.insert(tables.end(), page.tables.begin(), page.tables.end());
  std::string outDir = tableDumpDirectory(options.tablesOutDir, documentIndex, pdfPath);
  writeTablesAsCsv(tables, outDir);
  spdlog::info("Wrote {} table(s) of '{}' to '{}'", tables.size(), pdfPath, outDir);

  return extractItems(*document, options.engine.extractionMethod);
}

} // namespace

int main(int argc, char** argv)
{
  auto logger = spdlog::stderr_color_mt("pdfrecon");
  spdlog::set_default_logger(logger);

  CommandLineOptions options;
  try {
    options = parseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
  } catch (const std::invalid_argument& ex) {
    std::cerr << "Error: " << ex.what() << "\n" << usage(argv[0]);
    return 2;
  }

  if (options.showHelp) {
    std::cout << usage(argv[0]);
    return 0;
  }

  spdlog::set_level(options.logLevel);

  std::vector<std::string> inputs = options.invoicePaths;
  inputs.insert(inputs.begin(), options.offerPath);
  for (const auto& path : inputs) {
    if (!std::filesystem::exists(path)) {
      std::cerr << "PDF not found: " << path << "\n" << usage(argv[0]);
      return 2;
    }
  }

  try {
    spdlog::info("Extraction method: {}, price tolerance: {}",
                 toString(options.engine.extractionMethod), options.engine.priceTolerance.toString());

    std::vector<Item> offerItems = extractDocument(options.offerPath, 0, options);
    spdlog::info("Found {} item(s) in offer '{}'", offerItems.size(), options.offerPath);

    std::vector<std::vector<Item>> invoiceItems;
    for (size_t i = 0; i < options.invoicePaths.size(); ++i) {
      const std::string& path = options.invoicePaths[i];
      invoiceItems.push_back(extractDocument(path, i + 1, options));
      spdlog::info("Found {} item(s) in invoice '{}'", invoiceItems.back().size(), path);
    }

    ComparisonRun run;
    run.offerPath = options.offerPath;
    run.invoicePaths = options.invoicePaths;
    run.results = reconcile(offerItems, invoiceItems, options.engine.priceTolerance);
    run.summary = summarize(run.results);
    spdlog::info("{} result(s), {} discrepancy(ies)", run.summary.totalItems, run.summary.discrepancies());

    if (options.json) {
      std::cout << formatRunJson(run);
    } else {
      printRunReport(std::cout, run);
    }

    if (!options.csvPath.empty()) {
      writeResultsCsv(run.results, options.csvPath);
      spdlog::info("Wrote results to '{}'", options.csvPath);
    }

    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
