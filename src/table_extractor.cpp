#include "table_extractor.hpp"

#include "csv.hpp"
#include "pdf_text.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <regex>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace {

struct Line {
  double middle;
  std::vector<const WordBox*> words;
};

using LineIter = std::vector<Line>::const_iterator;

double centerX(const WordBox& w) { return (w.left + w.right) * 0.5; }
double centerY(const WordBox& w) { return (w.top + w.bottom) * 0.5; }

// Only the five XML entities and ASCII character references occur in bbox output.
std::string decodeEntities(const std::string& in) {
  static const std::map<std::string, char> named = {
    {"amp", '&'}, {"lt", '<'}, {"gt", '>'}, {"quot", '"'}, {"apos", '\''},
  };

  std::string out;
  out.reserve(in.size());
  size_t pos = 0;
  while (pos < in.size()) {
    size_t amp = in.find('&', pos);
    size_t semi = amp == std::string::npos ? std::string::npos : in.find(';', amp + 1);
    if (semi == std::string::npos) {
      out.append(in, pos, std::string::npos);
      break;
    }
    out.append(in, pos, amp - pos);

    std::string name = in.substr(amp + 1, semi - amp - 1);
    int decoded = -1;
    auto it = named.find(name);
    if (it != named.end()) {
      decoded = it->second;
    } else if (name.size() > 1 && name[0] == '#') {
      const bool hex = name[1] == 'x' || name[1] == 'X';
      const char* digits = name.c_str() + (hex ? 2 : 1);
      char* stop = nullptr;
      unsigned long code = std::strtoul(digits, &stop, hex ? 16 : 10);
      if (*digits != '\0' && *stop == '\0' && code <= 0x7F) decoded = static_cast<int>(code);
    }

    if (decoded < 0) {
      out.push_back('&');
      pos = amp + 1;
    } else {
      out.push_back(static_cast<char>(decoded));
      pos = semi + 1;
    }
  }
  return out;
}

// Words keyed by page; bbox output carries no page numbers, so pages are
// counted as their tags appear.
std::map<int, std::vector<WordBox>> parseWordsByPage(const std::string& xmlish) {
  static const std::regex token(
    "<page\\b[^>]*>|"
    "<word[^>]*?xMin=\"([0-9.]+)\"[^>]*?yMin=\"([0-9.]+)\"[^>]*?xMax=\"([0-9.]+)\"[^>]*?yMax=\"([0-9.]+)\"[^>]*>(.*?)</word>");

  std::map<int, std::vector<WordBox>> pages;
  int page = 0;
  for (std::sregex_iterator it(xmlish.begin(), xmlish.end(), token), end; it != end; ++it) {
    const std::smatch& m = *it;
    if (!m[1].matched) {
      ++page;
      continue;
    }
    WordBox w;
    w.left = std::stod(m[1].str());
    w.top = std::stod(m[2].str());
    w.right = std::stod(m[3].str());
    w.bottom = std::stod(m[4].str());
    w.text = decodeEntities(m[5].str());
    pages[std::max(page, 1)].push_back(std::move(w));
  }
  return pages;
}

double medianOf(std::vector<double> values) {
  if (values.empty()) return 0.0;
  auto mid = values.begin() + values.size() / 2;
  std::nth_element(values.begin(), mid, values.end());
  return *mid;
}

// Expects words sorted top to bottom. A word joins the current line while its
// vertical centre stays within 0.8 median word heights of the line's mean.
std::vector<Line> groupLines(const std::vector<WordBox>& words) {
  std::vector<double> heights;
  for (const auto& w : words) heights.push_back(w.bottom - w.top);
  const double typical = medianOf(heights);
  const double tolerance = typical > 0 ? typical * 0.8 : 6.0;

  std::vector<Line> lines;
  for (const auto& w : words) {
    const double y = centerY(w);
    if (lines.empty() || std::abs(y - lines.back().middle) > tolerance) {
      lines.push_back(Line{y, {}});
    }
    Line& line = lines.back();
    line.words.push_back(&w);
    line.middle += (y - line.middle) / static_cast<double>(line.words.size());
  }

  for (auto& line : lines) {
    std::sort(line.words.begin(), line.words.end(),
              [](const WordBox* a, const WordBox* b) { return a->left < b->left; });
  }
  return lines;
}

// Horizontal word centres closer than max(8pt, 1.2 median word widths) share a column.
std::vector<double> columnCenters(LineIter first, LineIter last) {
  std::vector<double> xs;
  std::vector<double> widths;
  for (auto line = first; line != last; ++line) {
    for (const WordBox* w : line->words) {
      xs.push_back(centerX(*w));
      widths.push_back(w->right - w->left);
    }
  }
  if (xs.empty()) return {};
  std::sort(xs.begin(), xs.end());
  const double gap = std::max(8.0, medianOf(widths) * 1.2);

  std::vector<double> centers;
  double sum = xs.front();
  size_t members = 1;
  for (size_t i = 1; i < xs.size(); ++i) {
    if (xs[i] - xs[i - 1] > gap) {
      centers.push_back(sum / static_cast<double>(members));
      sum = 0;
      members = 0;
    }
    sum += xs[i];
    ++members;
  }
  centers.push_back(sum / static_cast<double>(members));
  return centers;
}

std::vector<Row> layoutGrid(LineIter first, LineIter last, const std::vector<double>& centers) {
  std::vector<Row> grid;
  for (auto line = first; line != last; ++line) {
    Row row(centers.size());
    for (const WordBox* w : line->words) {
      const double x = centerX(*w);
      auto nearest = std::min_element(centers.begin(), centers.end(), [x](double a, double b) {
        return std::abs(x - a) < std::abs(x - b);
      });
      std::string& cell = row[static_cast<size_t>(nearest - centers.begin())];
      if (!cell.empty()) cell += ' ';
      cell += w->text;
    }
    grid.push_back(std::move(row));
  }
  return grid;
}

bool isDense(const Row& row) {
  return std::count_if(row.begin(), row.end(), [](const std::string& c) { return !c.empty(); }) >= 2;
}

} // namespace

std::vector<std::pair<size_t, size_t>> denseRowRanges(const std::vector<Row>& grid) {
  std::vector<std::pair<size_t, size_t>> ranges;
  size_t begin = 0;
  while (begin < grid.size()) {
    if (!isDense(grid[begin])) {
      ++begin;
      continue;
    }
    size_t end = begin;
    while (end < grid.size() && isDense(grid[end])) ++end;
    if (end - begin >= 2) ranges.emplace_back(begin, end);
    begin = end;
  }
  return ranges;
}

std::vector<Table> splitGridIntoTables(int pageNumber, const std::vector<Row>& grid) {
  std::vector<Table> tables;
  for (const auto& range : denseRowRanges(grid)) {
    Table table;
    table.pageNumber = pageNumber;
    table.rows.assign(grid.begin() + range.first, grid.begin() + range.second);
    tables.push_back(std::move(table));
  }
  return tables;
}

std::vector<Table> tablesFromWords(int pageNumber, std::vector<WordBox> words) {
  std::sort(words.begin(), words.end(), [](const WordBox& a, const WordBox& b) {
    if (centerY(a) == centerY(b)) return a.left < b.left;
    return centerY(a) < centerY(b);
  });

  const std::vector<Line> lines = groupLines(words);
  const std::vector<double> pageColumns = columnCenters(lines.begin(), lines.end());
  if (lines.size() < 2 || pageColumns.size() < 2) return {};

  // The page-wide grid only finds the blocks; each block gets its own columns.
  std::vector<Table> tables;
  for (const auto& range : denseRowRanges(layoutGrid(lines.begin(), lines.end(), pageColumns))) {
    const LineIter first = lines.begin() + static_cast<std::ptrdiff_t>(range.first);
    const LineIter last = lines.begin() + static_cast<std::ptrdiff_t>(range.second);
    const std::vector<double> columns = columnCenters(first, last);
    if (columns.size() < 2) continue;

    Table table;
    table.pageNumber = pageNumber;
    table.rows = layoutGrid(first, last, columns);
    tables.push_back(std::move(table));
  }
  return tables;
}

std::vector<Table> extractTablesFromPdf(const std::string& pdfPath) {
  requirePdftotext();
  std::string xmlish = runCommandCaptureStdout("pdftotext -bbox-layout -q " + shellQuote(pdfPath) + " -");

  std::vector<Table> tables;
  for (auto& page : parseWordsByPage(xmlish)) {
    const size_t wordCount = page.second.size();
    std::vector<Table> found = tablesFromWords(page.first, std::move(page.second));
    spdlog::debug("{}: page {} yielded {} table(s) from {} word(s)", pdfPath, page.first, found.size(), wordCount);
    for (auto& t : found) tables.push_back(std::move(t));
  }
  return tables;
}

void writeTablesAsCsv(const std::vector<Table>& tables, const std::string& outDir) {
  std::filesystem::create_directories(outDir);
  std::map<int, int> countPerPage;
  for (const auto& t : tables) {
    const int index = countPerPage[t.pageNumber]++;
    std::string filename = outDir + "/table_" + std::to_string(t.pageNumber) + "_" + std::to_string(index) + ".csv";
    std::ofstream ofs(filename);
    if (!ofs) throw std::runtime_error("Cannot write " + filename);
    for (const auto& r : t.rows) writeCsvRow(ofs, r);
  }
}

std::string tableDumpDirectory(const std::string& outDir, size_t documentIndex, const std::string& pdfPath) {
  std::filesystem::path dir(outDir);
  dir /= std::to_string(documentIndex) + "_" + std::filesystem::path(pdfPath).stem().string();
  return dir.string();
}
