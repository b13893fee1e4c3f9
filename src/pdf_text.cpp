#include "pdf_text.hpp"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace {

bool commandExists(const std::string& command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  int rc = std::system(test.c_str());
  return rc == 0;
}

} // namespace

std::string runCommandCaptureStdout(const std::string& command) {
  std::string output;

  FILE* pipe = popen(command.c_str(), "r");
  if (!pipe) {
    throw std::runtime_error("Failed to open pipe for: " + command);
  }

  char buffer[8192];
  while (true) {
    size_t n = std::fread(buffer, 1, sizeof(buffer), pipe);
    if (n > 0) output.append(buffer, n);
    if (n < sizeof(buffer)) break;
  }

  int rc = pclose(pipe);
  if (rc != 0) {
    throw std::runtime_error("Command returned non-zero exit code: " + command);
  }

  return output;
}

void requirePdftotext() {
  if (!commandExists("pdftotext")) {
    throw std::runtime_error(
      "pdftotext not found. Please install poppler-utils (e.g., apt-get install -y poppler-utils)."
    );
  }
}

std::string shellQuote(const std::string& arg) {
  std::string out = "'";
  for (char ch : arg) {
    if (ch == '\'') out += "'\\''";
    else out.push_back(ch);
  }
  out += "'";
  return out;
}

std::vector<std::string> extractPdfPageTexts(const std::string& pdfPath) {
  requirePdftotext();
  std::string text = runCommandCaptureStdout("pdftotext -layout -q " + shellQuote(pdfPath) + " -");

  // pdftotext terminates every page with a form feed.
  std::vector<std::string> pages;
  size_t start = 0;
  while (start < text.size()) {
    size_t ff = text.find('\f', start);
    if (ff == std::string::npos) {
      pages.push_back(text.substr(start));
      break;
    }
    pages.push_back(text.substr(start, ff - start));
    start = ff + 1;
  }
  return pages;
}
