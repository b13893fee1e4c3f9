#pragma once

#include <string>
#include <vector>

// Runs `command` through the shell and returns its stdout.
// Throws std::runtime_error if the pipe cannot be opened or the command fails.
std::string runCommandCaptureStdout(const std::string& command);

// Throws std::runtime_error naming poppler-utils when pdftotext is not on PATH.
void requirePdftotext();

std::string shellQuote(const std::string& arg);

// Returns the layout-preserving text of every page, in page order.
// Throws std::runtime_error on failure.
std::vector<std::string> extractPdfPageTexts(const std::string& pdfPath);
