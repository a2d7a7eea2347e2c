#pragma once
#include <string>
#include <vector>

#include "paper/Models.hpp"

// Extracted text of a paper. ".pdf" files go through `pdftotext` (form feeds
// separate pages); anything else is read as UTF-8 text.
// Throws std::runtime_error on failure.
std::string loadDocumentText(const std::string& path);

std::vector<paper::RawLine> loadDocumentLines(const std::string& path);
