#pragma once

#include "parser_config.hpp"
#include "word_stream.hpp"

#include <string>
#include <vector>

// Words sharing one vertical bucket, left to right.
struct ReconstructedRow {
  double key;
  std::vector<PageWord> words;
  std::string text;
};

struct ReconstructedPage {
  // Top to bottom.
  std::vector<ReconstructedRow> rows;
  // Row texts joined with '\n'.
  std::string fullText;
};

// Rebuilds whitespace-delimited text rows from word bounding boxes.
ReconstructedPage reconstructRows(const std::vector<PageWord>& words,
                                  const ParserConfig& config = ParserConfig());
