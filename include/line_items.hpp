#pragma once

#include "order_columns.hpp"
#include "parser_config.hpp"
#include "row_reconstructor.hpp"
#include "word_stream.hpp"

#include <optional>
#include <string>
#include <vector>

// One table row: a part and its build quantity for every order on the page.
struct LineItemRecord {
  std::string partNumber;
  std::optional<std::string> description;
  std::optional<int> lotQty;
  std::optional<std::string> kanbanCode;
  // quantities[i] belongs to the i-th discovered order number.
  std::vector<int> quantities;
};

struct LineItemExtraction {
  std::vector<LineItemRecord> items;
  // Rows starting with a part number that matched no row pattern.
  size_t skippedRows = 0;
  // Items came from the concatenated-text fallback.
  bool usedFallback = false;
};

// Extracts line items from a page. Rows of the reconstructed page are tried
// first; quantities come from word coordinates when `columns` is non-empty.
// If no row yields an item, the raw page text is scanned for concatenated
// rows instead (the reconstructed text when rawText is empty).
LineItemExtraction extractLineItems(const ReconstructedPage& page,
                                    const std::string& rawText,
                                    const std::vector<PageWord>& words,
                                    const std::vector<std::string>& orderNumbers,
                                    const ColumnMap& columns,
                                    const ParserConfig& config = ParserConfig());

// Concatenated layout, e.g. "68101-0E120-00 GLASS SUB-ASSY FR00045FA994".
// Pieces that cannot be isolated are left empty; quantities default to zeros.
std::vector<LineItemRecord> extractConcatenatedLineItems(const std::string& text,
                                                         size_t expectedCount,
                                                         const ParserConfig& config = ParserConfig());
