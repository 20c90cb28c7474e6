#pragma once

#include "order_columns.hpp"
#include "parser_config.hpp"
#include "word_stream.hpp"

#include <string>
#include <vector>

// True for a non-empty token made only of ASCII digits (after trimming).
bool isNumericToken(const std::string& text);

// Maps the numeric tokens of one table row onto order columns. For each
// order number, in the given order, the numeric token whose center is
// nearest the column center (within config.columnTolerance) supplies the
// quantity. No token near a column is a blank cell and yields 0, as does an
// order number that has no column. The result has one entry per order number.
std::vector<int> resolveQuantitiesByColumn(const std::vector<PageWord>& rowWords,
                                           const ColumnMap& columns,
                                           const std::vector<std::string>& orderNumbers,
                                           const ParserConfig& config = ParserConfig());

// "2 1" -> {2, 1}. Padded with zeros or truncated to expectedCount.
std::vector<int> parseSpaceSeparatedQuantities(const std::string& quantities, size_t expectedCount);

// Legacy layout where per-order digits run together:
//   "436", 3 expected -> {4, 3, 6}
//   "436", 1 expected -> {436}
//   otherwise the leading digits one per order, zero-padded.
std::vector<int> parseConcatenatedQuantities(const std::string& digits, size_t expectedCount);
