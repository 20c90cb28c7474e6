#pragma once

#include "parser_config.hpp"
#include "word_stream.hpp"

#include <map>
#include <string>
#include <vector>

// Part numbers look like 68101-0E120-00.
inline constexpr const char* kPartNumberPattern = "\\d{5}-[A-Z0-9]{5}-\\d{2}";

// Order number ("001") -> horizontal center of its header word.
using ColumnMap = std::map<std::string, double>;

// Finds the per-order sequence numbers printed in the table header, trying
// the clean "Order Number 001 002" layout first and progressively looser
// concatenated layouts after it. Never empty: defaults to {"001"}.
// The result is de-duplicated and sorted ascending.
std::vector<std::string> discoverOrderNumbers(const std::string& text);

// Locates the header row (average bottom of words containing "Order" or
// "Number") and records the center of each order number's header word.
// Order numbers without a header word get no entry.
ColumnMap locateOrderColumns(const std::vector<PageWord>& words,
                             const std::vector<std::string>& orderNumbers,
                             const ParserConfig& config = ParserConfig());
