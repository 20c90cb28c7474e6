#pragma once

#include <optional>
#include <string>
#include <vector>

// Tunables for page parsing. The geometric tolerances are in page units and
// were tuned against the TMMI order summary report font metrics.
struct ParserConfig {
  // Words are bucketed into rows by round(bottom / rowBucket) * rowBucket.
  double rowBucket = 5.0;
  // Max vertical distance between a part-number word and its row mates.
  double rowTolerance = 5.0;
  // Max vertical distance between the "Order Number" header row and its words.
  double headerRowTolerance = 10.0;
  // Max horizontal distance between a quantity token and its column center.
  double columnTolerance = 30.0;

  // Number of leading characters searched by the last dock code fallback.
  size_t dockCodeHeaderWindow = 500;
  // Characters following a part number used by the concatenated-row fallback.
  size_t fallbackContextLength = 200;

  std::vector<std::string> knownSuppliers = {
    "AGC Automotive", "Toyota", "Denso", "Aisin", "Bridgestone"};

  // Year used for month/day-only dates. Unset means the current year.
  std::optional<int> referenceYear;
  // Take the year of month/day-only dates from the order series when present.
  bool yearFromOrderSeries = false;

  // false: origin top-left, y grows downward (pdftotext -bbox-layout).
  // true: PDF user space, y grows upward.
  bool yAxisUp = false;
};

// Applies one "--name=value" (or bare "--flag") option to the config.
// Returns false if the option is not a parser option.
// Throws std::invalid_argument if the value is malformed.
bool applyConfigOption(ParserConfig& config, const std::string& arg);

// Year for month/day-only dates given an optional order series ("20251117").
int resolveYear(const ParserConfig& config, const std::optional<std::string>& orderSeries);
