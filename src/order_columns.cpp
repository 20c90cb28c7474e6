#include "order_columns.hpp"

#include "text_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <regex>
#include <set>
#include <sstream>

namespace {

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;

bool inOrderRange(const std::string& num) {
  int n = std::stoi(num);
  return n >= 1 && n <= 999;
}

std::vector<std::string> fromLabeledRun(const std::string& text) {
  static const std::regex labelRe("Order\\s+Number\\s+((?:\\d{3}[ \\t]*)+)", kIcase);
  static const std::regex numRe("\\d{3}");
  std::vector<std::string> found;
  std::smatch m;
  if (!std::regex_search(text, m, labelRe)) return found;
  std::string run = m[1].str();
  spdlog::debug("Found order numbers string: '{}'", trim(run));
  for (auto it = std::sregex_iterator(run.begin(), run.end(), numRe); it != std::sregex_iterator(); ++it) {
    found.push_back(it->str());
  }
  return found;
}

std::vector<std::string> fromLabeledLine(const std::string& text) {
  static const std::regex numRe("\\b(\\d{3})\\b");
  std::vector<std::string> found;
  std::istringstream lines(text);
  std::string line;
  while (std::getline(lines, line)) {
    if (!containsIgnoreCase(line, "Order Number")) continue;
    spdlog::debug("Found Order Number line: '{}'", preview(line));
    for (auto it = std::sregex_iterator(line.begin(), line.end(), numRe); it != std::sregex_iterator(); ++it) {
      std::string num = (*it)[1].str();
      if (inOrderRange(num)) found.push_back(num);
    }
    break;
  }
  return found;
}

std::vector<std::string> beforePartNumber(const std::string& text) {
  static const std::regex re(std::string("(\\d{3})(?=") + kPartNumberPattern + ")");
  std::smatch m;
  if (!std::regex_search(text, m, re)) return {};
  spdlog::debug("Found order number (before part): {}", m[1].str());
  return {m[1].str()};
}

std::vector<std::string> betweenSeriesAndPart(const std::string& text) {
  static const std::regex seriesRe("(202\\d{5})");
  static const std::regex partRe(kPartNumberPattern);
  static const std::regex tailRe("(\\d{3})(?=\\d{5}-|\\s*$)");
  std::smatch sm;
  if (!std::regex_search(text, sm, seriesRe)) return {};
  size_t start = static_cast<size_t>(sm.position(0) + sm.length(0));
  std::string rest = text.substr(start);
  std::smatch pm;
  if (!std::regex_search(rest, pm, partRe)) return {};
  std::string section = rest.substr(0, static_cast<size_t>(pm.position(0)));
  spdlog::debug("Searching for order numbers in section: {}", preview(section));
  std::smatch om;
  if (!std::regex_search(section, om, tailRe) || !inOrderRange(om[1].str())) return {};
  return {om[1].str()};
}

std::vector<std::string> precedingFirstPart(const std::string& text) {
  static const std::regex partRe(kPartNumberPattern);
  static const std::regex numRe("(\\d{3})(?!\\d)");
  std::smatch pm;
  if (!std::regex_search(text, pm, partRe) || pm.position(0) < 3) return {};
  size_t idx = static_cast<size_t>(pm.position(0));
  size_t from = idx > 10 ? idx - 10 : 0;
  std::string beforePart = text.substr(from, idx - from);
  spdlog::debug("Text before first part number: '{}'", beforePart);
  std::smatch om;
  if (!std::regex_search(beforePart, om, numRe) || !inOrderRange(om[1].str())) return {};
  return {om[1].str()};
}

} // namespace

std::vector<std::string> discoverOrderNumbers(const std::string& text) {
  using Step = std::vector<std::string> (*)(const std::string&);
  static const std::pair<const char*, Step> steps[] = {
    {"labeled run", fromLabeledRun},
    {"labeled line", fromLabeledLine},
    {"before part number", beforePartNumber},
    {"between series and part number", betweenSeriesAndPart},
    {"preceding first part number", precedingFirstPart},
  };

  std::vector<std::string> found;
  for (const auto& step : steps) {
    found = step.second(text);
    if (!found.empty()) {
      spdlog::debug("Order numbers found by step '{}'", step.first);
      break;
    }
  }
  if (found.empty()) {
    spdlog::warn("No order numbers found, defaulting to '001'");
    found.push_back("001");
  }

  std::set<std::string> unique(found.begin(), found.end());
  std::vector<std::string> result(unique.begin(), unique.end());
  spdlog::info("Extracted {} order numbers: {}", result.size(), joinStrings(result, ", "));
  return result;
}

ColumnMap locateOrderColumns(const std::vector<PageWord>& words,
                             const std::vector<std::string>& orderNumbers,
                             const ParserConfig& config) {
  ColumnMap positions;
  if (words.empty() || orderNumbers.empty()) {
    spdlog::warn("Cannot extract order positions: words or order numbers are empty");
    return positions;
  }

  double sum = 0.0;
  int count = 0;
  for (const auto& w : words) {
    if (containsIgnoreCase(w.text, "Order") || containsIgnoreCase(w.text, "Number")) {
      sum += w.bottom;
      count++;
    }
  }
  if (count == 0) {
    spdlog::warn("Could not find 'Order Number' header words");
    return positions;
  }
  double headerY = sum / count;
  spdlog::debug("Order Number header row Y position: {}", headerY);

  std::vector<const PageWord*> headerRow;
  for (const auto& w : words) {
    if (std::abs(w.bottom - headerY) < config.headerRowTolerance) headerRow.push_back(&w);
  }
  std::stable_sort(headerRow.begin(), headerRow.end(),
                   [](const PageWord* a, const PageWord* b) { return a->left < b->left; });

  for (const auto& orderNum : orderNumbers) {
    auto it = std::find_if(headerRow.begin(), headerRow.end(),
                           [&](const PageWord* w) { return trim(w->text) == orderNum; });
    if (it == headerRow.end()) {
      spdlog::warn("Could not find word for order number {} in header row", orderNum);
      continue;
    }
    positions[orderNum] = (*it)->centerX();
    spdlog::debug("Order {} column position: X={} (left={}, right={})",
                  orderNum, (*it)->centerX(), (*it)->left, (*it)->right);
  }

  spdlog::info("Extracted {} order column positions", positions.size());
  return positions;
}
