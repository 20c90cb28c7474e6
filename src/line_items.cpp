#include "line_items.hpp"

#include "quantities.hpp"
#include "text_utils.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cmath>
#include <regex>

namespace {

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;

struct RowFields {
  std::string description;
  std::string lotQty;
  std::string kanban;
  std::string quantities;
};

// Row patterns from most to least specific. The second one covers rows whose
// quantity cells are all blank.
std::optional<RowFields> matchRowRest(const std::string& rest) {
  struct RowPattern {
    const char* name;
    std::regex re;
    bool hasQuantities;
  };
  static const RowPattern patterns[] = {
    {"with quantities",
     std::regex("([A-Z][A-Z\\s\\-/,]+?)\\s+(\\d{5})\\s+([A-Z0-9]{2,6})\\s+([\\d\\s]+)\\s*", kIcase), true},
    {"without quantities",
     std::regex("([A-Z][A-Z\\s\\-/,]+?)\\s+(\\d{5})\\s+([A-Z0-9]{2,6})\\s*", kIcase), false},
    {"greedy description",
     std::regex("([A-Z][A-Z\\s\\-/,]+)\\s+(\\d{5})\\s+([A-Z0-9]{2,6})\\s+([\\d\\s]+)\\s*", kIcase), true},
  };

  for (const auto& p : patterns) {
    std::smatch m;
    if (!std::regex_match(rest, m, p.re)) continue;
    spdlog::debug("    Row pattern '{}' matched", p.name);
    return RowFields{trim(m[1].str()), m[2].str(), m[3].str(), p.hasQuantities ? m[4].str() : ""};
  }
  return std::nullopt;
}

std::vector<int> rowQuantities(const ReconstructedRow& row,
                               const std::string& partNumber,
                               const std::string& quantitiesText,
                               const std::vector<PageWord>& words,
                               const std::vector<std::string>& orderNumbers,
                               const ColumnMap& columns,
                               const ParserConfig& config) {
  if (columns.empty()) {
    spdlog::debug("    No order column positions available, parsing quantities from text");
    return parseSpaceSeparatedQuantities(quantitiesText, orderNumbers.size());
  }

  const PageWord* partWord = nullptr;
  for (const auto& w : row.words) {
    if (trim(w.text) == partNumber) { partWord = &w; break; }
  }
  if (!partWord) {
    spdlog::warn("    Could not find part word '{}' in row, parsing quantities from text", partNumber);
    return parseSpaceSeparatedQuantities(quantitiesText, orderNumbers.size());
  }

  std::vector<PageWord> rowWords;
  for (const auto& w : words) {
    if (std::abs(w.bottom - partWord->bottom) < config.rowTolerance) rowWords.push_back(w);
  }
  spdlog::debug("    Found {} words in part row at Y={}", rowWords.size(), partWord->bottom);
  return resolveQuantitiesByColumn(rowWords, columns, orderNumbers, config);
}

// First run of 2-6 uppercase letters/digits directly preceded by five digits.
std::optional<std::string> kanbanAfterLotQty(const std::string& context) {
  auto isDigit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };
  auto isKanbanChar = [&](char c) { return isDigit(c) || (c >= 'A' && c <= 'Z'); };
  for (size_t p = 5; p + 2 <= context.size(); ++p) {
    bool lotBefore = true;
    for (size_t k = p - 5; k < p && lotBefore; ++k) lotBefore = isDigit(context[k]);
    if (!lotBefore) continue;
    size_t len = 0;
    while (len < 6 && p + len < context.size() && isKanbanChar(context[p + len])) len++;
    if (len >= 2) return context.substr(p, len);
  }
  return std::nullopt;
}

LineItemRecord decomposePiecewise(const std::string& partNumber, const std::string& context,
                                  size_t expectedCount) {
  LineItemRecord item;
  item.partNumber = partNumber;

  std::regex descRe("^" + regexEscape(partNumber) + "\\s+([A-Z][A-Z\\s\\-/,]*?)(?=\\d{5})", kIcase);
  std::smatch dm;
  if (std::regex_search(context, dm, descRe)) {
    item.description = trim(dm[1].str());
    spdlog::debug("        Fallback: extracted description '{}'", *item.description);
  } else {
    spdlog::debug("        Fallback: failed to extract description");
  }

  static const std::regex lotRe("(\\d{5})(?=[A-Z])");
  std::smatch lm;
  if (std::regex_search(context, lm, lotRe)) {
    item.lotQty = std::stoi(lm[1].str());
    spdlog::debug("        Fallback: extracted lot qty {}", *item.lotQty);
  } else {
    spdlog::debug("        Fallback: failed to extract lot qty");
  }

  item.kanbanCode = kanbanAfterLotQty(context);
  if (item.kanbanCode) {
    spdlog::debug("        Fallback: extracted kanban '{}'", *item.kanbanCode);
    std::regex qtyRe(regexEscape(*item.kanbanCode) + "(\\d+)");
    std::smatch qm;
    if (std::regex_search(context, qm, qtyRe)) {
      item.quantities = parseConcatenatedQuantities(qm[1].str(), expectedCount);
    } else {
      spdlog::debug("        Fallback: failed to extract quantities after kanban");
    }
  } else {
    spdlog::debug("        Fallback: failed to extract kanban");
  }

  if (item.quantities.empty()) {
    item.quantities.assign(expectedCount, 0);
  }
  return item;
}

} // namespace

std::vector<LineItemRecord> extractConcatenatedLineItems(const std::string& text,
                                                         size_t expectedCount,
                                                         const ParserConfig& config) {
  static const std::regex partRe(std::string("(") + kPartNumberPattern + ")");
  static const std::regex rowRe(
    std::string("^(") + kPartNumberPattern + ")\\s+([A-Z][A-Z\\s\\-/,]*?)(\\d{5})([A-Z0-9]{2,6})(\\d+)",
    kIcase);

  std::vector<LineItemRecord> items;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), partRe); it != std::sregex_iterator(); ++it) {
    std::string partNumber = (*it)[1].str();
    size_t pos = static_cast<size_t>(it->position(0));
    std::string context = text.substr(pos, config.fallbackContextLength);
    spdlog::debug("Part {} at position {}, context [{}]", partNumber, pos, preview(context, 150));

    std::smatch m;
    if (std::regex_search(context, m, rowRe)) {
      // The kanban capture is greedy: "FA994" splits as "FA99" + "4".
      LineItemRecord item;
      item.partNumber = partNumber;
      item.description = trim(m[2].str());
      item.lotQty = std::stoi(m[3].str());
      item.kanbanCode = m[4].str();
      item.quantities = parseConcatenatedQuantities(m[5].str(), expectedCount);
      spdlog::debug("    Concatenated row matched: desc=[{}] lot={} kanban={} quantities=[{}]",
                    *item.description, *item.lotQty, *item.kanbanCode, joinInts(item.quantities));
      items.push_back(std::move(item));
      continue;
    }

    spdlog::warn("    Concatenated pattern failed for part {}, decomposing piecewise", partNumber);
    items.push_back(decomposePiecewise(partNumber, context, expectedCount));
  }
  return items;
}

LineItemExtraction extractLineItems(const ReconstructedPage& page,
                                    const std::string& rawText,
                                    const std::vector<PageWord>& words,
                                    const std::vector<std::string>& orderNumbers,
                                    const ColumnMap& columns,
                                    const ParserConfig& config) {
  static const std::regex lineRe(std::string("(") + kPartNumberPattern + ")\\s+(.+)");

  LineItemExtraction result;
  spdlog::debug("Line item extraction: {} rows, {} orders expected", page.rows.size(), orderNumbers.size());

  for (const auto& row : page.rows) {
    std::string line = trim(row.text);
    std::smatch lm;
    if (line.empty() || !std::regex_match(line, lm, lineRe)) continue;

    std::string partNumber = lm[1].str();
    std::string rest = trim(lm[2].str());
    auto fields = matchRowRest(rest);
    if (!fields) {
      result.skippedRows++;
      spdlog::warn("No row pattern matched for part {}: [{}]", partNumber, preview(rest));
      continue;
    }

    LineItemRecord item;
    item.partNumber = partNumber;
    item.description = fields->description;
    item.lotQty = std::stoi(fields->lotQty);
    item.kanbanCode = fields->kanban;
    item.quantities = rowQuantities(row, partNumber, fields->quantities, words, orderNumbers, columns, config);

    spdlog::debug("Line item: part={} desc={} lot={} kanban={} quantities=[{}]",
                  item.partNumber, fields->description, *item.lotQty, fields->kanban,
                  joinInts(item.quantities));
    result.items.push_back(std::move(item));
  }
  spdlog::debug("Clean row extraction found {} items, skipped {} rows", result.items.size(), result.skippedRows);

  if (result.items.empty()) {
    const std::string& text = rawText.empty() ? page.fullText : rawText;
    result.items = extractConcatenatedLineItems(text, orderNumbers.size(), config);
    result.usedFallback = !result.items.empty();
    if (result.usedFallback) {
      spdlog::info("Concatenated fallback found {} items", result.items.size());
    }
  }

  spdlog::info("Extracted {} line items", result.items.size());
  return result;
}
