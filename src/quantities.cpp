#include "quantities.hpp"

#include "text_utils.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cmath>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace {

std::optional<int> parseQuantity(const std::string& token) {
  std::string t = trim(token);
  if (t.empty()) return std::nullopt;
  for (char ch : t) {
    if (!std::isdigit(static_cast<unsigned char>(ch))) return std::nullopt;
  }
  try {
    return std::stoi(t);
  } catch (const std::out_of_range&) {
    spdlog::warn("Quantity '{}' is out of range, ignoring", t);
    return std::nullopt;
  }
}

} // namespace

bool isNumericToken(const std::string& text) {
  return parseQuantity(text).has_value();
}

std::vector<int> resolveQuantitiesByColumn(const std::vector<PageWord>& rowWords,
                                           const ColumnMap& columns,
                                           const std::vector<std::string>& orderNumbers,
                                           const ParserConfig& config) {
  std::vector<int> quantities;
  quantities.reserve(orderNumbers.size());

  for (const auto& orderNum : orderNumbers) {
    auto col = columns.find(orderNum);
    if (col == columns.end()) {
      spdlog::warn("Order {}: column position not found, defaulting to 0", orderNum);
      quantities.push_back(0);
      continue;
    }

    double columnX = col->second;
    std::optional<int> best;
    double bestDist = 0.0;
    for (const auto& w : rowWords) {
      auto qty = parseQuantity(w.text);
      if (!qty) continue;
      double dist = std::abs(w.centerX() - columnX);
      if (dist > config.columnTolerance) continue;
      if (!best || dist < bestDist) {
        best = qty;
        bestDist = dist;
      }
    }

    if (best) {
      spdlog::debug("Order {} (X={}): found quantity {}", orderNum, columnX, *best);
      quantities.push_back(*best);
    } else {
      spdlog::debug("Order {} (X={}): blank cell, defaulting to 0", orderNum, columnX);
      quantities.push_back(0);
    }
  }

  spdlog::debug("Extracted quantities using coordinates: [{}]", joinInts(quantities));
  return quantities;
}

std::vector<int> parseSpaceSeparatedQuantities(const std::string& quantities, size_t expectedCount) {
  std::vector<int> out;
  std::istringstream in(quantities);
  std::string token;
  while (in >> token) {
    if (auto qty = parseQuantity(token)) out.push_back(*qty);
  }
  out.resize(expectedCount, 0);
  return out;
}

std::vector<int> parseConcatenatedQuantities(const std::string& digits, size_t expectedCount) {
  std::vector<int> out;
  if (digits.empty()) {
    return std::vector<int>(expectedCount, 0);
  }

  auto appendDigits = [&](size_t limit) {
    for (size_t i = 0; i < limit && i < digits.size(); ++i) {
      if (std::isdigit(static_cast<unsigned char>(digits[i]))) out.push_back(digits[i] - '0');
    }
  };

  if (digits.size() == expectedCount) {
    appendDigits(digits.size());
  } else if (expectedCount == 1) {
    if (auto qty = parseQuantity(digits)) out.push_back(*qty);
  } else if (digits.size() > expectedCount) {
    appendDigits(expectedCount);
  } else {
    appendDigits(digits.size());
  }

  out.resize(expectedCount, 0);
  return out;
}
