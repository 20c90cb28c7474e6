#include "header_fields.hpp"

#include "pattern_cascade.hpp"
#include "text_utils.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdio>
#include <regex>
#include <sstream>

namespace {

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;

bool isLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
  static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && isLeapYear(year)) return 29;
  return days[month - 1];
}

std::optional<Timestamp> dateFromMatch(const std::smatch& m, const char* step) {
  int year = std::stoi(m[1].str());
  int month = std::stoi(m[2].str());
  int day = std::stoi(m[3].str());
  auto date = makeTimestamp(year, month, day);
  if (!date) {
    spdlog::warn("Invalid date extracted ({}): {}/{}/{}", step, year, month, day);
  }
  return date;
}

// First 8-digit run starting with 202 whose neighbours are not digits, nor
// a slash or dash (which would make it part of a date).
std::optional<std::string> findStandaloneSeries(const std::string& text) {
  auto isDigit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };
  for (size_t i = 0; i + 8 <= text.size(); ++i) {
    if (i > 0 && (isDigit(text[i - 1]) || text[i - 1] == '/' || text[i - 1] == '-')) continue;
    bool allDigits = true;
    for (size_t k = i; k < i + 8 && allDigits; ++k) allDigits = isDigit(text[k]);
    if (!allDigits) continue;
    if (i + 8 < text.size() && (text[i + 8] == '/' || text[i + 8] == '-')) continue;
    if (text.compare(i, 3, "202") == 0) return text.substr(i, 8);
  }
  return std::nullopt;
}

std::optional<Timestamp> extractLabeledDateTime(const std::string& text, const std::string& label,
                                                int year) {
  std::regex dateRe(label + "\\s+Date\\s+(\\d{1,2})/(\\d{1,2})", kIcase);
  std::regex timeRe(label + "\\s+Time\\s+(\\d{1,2}):(\\d{2})", kIcase);

  std::smatch dm;
  if (!std::regex_search(text, dm, dateRe)) {
    spdlog::warn("Could not extract {} date from text", label);
    return std::nullopt;
  }
  std::smatch tm;
  if (!std::regex_search(text, tm, timeRe)) {
    spdlog::warn("Could not extract {} time from text", label);
    return std::nullopt;
  }

  int month = std::stoi(dm[1].str());
  int day = std::stoi(dm[2].str());
  int hour = std::stoi(tm[1].str());
  int minute = std::stoi(tm[2].str());
  auto ts = makeTimestamp(year, month, day, hour, minute);
  if (!ts) {
    spdlog::warn("Invalid {} date/time: {}/{} {}:{}", label, month, day, hour, minute);
    return std::nullopt;
  }
  spdlog::debug("Extracted {} date/time: {}", label, ts->toIsoString());
  return ts;
}

} // namespace

std::string Timestamp::toIsoString() const {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:00", year, month, day, hour, minute);
  return buf;
}

std::optional<Timestamp> makeTimestamp(int year, int month, int day, int hour, int minute) {
  if (year < 1 || year > 9999 || month < 1 || month > 12) return std::nullopt;
  if (day < 1 || day > daysInMonth(year, month)) return std::nullopt;
  if (hour < 0 || hour > 23 || minute < 0 || minute > 59) return std::nullopt;
  return Timestamp{year, month, day, hour, minute};
}

std::optional<std::string> extractSupplierName(const std::string& text, const ParserConfig& config) {
  PatternCascade<std::string> cascade("supplier name");
  cascade
    .add("known supplier", [&config](const std::string& t) -> std::optional<std::string> {
      for (const auto& supplier : config.knownSuppliers) {
        if (containsIgnoreCase(t, supplier)) return supplier;
      }
      return std::nullopt;
    })
    .add("labeled", [](const std::string& t) -> std::optional<std::string> {
      // The name is at most 80 characters.
      static const std::regex re(
        "Supplier\\s+Name\\s*:?\\s*([A-Za-z0-9\\s&\\-\\.]{1,80}?)(?=Supplier\\s+Code|\\d{5})", kIcase);
      std::smatch m;
      if (!std::regex_search(t, m, re)) return std::nullopt;
      std::string name = trim(m[1].str());
      if (name.empty()) return std::nullopt;
      return name;
    });
  return cascade.resolve(text);
}

std::optional<std::string> extractSupplierCode(const std::string& text, const ParserConfig& config) {
  std::string names;
  for (const auto& supplier : config.knownSuppliers) {
    if (!names.empty()) names += '|';
    names += regexEscape(supplier);
  }

  PatternCascade<std::string> cascade("supplier code");
  cascade
    .add("labeled", regexCapture("Supplier\\s+Code\\s*:?\\s*(\\d{5})", 1, kIcase))
    .add("concatenated with dock", regexCapture("(\\d{5})([A-Z][A-Z0-9])"));
  if (!names.empty()) {
    cascade.add("after supplier name", regexCapture("(" + names + ")\\s*(\\d{5})", 2));
  }
  return cascade.resolve(text);
}

std::optional<std::string> extractDockCode(const std::string& text, const ParserConfig& config) {
  size_t window = config.dockCodeHeaderWindow;
  PatternCascade<std::string> cascade("dock code");
  cascade
    .add("labeled", regexCapture("NAMC\\s+Dock\\s+Code\\s*:?\\s*([A-Z][A-Z0-9])\\b", 1, kIcase))
    .add("concatenated with supplier", regexCapture("\\d{5}([A-Z][A-Z0-9])"))
    .add("header token", [window](const std::string& t) {
      return regexCapture("\\b([A-Z][A-Z0-9])\\b", 1, kIcase)(t.substr(0, window));
    });
  auto dock = cascade.resolve(text);
  if (dock) return toUpper(*dock);
  return dock;
}

std::optional<std::string> extractOrderSeries(const std::string& text) {
  PatternCascade<std::string> cascade("order series");
  cascade
    .add("labeled", regexCapture("Order\\s+Series\\s*:?\\s*(\\d{8})", 1, kIcase))
    .add("line scan", [](const std::string& t) -> std::optional<std::string> {
      static const std::regex re("\\b(202\\d{5})\\b");
      std::istringstream lines(t);
      std::string line;
      while (std::getline(lines, line)) {
        std::smatch m;
        if (!std::regex_search(line, m, re)) continue;
        size_t lastSlash = line.rfind('/');
        if (lastSlash == std::string::npos || static_cast<size_t>(m.position(1)) > lastSlash) {
          return m[1].str();
        }
      }
      return std::nullopt;
    })
    .add("standalone 8-digit", findStandaloneSeries)
    .add("after dock code", regexCapture("([A-Z][A-Z0-9])(\\d{8})", 2));
  return cascade.resolve(text);
}

std::optional<Timestamp> extractTransmitDate(const std::string& text) {
  PatternCascade<Timestamp> cascade("transmit date");
  cascade
    .add("labeled", [](const std::string& t) -> std::optional<Timestamp> {
      static const std::regex re(
        "Transmit\\s+Date\\s*:?\\s*(\\d{4})[/\\-](\\d{2})[/\\-](\\d{2})", kIcase);
      std::smatch m;
      if (!std::regex_search(t, m, re)) return std::nullopt;
      return dateFromMatch(m, "labeled");
    })
    .add("first date", [](const std::string& t) -> std::optional<Timestamp> {
      static const std::regex re("\\b(\\d{4})[/\\-](\\d{1,2})[/\\-](\\d{1,2})\\b");
      std::smatch m;
      if (!std::regex_search(t, m, re)) return std::nullopt;
      return dateFromMatch(m, "first date");
    });
  return cascade.resolve(text);
}

std::optional<Timestamp> extractArriveDateTime(const std::string& text, int year) {
  return extractLabeledDateTime(text, "Arrive", year);
}

std::optional<Timestamp> extractDepartDateTime(const std::string& text, int year) {
  return extractLabeledDateTime(text, "Depart", year);
}

std::optional<Timestamp> extractUnloadDateTime(const std::string& text, int year) {
  return extractLabeledDateTime(text, "Unload", year);
}

HeaderFields extractHeaderFields(const std::string& text, const ParserConfig& config) {
  HeaderFields header;
  header.supplierName = extractSupplierName(text, config);
  header.supplierCode = extractSupplierCode(text, config);
  header.dockCode = extractDockCode(text, config);
  header.orderSeries = extractOrderSeries(text);
  header.transmitDate = extractTransmitDate(text);

  int year = resolveYear(config, header.orderSeries);
  header.arriveDateTime = extractArriveDateTime(text, year);
  header.departDateTime = extractDepartDateTime(text, year);
  header.unloadDateTime = extractUnloadDateTime(text, year);
  return header;
}
