#pragma once

#include "parser_config.hpp"

#include <optional>
#include <string>

// Calendar date and wall-clock time, minute resolution.
struct Timestamp {
  int year;
  int month;
  int day;
  int hour;
  int minute;

  // "YYYY-MM-DDTHH:MM:00"
  std::string toIsoString() const;

  bool operator==(const Timestamp& other) const {
    return year == other.year && month == other.month && day == other.day &&
           hour == other.hour && minute == other.minute;
  }
  bool operator!=(const Timestamp& other) const { return !(*this == other); }
};

// Returns nullopt unless the fields form a real calendar date and time.
std::optional<Timestamp> makeTimestamp(int year, int month, int day, int hour = 0, int minute = 0);

// Scalar attributes printed once per page header.
struct HeaderFields {
  std::optional<std::string> supplierName;
  std::optional<std::string> supplierCode;
  std::optional<std::string> dockCode;
  // 8-digit date-prefixed id, e.g. "20251117".
  std::optional<std::string> orderSeries;
  std::optional<Timestamp> transmitDate;
  std::optional<Timestamp> arriveDateTime;
  std::optional<Timestamp> departDateTime;
  std::optional<Timestamp> unloadDateTime;
};

std::optional<std::string> extractSupplierName(const std::string& text,
                                               const ParserConfig& config = ParserConfig());
std::optional<std::string> extractSupplierCode(const std::string& text,
                                               const ParserConfig& config = ParserConfig());
std::optional<std::string> extractDockCode(const std::string& text,
                                           const ParserConfig& config = ParserConfig());
std::optional<std::string> extractOrderSeries(const std::string& text);

std::optional<Timestamp> extractTransmitDate(const std::string& text);

// "<Label> Date M/D" plus "<Label> Time H:MM"; both must be present.
// The report omits the year, so the caller supplies it.
std::optional<Timestamp> extractArriveDateTime(const std::string& text, int year);
std::optional<Timestamp> extractDepartDateTime(const std::string& text, int year);
std::optional<Timestamp> extractUnloadDateTime(const std::string& text, int year);

HeaderFields extractHeaderFields(const std::string& text, const ParserConfig& config = ParserConfig());
