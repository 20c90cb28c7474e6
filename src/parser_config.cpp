#include "parser_config.hpp"

#include <chrono>
#include <cmath>
#include <ctime>
#include <stdexcept>
#include <string>

namespace {

double parseNumber(const std::string& name, const std::string& value) {
  size_t used = 0;
  double v = 0.0;
  try {
    v = std::stod(value, &used);
  } catch (const std::logic_error&) {
    throw std::invalid_argument("Invalid value for " + name + ": '" + value + "'");
  }
  if (used != value.size() || !std::isfinite(v) || v < 0.0) {
    throw std::invalid_argument("Invalid value for " + name + ": '" + value + "'");
  }
  return v;
}

int parseYear(const std::string& value) {
  size_t used = 0;
  int year = 0;
  try {
    year = std::stoi(value, &used);
  } catch (const std::logic_error&) {
    throw std::invalid_argument("Invalid value for --year: '" + value + "'");
  }
  if (used != value.size() || year < 1 || year > 9999) {
    throw std::invalid_argument("Invalid value for --year: '" + value + "'");
  }
  return year;
}

int currentYear() {
  std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
  localtime_r(&now, &local);
  return local.tm_year + 1900;
}

} // namespace

bool applyConfigOption(ParserConfig& config, const std::string& arg) {
  auto valueOf = [&](const std::string& prefix, std::string& out) {
    if (arg.rfind(prefix, 0) != 0) return false;
    out = arg.substr(prefix.size());
    return true;
  };

  std::string value;
  if (valueOf("--row-bucket=", value)) {
    config.rowBucket = parseNumber("--row-bucket", value);
    if (config.rowBucket == 0.0) throw std::invalid_argument("--row-bucket must be positive");
  } else if (valueOf("--row-tolerance=", value)) {
    config.rowTolerance = parseNumber("--row-tolerance", value);
  } else if (valueOf("--header-tolerance=", value)) {
    config.headerRowTolerance = parseNumber("--header-tolerance", value);
  } else if (valueOf("--column-tolerance=", value)) {
    config.columnTolerance = parseNumber("--column-tolerance", value);
  } else if (valueOf("--year=", value)) {
    config.referenceYear = parseYear(value);
  } else if (arg == "--year-from-series") {
    config.yearFromOrderSeries = true;
  } else if (arg == "--y-up") {
    config.yAxisUp = true;
  } else {
    return false;
  }
  return true;
}

int resolveYear(const ParserConfig& config, const std::optional<std::string>& orderSeries) {
  if (config.referenceYear) return *config.referenceYear;
  if (config.yearFromOrderSeries && orderSeries && orderSeries->size() >= 4) {
    return std::stoi(orderSeries->substr(0, 4));
  }
  return currentYear();
}
