#include <catch2/catch.hpp>

#include "parser_config.hpp"

#include <stdexcept>

TEST_CASE("applyConfigOption sets tolerances", "[config]") {
  ParserConfig config;
  REQUIRE(applyConfigOption(config, "--row-bucket=4"));
  REQUIRE(applyConfigOption(config, "--row-tolerance=6.5"));
  REQUIRE(applyConfigOption(config, "--header-tolerance=12"));
  REQUIRE(applyConfigOption(config, "--column-tolerance=25"));

  REQUIRE(config.rowBucket == Catch::Detail::Approx(4.0));
  REQUIRE(config.rowTolerance == Catch::Detail::Approx(6.5));
  REQUIRE(config.headerRowTolerance == Catch::Detail::Approx(12.0));
  REQUIRE(config.columnTolerance == Catch::Detail::Approx(25.0));
}

TEST_CASE("applyConfigOption sets the year policy", "[config]") {
  ParserConfig config;
  REQUIRE_FALSE(config.referenceYear.has_value());
  REQUIRE(applyConfigOption(config, "--year=2024"));
  REQUIRE(config.referenceYear == 2024);
  REQUIRE(applyConfigOption(config, "--year-from-series"));
  REQUIRE(config.yearFromOrderSeries);
  REQUIRE(applyConfigOption(config, "--y-up"));
  REQUIRE(config.yAxisUp);
}

TEST_CASE("applyConfigOption ignores unrelated options", "[config]") {
  ParserConfig config;
  REQUIRE_FALSE(applyConfigOption(config, "--csv=out.csv"));
  REQUIRE_FALSE(applyConfigOption(config, "report.pdf"));
}

TEST_CASE("applyConfigOption rejects malformed values", "[config]") {
  ParserConfig config;
  REQUIRE_THROWS_AS(applyConfigOption(config, "--row-tolerance=abc"), std::invalid_argument);
  REQUIRE_THROWS_AS(applyConfigOption(config, "--column-tolerance=-1"), std::invalid_argument);
  REQUIRE_THROWS_AS(applyConfigOption(config, "--column-tolerance=5px"), std::invalid_argument);
  REQUIRE_THROWS_AS(applyConfigOption(config, "--row-bucket=0"), std::invalid_argument);
  REQUIRE_THROWS_AS(applyConfigOption(config, "--column-tolerance=nan"), std::invalid_argument);
  REQUIRE_THROWS_AS(applyConfigOption(config, "--row-tolerance=inf"), std::invalid_argument);
  REQUIRE_THROWS_AS(applyConfigOption(config, "--row-bucket=INFINITY"), std::invalid_argument);
  REQUIRE_THROWS_AS(applyConfigOption(config, "--header-tolerance=1e400"), std::invalid_argument);
  REQUIRE_THROWS_AS(applyConfigOption(config, "--year=0"), std::invalid_argument);
  REQUIRE_THROWS_AS(applyConfigOption(config, "--year="), std::invalid_argument);
}

TEST_CASE("rejected values leave the config unchanged", "[config]") {
  ParserConfig config;
  REQUIRE_THROWS_AS(applyConfigOption(config, "--column-tolerance=nan"), std::invalid_argument);
  REQUIRE(config.columnTolerance == Catch::Detail::Approx(30.0));
}

TEST_CASE("resolveYear prefers the reference year", "[config]") {
  ParserConfig config;
  config.referenceYear = 2023;
  config.yearFromOrderSeries = true;
  REQUIRE(resolveYear(config, std::string("20251117")) == 2023);

  ParserConfig fromSeries;
  fromSeries.yearFromOrderSeries = true;
  REQUIRE(resolveYear(fromSeries, std::string("20251117")) == 2025);

  ParserConfig plain;
  REQUIRE(resolveYear(plain, std::string("20251117")) >= 2024);
  REQUIRE(resolveYear(fromSeries, std::nullopt) == resolveYear(plain, std::nullopt));
}
