#include <catch2/catch.hpp>

#include "line_items.hpp"
#include "order_columns.hpp"
#include "report_fixtures.hpp"
#include "row_reconstructor.hpp"

#include <sstream>
#include <string>
#include <vector>

using Quantities = std::vector<int>;

namespace {

const std::vector<std::string> kOrders = {"001", "002", "003"};

// Lays the whitespace-separated tokens of `line` out left to right on one row.
std::vector<PageWord> textRow(const std::string& line, double bottom) {
  std::vector<PageWord> words;
  std::istringstream in(line);
  std::string token;
  double left = 10.0;
  while (in >> token) {
    double right = left + 6.0 * static_cast<double>(token.size());
    words.push_back(word(token, left, right, bottom));
    left = right + 5.0;
  }
  return words;
}

std::vector<PageWord> textRows(const std::vector<std::string>& lines) {
  std::vector<PageWord> words;
  double bottom = 100.0;
  for (const auto& line : lines) {
    auto row = textRow(line, bottom);
    words.insert(words.end(), row.begin(), row.end());
    bottom += 20.0;
  }
  return words;
}

} // namespace

TEST_CASE("extractLineItems resolves quantities from coordinates", "[line_items]") {
  PageContent page = sampleReportPage();
  ReconstructedPage rows = reconstructRows(page.words);
  ColumnMap columns = locateOrderColumns(page.words, kOrders);

  LineItemExtraction result = extractLineItems(rows, page.text, page.words, kOrders, columns);

  REQUIRE_FALSE(result.usedFallback);
  REQUIRE(result.skippedRows == 0);
  REQUIRE(result.items.size() == 2);

  const auto& first = result.items[0];
  REQUIRE(first.partNumber == "68101-0E120-00");
  REQUIRE(first.description == std::string("GLASS SUB-ASSY BA"));
  REQUIRE(first.lotQty == 12);
  REQUIRE(first.kanbanCode == std::string("TF63"));
  REQUIRE(first.quantities == Quantities{2, 0, 5});

  const auto& second = result.items[1];
  REQUIRE(second.partNumber == "68105-0E131-00");
  REQUIRE(second.kanbanCode == std::string("TF64"));
  REQUIRE(second.quantities == Quantities{0, 3, 0});
}

TEST_CASE("extractLineItems parses quantities from text without columns", "[line_items]") {
  PageContent page = sampleReportPage();
  ReconstructedPage rows = reconstructRows(page.words);

  LineItemExtraction result = extractLineItems(rows, page.text, page.words, kOrders, ColumnMap{});

  REQUIRE(result.items.size() == 2);
  // Without geometry the blank cell collapses and "5" shifts left.
  REQUIRE(result.items[0].quantities == Quantities{2, 5, 0});
  REQUIRE(result.items[1].quantities == Quantities{3, 0, 0});
}

TEST_CASE("extractLineItems accepts rows with all quantity cells blank", "[line_items]") {
  auto words = textRows({"68101-0E120-00 GLASS BA 00012 TF63"});
  ReconstructedPage rows = reconstructRows(words);

  LineItemExtraction result = extractLineItems(rows, "", words, kOrders, ColumnMap{});

  REQUIRE(result.items.size() == 1);
  REQUIRE(result.items[0].description == std::string("GLASS BA"));
  REQUIRE(result.items[0].quantities == Quantities{0, 0, 0});
}

TEST_CASE("extractLineItems counts rows that match no pattern", "[line_items]") {
  auto words = textRows({
    "68101-0E120-00 GLASS SUB-ASSY BA 00012 TF63 2 1",
    "68105-0E131-00 12345",
    "Total 3",
  });
  ReconstructedPage rows = reconstructRows(words);

  LineItemExtraction result = extractLineItems(rows, "", words, {"001", "002"}, ColumnMap{});

  REQUIRE(result.items.size() == 1);
  REQUIRE(result.items[0].quantities == Quantities{2, 1});
  REQUIRE(result.skippedRows == 1);
  REQUIRE_FALSE(result.usedFallback);
}

TEST_CASE("extractLineItems falls back to concatenated raw text", "[line_items]") {
  const std::string raw = "Order Number 001 002 003\n68101-0E120-00 GLASS SUB-ASSY FR00045KB0012436";

  LineItemExtraction result = extractLineItems(ReconstructedPage{}, raw, {}, kOrders, ColumnMap{});

  REQUIRE(result.usedFallback);
  REQUIRE(result.items.size() == 1);
  const auto& item = result.items[0];
  REQUIRE(item.partNumber == "68101-0E120-00");
  REQUIRE(item.description == std::string("GLASS SUB-ASSY FR"));
  REQUIRE(item.lotQty == 45);
  REQUIRE(item.kanbanCode == std::string("KB0012"));
  REQUIRE(item.quantities == Quantities{4, 3, 6});
}

TEST_CASE("extractLineItems with nothing to extract", "[line_items]") {
  LineItemExtraction result = extractLineItems(ReconstructedPage{}, "no parts here", {}, kOrders, ColumnMap{});
  REQUIRE(result.items.empty());
  REQUIRE_FALSE(result.usedFallback);
}

TEST_CASE("extractConcatenatedLineItems handles a single order", "[line_items]") {
  auto items = extractConcatenatedLineItems("68101-0E120-00 GLASS SUB-ASSY FR00045FA994", 1);

  REQUIRE(items.size() == 1);
  REQUIRE(items[0].kanbanCode == std::string("FA99"));
  REQUIRE(items[0].quantities == Quantities{4});
}

TEST_CASE("extractConcatenatedLineItems keeps kanban digits when quantities run short", "[line_items]") {
  auto items = extractConcatenatedLineItems("68101-0E120-00 GLASS SUB-ASSY FR00045FA994", 3);

  REQUIRE(items.size() == 1);
  REQUIRE(items[0].kanbanCode == std::string("FA99"));
  REQUIRE(items[0].quantities == Quantities{4, 0, 0});
}

TEST_CASE("extractConcatenatedLineItems reads every part in the text", "[line_items]") {
  auto items = extractConcatenatedLineItems(
    "68101-0E120-00 GLASS FR00045KB0012436 68105-0E131-00 TRIM BA00013KB0020102", 3);

  REQUIRE(items.size() == 2);
  REQUIRE(items[0].description == std::string("GLASS FR"));
  REQUIRE(items[0].quantities == Quantities{4, 3, 6});
  REQUIRE(items[1].partNumber == "68105-0E131-00");
  REQUIRE(items[1].description == std::string("TRIM BA"));
  REQUIRE(items[1].lotQty == 13);
  REQUIRE(items[1].kanbanCode == std::string("KB0020"));
  REQUIRE(items[1].quantities == Quantities{1, 0, 2});
}

TEST_CASE("extractConcatenatedLineItems decomposes unusual rows piecewise", "[line_items]") {
  auto items = extractConcatenatedLineItems("68101-0E120-00 12 GLASS00045FA994", 2);

  REQUIRE(items.size() == 1);
  const auto& item = items[0];
  REQUIRE_FALSE(item.description.has_value());
  REQUIRE(item.lotQty == 45);
  REQUIRE(item.kanbanCode == std::string("FA994"));
  REQUIRE(item.quantities == Quantities{0, 0});
}
