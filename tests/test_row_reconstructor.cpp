#include <catch2/catch.hpp>

#include "report_fixtures.hpp"
#include "row_reconstructor.hpp"

TEST_CASE("reconstructRows groups words by bottom and orders them", "[rows]") {
  std::vector<PageWord> words = {
    word("world", 60, 90, 21),
    word("second", 10, 50, 40),
    word("hello", 10, 50, 19),
    word("row", 55, 80, 41),
  };

  ReconstructedPage page = reconstructRows(words);

  REQUIRE(page.rows.size() == 2);
  REQUIRE(page.rows[0].key == Catch::Detail::Approx(20.0));
  REQUIRE(page.rows[0].text == "hello world");
  REQUIRE(page.rows[0].words.size() == 2);
  REQUIRE(page.rows[1].key == Catch::Detail::Approx(40.0));
  REQUIRE(page.rows[1].text == "second row");
  REQUIRE(page.fullText == "hello world\nsecond row");
}

TEST_CASE("reconstructRows restores whitespace between touching words", "[rows]") {
  // Raw extraction of this row reads "00045FA994"; geometry keeps the tokens apart.
  std::vector<PageWord> words = {
    word("FA99", 281, 300, 50),
    word("00045", 250, 280, 50),
    word("4", 301, 306, 50),
  };
  REQUIRE(reconstructRows(words).fullText == "00045 FA99 4");
}

TEST_CASE("reconstructRows puts higher rows first when y grows upward", "[rows]") {
  ParserConfig config;
  config.yAxisUp = true;
  std::vector<PageWord> words = {
    word("bottom", 10, 50, 100),
    word("top", 10, 50, 700),
  };
  REQUIRE(reconstructRows(words, config).fullText == "top\nbottom");
}

TEST_CASE("reconstructRows honours the configured bucket size", "[rows]") {
  ParserConfig config;
  config.rowBucket = 20.0;
  std::vector<PageWord> words = {
    word("a", 10, 20, 101),
    word("b", 30, 40, 108),
  };
  REQUIRE(reconstructRows(words).rows.size() == 2);
  REQUIRE(reconstructRows(words, config).rows.size() == 1);
}

TEST_CASE("reconstructRows of no words is empty", "[rows]") {
  ReconstructedPage page = reconstructRows({});
  REQUIRE(page.rows.empty());
  REQUIRE(page.fullText.empty());
}
