#pragma once

#include "word_stream.hpp"

#include <string>
#include <vector>

// Word with a 10 unit tall box whose bottom edge is `bottom`.
inline PageWord word(const std::string& text, double left, double right, double bottom) {
  return PageWord{text, left, right, bottom - 10.0, bottom};
}

// Word centered at `centerX`, 20 units wide.
inline PageWord centeredWord(const std::string& text, double centerX, double bottom) {
  return word(text, centerX - 10.0, centerX + 10.0, bottom);
}

// One page of an order summary report with three orders (001, 002, 003)
// whose columns are centered at x = 400, 500 and 600. The first part has a
// blank cell under 002, the second part only has a quantity under 002.
inline PageContent sampleReportPage(int pageNumber = 1) {
  PageContent page;
  page.pageNumber = pageNumber;
  page.words = {
    word("Supplier", 10, 55, 20), word("Name:", 60, 90, 20), word("AGC", 100, 125, 20),
    word("Automotive", 130, 190, 20), word("Supplier", 220, 265, 20), word("Code:", 270, 300, 20),
    word("02806", 310, 340, 20),

    word("NAMC", 10, 40, 30), word("Dock", 45, 70, 30), word("Code:", 75, 105, 30),
    word("FL", 110, 125, 30),

    word("Transmit", 10, 55, 40), word("Date", 60, 85, 40), word("2025/11/12", 90, 150, 40),

    word("Arrive", 10, 45, 50), word("Date", 50, 75, 50), word("11/14", 80, 110, 50),
    word("Arrive", 130, 165, 50), word("Time", 170, 195, 50), word("13:01", 200, 230, 50),

    word("Depart", 10, 45, 60), word("Date", 50, 75, 60), word("11/15", 80, 110, 60),
    word("Depart", 130, 165, 60), word("Time", 170, 195, 60), word("06:30", 200, 230, 60),

    word("Unload", 10, 45, 70), word("Date", 50, 75, 70), word("11/17", 80, 110, 70),
    word("Unload", 130, 165, 70), word("Time", 170, 195, 70), word("14:51", 200, 230, 70),

    word("Series", 10, 45, 80), word("20251117", 50, 100, 80),

    word("Order", 10, 40, 100), word("Number", 45, 90, 100),
    centeredWord("001", 400, 100), centeredWord("002", 500, 100), centeredWord("003", 600, 100),

    word("68101-0E120-00", 10, 90, 120), word("GLASS", 100, 130, 120), word("SUB-ASSY", 135, 185, 120),
    word("BA", 190, 200, 120), word("00012", 250, 280, 120), word("TF63", 300, 330, 120),
    centeredWord("2", 402, 120), centeredWord("5", 597, 120),

    word("68105-0E131-00", 10, 90, 141), word("GLASS", 100, 130, 141), word("SUB-ASSY", 135, 185, 141),
    word("FR", 190, 200, 141), word("00013", 250, 280, 141), word("TF64", 300, 330, 141),
    centeredWord("3", 505, 139),
  };
  for (size_t i = 0; i < page.words.size(); ++i) {
    if (i > 0) page.text += ' ';
    page.text += page.words[i].text;
  }
  return page;
}
