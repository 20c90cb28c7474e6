#pragma once

#include <string>
#include <vector>

// One positioned token on a page.
struct PageWord {
  std::string text;
  double left;
  double right;
  double top;
  double bottom;

  double width() const { return right - left; }
  double centerX() const { return left + width() / 2.0; }
};

// Everything the order parser needs from one page.
struct PageContent {
  int pageNumber = 0;
  // Flattened page text as produced by the page layer.
  std::string text;
  std::vector<PageWord> words;
};

// Parses `pdftotext -bbox-layout` XHTML into pages. Pages without a "number"
// attribute are numbered sequentially starting at firstPageNumber.
std::vector<PageContent> parseBboxLayout(const std::string& xhtml, int firstPageNumber = 1);

// Runs `pdftotext -bbox-layout` on the PDF and returns its pages.
// If lastPage < firstPage or lastPage == -1, processes until end.
// Throws std::runtime_error if the document cannot be opened.
std::vector<PageContent> loadPdfPages(const std::string& pdfPath,
                                      int firstPage = 1,
                                      int lastPage = -1);
