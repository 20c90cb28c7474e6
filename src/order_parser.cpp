#include "order_parser.hpp"

#include "header_fields.hpp"
#include "line_items.hpp"
#include "order_columns.hpp"
#include "row_reconstructor.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <exception>
#include <iterator>
#include <stdexcept>

namespace {

void checkWordGeometry(const PageContent& page) {
  for (const auto& w : page.words) {
    if (!std::isfinite(w.left) || !std::isfinite(w.right) ||
        !std::isfinite(w.top) || !std::isfinite(w.bottom)) {
      throw std::invalid_argument("Page " + std::to_string(page.pageNumber) + ": word '" + w.text +
                                  "' has a non-finite bounding box");
    }
  }
}

} // namespace

std::vector<ExtractedOrder> parsePage(const PageContent& page, const ParserConfig& config) {
  spdlog::info("Processing page {} ({} words)", page.pageNumber, page.words.size());
  checkWordGeometry(page);

  ReconstructedPage rows = reconstructRows(page.words, config);
  const std::string& text = rows.fullText.empty() ? page.text : rows.fullText;

  HeaderFields header = extractHeaderFields(text, config);
  std::vector<std::string> orderNumbers = discoverOrderNumbers(text);
  ColumnMap columns = locateOrderColumns(page.words, orderNumbers, config);

  spdlog::info("Page {} - supplier: {}, code: {}, dock: {}, series: {}, orders: {}",
               page.pageNumber, header.supplierName.value_or("?"), header.supplierCode.value_or("?"),
               header.dockCode.value_or("?"), header.orderSeries.value_or("?"), orderNumbers.size());

  LineItemExtraction lines = extractLineItems(rows, page.text, page.words, orderNumbers, columns, config);
  if (lines.skippedRows > 0) {
    spdlog::warn("Page {}: skipped {} unparseable rows", page.pageNumber, lines.skippedRows);
  }

  return assembleOrders(header, orderNumbers, lines.items, page.pageNumber);
}

std::vector<ExtractedOrder> parseDocument(const std::vector<PageContent>& pages, const ParserConfig& config) {
  std::vector<ExtractedOrder> orders;
  for (const auto& page : pages) {
    try {
      std::vector<ExtractedOrder> pageOrders = parsePage(page, config);
      spdlog::info("Extracted {} orders from page {}", pageOrders.size(), page.pageNumber);
      orders.insert(orders.end(), std::make_move_iterator(pageOrders.begin()),
                    std::make_move_iterator(pageOrders.end()));
    } catch (const std::exception& ex) {
      spdlog::error("Error parsing page {}: {}", page.pageNumber, ex.what());
    }
  }
  spdlog::info("PDF parsing completed. Total orders extracted: {}", orders.size());
  return orders;
}

std::vector<ExtractedOrder> parseOrderPdf(const std::string& pdfPath, const ParserConfig& config,
                                          int firstPage, int lastPage) {
  return parseDocument(loadPdfPages(pdfPath, firstPage, lastPage), config);
}
