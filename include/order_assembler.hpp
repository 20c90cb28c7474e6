#pragma once

#include "header_fields.hpp"
#include "line_items.hpp"

#include <optional>
#include <string>
#include <vector>

struct ExtractedOrderItem {
  std::string partNumber;
  std::optional<std::string> description;
  std::optional<int> lotQty;
  std::optional<std::string> kanbanCode;
  // Quantity ordered for this order number.
  int plannedQty = 0;
  std::optional<std::string> rawKanbanValue;
};

struct ExtractedOrder {
  int pageNumber = 0;
  HeaderFields header;
  std::string orderNumber;
  // SupplierCode-DockCode-OrderSeries-OrderNumber, absent parts left empty.
  std::string owkNumber;
  // OrderSeries followed by OrderNumber, e.g. "20251117001".
  std::string realOrderNumber;
  std::vector<ExtractedOrderItem> items;
};

// Builds one order per order number (orderNumbers[i] takes quantities[i] of
// every line item), keeping only items with a positive quantity. Orders left
// without items are dropped.
std::vector<ExtractedOrder> assembleOrders(const HeaderFields& header,
                                           const std::vector<std::string>& orderNumbers,
                                           const std::vector<LineItemRecord>& lineItems,
                                           int pageNumber = 0);
