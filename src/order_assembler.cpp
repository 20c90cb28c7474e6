#include "order_assembler.hpp"

#include <spdlog/spdlog.h>

std::vector<ExtractedOrder> assembleOrders(const HeaderFields& header,
                                           const std::vector<std::string>& orderNumbers,
                                           const std::vector<LineItemRecord>& lineItems,
                                           int pageNumber) {
  std::vector<ExtractedOrder> orders;
  const std::string series = header.orderSeries.value_or("");

  for (size_t index = 0; index < orderNumbers.size(); ++index) {
    const std::string& orderNumber = orderNumbers[index];

    ExtractedOrder order;
    order.pageNumber = pageNumber;
    order.header = header;
    order.orderNumber = orderNumber;
    order.owkNumber = header.supplierCode.value_or("") + "-" + header.dockCode.value_or("") + "-" +
                      series + "-" + orderNumber;
    order.realOrderNumber = series + orderNumber;

    for (const auto& line : lineItems) {
      if (index >= line.quantities.size() || line.quantities[index] <= 0) continue;
      ExtractedOrderItem item;
      item.partNumber = line.partNumber;
      item.description = line.description;
      item.lotQty = line.lotQty;
      item.kanbanCode = line.kanbanCode;
      item.plannedQty = line.quantities[index];
      item.rawKanbanValue = line.kanbanCode;
      order.items.push_back(std::move(item));
    }

    if (order.items.empty()) {
      spdlog::debug("Order {} has no items with a positive quantity, dropping it", orderNumber);
      continue;
    }
    spdlog::info("Created order {} (series: {}, number: {}) with {} items",
                 order.realOrderNumber, series, orderNumber, order.items.size());
    orders.push_back(std::move(order));
  }
  return orders;
}
