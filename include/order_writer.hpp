#pragma once

#include "order_assembler.hpp"

#include <ostream>
#include <string>
#include <vector>

// Keeps the first order for each (realOrderNumber, dockCode) pair.
std::vector<ExtractedOrder> dedupeOrders(const std::vector<ExtractedOrder>& orders);

// Writes orders as a JSON array. Absent values are written as null.
void writeOrdersAsJson(const std::vector<ExtractedOrder>& orders, std::ostream& out);

// Writes one CSV row per order item, with a header row.
// Throws std::runtime_error if the file cannot be written.
void writeOrdersAsCsv(const std::vector<ExtractedOrder>& orders, const std::string& path);
