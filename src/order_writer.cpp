#include "order_writer.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>
#include <utility>

namespace {

std::string jsonString(const std::string& s) {
  std::string out = "\"";
  for (char ch : s) {
    switch (ch) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(ch));
          out += buf;
        } else {
          out += ch;
        }
    }
  }
  return out + "\"";
}

std::string jsonValue(const std::optional<std::string>& v) {
  return v ? jsonString(*v) : "null";
}

std::string jsonValue(const std::optional<int>& v) {
  return v ? std::to_string(*v) : "null";
}

std::string jsonValue(const std::optional<Timestamp>& v) {
  return v ? jsonString(v->toIsoString()) : "null";
}

std::string csvCell(const std::string& cell) {
  bool needQuotes = cell.find(',') != std::string::npos || cell.find('"') != std::string::npos ||
                    cell.find('\n') != std::string::npos;
  if (!needQuotes) return cell;
  std::string escaped;
  for (char ch : cell) {
    if (ch == '"') escaped += '"';
    escaped += ch;
  }
  return '"' + escaped + '"';
}

} // namespace

std::vector<ExtractedOrder> dedupeOrders(const std::vector<ExtractedOrder>& orders) {
  std::set<std::pair<std::string, std::string>> seen;
  std::vector<ExtractedOrder> unique;
  for (const auto& order : orders) {
    auto key = std::make_pair(order.realOrderNumber, order.header.dockCode.value_or(""));
    if (!seen.insert(key).second) {
      spdlog::warn("Order {} (dock: {}) already extracted, skipping", key.first, key.second);
      continue;
    }
    unique.push_back(order);
  }
  return unique;
}

void writeOrdersAsJson(const std::vector<ExtractedOrder>& orders, std::ostream& out) {
  out << "[";
  for (size_t i = 0; i < orders.size(); ++i) {
    const ExtractedOrder& o = orders[i];
    const HeaderFields& h = o.header;
    out << (i == 0 ? "\n" : ",\n");
    out << "  {\n";
    out << "    \"page\": " << o.pageNumber << ",\n";
    out << "    \"owkNumber\": " << jsonString(o.owkNumber) << ",\n";
    out << "    \"realOrderNumber\": " << jsonString(o.realOrderNumber) << ",\n";
    out << "    \"orderNumber\": " << jsonString(o.orderNumber) << ",\n";
    out << "    \"supplierName\": " << jsonValue(h.supplierName) << ",\n";
    out << "    \"supplierCode\": " << jsonValue(h.supplierCode) << ",\n";
    out << "    \"dockCode\": " << jsonValue(h.dockCode) << ",\n";
    out << "    \"orderSeries\": " << jsonValue(h.orderSeries) << ",\n";
    out << "    \"transmitDate\": " << jsonValue(h.transmitDate) << ",\n";
    out << "    \"arriveDateTime\": " << jsonValue(h.arriveDateTime) << ",\n";
    out << "    \"departDateTime\": " << jsonValue(h.departDateTime) << ",\n";
    out << "    \"unloadDateTime\": " << jsonValue(h.unloadDateTime) << ",\n";
    out << "    \"itemCount\": " << o.items.size() << ",\n";
    out << "    \"items\": [";
    for (size_t j = 0; j < o.items.size(); ++j) {
      const ExtractedOrderItem& it = o.items[j];
      out << (j == 0 ? "\n" : ",\n");
      out << "      {\"partNumber\": " << jsonString(it.partNumber)
          << ", \"description\": " << jsonValue(it.description)
          << ", \"lotQty\": " << jsonValue(it.lotQty)
          << ", \"kanbanNumber\": " << jsonValue(it.kanbanCode)
          << ", \"plannedQty\": " << it.plannedQty
          << ", \"rawKanbanValue\": " << jsonValue(it.rawKanbanValue) << "}";
    }
    out << (o.items.empty() ? "]\n" : "\n    ]\n");
    out << "  }";
  }
  out << (orders.empty() ? "]\n" : "\n]\n");
}

void writeOrdersAsCsv(const std::vector<ExtractedOrder>& orders, const std::string& path) {
  std::filesystem::path parent = std::filesystem::path(path).parent_path();
  if (!parent.empty() && !std::filesystem::exists(parent)) {
    std::filesystem::create_directories(parent);
  }
  std::ofstream ofs(path);
  if (!ofs) throw std::runtime_error("Cannot open '" + path + "' for writing");

  auto writeRow = [&](const std::vector<std::string>& row) {
    for (size_t i = 0; i < row.size(); ++i) {
      ofs << csvCell(row[i]);
      if (i + 1 < row.size()) ofs << ',';
    }
    ofs << "\n";
  };

  writeRow({"page", "owk_number", "real_order_number", "order_number", "supplier_name",
            "supplier_code", "dock_code", "order_series", "transmit_date", "unload_datetime",
            "part_number", "description", "lot_qty", "kanban", "planned_qty"});
  for (const auto& o : orders) {
    const HeaderFields& h = o.header;
    for (const auto& it : o.items) {
      writeRow({std::to_string(o.pageNumber), o.owkNumber, o.realOrderNumber, o.orderNumber,
                h.supplierName.value_or(""), h.supplierCode.value_or(""), h.dockCode.value_or(""),
                h.orderSeries.value_or(""),
                h.transmitDate ? h.transmitDate->toIsoString() : "",
                h.unloadDateTime ? h.unloadDateTime->toIsoString() : "",
                it.partNumber, it.description.value_or(""),
                it.lotQty ? std::to_string(*it.lotQty) : "",
                it.kanbanCode.value_or(""), std::to_string(it.plannedQty)});
    }
  }
  if (!ofs) throw std::runtime_error("Failed writing '" + path + "'");
}
