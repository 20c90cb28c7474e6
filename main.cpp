#include "order_parser.hpp"
#include "order_writer.hpp"
#include "parser_config.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void printUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " [--csv=file] [--no-dedupe] [--year=YYYY] [--year-from-series] [--y-up]"
               " [--row-bucket=n] [--row-tolerance=n] [--header-tolerance=n]"
               " [--column-tolerance=n] [--first=n] [--last=n] [--verbose] <pdf_path>\n";
}

int parsePageNumber(const std::string& name, const std::string& value) {
  size_t used = 0;
  int n = std::stoi(value, &used);
  if (used != value.size()) throw std::invalid_argument("Invalid value for " + name + ": '" + value + "'");
  return n;
}

} // namespace

int main(int argc, char** argv)
{
  // Logs go to stderr; stdout carries only the JSON result.
  spdlog::set_default_logger(spdlog::stderr_color_mt("orderextract"));
  spdlog::set_level(spdlog::level::warn);

  std::string pdfPath;
  std::string csvPath;
  bool dedupe = true;
  int firstPage = 1;
  int lastPage = -1;
  ParserConfig config;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (applyConfigOption(config, arg)) {
        continue;
      } else if (arg == "--verbose") {
        spdlog::set_level(spdlog::level::debug);
      } else if (arg == "--no-dedupe") {
        dedupe = false;
      } else if (arg.rfind("--csv=", 0) == 0) {
        csvPath = arg.substr(std::string("--csv=").size());
      } else if (arg.rfind("--first=", 0) == 0) {
        firstPage = parsePageNumber("--first", arg.substr(std::string("--first=").size()));
      } else if (arg.rfind("--last=", 0) == 0) {
        lastPage = parsePageNumber("--last", arg.substr(std::string("--last=").size()));
      } else if (arg.rfind("--", 0) == 0) {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 2;
      } else if (pdfPath.empty()) {
        pdfPath = arg;
      }
    }
  } catch (const std::logic_error& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    printUsage(argv[0]);
    return 2;
  }

  if (pdfPath.empty()) {
    printUsage(argv[0]);
    return 2;
  }

  try {
    auto orders = parseOrderPdf(pdfPath, config, firstPage, lastPage);
    if (dedupe) orders = dedupeOrders(orders);

    writeOrdersAsJson(orders, std::cout);
    if (!csvPath.empty()) {
      writeOrdersAsCsv(orders, csvPath);
      std::cerr << "Wrote " << orders.size() << " order(s) to '" << csvPath << "'\n";
    }
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
