#pragma once

#include "order_assembler.hpp"
#include "parser_config.hpp"
#include "word_stream.hpp"

#include <string>
#include <vector>

// Parses one page of a Daily One-Way Kanban Order Summary Report.
// Exceptions are not caught here; see parseDocument.
std::vector<ExtractedOrder> parsePage(const PageContent& page, const ParserConfig& config = ParserConfig());

// Parses pages in order. A page that throws is logged and contributes no
// orders; the remaining pages are still parsed.
std::vector<ExtractedOrder> parseDocument(const std::vector<PageContent>& pages,
                                          const ParserConfig& config = ParserConfig());

// Opens the PDF and parses all pages in [firstPage, lastPage].
// Throws std::runtime_error if the document cannot be opened.
std::vector<ExtractedOrder> parseOrderPdf(const std::string& pdfPath,
                                          const ParserConfig& config = ParserConfig(),
                                          int firstPage = 1,
                                          int lastPage = -1);
