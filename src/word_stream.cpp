#include "word_stream.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <regex>
#include <stdexcept>
#include <string>

namespace {

void appendUtf8(std::string& out, unsigned long code) {
  if (code < 0x80) {
    out.push_back(static_cast<char>(code));
  } else if (code < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code >> 6)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else if (code < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else if (code < 0x110000) {
    out.push_back(static_cast<char>(0xF0 | (code >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  }
}

// Decodes a numeric character reference body ("#65", "#x41"); empty if malformed
// or not a Unicode scalar value.
std::string decodeNumericEntity(const std::string& ent) {
  std::string rep;
  bool hex = ent.size() > 1 && (ent[1] == 'x' || ent[1] == 'X');
  std::string digits = ent.substr(hex ? 2 : 1);
  if (digits.empty() || digits.size() > 6) return rep;
  for (char ch : digits) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (hex ? !std::isxdigit(c) : !std::isdigit(c)) return rep;
  }
  unsigned long code = std::strtoul(digits.c_str(), nullptr, hex ? 16 : 10);
  if (code == 0 || (code >= 0xD800 && code <= 0xDFFF)) return rep;
  appendUtf8(rep, code);
  return rep;
}

std::string decodeEntities(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '&') {
      size_t j = in.find(';', i + 1);
      if (j != std::string::npos) {
        std::string ent = in.substr(i + 1, j - (i + 1));
        std::string rep;
        if (ent == "amp") rep = "&";
        else if (ent == "lt") rep = "<";
        else if (ent == "gt") rep = ">";
        else if (ent == "quot") rep = "\"";
        else if (ent == "apos") rep = "'";
        else if (!ent.empty() && ent[0] == '#') rep = decodeNumericEntity(ent);
        if (!rep.empty()) {
          out += rep; i = j; continue;
        }
      }
    }
    out.push_back(in[i]);
  }
  return out;
}

bool commandExists(const std::string& command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  return std::system(test.c_str()) == 0;
}

std::string runPdftotextBboxLayout(const std::string& pdfPath, int firstPage, int lastPage) {
  if (!commandExists("pdftotext")) {
    throw std::runtime_error("pdftotext not found; install poppler-utils");
  }
  std::string cmd = "pdftotext -bbox-layout";
  if (firstPage > 0) {
    cmd += " -f " + std::to_string(firstPage);
  }
  if (lastPage > 0 && lastPage >= firstPage) {
    cmd += " -l " + std::to_string(lastPage);
  }
  cmd += " -q \"" + pdfPath + "\" -";

  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) throw std::runtime_error("Failed to run pdftotext -bbox-layout");
  std::string out;
  char buf[8192];
  while (true) {
    size_t n = std::fread(buf, 1, sizeof(buf), pipe);
    if (n > 0) out.append(buf, n);
    if (n < sizeof(buf)) break;
  }
  int rc = pclose(pipe);
  if (rc != 0) throw std::runtime_error("pdftotext -bbox-layout failed to open '" + pdfPath + "'");
  return out;
}

void finishPage(PageContent& page) {
  while (!page.text.empty() && page.text.back() == '\n') page.text.pop_back();
}

} // namespace

std::vector<PageContent> parseBboxLayout(const std::string& xhtml, int firstPageNumber) {
  static const std::regex tokenRe(
    "<page\\b([^>]*)>|</page>|</line>|<word\\b([^>]*)>([^<]*)</word>");
  static const std::regex attrRe(
    "\\b(xMin|yMin|xMax|yMax|number)=\"(-?[0-9]+(?:\\.[0-9]+)?)\"");

  std::vector<PageContent> pages;
  bool inPage = false;
  bool lineHasWords = false;

  auto openPage = [&](int number) {
    PageContent page;
    page.pageNumber = number;
    pages.push_back(std::move(page));
    inPage = true;
    lineHasWords = false;
  };
  auto nextNumber = [&]() {
    return pages.empty() ? firstPageNumber : pages.back().pageNumber + 1;
  };

  std::sregex_iterator it(xhtml.begin(), xhtml.end(), tokenRe);
  std::sregex_iterator end;
  for (; it != end; ++it) {
    const std::smatch& m = *it;
    std::string tag = m.str(0);

    if (tag.rfind("<page", 0) == 0) {
      int number = nextNumber();
      std::string attrs = m.str(1);
      for (auto ai = std::sregex_iterator(attrs.begin(), attrs.end(), attrRe);
           ai != std::sregex_iterator(); ++ai) {
        if ((*ai)[1] == "number") number = std::stoi((*ai)[2].str());
      }
      openPage(number);
    } else if (tag == "</page>") {
      if (!pages.empty()) finishPage(pages.back());
      inPage = false;
    } else if (tag == "</line>") {
      if (inPage && lineHasWords) pages.back().text += '\n';
      lineHasWords = false;
    } else {
      if (!inPage) openPage(nextNumber());
      PageWord w{decodeEntities(m.str(3)), 0.0, 0.0, 0.0, 0.0};
      std::string attrs = m.str(2);
      int seen = 0;
      for (auto ai = std::sregex_iterator(attrs.begin(), attrs.end(), attrRe);
           ai != std::sregex_iterator(); ++ai) {
        std::string name = (*ai)[1].str();
        double v = std::stod((*ai)[2].str());
        if (name == "xMin") { w.left = v; seen |= 1; }
        else if (name == "yMin") { w.top = v; seen |= 2; }
        else if (name == "xMax") { w.right = v; seen |= 4; }
        else if (name == "yMax") { w.bottom = v; seen |= 8; }
      }
      if (seen != 15) {
        spdlog::warn("Skipping word '{}' on page {} without a complete bounding box",
                     w.text, pages.back().pageNumber);
        continue;
      }
      PageContent& page = pages.back();
      if (lineHasWords) page.text += ' ';
      page.text += w.text;
      lineHasWords = true;
      page.words.push_back(std::move(w));
    }
  }
  if (inPage) finishPage(pages.back());
  return pages;
}

std::vector<PageContent> loadPdfPages(const std::string& pdfPath, int firstPage, int lastPage) {
  if (!std::filesystem::exists(pdfPath)) {
    throw std::runtime_error("PDF not found: " + pdfPath);
  }
  std::string xhtml = runPdftotextBboxLayout(pdfPath, firstPage, lastPage);
  std::vector<PageContent> pages = parseBboxLayout(xhtml, firstPage > 0 ? firstPage : 1);
  spdlog::info("PDF '{}' opened successfully. Total pages: {}", pdfPath, pages.size());
  return pages;
}
