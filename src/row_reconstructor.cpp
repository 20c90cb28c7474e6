#include "row_reconstructor.hpp"

#include "text_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <map>

ReconstructedPage reconstructRows(const std::vector<PageWord>& words, const ParserConfig& config) {
  ReconstructedPage page;
  if (words.empty()) {
    spdlog::warn("No words to reconstruct rows from");
    return page;
  }

  // nearbyint rounds ties to even, so a bottom of exactly 12.5 lands in bucket 10.
  std::map<double, std::vector<PageWord>> buckets;
  for (const auto& w : words) {
    double key = std::nearbyint(w.bottom / config.rowBucket) * config.rowBucket;
    buckets[key].push_back(w);
  }

  auto addRow = [&](const std::pair<const double, std::vector<PageWord>>& bucket) {
    ReconstructedRow row{bucket.first, bucket.second, {}};
    std::stable_sort(row.words.begin(), row.words.end(),
                     [](const PageWord& a, const PageWord& b) { return a.left < b.left; });
    for (size_t i = 0; i < row.words.size(); ++i) {
      if (i > 0) row.text += ' ';
      row.text += row.words[i].text;
    }
    spdlog::debug("Row at Y={}: {}", row.key, preview(row.text));
    page.rows.push_back(std::move(row));
  };

  if (config.yAxisUp) {
    for (auto it = buckets.rbegin(); it != buckets.rend(); ++it) addRow(*it);
  } else {
    for (const auto& bucket : buckets) addRow(bucket);
  }

  for (size_t i = 0; i < page.rows.size(); ++i) {
    if (i > 0) page.fullText += '\n';
    page.fullText += page.rows[i].text;
  }

  spdlog::debug("Reconstructed {} rows from {} words, total length {}",
                page.rows.size(), words.size(), page.fullText.size());
  return page;
}
