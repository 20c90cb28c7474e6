#pragma once

#include <spdlog/spdlog.h>

#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

// Ordered list of matchers for one field. The first matcher returning a value
// wins; when none does the field is absent.
template <typename T>
class PatternCascade {
public:
  using Matcher = std::function<std::optional<T>(const std::string&)>;

  explicit PatternCascade(std::string field) : field_(std::move(field)) {}

  PatternCascade& add(std::string stepName, Matcher matcher) {
    steps_.push_back(Step{std::move(stepName), std::move(matcher)});
    return *this;
  }

  std::optional<T> resolve(const std::string& text) const {
    for (const auto& step : steps_) {
      std::optional<T> value = step.matcher(text);
      if (value) {
        spdlog::debug("Extracted {} ({})", field_, step.name);
        return value;
      }
    }
    spdlog::warn("Could not extract {} from text", field_);
    return std::nullopt;
  }

  size_t size() const { return steps_.size(); }

private:
  struct Step {
    std::string name;
    Matcher matcher;
  };

  std::string field_;
  std::vector<Step> steps_;
};

// Matcher returning capture group `group` of the first match of `pattern`.
inline std::function<std::optional<std::string>(const std::string&)>
regexCapture(const std::string& pattern, size_t group = 1,
             std::regex::flag_type flags = std::regex::ECMAScript) {
  std::regex re(pattern, flags);
  return [re, group](const std::string& text) -> std::optional<std::string> {
    std::smatch m;
    if (!std::regex_search(text, m, re) || !m[group].matched) return std::nullopt;
    return m[group].str();
  };
}
