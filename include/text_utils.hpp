#pragma once

#include <string>
#include <vector>

std::string trim(const std::string& s);

std::string toUpper(std::string s);

bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

// Joins integers as "a, b, c" for log lines.
std::string joinInts(const std::vector<int>& values);

std::string joinStrings(const std::vector<std::string>& values, const std::string& sep);

// Shortens long text for log output, appending "..." when cut.
std::string preview(const std::string& s, size_t maxLen = 100);

// Escapes ECMAScript regex metacharacters so `s` matches literally.
std::string regexEscape(const std::string& s);
