#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

inline std::string to_lower(std::string_view str) {
  std::string out{str};
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

inline std::string_view trim(std::string_view str) {
  auto is_space = [](unsigned char c) { return std::isspace(c); };
  while (!str.empty() && is_space(str.front()))
    str.remove_prefix(1);
  while (!str.empty() && is_space(str.back()))
    str.remove_suffix(1);
  return str;
}

// Lowercases a classifier label and drops markdown emphasis ("** long-term").
inline std::string normalize_label(std::string_view label) {
  label = trim(label);
  while (!label.empty() && label.front() == '*')
    label.remove_prefix(1);
  return to_lower(trim(label));
}

inline bool iequals(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

inline std::vector<std::string> split(std::string_view str, char sep = ',') {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos <= str.size()) {
    auto next = str.find(sep, pos);
    if (next == std::string_view::npos)
      next = str.size();
    auto part = trim(str.substr(pos, next - pos));
    if (!part.empty())
      out.emplace_back(part);
    pos = next + 1;
  }
  return out;
}
