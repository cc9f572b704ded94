#pragma once

#include <concepts>
#include <format>
#include <string>
#include <vector>

template <typename T>
std::string to_str(const T& t);

template <typename T, typename S>
std::string to_str(const T& t, const S& s);

template <typename Str>
  requires std::constructible_from<std::string, Str>
std::string to_str(const Str& str) {
  return std::string{str};
}

inline std::string join(auto start, auto end, std::string sep = ", ") {
  std::string result;

  for (auto it = start; it != end; it++) {
    result += to_str(*it);

    auto _end = end;
    if (it != --_end)
      result += sep;
  }

  return result;
}

// Guidance shown instead of an empty chart.
std::string no_data_message(const std::string& topic,
                            const std::vector<std::string>& available_topics);
std::string no_match_message(const std::string& topic,
                             const std::vector<std::string>& requested,
                             const std::vector<std::string>& available);
