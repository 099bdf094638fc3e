#pragma once

#include <concepts>
#include <format>
#include <string>
#include <type_traits>

enum class FormatTarget {
  None,
  Console,
  Csv,
};

template <FormatTarget target, typename T>
std::string to_str(const T& t);

template <typename T>
std::string to_str(const T& t);

template <typename Str>
  requires std::constructible_from<std::string, Str>
std::string to_str(const Str& str) {
  return std::string{str};
}

template <FormatTarget target = FormatTarget::None>
inline std::string join(auto start, auto end, std::string sep = ", ") {
  std::string result;

  for (auto it = start; it != end; it++) {
    if constexpr (target == FormatTarget::None)
      result += to_str(*it);
    else
      result += to_str<target>(*it);

    auto _end = end;
    if (it != --_end)
      result += sep;
  }

  return result;
}

// quotes a csv field when it holds a separator, quote or newline
std::string csv_escape(const std::string& field);
