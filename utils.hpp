#pragma once

#include <chrono>
#include <ctime>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

// A central utility to convert a std::filesystem::path to a UTF-8 encoded
// std::string, suitable for logging and display.
inline std::string safe_path_to_string(const fs::path& p) {
  // path::u8string() is locale-independent and returns a UTF-8 encoded string.
  // On C++20/23, this returns a std::u8string, which needs to be converted.
  auto u8str = p.u8string();
  return std::string(reinterpret_cast<const char*>(u8str.c_str()),
                     u8str.length());
}

// Wraps a path in double quotes so every "move" line can be split back into
// exactly two paths: quotes and backslashes are escaped, and control
// characters are written as \n, \t, \r, \0 or \u{XX}.
inline std::string quote_path(const fs::path& p) {
  std::string result = "\"";
  for (char c : safe_path_to_string(p)) {
    const auto byte = static_cast<unsigned char>(c);
    switch (c) {
      case '"':
      case '\\':
        result += '\\';
        result += c;
        break;
      case '\n':
        result += "\\n";
        break;
      case '\t':
        result += "\\t";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\0':
        result += "\\0";
        break;
      default:
        if (byte < 0x20 || byte == 0x7f) {
          result += std::format("\\u{{{:x}}}", byte);
        } else {
          result += c;
        }
    }
  }
  result += '"';
  return result;
}

// A simple, locale-independent function to convert a string to lowercase.
// It only handles basic ASCII characters, which is sufficient for file
// extensions.
inline std::string string_to_lower_ascii(std::string_view sv) {
  std::string result;
  result.reserve(sv.length());
  for (char c : sv) {
    if (c >= 'A' && c <= 'Z') {
      result += static_cast<char>(c + ('a' - 'A'));
    } else {
      result += c;
    }
  }
  return result;
}

// Four digit calendar year of a point in time, in the process's local
// timezone (TZ is honored).
inline std::string year_string(std::chrono::system_clock::time_point tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm local{};
  localtime_r(&t, &local);
  return std::format("{:04d}", local.tm_year + 1900);
}
