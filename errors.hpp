#pragma once

#include <cstddef>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

// Bad roots, files outside their root and unusable command lines.
class InvalidInputError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

// Raised by the mover when the destination is taken and --force is off.
class DestinationExistsError : public std::filesystem::filesystem_error {
 public:
  DestinationExistsError(const std::filesystem::path& source,
                         const std::filesystem::path& destination)
      : std::filesystem::filesystem_error(
            "destination file already exists", source, destination,
            std::make_error_code(std::errc::file_exists)) {}
};

class PatternSyntaxError : public std::runtime_error {
 public:
  PatternSyntaxError(std::string pattern, std::size_t position,
                     const std::string& reason)
      : std::runtime_error(std::format("invalid pattern '{}' at position {}: {}",
                                       pattern, position, reason)),
        m_pattern(std::move(pattern)),
        m_position(position) {}

  const std::string& pattern() const { return m_pattern; }
  std::size_t position() const { return m_position; }

 private:
  std::string m_pattern;
  std::size_t m_position;
};
