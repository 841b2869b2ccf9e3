#include "PathRemapper.hpp"

#include <algorithm>
#include <cstddef>
#include <format>
#include <string>

#include "errors.hpp"
#include "utils.hpp"

namespace {
bool is_skippable(const fs::path& element) {
  return element.empty() || element == "." || element == "..";
}

fs::path without_trailing_separator(fs::path p) {
  if (!p.has_filename() && p.has_relative_path()) {
    return p.parent_path();
  }
  return p;
}
}  // namespace

std::vector<fs::path> PathRemapper::root_segments(const fs::path& root) {
  std::vector<fs::path> segments;
  for (const auto& element : root.lexically_normal().relative_path()) {
    if (!is_skippable(element)) {
      segments.push_back(element);
    }
  }
  return segments;
}

Destination PathRemapper::remap(const fs::path& root, const fs::path& file,
                                Timestamp timestamp, std::size_t strip,
                                const fs::path& outputDir) {
  return remap(root, file, year_string(timestamp), strip, outputDir);
}

Destination PathRemapper::remap(const fs::path& root, const fs::path& file,
                                const std::string& year, std::size_t strip,
                                const fs::path& outputDir) {
  const fs::path normalRoot =
      without_trailing_separator(root.lexically_normal());
  const fs::path relative =
      file.lexically_normal().lexically_relative(normalRoot);
  if (relative.empty() || relative == "." || *relative.begin() == ".." ||
      !relative.has_filename()) {
    throw InvalidInputError(std::format("'{}' is not inside '{}'",
                                        safe_path_to_string(file),
                                        safe_path_to_string(root)));
  }

  std::vector<fs::path> dirSegments = root_segments(normalRoot);
  for (const auto& element : relative.parent_path()) {
    if (!is_skippable(element)) {
      dirSegments.push_back(element);
    }
  }
  const fs::path baseName = relative.filename();

  const std::size_t dropped = std::min(strip, dirSegments.size());

  Destination destination;
  fs::path current = outputDir;
  destination.required_directories.push_back(current);
  current /= year;
  destination.required_directories.push_back(current);
  for (auto it = dirSegments.begin() + static_cast<std::ptrdiff_t>(dropped);
       it != dirSegments.end(); ++it) {
    current /= *it;
    destination.required_directories.push_back(current);
  }
  destination.path = current / baseName;
  return destination;
}
