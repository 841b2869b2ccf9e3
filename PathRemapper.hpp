#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "types.hpp"

namespace PathRemapper {
// Maps a file found under `root` to
//   outputDir / <year of timestamp> / <directories after stripping> / <name>
//
// The directories eligible for stripping are the root as it was given
// ("photos/2013" contributes "photos" and "2013") followed by the
// directories between the root and the file. `strip` larger than that count
// keeps only the file name. Nothing on disk is consulted.
//
// Throws InvalidInputError if `file` does not lie strictly inside `root`.
Destination remap(const fs::path& root, const fs::path& file,
                  Timestamp timestamp, std::size_t strip,
                  const fs::path& outputDir);

// Same as above with the year bucket already computed.
Destination remap(const fs::path& root, const fs::path& file,
                  const std::string& year, std::size_t strip,
                  const fs::path& outputDir);

// Leading segments a root contributes to every remapped path.
std::vector<fs::path> root_segments(const fs::path& root);
}  // namespace PathRemapper
