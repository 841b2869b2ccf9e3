#pragma once

#include <cstddef>
#include <functional>

#include "GlobPattern.hpp"
#include "types.hpp"

namespace FileWalker {
// Visits every regular file below `root` whose name matches `include` (an
// empty set accepts everything) and none of `exclude`. Patterns only ever
// see the basename; every directory is descended regardless of its name.
// A directory that cannot be read is logged and skipped (its siblings are
// still walked); the number of such failures is returned.
std::size_t for_each_file(const fs::path& root, const PatternSet& include,
                          const PatternSet& exclude,
                          const std::function<void(const fs::path&)>& visit);
}  // namespace FileWalker
