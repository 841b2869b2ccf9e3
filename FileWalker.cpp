#include "FileWalker.hpp"

#include <format>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "IOManager.hpp"
#include "utils.hpp"

std::size_t FileWalker::for_each_file(
    const fs::path& root, const PatternSet& include, const PatternSet& exclude,
    const std::function<void(const fs::path&)>& visit) {
  std::size_t errors = 0;
  // Each directory gets its own iterator, so one unreadable directory only
  // costs its own subtree.
  std::vector<fs::path> pending{root};
  while (!pending.empty()) {
    const fs::path dir = std::move(pending.back());
    pending.pop_back();

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
      IOManager::log(std::format("Error: cannot scan '{}': {}",
                                 safe_path_to_string(dir), ec.message()));
      ++errors;
      continue;
    }

    std::vector<fs::path> subdirs;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
      const fs::directory_entry& entry = *it;
      std::error_code typeErr;
      if (entry.is_directory(typeErr)) {
        // Directory symlinks are not followed.
        if (!entry.is_symlink(typeErr)) subdirs.push_back(entry.path());
      } else if (entry.is_regular_file(typeErr)) {
        const std::string name = safe_path_to_string(entry.path().filename());
        if (exclude.any_match(name)) {
          IOManager::log(std::format("Excluded '{}'",
                                     safe_path_to_string(entry.path())));
        } else if (include.empty() || include.any_match(name)) {
          visit(entry.path());
        }
      }
    }
    if (ec) {
      IOManager::log(std::format("Error: scan of '{}' stopped early: {}",
                                 safe_path_to_string(dir), ec.message()));
      ++errors;
    }

    // Reversed so that directories are visited in the order they were read.
    pending.insert(pending.end(), subdirs.rbegin(), subdirs.rend());
  }
  return errors;
}
