#pragma once

#include <cstddef>
#include <iostream>
#include <ostream>
#include <vector>

#include "GlobPattern.hpp"
#include "types.hpp"

class Organizer {
 public:
  // Compiles the include and exclusion patterns; throws PatternSyntaxError.
  explicit Organizer(Options options);

  // Throws InvalidInputError unless `root` is an existing directory.
  static void validate_root(const fs::path& root);

  // Walks `root` and computes a destination for every selected file. With
  // per_directory set, files sharing a directory group get the group's
  // extreme time stamp. Per-file failures are logged and counted.
  Plan generate_plan(const fs::path& root) const;

  // Announces and performs every action in order. Returns the number of
  // actions that failed; a failure never stops the remaining moves.
  std::size_t execute_plan(const Plan& plan,
                           std::ostream& out = std::cout) const;

  // Validates all roots up front, then plans and executes each in turn.
  // Returns the total error count.
  std::size_t run(const std::vector<fs::path>& roots,
                  std::ostream& out = std::cout) const;

 private:
  Action generate_action_for_path(const fs::path& path,
                                  const fs::path& root) const;
  void apply_directory_timestamps(Plan& plan, const fs::path& root) const;

  Options m_options;
  PatternSet m_include;
  PatternSet m_exclude;
};
