#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

inline constexpr std::string_view kVersion = "organize-by-time v1.0.0";

// Flags exactly as given; unset scalars stay empty so that a configuration
// file can supply them.
struct CommandLine {
  std::vector<fs::path> directories;
  std::optional<fs::path> config_path;
  std::optional<fs::path> output_dir;
  std::optional<std::size_t> strip;
  std::optional<AgePolicy> policy;
  std::vector<std::string> patterns;
  std::vector<std::string> not_patterns;
  std::optional<fs::path> log_file;
  bool per_directory = false;
  bool dry_run = false;
  bool force = false;
  bool verbose = false;
  bool show_help = false;
  bool show_version = false;
};

// Throws InvalidInputError on unknown flags, bad values or conflicting
// age policies.
CommandLine parse_command_line(int argc, char* argv[]);

// Layers the command line over `base` (usually loaded from --config):
// scalars override, pattern lists are appended. Throws InvalidInputError
// when no directory or no output directory is left.
Options resolve_options(const CommandLine& cli, Options base = {});

std::string usage();
