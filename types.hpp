#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <format>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "errors.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;
using Timestamp = std::chrono::system_clock::time_point;

// Which of a file's timestamps decides its year bucket.
enum class AgePolicy { MODIFIED, OLDEST, NEWEST, EXIF };
NLOHMANN_JSON_SERIALIZE_ENUM(AgePolicy, {{AgePolicy::MODIFIED, "modified"},
                                         {AgePolicy::OLDEST, "oldest"},
                                         {AgePolicy::NEWEST, "newest"},
                                         {AgePolicy::EXIF, "exif"}});

struct Options {
  fs::path output_dir;
  std::size_t strip = 0;
  AgePolicy policy = AgePolicy::MODIFIED;
  // Date every file of a top-level directory by the group's extreme time.
  bool per_directory = false;
  std::vector<std::string> patterns;
  std::vector<std::string> not_patterns;
  bool dry_run = false;
  bool force = false;
  bool verbose = false;
  fs::path log_file;
};

// Unknown keys are ignored; a known key with an unusable value throws
// InvalidInputError instead of silently falling back to a default.
inline void from_json(const json& j, Options& o) {
  if (j.contains("output_dir")) {
    o.output_dir = fs::path(j.at("output_dir").get<std::string>());
  }
  if (j.contains("strip")) {
    const json& strip = j.at("strip");
    if (!strip.is_number_unsigned()) {
      throw InvalidInputError(std::format(
          "\"strip\" must be a non-negative integer, got {}", strip.dump()));
    }
    strip.get_to(o.strip);
  }
  if (j.contains("policy")) {
    const json& policy = j.at("policy");
    // The enum mapping turns unknown names into the first entry; a value
    // that does not survive the round trip was not a policy name.
    const auto parsed = policy.get<AgePolicy>();
    if (json(parsed) != policy) {
      throw InvalidInputError(std::format(
          "\"policy\" must be one of modified, oldest, newest, exif; got {}",
          policy.dump()));
    }
    o.policy = parsed;
  }
  if (j.contains("per_directory")) {
    j.at("per_directory").get_to(o.per_directory);
  }
  if (j.contains("patterns")) {
    j.at("patterns").get_to(o.patterns);
  }
  if (j.contains("not_patterns")) {
    j.at("not_patterns").get_to(o.not_patterns);
  }
  if (j.contains("dry_run")) {
    j.at("dry_run").get_to(o.dry_run);
  }
  if (j.contains("force")) {
    j.at("force").get_to(o.force);
  }
  if (j.contains("verbose")) {
    j.at("verbose").get_to(o.verbose);
  }
  if (j.contains("log_file")) {
    o.log_file = fs::path(j.at("log_file").get<std::string>());
  }
}

// Where a file goes, and the directories (outermost first) that must exist
// before it can be moved there.
struct Destination {
  fs::path path;
  std::vector<fs::path> required_directories;
};

struct Action {
  fs::path from;
  fs::path to;
  Timestamp timestamp;
  std::string year;
  std::vector<fs::path> required_directories;
};

struct Plan {
  std::vector<Action> actions;
  std::size_t errors = 0;
};

enum class MoveStatus { MOVED, COPIED_ACROSS_DEVICES, DRY_RUN };

struct MoveOutcome {
  fs::path from;
  fs::path to;
  MoveStatus status;
};
