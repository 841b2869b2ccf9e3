#include "Organizer.hpp"

#include <algorithm>
#include <cstddef>
#include <format>
#include <map>
#include <print>
#include <string>
#include <system_error>
#include <utility>

#include "FileMover.hpp"
#include "FileWalker.hpp"
#include "IOManager.hpp"
#include "PathRemapper.hpp"
#include "errors.hpp"
#include "utils.hpp"

namespace {
// Files directly in a root form one group, and so does every directory one
// or two levels below it, together with everything underneath.
fs::path directory_group(const fs::path& root, const fs::path& file) {
  fs::path group;
  std::size_t depth = 0;
  for (const auto& element : file.lexically_relative(root).parent_path()) {
    if (depth++ == 2) break;
    group /= element;
  }
  return group;
}
}  // namespace

Organizer::Organizer(Options options)
    : m_options(std::move(options)),
      m_include(m_options.patterns),
      m_exclude(m_options.not_patterns) {}

void Organizer::validate_root(const fs::path& root) {
  std::error_code ec;
  if (!fs::exists(root, ec)) {
    throw InvalidInputError(std::format("source directory '{}' does not exist",
                                        safe_path_to_string(root)));
  }
  if (!fs::is_directory(root, ec)) {
    throw InvalidInputError(std::format("'{}' is not a directory",
                                        safe_path_to_string(root)));
  }
}

Plan Organizer::generate_plan(const fs::path& root) const {
  validate_root(root);
  IOManager::log(std::format("Scanning '{}' for files to move...",
                             safe_path_to_string(root)));

  Plan plan;
  plan.errors = FileWalker::for_each_file(
      root, m_include, m_exclude, [&](const fs::path& path) {
        try {
          plan.actions.push_back(generate_action_for_path(path, root));
        } catch (const fs::filesystem_error& e) {
          std::println(stderr, "Error: {}: {}", quote_path(path),
                       e.code().message());
          IOManager::log(std::format(
              "Warning: Filesystem error processing '{}': {}. Skipping.",
              safe_path_to_string(path), e.what()));
          ++plan.errors;
        } catch (const InvalidInputError& e) {
          std::println(stderr, "Error: {}: {}", quote_path(path), e.what());
          IOManager::log(std::format("Warning: Skipping '{}': {}",
                                     safe_path_to_string(path), e.what()));
          ++plan.errors;
        }
      });

  if (m_options.per_directory) {
    apply_directory_timestamps(plan, root);
  }

  IOManager::log(std::format("Analysis of '{}' complete. Found {} actions.",
                             safe_path_to_string(root), plan.actions.size()));
  return plan;
}

Action Organizer::generate_action_for_path(const fs::path& path,
                                           const fs::path& root) const {
  const Timestamp timestamp =
      IOManager::get_file_timestamp(path, m_options.policy);
  const std::string year = year_string(timestamp);
  Destination destination = PathRemapper::remap(
      root, path, year, m_options.strip, m_options.output_dir);
  return Action{path, std::move(destination.path), timestamp, year,
                std::move(destination.required_directories)};
}

void Organizer::apply_directory_timestamps(Plan& plan,
                                           const fs::path& root) const {
  const bool newest = m_options.policy == AgePolicy::NEWEST;
  std::map<fs::path, Timestamp> extremes;
  for (const auto& action : plan.actions) {
    const fs::path group = directory_group(root, action.from);
    auto [it, inserted] = extremes.try_emplace(group, action.timestamp);
    if (!inserted) {
      it->second = newest ? std::max(it->second, action.timestamp)
                          : std::min(it->second, action.timestamp);
    }
  }

  for (auto& action : plan.actions) {
    action.timestamp = extremes.at(directory_group(root, action.from));
    const std::string year = year_string(action.timestamp);
    if (year == action.year) continue;

    Destination destination = PathRemapper::remap(
        root, action.from, year, m_options.strip, m_options.output_dir);
    IOManager::log(std::format("Grouped '{}' with its directory: {} -> {}",
                               safe_path_to_string(action.from), action.year,
                               year));
    action.to = std::move(destination.path);
    action.year = year;
    action.required_directories = std::move(destination.required_directories);
  }
}

std::size_t Organizer::execute_plan(const Plan& plan,
                                    std::ostream& out) const {
  std::size_t errors = 0;
  for (const auto& action : plan.actions) {
    std::println(out, "move {} {}", quote_path(action.from),
                 quote_path(action.to));

    if (m_options.dry_run) {
      for (const auto& dir : action.required_directories) {
        std::error_code ec;
        if (!fs::exists(dir, ec)) {
          IOManager::log(std::format("Dry run: would create '{}'",
                                     safe_path_to_string(dir)));
        }
      }
    }

    try {
      const MoveOutcome outcome = FileMover::move_file(
          action.from, action.to, m_options.dry_run, m_options.force);
      if (outcome.status == MoveStatus::COPIED_ACROSS_DEVICES) {
        IOManager::log(std::format("Copied '{}' -> '{}' (cross-device move)",
                                   safe_path_to_string(outcome.from),
                                   safe_path_to_string(outcome.to)));
      } else if (outcome.status == MoveStatus::MOVED) {
        IOManager::log(std::format("Moved '{}' -> '{}'",
                                   safe_path_to_string(outcome.from),
                                   safe_path_to_string(outcome.to)));
      }
    } catch (const DestinationExistsError& e) {
      std::println(stderr, "Error: dest: {}: {}", quote_path(action.to),
                   "destination file already exists");
      IOManager::log(std::format("Skipped '{}': {}",
                                 safe_path_to_string(action.from), e.what()));
      ++errors;
    } catch (const fs::filesystem_error& e) {
      std::println(stderr, "Error: dest: {}: {}", quote_path(action.to),
                   e.code().message());
      IOManager::log(std::format("Error moving '{}': {}",
                                 safe_path_to_string(action.from), e.what()));
      ++errors;
    }
  }
  return errors;
}

std::size_t Organizer::run(const std::vector<fs::path>& roots,
                           std::ostream& out) const {
  for (const auto& root : roots) {
    validate_root(root);
  }

  std::size_t errors = 0;
  for (const auto& root : roots) {
    const Plan plan = generate_plan(root);
    errors += plan.errors;
    errors += execute_plan(plan, out);
  }
  return errors;
}
