#include "FileMover.hpp"

#include <system_error>

#include "errors.hpp"

MoveOutcome FileMover::move_file(const fs::path& source,
                                 const fs::path& destination, bool dryRun,
                                 bool force) {
  if (dryRun) {
    return {source, destination, MoveStatus::DRY_RUN};
  }

  if (destination.has_parent_path()) {
    fs::create_directories(destination.parent_path());
  }

  // symlink_status so that a dangling link still counts as taken.
  std::error_code existsErr;
  const bool destinationExists =
      fs::exists(fs::symlink_status(destination, existsErr));
  if (existsErr && existsErr != std::errc::no_such_file_or_directory) {
    throw fs::filesystem_error("cannot inspect destination", source,
                               destination, existsErr);
  }
  if (destinationExists && !force) {
    throw DestinationExistsError(source, destination);
  }

  std::error_code renameErr;
  fs::rename(source, destination, renameErr);
  if (!renameErr) {
    return {source, destination, MoveStatus::MOVED};
  }

  if (renameErr != std::errc::cross_device_link) {
    throw fs::filesystem_error("cannot move file", source, destination,
                               renameErr);
  }

  // rename(2) cannot cross filesystems; copy then drop the original.
  const auto copyOptions = force ? fs::copy_options::overwrite_existing
                                 : fs::copy_options::none;
  fs::copy_file(source, destination, copyOptions);
  fs::remove(source);
  return {source, destination, MoveStatus::COPIED_ACROSS_DEVICES};
}
