#pragma once

#include <functional>
#include <optional>
#include <string_view>

#include "types.hpp"

namespace IOManager {
// Opens (appending) the log file; returns false if it cannot be opened.
bool initialize_logger(const fs::path& logPath);

void set_log_handler(std::function<void(std::string_view)> handler);

void log(std::string_view message);

std::optional<Options> load_config(const fs::path& configPath);

// Effective timestamp of a file under the given policy. Throws
// fs::filesystem_error if the file cannot be stat'ed.
Timestamp get_file_timestamp(const fs::path& path, AgePolicy policy);

// Exif.Photo.DateTimeOriginal of an image, interpreted as local time.
std::optional<Timestamp> get_exif_timestamp(const fs::path& path);
}  // namespace IOManager
