#include "IOManager.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <ctime>
#include <exiv2/exiv2.hpp>
#include <format>
#include <fstream>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

#include "errors.hpp"
#include "utils.hpp"

namespace {
std::ofstream g_log_stream;

std::mutex log_mutex;

std::function<void(std::string_view)> g_log_handler = nullptr;

Timestamp to_timestamp(const struct timespec& ts) {
  auto since_epoch =
      std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
  return Timestamp(
      std::chrono::duration_cast<Timestamp::duration>(since_epoch));
}

bool parse_number(std::string_view text, int& out) {
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc() && ptr == text.data() + text.size();
}

// EXIF dates look like "2013:03:02 14:05:59". Cameras without a clock write
// all zeros, which is rejected.
std::optional<Timestamp> parse_exif_datetime(std::string_view value) {
  if (value.length() < 19 || value[4] != ':' || value[7] != ':' ||
      value[10] != ' ' || value[13] != ':' || value[16] != ':') {
    return std::nullopt;
  }
  std::tm tm{};
  int year, month;
  if (!parse_number(value.substr(0, 4), year) ||
      !parse_number(value.substr(5, 2), month) ||
      !parse_number(value.substr(8, 2), tm.tm_mday) ||
      !parse_number(value.substr(11, 2), tm.tm_hour) ||
      !parse_number(value.substr(14, 2), tm.tm_min) ||
      !parse_number(value.substr(17, 2), tm.tm_sec)) {
    return std::nullopt;
  }
  if (year == 0 || month < 1 || month > 12 || tm.tm_mday < 1) {
    return std::nullopt;
  }
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_isdst = -1;
  std::time_t t = std::mktime(&tm);
  if (t == static_cast<std::time_t>(-1)) return std::nullopt;
  return std::chrono::system_clock::from_time_t(t);
}

bool is_image(const fs::path& path) {
  static const std::vector<std::string> image_extensions = {
      ".jpg", ".jpeg", ".png", ".webp", ".tiff", ".tif",
      ".raw", ".cr2",  ".nef", ".arw",  ".dng",  ".heic"};
  const std::string ext =
      string_to_lower_ascii(safe_path_to_string(path.extension()));
  return std::find(image_extensions.begin(), image_extensions.end(), ext) !=
         image_extensions.end();
}

}  // namespace

bool IOManager::initialize_logger(const fs::path& logPath) {
  std::scoped_lock lock(log_mutex);
  if (g_log_stream.is_open()) {
    g_log_stream.close();
  }
  g_log_stream.open(logPath, std::ios_base::app);
  return g_log_stream.is_open();
}

void IOManager::set_log_handler(std::function<void(std::string_view)> handler) {
  std::scoped_lock lock(log_mutex);
  g_log_handler = handler;
}

void IOManager::log(std::string_view message) {
  std::scoped_lock lock(log_mutex);

  auto now = std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());
  std::string full_message =
      std::format("{:%Y-%m-%d %H:%M:%S} | {}", now, message);

  if (g_log_handler) {
    g_log_handler(full_message);
  }

  if (g_log_stream.is_open()) {
    g_log_stream << full_message << "\n" << std::flush;
  }
}

std::optional<Options> IOManager::load_config(const fs::path& configPath) {
  if (!fs::exists(configPath)) {
    log(std::format("Error: Config file not found at {}",
                    safe_path_to_string(configPath)));
    return std::nullopt;
  }
  std::ifstream configFile(configPath);
  try {
    json configJson = json::parse(configFile);
    if (!configJson.is_object()) {
      log(std::format("Error: {} must contain a JSON object",
                      safe_path_to_string(configPath)));
      return std::nullopt;
    }
    return configJson.get<Options>();
  } catch (const json::exception& e) {
    log(std::format("Error parsing {}: {}", safe_path_to_string(configPath),
                    e.what()));
    return std::nullopt;
  } catch (const InvalidInputError& e) {
    log(std::format("Error in {}: {}", safe_path_to_string(configPath),
                    e.what()));
    return std::nullopt;
  }
}

Timestamp IOManager::get_file_timestamp(const fs::path& path,
                                        AgePolicy policy) {
  if (policy == AgePolicy::EXIF && is_image(path)) {
    if (auto exif = get_exif_timestamp(path)) {
      return *exif;
    }
  }

  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    throw fs::filesystem_error("cannot read file timestamps", path,
                               std::error_code(errno, std::generic_category()));
  }

  const Timestamp modified = to_timestamp(st.st_mtim);
  const Timestamp changed = to_timestamp(st.st_ctim);
  const Timestamp accessed = to_timestamp(st.st_atim);

  switch (policy) {
    case AgePolicy::OLDEST:
      return std::min({modified, changed, accessed});
    case AgePolicy::NEWEST:
      return std::max({modified, changed, accessed});
    case AgePolicy::MODIFIED:
    case AgePolicy::EXIF:
      break;
  }
  return modified;
}

std::optional<Timestamp> IOManager::get_exif_timestamp(const fs::path& path) {
  try {
    Exiv2::Image::UniquePtr image =
        Exiv2::ImageFactory::open(safe_path_to_string(path));
    if (!image.get()) return std::nullopt;
    image->readMetadata();
    auto& exifData = image->exifData();
    if (exifData.empty()) return std::nullopt;

    auto datum =
        exifData.findKey(Exiv2::ExifKey("Exif.Photo.DateTimeOriginal"));
    if (datum != exifData.end() && datum->count() > 0) {
      return parse_exif_datetime(datum->toString());
    }
  } catch (const Exiv2::Error& e) {
    log(std::format("Non-critical Exiv2 error reading '{}': {}",
                    safe_path_to_string(path), e.what()));
  } catch (const std::exception& e) {
    log(std::format("Non-critical standard exception reading '{}': {}",
                    safe_path_to_string(path), e.what()));
  }
  return std::nullopt;
}
