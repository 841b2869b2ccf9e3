#pragma once

#include <fcntl.h>
#include <gtest/gtest.h>
#include <sys/stat.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

// Test fixture base that handles setting up and tearing down a temporary
// directory tree, unique per test so that tests can run in parallel.
class TempDirTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    test_dir = fs::temp_directory_path() /
               (std::string("organize_by_time_") + info->test_suite_name() +
                "_" + info->name());
    std::error_code ec;
    fs::remove_all(test_dir, ec);
    fs::create_directories(test_dir);
    // Canonical so comparisons with walked paths are not fooled by /tmp
    // being a symlink.
    test_dir = fs::canonical(test_dir);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir, ec);
    // Ignore errors during cleanup as they are not part of the test result.
  }

  // Creates a file (and its parent directories) below test_dir.
  fs::path CreateDummyFile(const fs::path& relative_path,
                           const std::string& content = "dummy content") {
    fs::path full_path = test_dir / relative_path;
    if (full_path.has_parent_path()) {
      fs::create_directories(full_path.parent_path());
    }
    std::ofstream ofs(full_path);
    ofs << content;
    ofs.close();
    return full_path;
  }

  static std::string ReadFile(const fs::path& path) {
    std::ifstream ifs(path);
    return std::string(std::istreambuf_iterator<char>(ifs),
                       std::istreambuf_iterator<char>());
  }

  fs::path test_dir;
};

// Noon UTC, so the local calendar year is the same in every timezone.
inline std::chrono::system_clock::time_point MakeTime(int year, unsigned month,
                                                      unsigned day) {
  using namespace std::chrono;
  return sys_days{std::chrono::year{year} / month / day} + hours{12};
}

// Sets both access and modification time of a file.
inline void SetFileTimes(const fs::path& path,
                         std::chrono::system_clock::time_point accessed,
                         std::chrono::system_clock::time_point modified) {
  auto to_timespec = [](std::chrono::system_clock::time_point tp) {
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(
        tp.time_since_epoch());
    struct timespec ts {};
    ts.tv_sec = static_cast<time_t>(secs.count());
    ts.tv_nsec = 0;
    return ts;
  };
  const struct timespec times[2] = {to_timespec(accessed),
                                    to_timespec(modified)};
  ASSERT_EQ(::utimensat(AT_FDCWD, path.c_str(), times, 0), 0)
      << "utimensat failed for " << path;
}
