#include <gtest/gtest.h>

#include <chrono>
#include <exiv2/exiv2.hpp>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "../IOManager.hpp"
#include "../utils.hpp"
#include "TestHelpers.hpp"

namespace fs = std::filesystem;

class IOManagerTest : public TempDirTest {
 protected:
  void TearDown() override {
    IOManager::set_log_handler(nullptr);
    TempDirTest::TearDown();
  }

  // Writes a blank JPEG carrying the given Exif.Photo.DateTimeOriginal
  // (none when `captured` is empty).
  fs::path CreateJpeg(const fs::path& relative_path,
                      const std::string& captured) {
    const fs::path path = test_dir / relative_path;
    Exiv2::Image::UniquePtr image = Exiv2::ImageFactory::create(
        Exiv2::ImageType::jpeg, safe_path_to_string(path));
    if (!captured.empty()) {
      image->exifData()["Exif.Photo.DateTimeOriginal"] = captured;
    }
    image->exifData()["Exif.Image.Make"] = std::string("TestCam");
    image->writeMetadata();
    return path;
  }
};

TEST_F(IOManagerTest, LoadsEveryConfigurationKey) {
  fs::path config = CreateDummyFile("config.json", R"({
    "output_dir": "sorted",
    "strip": 2,
    "policy": "oldest",
    "patterns": ["*.jpg"],
    "not_patterns": ["*~", ".*"],
    "dry_run": true,
    "force": true,
    "verbose": true,
    "log_file": "run.log",
    "per_directory": true
  })");

  auto options = IOManager::load_config(config);

  ASSERT_TRUE(options.has_value());
  EXPECT_EQ(options->output_dir, fs::path("sorted"));
  EXPECT_EQ(options->strip, 2u);
  EXPECT_EQ(options->policy, AgePolicy::OLDEST);
  EXPECT_EQ(options->patterns, std::vector<std::string>{"*.jpg"});
  EXPECT_EQ(options->not_patterns, (std::vector<std::string>{"*~", ".*"}));
  EXPECT_TRUE(options->dry_run);
  EXPECT_TRUE(options->force);
  EXPECT_TRUE(options->verbose);
  EXPECT_EQ(options->log_file, fs::path("run.log"));
  EXPECT_TRUE(options->per_directory);
}

TEST_F(IOManagerTest, MissingKeysKeepDefaults) {
  fs::path config = CreateDummyFile("config.json", R"({"strip": 1})");

  auto options = IOManager::load_config(config);

  ASSERT_TRUE(options.has_value());
  EXPECT_EQ(options->strip, 1u);
  EXPECT_TRUE(options->output_dir.empty());
  EXPECT_EQ(options->policy, AgePolicy::MODIFIED);
  EXPECT_FALSE(options->force);
}

TEST_F(IOManagerTest, BrokenConfigurationIsRejected) {
  std::vector<std::string> logged;
  IOManager::set_log_handler(
      [&](std::string_view message) { logged.emplace_back(message); });

  EXPECT_FALSE(IOManager::load_config(test_dir / "missing.json"));
  EXPECT_FALSE(
      IOManager::load_config(CreateDummyFile("bad.json", "{ not json")));
  EXPECT_FALSE(IOManager::load_config(CreateDummyFile("list.json", "[1, 2]")));
  EXPECT_FALSE(IOManager::load_config(
      CreateDummyFile("types.json", R"({"strip": "two"})")));
  EXPECT_FALSE(IOManager::load_config(
      CreateDummyFile("negative.json", R"({"strip": -1})")));
  EXPECT_FALSE(IOManager::load_config(
      CreateDummyFile("fraction.json", R"({"strip": 1.5})")));
  EXPECT_FALSE(IOManager::load_config(
      CreateDummyFile("policy.json", R"({"policy": "olddest"})")));
  EXPECT_FALSE(IOManager::load_config(
      CreateDummyFile("policy_type.json", R"({"policy": 3})")));

  EXPECT_EQ(logged.size(), 8u);
}

TEST_F(IOManagerTest, LogLinesAreTimestampedAndWrittenToFile) {
  fs::path logPath = test_dir / "organize.log";
  ASSERT_TRUE(IOManager::initialize_logger(logPath));

  std::string seen;
  IOManager::set_log_handler(
      [&](std::string_view message) { seen = std::string(message); });
  IOManager::log("hello");

  // "YYYY-MM-DD HH:MM:SS | hello"
  ASSERT_EQ(seen.size(), 27u);
  EXPECT_EQ(seen.substr(19), " | hello");
  EXPECT_NE(ReadFile(logPath).find(seen), std::string::npos);
}

TEST_F(IOManagerTest, ModifiedPolicyUsesMtime) {
  fs::path file = CreateDummyFile("a.txt");
  SetFileTimes(file, MakeTime(2005, 6, 1), MakeTime(2013, 3, 2));

  EXPECT_EQ(year_string(
                IOManager::get_file_timestamp(file, AgePolicy::MODIFIED)),
            "2013");
}

TEST_F(IOManagerTest, OldestPolicyPicksEarliestTimestamp) {
  fs::path file = CreateDummyFile("a.txt");
  SetFileTimes(file, MakeTime(2001, 7, 14), MakeTime(2004, 12, 8));

  const Timestamp oldest =
      IOManager::get_file_timestamp(file, AgePolicy::OLDEST);
  EXPECT_EQ(oldest, MakeTime(2001, 7, 14));
  EXPECT_EQ(year_string(oldest), "2001");
}

TEST_F(IOManagerTest, NewestPolicyPicksLatestTimestamp) {
  fs::path file = CreateDummyFile("a.txt");
  SetFileTimes(file, MakeTime(2001, 7, 14), MakeTime(2004, 12, 8));

  // ctime cannot be set from user space; it is "now".
  const Timestamp newest =
      IOManager::get_file_timestamp(file, AgePolicy::NEWEST);
  EXPECT_GT(newest, MakeTime(2004, 12, 8));
  EXPECT_EQ(year_string(newest),
            year_string(std::chrono::system_clock::now()));
}

TEST_F(IOManagerTest, ExifPolicyFallsBackToMtime) {
  // Not a real JPEG: Exiv2 fails to read it and mtime is used.
  fs::path fake = CreateDummyFile("fake.jpg", "not an image");
  SetFileTimes(fake, MakeTime(2010, 1, 1), MakeTime(2012, 5, 5));
  EXPECT_FALSE(IOManager::get_exif_timestamp(fake).has_value());
  EXPECT_EQ(year_string(IOManager::get_file_timestamp(fake, AgePolicy::EXIF)),
            "2012");

  // Non-image extensions are never handed to Exiv2.
  fs::path text = CreateDummyFile("notes.txt");
  SetFileTimes(text, MakeTime(2010, 1, 1), MakeTime(2011, 5, 5));
  EXPECT_EQ(year_string(IOManager::get_file_timestamp(text, AgePolicy::EXIF)),
            "2011");
}

TEST_F(IOManagerTest, ExifCaptureDateWinsOverMtime) {
  fs::path photo = CreateJpeg("photo.jpg", "2009:05:06 14:05:59");
  SetFileTimes(photo, MakeTime(2015, 1, 1), MakeTime(2015, 1, 1));

  auto captured = IOManager::get_exif_timestamp(photo);
  ASSERT_TRUE(captured.has_value());
  EXPECT_EQ(year_string(*captured), "2009");
  EXPECT_EQ(year_string(IOManager::get_file_timestamp(photo, AgePolicy::EXIF)),
            "2009");

  // Other policies ignore the metadata.
  EXPECT_EQ(year_string(
                IOManager::get_file_timestamp(photo, AgePolicy::MODIFIED)),
            "2015");
}

TEST_F(IOManagerTest, UnusableExifDatesFallBackToMtime) {
  struct Case {
    const char* name;
    const char* captured;
  };
  const Case cases[] = {{"zeros.jpg", "0000:00:00 00:00:00"},
                        {"month.jpg", "2009:13:06 14:05:59"},
                        {"separators.jpg", "2009-05-06 14:05:59"},
                        {"short.jpg", "2009:05:06"},
                        {"absent.jpg", ""}};

  for (const auto& c : cases) {
    SCOPED_TRACE(c.name);
    fs::path photo = CreateJpeg(c.name, c.captured);
    SetFileTimes(photo, MakeTime(2015, 1, 1), MakeTime(2016, 1, 1));

    EXPECT_FALSE(IOManager::get_exif_timestamp(photo).has_value());
    EXPECT_EQ(
        year_string(IOManager::get_file_timestamp(photo, AgePolicy::EXIF)),
        "2016");
  }
}

TEST_F(IOManagerTest, MissingFileThrows) {
  EXPECT_THROW(IOManager::get_file_timestamp(test_dir / "gone.jpg",
                                             AgePolicy::MODIFIED),
               fs::filesystem_error);
}
