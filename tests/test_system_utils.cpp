#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "SystemUtils.hpp"

namespace fs = std::filesystem;

TEST(FolderManagerTest, CreatesNestedDirectoriesAndKeepsContents) {
    fs::path root = fs::temp_directory_path() / "cmbdaq_folder_manager";
    fs::remove_all(root);
    fs::path nested = root / "Data" / "BW";

    ASSERT_TRUE(folder_manager(nested.string()));
    EXPECT_TRUE(fs::is_directory(nested));

    fs::path existing = nested / "2016-11-10_10:20:50_Readout.txt";
    { std::ofstream(existing) << "# kept\n"; }
    ASSERT_TRUE(folder_manager(nested.string()));
    EXPECT_TRUE(fs::exists(existing));

    fs::remove_all(root);
}

TEST(FolderManagerTest, RegularFileIsNotADirectory) {
    fs::path file = fs::temp_directory_path() / "cmbdaq_folder_manager_file";
    { std::ofstream(file) << "x"; }

    EXPECT_FALSE(folder_manager(file.string()));

    fs::remove(file);
}

TEST(OutputDirectoryTest, ParentOfPrefix) {
    EXPECT_EQ(output_directory("./Data/BW"), "./Data");
    EXPECT_EQ(output_directory("BW"), ".");
    EXPECT_EQ(output_directory("/srv/cmb/run_"), "/srv/cmb");
}

TEST(DiskSpaceTest, ZeroThresholdNeverLow) {
    EXPECT_FALSE(is_disk_space_below_threshold(fs::temp_directory_path().c_str(), 0.0));
}

TEST(PrintDurationTest, MinutesSecondsMillis) {
    std::ostringstream out;
    print_duration("Run", 0, 61'250'000'000ULL, out);
    EXPECT_NE(out.str().find("1 min 1 sec 250 ms"), std::string::npos);
}

TEST(PrintProgressTest, DrawsBar) {
    std::ostringstream out;
    print_progress(15.0, 30.0, "Progress:", "Complete", 10, out);
    EXPECT_EQ(out.str(), "\rProgress: |#####-----| 50.0% Complete");
}

TEST(ProgressPrinterTest, ReportsOncePerInterval) {
    std::ostringstream out;
    ProgressCallback progress = make_progress_printer(10.0, out);

    for (double t = 0.0; t <= 30.0; t += 0.125) {
        progress(t, 30.0);
    }

    std::string text = out.str();
    std::size_t redraws = 0;
    for (char c : text) {
        if (c == '\r') {
            ++redraws;
        }
    }
    // t = 0, 10, 20, 30
    EXPECT_EQ(redraws, 4u);
}

TEST(WaitUntilTest, ReturnsOnceReady) {
    int polls = 0;
    auto ready = [&polls]() { return ++polls >= 3; };

    EXPECT_TRUE(wait_until(ready, std::chrono::steady_clock::now() + std::chrono::seconds(5),
                           std::chrono::microseconds(100)));
    EXPECT_EQ(polls, 3);
}

TEST(WaitUntilTest, SleepsBetweenPollsUntilDeadline) {
    int polls = 0;
    auto never = [&polls]() { ++polls; return false; };
    const auto start = std::chrono::steady_clock::now();

    EXPECT_FALSE(wait_until(never, start + std::chrono::milliseconds(20), std::chrono::milliseconds(5)));

    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(20));
    // A sleeping poll runs a handful of times, not millions
    EXPECT_LE(polls, 10);
}
