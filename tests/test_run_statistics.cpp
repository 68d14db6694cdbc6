#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include "OutputUtils.hpp"
#include "RunStatistics.hpp"

namespace fs = std::filesystem;

TEST(RunStatisticsTest, CountsRunsAndKeepsLongest)
{
    RunStatistics stats;
    stats.recordRunEnded({12.0, RunEndReason::DIVERGED});
    stats.recordRunEnded({30.5, RunEndReason::USER_RESET});
    stats.recordRunEnded({4.0, RunEndReason::DIVERGED});

    EXPECT_EQ(stats.totalRuns(), 3);
    EXPECT_DOUBLE_EQ(stats.longestRunSeconds(), 30.5);
}

TEST(RunStatisticsTest, TracksCurrentRunElapsed)
{
    RunStatistics stats;
    stats.markRunStarted(50.0);
    EXPECT_DOUBLE_EQ(stats.currentRunStart(), 50.0);
    EXPECT_DOUBLE_EQ(stats.currentRunElapsed(62.5), 12.5);
}

TEST(RunStatisticsTest, SaveAndLoad)
{
    fs::path file = fs::temp_directory_path() / "threebody_stats_roundtrip.json";
    fs::remove(file);

    RunStatistics stats;
    stats.recordRunEnded({7.25, RunEndReason::DIVERGED});
    stats.recordRunEnded({3.0, RunEndReason::DIVERGED});
    stats.save(file.string());

    RunStatistics loaded;
    ASSERT_TRUE(loaded.load(file.string()));
    EXPECT_EQ(loaded.totalRuns(), 2);
    EXPECT_DOUBLE_EQ(loaded.longestRunSeconds(), 7.25);

    fs::remove(file);
}

TEST(RunStatisticsTest, MissingFileGivesFreshCounters)
{
    RunStatistics stats;
    stats.recordRunEnded({1.0, RunEndReason::DIVERGED});
    EXPECT_FALSE(stats.load((fs::temp_directory_path() / "threebody_no_such_file.json").string()));
    EXPECT_EQ(stats.totalRuns(), 0);
    EXPECT_DOUBLE_EQ(stats.longestRunSeconds(), 0.0);
}

TEST(RunStatisticsTest, CorruptFileGivesFreshCounters)
{
    fs::path file = fs::temp_directory_path() / "threebody_stats_corrupt.json";
    {
        std::ofstream out(file);
        out << "{ \"totalRuns\": \"many\" ";
    }

    RunStatistics stats;
    EXPECT_FALSE(stats.load(file.string()));
    EXPECT_EQ(stats.totalRuns(), 0);

    fs::remove(file);
}

TEST(RunStatisticsTest, SaveToUnwritablePathThrows)
{
    RunStatistics stats;
    fs::path file = fs::temp_directory_path() / "threebody_missing_dir" / "nested" / "stats.json";
    EXPECT_THROW(stats.save(file.string()), std::runtime_error);
}

TEST(OutputUtilsTest, FormatDuration)
{
    EXPECT_EQ(formatDuration(0.0), "00:00.0");
    EXPECT_EQ(formatDuration(5.34), "00:05.3");
    EXPECT_EQ(formatDuration(65.0), "01:05.0");
    EXPECT_EQ(formatDuration(3599.99), "59:59.9");
    EXPECT_EQ(formatDuration(-2.0), "00:00.0");
}
