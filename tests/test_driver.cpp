#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include "Driver.hpp"
#include "RunStatistics.hpp"

namespace {

SimulationConfig driverConfig()
{
    SimulationConfig cfg;
    cfg.seed = 31337;
    cfg.stepRate = 10.0;
    cfg.maxStepsPerFrame = 4;
    return cfg;
}

std::vector<Body> farApartBodies()
{
    return {
        Body(Vector2(-1000.0, 0.0), Vector2(), 30.0),
        Body(Vector2(1000.0, 0.0), Vector2(), 30.0),
        Body(Vector2(0.0, 0.0), Vector2(), 30.0),
    };
}

}

TEST(DriverTest, AdvanceStepsAtFixedRate)
{
    double now = 0.0;
    Driver driver(driverConfig(), 800.0, 600.0, StatisticsSink(), [&now]() { return now; });

    EXPECT_EQ(driver.advance(0.05), 0);   // half a step accumulated
    EXPECT_EQ(driver.advance(0.06), 1);   // 0.11 -> one step, 0.01 left
    EXPECT_EQ(driver.advance(0.2), 2);    // 0.21 -> two steps
    EXPECT_EQ(driver.simulation().bodies()[0].trail().size(), 3u);
}

TEST(DriverTest, AdvanceCapsStepsPerFrame)
{
    double now = 0.0;
    Driver driver(driverConfig(), 800.0, 600.0, StatisticsSink(), [&now]() { return now; });

    EXPECT_EQ(driver.advance(5.0), 4);
    // The backlog is dropped rather than replayed
    EXPECT_EQ(driver.advance(0.05), 0);
}

TEST(DriverTest, PauseStopsStepping)
{
    double now = 0.0;
    Driver driver(driverConfig(), 800.0, 600.0, StatisticsSink(), [&now]() { return now; });

    driver.togglePause();
    EXPECT_TRUE(driver.isPaused());
    EXPECT_EQ(driver.advance(1.0), 0);

    driver.togglePause();
    EXPECT_EQ(driver.advance(0.1), 1);
}

TEST(DriverTest, UserResetIsRecordedWithItsDuration)
{
    double now = 100.0;
    Driver driver(driverConfig(), 800.0, 600.0, StatisticsSink(), [&now]() { return now; });

    now = 104.5;
    EXPECT_DOUBLE_EQ(driver.currentRunSeconds(), 4.5);
    driver.requestReset();

    EXPECT_EQ(driver.statistics().totalRuns(), 1);
    EXPECT_DOUBLE_EQ(driver.statistics().longestRunSeconds(), 4.5);
    EXPECT_DOUBLE_EQ(driver.statistics().currentRunStart(), 104.5);
    EXPECT_DOUBLE_EQ(driver.currentRunSeconds(), 0.0);
}

TEST(DriverTest, DivergenceFeedsStatistics)
{
    double now = 0.0;
    Driver driver(driverConfig(), 800.0, 600.0, StatisticsSink(), [&now]() { return now; });

    now = 8.0;
    driver.simulation().loadBodies(farApartBodies());
    EXPECT_TRUE(driver.stepOnce());

    now = 10.0;
    driver.simulation().loadBodies(farApartBodies());
    EXPECT_TRUE(driver.stepOnce());

    EXPECT_EQ(driver.statistics().totalRuns(), 2);
    EXPECT_DOUBLE_EQ(driver.statistics().longestRunSeconds(), 8.0);
    EXPECT_DOUBLE_EQ(driver.statistics().currentRunStart(), 10.0);
}

TEST(DriverTest, PersistsStatisticsAndRunLog)
{
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "threebody_driver_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    StatisticsSink sink{(dir / "stats.json").string(), (dir / "runs.csv").string()};

    double now = 0.0;
    {
        Driver driver(driverConfig(), 800.0, 600.0, sink, [&now]() { return now; });
        now = 3.0;
        driver.requestReset();
        now = 4.0;
        driver.requestReset();
    }

    RunStatistics reloaded;
    ASSERT_TRUE(reloaded.load(sink.statsFile));
    EXPECT_EQ(reloaded.totalRuns(), 2);
    EXPECT_DOUBLE_EQ(reloaded.longestRunSeconds(), 3.0);

    std::ifstream log(sink.runLogFile);
    std::string header, first, second;
    std::getline(log, header);
    std::getline(log, first);
    std::getline(log, second);
    EXPECT_EQ(header, "run,duration_seconds,reason");
    EXPECT_EQ(first, "1,3.000,reset");
    EXPECT_EQ(second, "2,1.000,reset");

    // A new driver continues from the persisted counters
    Driver again(driverConfig(), 800.0, 600.0, sink, [&now]() { return now; });
    EXPECT_EQ(again.statistics().totalRuns(), 2);

    fs::remove_all(dir);
}
