#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include "ConfigParser.hpp"

namespace fs = std::filesystem;

TEST(ConfigParserTest, EmptyDocumentKeepsDefaults)
{
    Config cfg = configFromJson(json::object());

    EXPECT_EQ(cfg.outputMode, OutputMode::VISUALIZATION);
    EXPECT_EQ(cfg.simulation.bodyCount, 3);
    EXPECT_EQ(cfg.simulation.trailCapacity, 60u);
    EXPECT_DOUBLE_EQ(cfg.simulation.gravitationalConstant, 0.4);
    EXPECT_DOUBLE_EQ(cfg.simulation.minDistance, 10.0);
    EXPECT_DOUBLE_EQ(cfg.simulation.forceCap, 10000.0);
    EXPECT_DOUBLE_EQ(cfg.simulation.forceDamping, 0.25);
    EXPECT_DOUBLE_EQ(cfg.simulation.divergenceMultiplier, 1.6);
    EXPECT_DOUBLE_EQ(cfg.simulation.cameraEase, 0.995);
    EXPECT_DOUBLE_EQ(cfg.simulation.initialZoom, 0.875);
    EXPECT_DOUBLE_EQ(cfg.simulation.massMin, 20.0);
    EXPECT_DOUBLE_EQ(cfg.simulation.massMax, 60.0);
    EXPECT_DOUBLE_EQ(cfg.simulation.speedMin * cfg.simulation.speedScale, 0.025);
    EXPECT_DOUBLE_EQ(cfg.simulation.speedMax * cfg.simulation.speedScale, 0.275);
    ASSERT_EQ(cfg.palette.size(), 3u);
    EXPECT_EQ(toHexColor(cfg.palette[0]), "#ffbf00");
    EXPECT_EQ(toHexColor(cfg.palette[1]), "#00ffff");
    EXPECT_EQ(toHexColor(cfg.palette[2]), "#ffffff");
}

TEST(ConfigParserTest, ReadsAllSections)
{
    json j = json::parse(R"({
        "outputMode": "HEADLESS",
        "headlessSteps": 500,
        "window": { "width": 800, "height": 600, "title": "Test" },
        "simulation": { "trailCapacity": 30, "cameraEase": 0.0, "seed": 9, "stepRate": 120.0 },
        "palette": ["#ff0000", "#00ff00"],
        "statistics": { "file": "s.json", "runLog": "r.csv" }
    })");
    Config cfg = configFromJson(j);

    EXPECT_EQ(cfg.outputMode, OutputMode::HEADLESS);
    EXPECT_EQ(cfg.headlessSteps, 500);
    EXPECT_EQ(cfg.windowWidth, 800);
    EXPECT_EQ(cfg.windowHeight, 600);
    EXPECT_EQ(cfg.windowTitle, "Test");
    EXPECT_EQ(cfg.simulation.trailCapacity, 30u);
    EXPECT_DOUBLE_EQ(cfg.simulation.cameraEase, 0.0);
    EXPECT_EQ(cfg.simulation.seed, 9u);
    EXPECT_DOUBLE_EQ(cfg.simulation.stepRate, 120.0);
    ASSERT_EQ(cfg.palette.size(), 2u);
    EXPECT_FLOAT_EQ(cfg.palette[0].r, 1.0f);
    EXPECT_FLOAT_EQ(cfg.palette[1].g, 1.0f);
    EXPECT_EQ(cfg.statsFile, "s.json");
    EXPECT_EQ(cfg.runLogFile, "r.csv");
}

TEST(ConfigParserTest, RejectsBadValues)
{
    EXPECT_THROW(configFromJson(json::parse(R"({"outputMode": "CSV"})")), std::runtime_error);
    EXPECT_THROW(configFromJson(json::parse(R"({"simulation": {"gravitationalConstant": "strong"}})")),
                 std::runtime_error);
    EXPECT_THROW(configFromJson(json::parse(R"({"simulation": {"massMin": 70.0}})")), std::runtime_error);
    EXPECT_THROW(configFromJson(json::parse(R"({"simulation": {"cameraEase": 1.2}})")), std::runtime_error);
    EXPECT_THROW(configFromJson(json::parse(R"({"window": {"width": 0}})")), std::runtime_error);
    EXPECT_THROW(configFromJson(json::parse(R"({"palette": ["red"]})")), std::runtime_error);
    EXPECT_THROW(configFromJson(json::parse(R"({"palette": []})")), std::runtime_error);
    EXPECT_THROW(configFromJson(json::parse("[1, 2]")), std::runtime_error);
}

TEST(ConfigParserTest, RejectsNegativeUnsignedValues)
{
    EXPECT_THROW(configFromJson(json::parse(R"({"simulation": {"trailCapacity": -1}})")), std::runtime_error);
    EXPECT_THROW(configFromJson(json::parse(R"({"simulation": {"seed": -7}})")), std::runtime_error);
    EXPECT_THROW(configFromJson(json::parse(R"({"simulation": {"seed": 4294967296}})")), std::runtime_error);

    Config cfg = configFromJson(json::parse(R"({"simulation": {"trailCapacity": 5, "seed": 4294967295}})"));
    EXPECT_EQ(cfg.simulation.trailCapacity, 5u);
    EXPECT_EQ(cfg.simulation.seed, 4294967295u);
}

TEST(ConfigParserTest, ParseConfigFile)
{
    fs::path file = fs::temp_directory_path() / "threebody_config_test.json";
    {
        std::ofstream out(file);
        out << R"({ "simulation": { "bodyCount": 3, "minDistance": 12.5 } })";
    }
    Config cfg = parseConfig(file.string());
    EXPECT_DOUBLE_EQ(cfg.simulation.minDistance, 12.5);
    fs::remove(file);
}

TEST(ConfigParserTest, MissingOrMalformedFileThrows)
{
    fs::path missing = fs::temp_directory_path() / "threebody_config_missing.json";
    fs::remove(missing);
    EXPECT_THROW(parseConfig(missing.string()), std::runtime_error);

    fs::path broken = fs::temp_directory_path() / "threebody_config_broken.json";
    {
        std::ofstream out(broken);
        out << "{ \"window\": ";
    }
    EXPECT_THROW(parseConfig(broken.string()), std::runtime_error);
    fs::remove(broken);
}

TEST(ColorTest, ParsesHexStrings)
{
    Color c = parseHexColor("#FF8000");
    EXPECT_FLOAT_EQ(c.r, 1.0f);
    EXPECT_NEAR(c.g, 128.0f / 255.0f, 1e-6);
    EXPECT_FLOAT_EQ(c.b, 0.0f);
    EXPECT_FLOAT_EQ(c.a, 1.0f);

    Color translucent = parseHexColor("#00000080");
    EXPECT_NEAR(translucent.a, 128.0f / 255.0f, 1e-6);

    EXPECT_EQ(toHexColor(parseHexColor("#12abef")), "#12abef");
    EXPECT_THROW(parseHexColor("12abef"), std::runtime_error);
    EXPECT_THROW(parseHexColor("#12abeg"), std::runtime_error);
}
