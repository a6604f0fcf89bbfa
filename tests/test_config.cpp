#include "Core/Config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace
{
    boost::json::object Sample()
    {
        return boost::json::parse(R"({"name":"n1","port":4160,"big":18446744073709551615,
                                      "on":true,"nothing":null,"str_port":"80"})").as_object();
    }
}

TEST(Config, OptionalReadsTypedValues)
{
    const auto o = Sample();
    EXPECT_EQ(Config::OptionalString(o, "name", "def"), "n1");
    EXPECT_EQ(Config::OptionalInt(o, "port", 0), 4160);
    EXPECT_TRUE(Config::OptionalBool(o, "on", false));
}

TEST(Config, OptionalThrowsOnWrongType)
{
    const auto o = Sample();
    EXPECT_THROW(Config::OptionalInt(o, "str_port", 0), std::invalid_argument);
    EXPECT_THROW(Config::OptionalInt(o, "big", 0), std::invalid_argument);
    EXPECT_THROW(Config::OptionalBool(o, "port", false), std::invalid_argument);
    EXPECT_THROW(Config::OptionalString(o, "on", ""), std::invalid_argument);
}

TEST(Config, OptionalFallsBackToDefault)
{
    const auto o = Sample();
    EXPECT_EQ(Config::OptionalString(o, "absent", "def"), "def");
    EXPECT_EQ(Config::OptionalString(o, "nothing", "def"), "def");
    EXPECT_EQ(Config::OptionalInt(o, "absent", 7), 7);
    EXPECT_FALSE(Config::OptionalBool(o, "absent", false));
    EXPECT_THROW(Config::OptionalInt(o, "name", 7), std::invalid_argument);
}

TEST(Config, LoadObjectFile)
{
    const auto dir = std::filesystem::temp_directory_path() / "podweave_config_test";
    std::filesystem::create_directories(dir);

    const auto good = dir / "good.json";
    std::ofstream(good) << R"({"node_name":"n1"})";
    EXPECT_EQ(Config::OptionalString(Config::LoadObjectFile(good.string()), "node_name", ""), "n1");

    const auto array = dir / "array.json";
    std::ofstream(array) << "[1,2]";
    EXPECT_THROW(Config::LoadObjectFile(array.string()), std::invalid_argument);

    const auto broken = dir / "broken.json";
    std::ofstream(broken) << "{\"a\":";
    EXPECT_THROW(Config::LoadObjectFile(broken.string()), std::invalid_argument);

    EXPECT_THROW(Config::LoadObjectFile((dir / "missing.json").string()), std::runtime_error);

    std::filesystem::remove_all(dir);
}
