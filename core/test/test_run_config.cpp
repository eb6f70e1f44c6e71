#include "test.hpp"

#include <stdexcept>

#include <nlohmann/json.hpp>

#include "tc/core/util/RunConfig.hpp"

TEST(RunConfig, Defaults)
{
    auto cfg = tc::RunConfig::fromJson(nlohmann::json::object());
    EXPECT_EQ(cfg.logLevel, std::string("info"));
    EXPECT_TRUE(cfg.logFile.empty());
    EXPECT_TRUE(cfg.metadataFile.empty());
    EXPECT_FALSE(cfg.mpi);
    EXPECT_EQ(cfg.defaultMaxFrames, 1u);
}

TEST(RunConfig, ReadsEveryKey)
{
    nlohmann::json j = {
        {"log_level", "debug"},
        {"log_file", "run.log"},
        {"metadata_file", "pipeline.json"},
        {"mpi", true},
        {"default_max_frames", 8}};
    auto cfg = tc::RunConfig::fromJson(j);
    EXPECT_EQ(cfg.logLevel, std::string("debug"));
    EXPECT_EQ(cfg.logFile.string(), std::string("run.log"));
    EXPECT_EQ(cfg.metadataFile.string(), std::string("pipeline.json"));
    EXPECT_TRUE(cfg.mpi);
    EXPECT_EQ(cfg.defaultMaxFrames, 8u);
}

TEST(RunConfig, NumbersMayBeStrings)
{
    nlohmann::json j = {{"default_max_frames", "4"}};
    EXPECT_EQ(tc::RunConfig::fromJson(j).defaultMaxFrames, 4u);
}

TEST(RunConfig, RejectsInvalidValues)
{
    nlohmann::json zero = {{"default_max_frames", 0}};
    EXPECT_THROW(tc::RunConfig::fromJson(zero), std::runtime_error);
    EXPECT_THROW(tc::RunConfig::fromJson(nlohmann::json::array()), std::runtime_error);
    for (const char* text : {"nan", "inf", "-3", "1.5", "1e30"}) {
        nlohmann::json j = {{"default_max_frames", text}};
        EXPECT_THROW(tc::RunConfig::fromJson(j), std::runtime_error);
    }
    nlohmann::json fraction = {{"default_max_frames", 2.5}};
    EXPECT_THROW(tc::RunConfig::fromJson(fraction), std::runtime_error);
    nlohmann::json huge = {{"default_max_frames", 1e300}};
    EXPECT_THROW(tc::RunConfig::fromJson(huge), std::runtime_error);
    nlohmann::json whole = {{"default_max_frames", 3.0}};
    EXPECT_EQ(tc::RunConfig::fromJson(whole).defaultMaxFrames, 3u);
    EXPECT_THROW(tc::RunConfig::load("/nonexistent/tc_run.json"), std::runtime_error);
}
