#include "test.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "tc/core/pipeline/PipelineMetadata.hpp"

using tc::DatasetEntry;
using tc::PipelineMetadata;
using tc::StageEntry;

namespace
{

DatasetEntry entry(const std::string& name, const std::string& pattern)
{
    return {name, pattern, {8, 4, 4}, "float32", ""};
}

// load -> normalise(tomo) -> filter(normalised) -> overwrite(normalised) -> recon(normalised)
PipelineMetadata chain()
{
    PipelineMetadata meta;
    meta.addStage({0, "normalise", 4, {entry("tomo", "PROJECTION")}, {entry("normalised", "PROJECTION")}});
    meta.addStage({0, "filter", 1, {entry("normalised", "SINOGRAM")}, {entry("filtered", "SINOGRAM")}});
    meta.addStage({0, "rewrite", 1, {entry("filtered", "SINOGRAM")}, {entry("normalised", "VOLUME_XZ")}});
    meta.addStage({0, "recon", 2, {entry("normalised", "TANGENTOGRAM")}, {entry("volume", "VOLUME_XZ")}});
    return meta;
}

std::filesystem::path scratch(const char* name)
{
    auto p = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove(p);
    return p;
}

}  // namespace

TEST(Metadata, StagesAreIndexedInOrder)
{
    auto meta = chain();
    ASSERT_EQ(meta.stageCount(), 4u);
    EXPECT_EQ(meta.stages()[2].index, 2u);
    EXPECT_EQ(meta.stages()[3].name, std::string("recon"));
}

TEST(Metadata, ResolvesNextPatterns)
{
    auto meta = chain();
    meta.resolveNextPatterns();
    const auto& s = meta.stages();
    // first consumer wins
    EXPECT_EQ(s[0].outputs[0].nextPattern, std::string("SINOGRAM"));
    EXPECT_EQ(s[1].outputs[0].nextPattern, std::string("SINOGRAM"));
    EXPECT_EQ(s[2].outputs[0].nextPattern, std::string("TANGENTOGRAM"));
    EXPECT_TRUE(s[3].outputs[0].nextPattern.empty());
}

TEST(Metadata, OverwrittenOutputHasNoConsumer)
{
    PipelineMetadata meta;
    meta.addStage({0, "a", 1, {}, {entry("tmp", "FRAME")}});
    meta.addStage({0, "b", 1, {}, {entry("tmp", "FRAME")}});
    meta.addStage({0, "c", 1, {entry("tmp", "SINOGRAM")}, {}});
    meta.resolveNextPatterns();
    EXPECT_TRUE(meta.stages()[0].outputs[0].nextPattern.empty());
    EXPECT_EQ(meta.stages()[1].outputs[0].nextPattern, std::string("SINOGRAM"));
}

TEST(Metadata, JsonRoundTrip)
{
    auto meta = chain();
    meta.resolveNextPatterns();
    auto back = PipelineMetadata::fromJson(meta.toJson());
    EXPECT_EQ(back.stages(), meta.stages());
}

TEST(Metadata, SaveAndLoad)
{
    auto path = scratch("tc_test_metadata.json");
    auto meta = chain();
    meta.save(path);
    auto back = PipelineMetadata::load(path);
    EXPECT_EQ(back.stages(), meta.stages());
    std::filesystem::remove(path);
}

TEST(Metadata, LoadFailures)
{
    EXPECT_THROW(PipelineMetadata::load(scratch("tc_test_missing.json")), std::runtime_error);

    auto path = scratch("tc_test_broken.json");
    {
        std::ofstream out(path);
        out << "{\"stages\": [";
    }
    EXPECT_THROW(PipelineMetadata::load(path), std::runtime_error);
    std::filesystem::remove(path);

    EXPECT_THROW(PipelineMetadata::fromJson(nlohmann::json::object()), std::runtime_error);
    auto noShape = nlohmann::json::parse(R"({
        "stages": [{"name": "a", "inputs": [{"name": "x", "pattern": "P"}], "outputs": []}]
    })");
    EXPECT_THROW(PipelineMetadata::fromJson(noShape), std::runtime_error);
}
