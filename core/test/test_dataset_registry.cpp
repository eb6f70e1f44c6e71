#include "test.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "tc/core/types/DatasetRegistry.hpp"
#include "tc/core/util/Errors.hpp"

using tc::Dataset;
using tc::DatasetRegistry;
using tc::Pattern;
using Names = std::vector<std::string>;

namespace
{

Dataset& shaped(Dataset& ds)
{
    ds.setShape({4, 5});
    ds.addPattern(Pattern("FRAME", {1}, {0}));
    return ds;
}

bool contains(const std::vector<tc::DatasetHandle>& handles, tc::DatasetHandle h)
{
    return std::find(handles.begin(), handles.end(), h) != handles.end();
}

}  // namespace

TEST(Registry, MergeMovesOutputsToInputs)
{
    DatasetRegistry reg;
    shaped(reg.createOutput("A"));
    shaped(reg.createOutput("B"));
    reg.mergeOutputsIntoInputs();

    EXPECT_EQ(reg.inputNames(), (Names{"A", "B"}));
    EXPECT_TRUE(reg.outputNames().empty());
}

TEST(Registry, FinaliseDropsRemovedOutputs)
{
    DatasetRegistry reg;
    shaped(reg.createOutput("A")).setRemove(true);
    shaped(reg.createOutput("B"));
    const auto a = reg.outputHandle("A");

    auto record = reg.finalise();
    EXPECT_FALSE(reg.hasInput("A"));
    EXPECT_TRUE(reg.hasInput("B"));
    EXPECT_TRUE(contains(record.remove, a));
    EXPECT_EQ(record.keep.size(), 1u);
    EXPECT_TRUE(reg.isRetired(a));
    EXPECT_TRUE(reg.outputMap().empty());
}

TEST(Registry, AlternatingPairKeepsLastWrittenBuffer)
{
    for (std::size_t iterations : {1u, 2u, 3u, 4u}) {
        DatasetRegistry reg;
        shaped(reg.createOutput("X"));
        shaped(reg.createOutput("Y"));
        const auto x = reg.outputHandle("X");
        const auto y = reg.outputHandle("Y");
        reg.registerAlternatingPair("X", "Y");

        // the buffer written on the last iteration
        const std::string last = reg.alternatingWriter("X", iterations - 1);
        const auto lastHandle = last == "X" ? x : y;

        reg.finaliseAlternatingPairs(iterations);
        EXPECT_FALSE(reg.output("X").remove());
        EXPECT_TRUE(reg.output("Y").remove());
        EXPECT_EQ(reg.outputHandle("X"), lastHandle);
        EXPECT_EQ(reg.at(lastHandle).name(), std::string("X"));
        EXPECT_TRUE(reg.alternatingPairs().empty());
    }
}

TEST(Registry, AlternatingRoles)
{
    DatasetRegistry reg;
    shaped(reg.createOutput("X"));
    shaped(reg.createOutput("Y"));
    reg.registerAlternatingPair("X", "Y");
    EXPECT_EQ(reg.alternatingWriter("X", 0), std::string("X"));
    EXPECT_EQ(reg.alternatingReader("X", 0), std::string("Y"));
    EXPECT_EQ(reg.alternatingWriter("X", 1), std::string("Y"));
    EXPECT_EQ(reg.alternatingReader("X", 1), std::string("X"));
    EXPECT_THROW((void)reg.alternatingWriter("Y", 0), tc::UnknownDatasetError);
}

TEST(Registry, AlternatingPairChecks)
{
    DatasetRegistry reg;
    shaped(reg.createOutput("X"));
    shaped(reg.createOutput("Y"));
    shaped(reg.createOutput("Z"));
    reg.createOutput("W").setShape({2, 2});

    EXPECT_THROW(reg.registerAlternatingPair("X", "X"), std::invalid_argument);
    EXPECT_THROW(reg.registerAlternatingPair("X", "missing"), tc::UnknownDatasetError);
    EXPECT_THROW(reg.registerAlternatingPair("X", "W"), tc::ShapeMismatchError);

    reg.registerAlternatingPair("X", "Y");
    EXPECT_NO_THROW(reg.registerAlternatingPair("X", "Y"));
    EXPECT_THROW(reg.registerAlternatingPair("Z", "Y"), std::logic_error);
    EXPECT_EQ(reg.alternatingPairs().size(), 1u);
    EXPECT_THROW(reg.finaliseAlternatingPairs(0), std::invalid_argument);
}

TEST(Registry, MergeOfNothingKeepsInputs)
{
    DatasetRegistry reg;
    shaped(reg.createInput("tomo"));
    const auto before = reg.inputMap();
    reg.mergeOutputsIntoInputs();
    EXPECT_EQ(reg.inputMap(), before);
}

TEST(Registry, MergeOverwritesAndDrops)
{
    DatasetRegistry reg;
    shaped(reg.createInput("tomo"));
    const auto old = reg.inputHandle("tomo");

    shaped(reg.createOutput("tomo"));
    shaped(reg.createOutput("scratch")).setRemove(true);
    const auto fresh = reg.outputHandle("tomo");
    reg.mergeOutputsIntoInputs();

    EXPECT_EQ(reg.inputHandle("tomo"), fresh);
    EXPECT_TRUE(reg.isRetired(old));
    EXPECT_FALSE(reg.hasInput("scratch"));
}

TEST(Registry, DuplicateOutputInOneStage)
{
    DatasetRegistry reg;
    reg.createOutput("A");
    EXPECT_THROW(reg.createOutput("A"), tc::DuplicateDatasetError);
    reg.mergeOutputsIntoInputs();
    // a new stage may declare it again
    EXPECT_NO_THROW(reg.createOutput("A"));
}

TEST(Registry, DuplicateErrorCarriesName)
{
    DatasetRegistry reg;
    reg.createOutput("A");
    try {
        reg.createOutput("A");
        EXPECT_TRUE(false);
    } catch (const tc::DuplicateDatasetError& e) {
        EXPECT_EQ(e.datasetName(), std::string("A"));
    }
}

TEST(Registry, CreateInputReturnsExisting)
{
    DatasetRegistry reg;
    Dataset& a = reg.createInput("tomo");
    a.setShape({3, 3});
    Dataset& b = reg.createInput("tomo");
    EXPECT_EQ(&a, &b);
    EXPECT_EQ(reg.inputNames().size(), 1u);
}

TEST(Registry, UnknownNames)
{
    DatasetRegistry reg;
    EXPECT_THROW((void)reg.input("nope"), tc::UnknownDatasetError);
    EXPECT_THROW((void)reg.output("nope"), tc::UnknownDatasetError);
    EXPECT_THROW((void)reg.inputHandle("nope"), tc::UnknownDatasetError);
}

TEST(Registry, FinaliseReplacesAndClearsPreview)
{
    DatasetRegistry reg;
    shaped(reg.createInput("tomo"));
    const auto prior = reg.inputHandle("tomo");

    Dataset& out = shaped(reg.createOutput("tomo"));
    out.setPreview(tc::Preview({{0, 2, 1}, {0, 5, 1}}));
    const auto produced = reg.outputHandle("tomo");

    auto record = reg.finalise();
    EXPECT_TRUE(contains(record.replace, prior));
    EXPECT_TRUE(contains(record.keep, produced));
    EXPECT_TRUE(reg.isRetired(prior));
    EXPECT_TRUE(reg.isRetired(produced));
    EXPECT_TRUE(reg.input("tomo").preview().empty());
    EXPECT_NE(reg.inputHandle("tomo"), produced);
}

TEST(Registry, FinaliseKeepsInputsWhoseOutputIsRemoved)
{
    DatasetRegistry reg;
    shaped(reg.createInput("tomo"));
    const auto prior = reg.inputHandle("tomo");
    shaped(reg.createOutput("tomo")).setRemove(true);

    reg.finalise();
    EXPECT_EQ(reg.inputHandle("tomo"), prior);
    EXPECT_FALSE(reg.isRetired(prior));
}

TEST(Registry, FinaliseUnreplicatesInputs)
{
    DatasetRegistry reg;
    Dataset& flat = shaped(reg.createInput("flat"));
    flat.replicate(3);
    reg.finalise();
    EXPECT_EQ(reg.input("flat").kind(), tc::DatasetKind::Plain);
    EXPECT_EQ(reg.input("flat").rank(), 2u);
}

TEST(Registry, CheckpointRestore)
{
    DatasetRegistry reg;
    EXPECT_THROW(reg.restoreCheckpoint(), std::logic_error);

    shaped(reg.createInput("tomo"));
    reg.captureCheckpoint();

    reg.input("tomo").setCurrentPattern("FRAME");
    shaped(reg.createOutput("normalised"));
    reg.mergeOutputsIntoInputs();
    EXPECT_TRUE(reg.hasInput("normalised"));
    const auto used = reg.inputHandle("tomo");

    reg.restoreCheckpoint();
    EXPECT_EQ(reg.inputNames(), (Names{"tomo"}));
    EXPECT_TRUE(reg.outputNames().empty());
    EXPECT_FALSE(reg.input("tomo").hasCurrentPattern());
    EXPECT_TRUE(reg.isRetired(used));
    EXPECT_NE(reg.inputHandle("tomo"), used);

    // restoring twice hands out fresh copies each time
    const auto first = reg.inputHandle("tomo");
    reg.restoreCheckpoint();
    EXPECT_NE(reg.inputHandle("tomo"), first);
}

TEST(Registry, StorageInUse)
{
    DatasetRegistry reg;
    shaped(reg.createInput("tomo")).setStorage(7);
    reg.captureCheckpoint();
    shaped(reg.createOutput("normalised")).setStorage(8);

    EXPECT_TRUE(reg.storageInUse(7));
    EXPECT_TRUE(reg.storageInUse(8));
    EXPECT_FALSE(reg.storageInUse(9));
    EXPECT_FALSE(reg.storageInUse(tc::kNoStorage));

    // the checkpoint still holds the storage of a replaced input
    shaped(reg.createOutput("tomo")).setStorage(9);
    auto record = reg.finalise();
    ASSERT_EQ(record.replace.size(), 1u);
    EXPECT_TRUE(reg.storageInUse(7));
    EXPECT_TRUE(reg.storageInUse(9));
}

TEST(Registry, ResetDropsEverything)
{
    DatasetRegistry reg;
    shaped(reg.createInput("tomo")).setStorage(3);
    reg.captureCheckpoint();
    shaped(reg.createOutput("A")).setStorage(4);
    shaped(reg.createOutput("B"));
    reg.finalise();
    reg.restoreCheckpoint();
    EXPECT_GT(reg.storeSize(), 0u);

    auto held = reg.reset();
    EXPECT_EQ(held, (std::set<tc::StorageHandle>{3, 4}));
    EXPECT_EQ(reg.storeSize(), 0u);
    EXPECT_TRUE(reg.inputNames().empty());
    EXPECT_FALSE(reg.hasCheckpoint());
    EXPECT_THROW(reg.restoreCheckpoint(), std::logic_error);

    // names are free again
    EXPECT_NO_THROW(reg.createOutput("A"));
    EXPECT_THROW((void)reg.input("tomo"), tc::UnknownDatasetError);
}

TEST(Registry, SnapshotAndInstallOutputs)
{
    DatasetRegistry reg;
    shaped(reg.createOutput("A"));
    const auto snapshot = reg.snapshotOutputs();
    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_TRUE(reg.isRetired(snapshot.at("A")));

    reg.output("A").setRemove(true);
    reg.mergeOutputsIntoInputs();

    reg.installOutputs(snapshot);
    ASSERT_TRUE(reg.hasOutput("A"));
    EXPECT_FALSE(reg.output("A").remove());
    EXPECT_NE(reg.outputHandle("A"), snapshot.at("A"));
    // the installed name is handed back on its first declaration
    Dataset& again = reg.createOutput("A");
    EXPECT_EQ(&again, &reg.output("A"));
    EXPECT_THROW(reg.createOutput("A"), tc::DuplicateDatasetError);
}
