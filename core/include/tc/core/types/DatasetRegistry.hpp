#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "tc/core/types/Dataset.hpp"

namespace tc
{

// Stable index of a dataset in the registry's append-only store
using DatasetHandle = std::size_t;
using DatasetMap = std::map<std::string, DatasetHandle>;

/**
 * @brief Decisions taken when a stage's outputs are folded into the inputs.
 *
 * Created fresh for each stage, consumed by DatasetRegistry::reorganise().
 */
struct TransitionRecord {
    // Outputs flagged remove: dropped
    std::vector<DatasetHandle> remove;
    // Outputs that continue as inputs of the next stage
    std::vector<DatasetHandle> keep;
    // Prior inputs overwritten by an output of the same name
    std::vector<DatasetHandle> replace;
};

/** @brief Read/write buffers swapped on every iteration of an iterative stage */
struct AlternatingPair {
    std::string visible;
    std::string partner;
};

/**
 * @brief Owner of every dataset of a pipeline run.
 *
 * Datasets live in an append-only store and are addressed by DatasetHandle;
 * the input and output sets are name -> handle maps into that store.
 * References returned by the accessors stay valid for the registry's
 * lifetime. A checkpoint is a saved handle map; restoring it hands out fresh
 * copies so the checkpointed datasets themselves are never modified.
 */
class DatasetRegistry
{
public:
    DatasetRegistry() = default;

    DatasetRegistry(const DatasetRegistry&) = delete;
    DatasetRegistry& operator=(const DatasetRegistry&) = delete;

    // --- loading ---

    /**
     * @brief Drop every dataset, the checkpoint included, before loading again.
     * @return the storage handles the dropped datasets held
     */
    std::set<StorageHandle> reset();

    // Loaders only; returns the existing input when the name is taken
    Dataset& createInput(const std::string& name);

    void captureCheckpoint();
    [[nodiscard]] bool hasCheckpoint() const { return hasCheckpoint_; }

    /**
     * @brief Reset the inputs to the datasets present when loading finished.
     * @throws std::logic_error if no checkpoint was captured
     */
    void restoreCheckpoint();

    // --- stage setup ---

    /**
     * @brief Declare an output of the current stage.
     *
     * A name installed by installOutputs() is handed back on its first
     * declaration.
     *
     * @throws DuplicateDatasetError if the stage already declared this name
     */
    Dataset& createOutput(const std::string& name);

    // Copies of the current outputs, kept apart from the live sets
    [[nodiscard]] DatasetMap snapshotOutputs();

    // Replace the output set with copies of a snapshot
    void installOutputs(const DatasetMap& snapshot);

    // --- lookup ---

    [[nodiscard]] bool hasInput(const std::string& name) const { return in_.contains(name); }
    [[nodiscard]] bool hasOutput(const std::string& name) const { return out_.contains(name); }

    /** @throws UnknownDatasetError */
    Dataset& input(const std::string& name);
    [[nodiscard]] const Dataset& input(const std::string& name) const;
    Dataset& output(const std::string& name);
    [[nodiscard]] const Dataset& output(const std::string& name) const;

    [[nodiscard]] DatasetHandle inputHandle(const std::string& name) const;
    [[nodiscard]] DatasetHandle outputHandle(const std::string& name) const;

    /** @throws std::out_of_range for a handle never issued */
    Dataset& at(DatasetHandle handle);
    [[nodiscard]] const Dataset& at(DatasetHandle handle) const;
    [[nodiscard]] bool isRetired(DatasetHandle handle) const;

    [[nodiscard]] const DatasetMap& inputMap() const { return in_; }
    [[nodiscard]] const DatasetMap& outputMap() const { return out_; }
    [[nodiscard]] std::vector<std::string> inputNames() const;
    [[nodiscard]] std::vector<std::string> outputNames() const;
    [[nodiscard]] std::size_t storeSize() const { return store_.size(); }

    // True if an input, output or checkpointed dataset refers to the storage
    [[nodiscard]] bool storageInUse(StorageHandle handle) const;

    // --- stage transitions ---

    /**
     * @brief Move the outputs into the input set.
     *
     * Outputs not flagged remove overwrite inputs of the same name; flagged
     * ones are dropped. The output set is left empty.
     */
    void mergeOutputsIntoInputs();

    // Compare the current outputs against the inputs
    [[nodiscard]] TransitionRecord transitionRecord() const;

    /**
     * @brief Apply a transition record.
     *
     * Replicated inputs are unreplicated, removed outputs are retired and the
     * survivors are copied into the input set with their preview cleared.
     */
    void reorganise(const TransitionRecord& record);

    // transitionRecord() followed by reorganise()
    TransitionRecord finalise();

    // --- iteration ---

    /**
     * @brief Pair two outputs as alternating buffers.
     *
     * visible is the name the rest of the chain knows the result by.
     *
     * @throws UnknownDatasetError unless both are current outputs
     * @throws ShapeMismatchError if their shapes differ
     */
    void registerAlternatingPair(const std::string& visible, const std::string& partner);
    [[nodiscard]] const std::vector<AlternatingPair>& alternatingPairs() const { return pairs_; }

    // Name of the buffer written (resp. read) on an iteration of the pair
    [[nodiscard]] const std::string& alternatingWriter(
        const std::string& visible, std::size_t iteration) const;
    [[nodiscard]] const std::string& alternatingReader(
        const std::string& visible, std::size_t iteration) const;

    /**
     * @brief Resolve every pair after the given number of iterations.
     *
     * The buffer written last ends up under the visible name; the other one
     * is flagged remove. The pairs are cleared.
     */
    void finaliseAlternatingPairs(std::size_t iterations);

private:
    struct Slot {
        Dataset dataset;
        bool retired{false};
    };

    DatasetHandle append(const Dataset& ds);
    void retire(DatasetHandle handle);
    const AlternatingPair& pair(const std::string& visible) const;
    void endStage();

    std::deque<Slot> store_;
    DatasetMap in_;
    DatasetMap out_;
    DatasetMap checkpoint_;
    bool hasCheckpoint_ = false;
    std::set<std::string> declared_;
    std::vector<AlternatingPair> pairs_;
};

}  // namespace tc
