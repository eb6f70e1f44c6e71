#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "tc/core/util/SliceList.hpp"

namespace tc
{

class PipelineContext;

/** @brief A dataset the stage accesses, and the pattern it accesses it with */
struct PatternRequest {
    std::string dataset;
    std::string pattern;
};

struct StagePatterns {
    std::vector<PatternRequest> inputs;
    std::vector<PatternRequest> outputs;
};

/**
 * @brief One unit of work handed to Stage::execute().
 *
 * Holds the batch at the same position of every declared dataset's grouped
 * slice list, in declaration order.
 */
struct StageBatch {
    // Position in the full (all ranks) grouped slice list
    std::size_t index{0};
    std::vector<std::pair<std::string, WorkBatch>> inputs;
    std::vector<std::pair<std::string, WorkBatch>> outputs;

    /** @throws UnknownDatasetError if the stage did not declare the dataset */
    [[nodiscard]] const WorkBatch& input(const std::string& dataset) const;
    [[nodiscard]] const WorkBatch& output(const std::string& dataset) const;
};

/**
 * @brief A processing step of the chain.
 *
 * Per stage the driver calls, in order: setup(), declarePatterns(), then
 * preProcess(), execute() for every batch of this rank's share and
 * postProcess(). setup() and declarePatterns() run twice per run: once while
 * the pipeline layout is being fixed and once before execution. They must
 * declare the same datasets both times.
 */
class Stage
{
public:
    virtual ~Stage() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    // Create the outputs and declare the patterns of every dataset touched
    virtual void setup(PipelineContext& ctx) = 0;

    [[nodiscard]] virtual StagePatterns declarePatterns() const = 0;

    // Upper bound on frames per batch
    [[nodiscard]] virtual std::size_t maxBatchSize() const { return 1; }

    virtual void preProcess(PipelineContext& /*ctx*/) {}
    virtual void execute(PipelineContext& ctx, const StageBatch& batch) = 0;
    virtual void postProcess(PipelineContext& /*ctx*/) {}
};

/** @brief Populates the input set before any stage runs */
class LoaderStage
{
public:
    virtual ~LoaderStage() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    virtual void load(PipelineContext& ctx) = 0;
};

/**
 * @brief Stage whose pre-process/execute/post-process cycle is repeated.
 *
 * The cycle runs until iterations() cycles are done or the stage calls
 * setProcessingComplete(). Outputs registered with setAlternatingDatasets()
 * swap roles every iteration; afterwards the buffer written last carries the
 * first name. setIterationDatasets() replaces the declared datasets for
 * single iterations.
 */
class IterativeStage : public Stage
{
public:
    /** @throws std::invalid_argument if n is zero */
    void setIterations(std::size_t n);
    [[nodiscard]] std::size_t iterations() const { return iterations_; }

    // Zero-based index of the cycle being run; after the run, the cycles done
    [[nodiscard]] std::size_t iteration() const { return iteration_; }

    void setProcessingComplete() { complete_ = true; }
    [[nodiscard]] bool complete() const { return complete_ || iteration_ >= iterations_; }

    // Pair two outputs of this stage; call from setup()
    void setAlternatingDatasets(
        PipelineContext& ctx, const std::string& visible, const std::string& partner);

    /**
     * @brief Datasets accessed on one iteration in place of declarePatterns().
     *
     * Inputs may name inputs or outputs of the stage, so an iteration can read
     * what an earlier one wrote; outputs must be outputs. Call from setup().
     */
    void setIterationDatasets(std::size_t iteration, StagePatterns datasets);

    // Override for an iteration, or nullptr when declarePatterns() applies
    [[nodiscard]] const StagePatterns* iterationDatasets(std::size_t iteration) const;
    [[nodiscard]] bool hasIterationDatasets() const { return !iterationDatasets_.empty(); }

    // Driver hooks
    void resetIterations();
    void advance() { ++iteration_; }

private:
    std::size_t iterations_ = 1;
    std::size_t iteration_ = 0;
    bool complete_ = false;
    std::map<std::size_t, StagePatterns> iterationDatasets_;
};

}  // namespace tc
