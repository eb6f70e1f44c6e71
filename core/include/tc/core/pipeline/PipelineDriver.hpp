#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "tc/core/pipeline/PipelineContext.hpp"
#include "tc/core/pipeline/PipelineMetadata.hpp"
#include "tc/core/pipeline/Stage.hpp"

namespace tc
{

class Coordinator;

struct DriverOptions {
    // Where the coordinator writes the pipeline metadata; empty keeps it in memory
    std::filesystem::path metadataFile;
};

/** @brief What happened to one stage during execution, as seen by this rank */
struct StageReport {
    std::string stage;
    // Length of the grouped slice list shared by every rank
    std::size_t totalBatches{0};
    std::size_t localBatches{0};
    std::size_t iterations{1};
    std::vector<std::string> kept;
    std::vector<std::string> removed;
    std::vector<std::string> replaced;
};

/**
 * @brief Runs loaders and stages over the ranks of a coordinator.
 *
 * run() goes through:
 *  1. loading: every loader populates the inputs, then the inputs are
 *     checkpointed;
 *  2. setup pass: each stage is set up against the outputs of the stages
 *     before it, which fixes the layout of the whole chain;
 *  3. metadata: layoutFixed(), the coordinator publishes the metadata,
 *     metadataCommitted(), every rank reads it back;
 *  4. execution pass: from the checkpoint, each stage is set up again,
 *     sliced, distributed and executed, and its outputs finalised into the
 *     inputs of the next stage;
 *  5. the checkpoint is restored so the results can be inspected.
 *
 * A repeated run() drops every dataset, releases its storage and loads again.
 *
 * Any error is logged with the stage it happened in and rethrown.
 */
class PipelineDriver
{
public:
    PipelineDriver(StorageBackend& storage, Coordinator& coordinator, DriverOptions options = {});

    void addLoader(std::unique_ptr<LoaderStage> loader);
    void addStage(std::unique_ptr<Stage> stage);
    [[nodiscard]] std::size_t stageCount() const { return stages_.size(); }

    void run();

    PipelineContext& context() { return ctx_; }
    [[nodiscard]] const PipelineMetadata& metadata() const { return metadata_; }
    [[nodiscard]] const std::vector<StageReport>& reports() const { return reports_; }

    // Inputs present after the last stage, captured before the final restore
    [[nodiscard]] const std::map<std::string, Dataset>& results() const { return results_; }

private:
    void load();
    void setupPass();
    void publishMetadata();
    void executionPass();

    StagePatterns applyPatterns(Stage& stage);
    void applyRequests(const StagePatterns& patterns);
    StageEntry describe(const Stage& stage, const StagePatterns& patterns) const;
    std::vector<StageBatch> shareOf(
        const Stage& stage, const StagePatterns& patterns, StageReport& report);
    void runCycle(Stage& stage, const std::vector<StageBatch>& share);
    void executeStage(Stage& stage, const StagePatterns& patterns, StageReport& report);
    void releaseRetired(const TransitionRecord& record);

    Coordinator& coordinator_;
    DriverOptions options_;
    PipelineContext ctx_;
    std::vector<std::unique_ptr<LoaderStage>> loaders_;
    std::vector<std::unique_ptr<Stage>> stages_;

    // Outputs of each stage as declared during the setup pass
    std::vector<DatasetMap> collections_;
    PipelineMetadata metadata_;
    std::vector<StageReport> reports_;
    std::map<std::string, Dataset> results_;
};

}  // namespace tc
