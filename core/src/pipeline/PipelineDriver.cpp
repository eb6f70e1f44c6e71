#include "tc/core/pipeline/PipelineDriver.hpp"

#include <stdexcept>
#include <utility>

#include "tc/core/pipeline/Coordinator.hpp"
#include "tc/core/storage/Dtype.hpp"
#include "tc/core/util/Errors.hpp"
#include "tc/core/util/Logging.hpp"
#include "tc/core/util/SlicingStrategy.hpp"
#include "tc/core/util/WorkDistribution.hpp"

namespace tc
{

namespace
{

using GroupedList = std::pair<std::string, std::vector<WorkBatch>>;

std::string joined(const std::vector<std::string>& names)
{
    std::string out;
    for (const auto& n : names) {
        out += (out.empty() ? "" : ", ") + n;
    }
    return out.empty() ? "-" : out;
}

// Stage inputs are looked up among the inputs first, then the outputs
template<typename Registry>
auto& requestedInput(Registry& reg, const std::string& name)
{
    return reg.hasInput(name) || !reg.hasOutput(name) ? reg.input(name) : reg.output(name);
}

std::vector<std::string> namesOf(const DatasetRegistry& reg, const std::vector<DatasetHandle>& handles)
{
    std::vector<std::string> out;
    out.reserve(handles.size());
    for (auto h : handles) {
        out.push_back(reg.at(h).name());
    }
    return out;
}

}  // namespace

PipelineDriver::PipelineDriver(StorageBackend& storage, Coordinator& coordinator, DriverOptions options)
    : coordinator_(coordinator), options_(std::move(options)), ctx_(storage, coordinator)
{
}

void PipelineDriver::addLoader(std::unique_ptr<LoaderStage> loader)
{
    if (!loader) {
        throw std::invalid_argument("null loader");
    }
    loaders_.push_back(std::move(loader));
}

void PipelineDriver::addStage(std::unique_ptr<Stage> stage)
{
    if (!stage) {
        throw std::invalid_argument("null stage");
    }
    stages_.push_back(std::move(stage));
}

void PipelineDriver::run()
{
    Logger()->setPrefix(
        "rank " + std::to_string(coordinator_.rank()) + "/" +
        std::to_string(coordinator_.totalRanks()));

    try {
        load();
        setupPass();
        publishMetadata();
        executionPass();
        ctx_.registry().restoreCheckpoint();
    } catch (const ShapeMismatchError& e) {
        Logger()->error(
            "stage '{}': dataset '{}' does not fit pattern '{}': {}", ctx_.stageName(),
            e.datasetName(), e.patternName(), e.what());
        throw;
    } catch (const PipelineError& e) {
        Logger()->error("stage '{}': {}", ctx_.stageName(), e.what());
        throw;
    } catch (const std::exception& e) {
        Logger()->error("stage '{}' failed: {}", ctx_.stageName(), e.what());
        throw;
    }
}

// --- loading -----------------------------------------------------------------

void PipelineDriver::load()
{
    auto& reg = ctx_.registry();
    // a repeated run loads from scratch
    for (auto handle : reg.reset()) {
        ctx_.storage().release(handle);
    }
    results_.clear();

    for (std::size_t i = 0; i < loaders_.size(); ++i) {
        ctx_.enterStage(i, loaders_[i]->name());
        Logger()->info("Loading with '{}'", loaders_[i]->name());
        loaders_[i]->load(ctx_);
    }
    reg.captureCheckpoint();
    Logger()->info("Loaded inputs: {}", joined(reg.inputNames()));
}

// --- setup pass --------------------------------------------------------------

void PipelineDriver::setupPass()
{
    auto& reg = ctx_.registry();
    ctx_.setExecuting(false);
    collections_.clear();
    metadata_.clear();

    for (std::size_t k = 0; k < stages_.size(); ++k) {
        Stage& stage = *stages_[k];
        ctx_.enterStage(k, stage.name());
        Logger()->debug("Setting up stage {} '{}'", k, stage.name());

        stage.setup(ctx_);
        const StagePatterns patterns = applyPatterns(stage);

        // both buffers share shape and patterns, so one iteration resolves the layout
        if (!reg.alternatingPairs().empty()) {
            reg.finaliseAlternatingPairs(1);
        }

        collections_.push_back(reg.snapshotOutputs());
        metadata_.addStage(describe(stage, patterns));
        reg.mergeOutputsIntoInputs();
        for (const auto& [name, handle] : reg.inputMap()) {
            reg.at(handle).unreplicate();
        }
    }
    metadata_.resolveNextPatterns();
    reg.restoreCheckpoint();
}

StagePatterns PipelineDriver::applyPatterns(Stage& stage)
{
    StagePatterns patterns = stage.declarePatterns();
    applyRequests(patterns);
    return patterns;
}

void PipelineDriver::applyRequests(const StagePatterns& patterns)
{
    auto& reg = ctx_.registry();
    for (const auto& req : patterns.inputs) {
        requestedInput(reg, req.dataset).setCurrentPattern(req.pattern);
    }
    for (const auto& req : patterns.outputs) {
        reg.output(req.dataset).setCurrentPattern(req.pattern);
    }
}

StageEntry PipelineDriver::describe(const Stage& stage, const StagePatterns& patterns) const
{
    const auto& reg = ctx_.registry();
    auto entry = [](const Dataset& ds, const std::string& pattern) {
        DatasetEntry d;
        d.name = ds.name();
        d.pattern = pattern;
        d.shape = ds.shape();
        d.dtype = dtypeToString(ds.dtype());
        return d;
    };

    StageEntry s;
    s.name = stage.name();
    s.maxBatch = stage.maxBatchSize();
    for (const auto& req : patterns.inputs) {
        s.inputs.push_back(entry(requestedInput(reg, req.dataset), req.pattern));
    }
    for (const auto& req : patterns.outputs) {
        s.outputs.push_back(entry(reg.output(req.dataset), req.pattern));
    }
    return s;
}

// --- metadata ----------------------------------------------------------------

void PipelineDriver::publishMetadata()
{
    coordinator_.layoutFixed();
    if (coordinator_.isCoordinator() && !options_.metadataFile.empty()) {
        metadata_.save(options_.metadataFile);
        Logger()->info("Wrote pipeline metadata to {}", options_.metadataFile.string());
    }
    coordinator_.metadataCommitted();

    if (!options_.metadataFile.empty()) {
        metadata_ = PipelineMetadata::load(options_.metadataFile);
    }
    if (metadata_.stageCount() != stages_.size()) {
        throw std::runtime_error(
            "pipeline metadata lists " + std::to_string(metadata_.stageCount()) +
            " stages, the chain has " + std::to_string(stages_.size()));
    }
}

// --- execution pass ----------------------------------------------------------

void PipelineDriver::executionPass()
{
    auto& reg = ctx_.registry();
    ctx_.setExecuting(true);
    reports_.clear();
    results_.clear();

    for (std::size_t k = 0; k < stages_.size(); ++k) {
        Stage& stage = *stages_[k];
        ctx_.enterStage(k, stage.name());
        Logger()->info("Running stage {} '{}'", k, stage.name());

        reg.installOutputs(collections_[k]);
        stage.setup(ctx_);
        const StagePatterns patterns = applyPatterns(stage);
        for (const auto& req : patterns.outputs) {
            ctx_.allocate(reg.output(req.dataset));
        }

        StageReport report;
        report.stage = stage.name();
        executeStage(stage, patterns, report);

        const TransitionRecord record = reg.finalise();
        report.kept = namesOf(reg, record.keep);
        report.removed = namesOf(reg, record.remove);
        report.replaced = namesOf(reg, record.replace);
        releaseRetired(record);

        Logger()->info(
            "Stage '{}' done: kept [{}], removed [{}], replaced [{}]", stage.name(),
            joined(report.kept), joined(report.removed), joined(report.replaced));
        reports_.push_back(std::move(report));
    }

    for (const auto& [name, handle] : reg.inputMap()) {
        results_.insert_or_assign(name, reg.at(handle));
    }
}

std::vector<StageBatch> PipelineDriver::shareOf(
    const Stage& stage, const StagePatterns& patterns, StageReport& report)
{
    auto& reg = ctx_.registry();
    const std::size_t maxBatch = stage.maxBatchSize();

    std::vector<GroupedList> inputs;
    std::vector<GroupedList> outputs;
    for (const auto& req : patterns.inputs) {
        inputs.emplace_back(
            req.dataset, groupedSliceListFor(requestedInput(reg, req.dataset), maxBatch));
    }
    for (const auto& req : patterns.outputs) {
        outputs.emplace_back(req.dataset, groupedSliceListFor(reg.output(req.dataset), maxBatch));
    }

    // every declared dataset must split into the same number of batches
    const GroupedList* head = !inputs.empty() ? &inputs.front()
                              : !outputs.empty() ? &outputs.front()
                                                 : nullptr;
    const std::size_t total = head ? head->second.size() : 0;
    const std::string reference = head ? head->first : std::string();
    auto check = [&](const GroupedList& list, const PatternRequest& req) {
        if (list.second.size() != total) {
            throw ShapeMismatchError(
                req.dataset, req.pattern,
                std::to_string(list.second.size()) + " batches where '" + reference + "' has " +
                    std::to_string(total));
        }
    };
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        check(inputs[i], patterns.inputs[i]);
    }
    for (std::size_t i = 0; i < outputs.size(); ++i) {
        check(outputs[i], patterns.outputs[i]);
    }

    const auto [begin, end] = shareBounds(total, coordinator_.rank(), coordinator_.totalRanks());
    report.totalBatches = total;
    report.localBatches = end - begin;
    Logger()->debug("Stage '{}': batches [{}, {}) of {}", stage.name(), begin, end, total);

    std::vector<StageBatch> share;
    share.reserve(end - begin);
    for (std::size_t i = begin; i < end; ++i) {
        StageBatch b;
        b.index = i;
        for (const auto& [name, list] : inputs) {
            b.inputs.emplace_back(name, list[i]);
        }
        for (const auto& [name, list] : outputs) {
            b.outputs.emplace_back(name, list[i]);
        }
        share.push_back(std::move(b));
    }
    return share;
}

void PipelineDriver::runCycle(Stage& stage, const std::vector<StageBatch>& share)
{
    stage.preProcess(ctx_);
    for (const auto& b : share) {
        stage.execute(ctx_, b);
    }
    stage.postProcess(ctx_);
}

void PipelineDriver::executeStage(Stage& stage, const StagePatterns& patterns, StageReport& report)
{
    auto& reg = ctx_.registry();
    std::vector<StageBatch> share = shareOf(stage, patterns, report);

    auto* iterative = dynamic_cast<IterativeStage*>(&stage);
    if (!iterative) {
        ctx_.setIteration(0);
        runCycle(stage, share);
        return;
    }

    iterative->resetIterations();
    const StagePatterns* active = &patterns;
    do {
        const std::size_t iteration = iterative->iteration();
        ctx_.setIteration(iteration);
        Logger()->debug("Stage '{}' iteration {}", stage.name(), iteration);

        const StagePatterns* own = iterative->iterationDatasets(iteration);
        const StagePatterns* wanted = own ? own : &patterns;
        if (wanted != active) {
            applyRequests(*wanted);
            share = shareOf(stage, *wanted, report);
            active = wanted;
        }

        runCycle(stage, share);
        iterative->advance();
    } while (!iterative->complete());

    report.iterations = iterative->iteration();
    if (!reg.alternatingPairs().empty()) {
        reg.finaliseAlternatingPairs(report.iterations);
    }
}

void PipelineDriver::releaseRetired(const TransitionRecord& record)
{
    auto& reg = ctx_.registry();
    auto release = [&](DatasetHandle h) {
        Dataset& ds = reg.at(h);
        // checkpointed datasets share storage with the inputs copied from them
        if (ds.hasStorage() && !reg.storageInUse(ds.storage())) {
            ctx_.storage().release(ds.storage());
            ds.setStorage(kNoStorage);
        }
    };
    for (auto h : record.remove) {
        release(h);
    }
    for (auto h : record.replace) {
        release(h);
    }
}

}  // namespace tc
