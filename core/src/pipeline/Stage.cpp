#include "tc/core/pipeline/Stage.hpp"

#include <stdexcept>
#include <utility>

#include "tc/core/pipeline/PipelineContext.hpp"
#include "tc/core/util/Errors.hpp"

namespace tc
{

namespace
{

const WorkBatch& find(
    const std::vector<std::pair<std::string, WorkBatch>>& batches,
    const std::string& dataset,
    const char* role)
{
    for (const auto& [name, wb] : batches) {
        if (name == dataset) {
            return wb;
        }
    }
    throw UnknownDatasetError(
        std::string("stage declared no ") + role + " dataset named '" + dataset + "'");
}

}  // namespace

const WorkBatch& StageBatch::input(const std::string& dataset) const
{
    return find(inputs, dataset, "input");
}

const WorkBatch& StageBatch::output(const std::string& dataset) const
{
    return find(outputs, dataset, "output");
}

void IterativeStage::setIterations(std::size_t n)
{
    if (n == 0) {
        throw std::invalid_argument("stage '" + name() + "' needs at least one iteration");
    }
    iterations_ = n;
}

void IterativeStage::setAlternatingDatasets(
    PipelineContext& ctx, const std::string& visible, const std::string& partner)
{
    ctx.registry().registerAlternatingPair(visible, partner);
}

void IterativeStage::setIterationDatasets(std::size_t iteration, StagePatterns datasets)
{
    iterationDatasets_.insert_or_assign(iteration, std::move(datasets));
}

const StagePatterns* IterativeStage::iterationDatasets(std::size_t iteration) const
{
    auto it = iterationDatasets_.find(iteration);
    return it == iterationDatasets_.end() ? nullptr : &it->second;
}

void IterativeStage::resetIterations()
{
    iteration_ = 0;
    complete_ = false;
}

}  // namespace tc
