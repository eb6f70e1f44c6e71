#include "tc/core/pipeline/PipelineContext.hpp"

#include "tc/core/pipeline/Coordinator.hpp"
#include "tc/core/util/Errors.hpp"

namespace tc
{

PipelineContext::PipelineContext(StorageBackend& storage, const Coordinator& coordinator)
    : storage_(storage), coordinator_(coordinator)
{
}

int PipelineContext::rank() const
{
    return coordinator_.rank();
}

int PipelineContext::totalRanks() const
{
    return coordinator_.totalRanks();
}

void PipelineContext::enterStage(std::size_t index, const std::string& name)
{
    stageIndex_ = index;
    stageName_ = name;
    iteration_ = 0;
}

void PipelineContext::allocate(Dataset& ds)
{
    if (ds.hasStorage()) {
        return;
    }
    ds.setStorage(storage_.allocate(ds.storageShape(), ds.dtype()));
}

Array PipelineContext::read(const std::string& name, const SliceTuple& region) const
{
    if (registry_.hasInput(name)) {
        return readRegion(storage_, registry_.input(name), region);
    }
    if (registry_.hasOutput(name)) {
        return readRegion(storage_, registry_.output(name), region);
    }
    throw UnknownDatasetError("no input or output dataset named '" + name + "'");
}

void PipelineContext::write(const std::string& name, const SliceTuple& region, const Array& data)
{
    writeRegion(storage_, registry_.output(name), region, data);
}

const std::string& PipelineContext::alternatingWriter(const std::string& visible) const
{
    return registry_.alternatingWriter(visible, iteration_);
}

const std::string& PipelineContext::alternatingReader(const std::string& visible) const
{
    return registry_.alternatingReader(visible, iteration_);
}

}  // namespace tc
