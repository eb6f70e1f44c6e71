#include "tc/core/storage/StorageBackend.hpp"

#include <stdexcept>

#include <xtensor/core/xbroadcast.hpp>

#include "tc/core/types/Dataset.hpp"

namespace tc
{

Array readRegion(const StorageBackend& storage, const Dataset& ds, const SliceTuple& region)
{
    if (!ds.hasStorage()) {
        throw std::logic_error("dataset '" + ds.name() + "' has no storage allocated");
    }
    if (ds.kind() != DatasetKind::Replicated) {
        return storage.read(ds.storage(), region);
    }

    if (region.size() != ds.rank()) {
        throw std::invalid_argument(
            "region " + toString(region) + " does not match dataset '" + ds.name() + "'");
    }
    const std::size_t copies = region.front().count(ds.replicas());
    SliceTuple stored(region.begin() + 1, region.end());
    Array base = storage.read(ds.storage(), stored);

    std::vector<std::size_t> shp{copies};
    shp.insert(shp.end(), base.shape().begin(), base.shape().end());
    Array out = xt::broadcast(base, shp);
    return out;
}

void writeRegion(
    StorageBackend& storage, const Dataset& ds, const SliceTuple& region, const Array& data)
{
    if (!ds.hasStorage()) {
        throw std::logic_error("dataset '" + ds.name() + "' has no storage allocated");
    }
    if (ds.kind() == DatasetKind::Replicated) {
        throw std::logic_error("replicated dataset '" + ds.name() + "' is read-only");
    }
    storage.write(ds.storage(), region, data);
}

}  // namespace tc
