#pragma once

#include <cstddef>
#include <vector>

#include <xtensor/containers/xarray.hpp>

#include "tc/core/storage/Dtype.hpp"
#include "tc/core/util/SliceList.hpp"

namespace tc
{

class Dataset;

// Frames exchanged with a storage backend; rank always equals the dataset rank
using Array = xt::xarray<float>;

/**
 * @brief Backing store for dataset arrays.
 *
 * The pipeline core never looks at file formats; it only asks for
 * allocations and for reads/writes of computed regions.
 */
class StorageBackend
{
public:
    virtual ~StorageBackend() = default;

    virtual StorageHandle allocate(const std::vector<std::size_t>& shape, Dtype dtype) = 0;

    // Copy of the region; single indices keep their dimension with extent 1
    [[nodiscard]] virtual Array read(StorageHandle handle, const SliceTuple& region) const = 0;

    virtual void write(StorageHandle handle, const SliceTuple& region, const Array& data) = 0;

    virtual void release(StorageHandle handle) = 0;

    [[nodiscard]] virtual std::vector<std::size_t> shape(StorageHandle handle) const = 0;
};

/**
 * @brief Read a region of a dataset through its storage.
 *
 * Replicated datasets are served from their single stored copy and broadcast
 * along the replica axis.
 *
 * @throws std::logic_error if the dataset has no storage
 */
Array readRegion(const StorageBackend& storage, const Dataset& ds, const SliceTuple& region);

/**
 * @throws std::logic_error if the dataset has no storage or is replicated
 */
void writeRegion(StorageBackend& storage, const Dataset& ds, const SliceTuple& region, const Array& data);

}  // namespace tc
