#include "tc/core/storage/MemoryStorage.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

#include <xtensor/generators/xbuilder.hpp>
#include <xtensor/views/xslice.hpp>
#include <xtensor/views/xstrided_view.hpp>

namespace tc
{

namespace
{

xt::xstrided_slice_vector toSliceVector(
    const SliceTuple& region, const std::vector<std::size_t>& shape)
{
    if (region.size() != shape.size()) {
        throw std::invalid_argument(
            "region " + toString(region) + " does not match an array of rank " +
            std::to_string(shape.size()));
    }

    xt::xstrided_slice_vector sv;
    sv.reserve(region.size());
    for (std::size_t d = 0; d < region.size(); ++d) {
        const auto& r = region[d];
        if (r.kind == SliceIndex::Kind::Full) {
            sv.push_back(xt::all());
            continue;
        }
        if (r.start >= r.stop || r.stop > shape[d] || r.step == 0) {
            throw std::out_of_range(
                "region " + toString(region) + " is outside extent " +
                std::to_string(shape[d]) + " of dimension " + std::to_string(d));
        }
        sv.push_back(xt::range(
            static_cast<std::ptrdiff_t>(r.start),
            static_cast<std::ptrdiff_t>(r.stop),
            static_cast<std::ptrdiff_t>(r.step)));
    }
    return sv;
}

}  // namespace

// --- MemoryStorage -----------------------------------------------------------

StorageHandle MemoryStorage::allocate(const std::vector<std::size_t>& shape, Dtype dtype)
{
    if (dtype == Dtype::Unknown) {
        throw std::invalid_argument("cannot allocate storage of unknown dtype");
    }
    StorageHandle handle = next_++;
    Block b;
    b.data = xt::zeros<float>(shape);
    b.dtype = dtype;
    blocks_.emplace(handle, std::move(b));
    return handle;
}

Array MemoryStorage::read(StorageHandle handle, const SliceTuple& region) const
{
    const Block& b = block(handle);
    std::vector<std::size_t> shp(b.data.shape().begin(), b.data.shape().end());
    Array out = xt::strided_view(b.data, toSliceVector(region, shp));
    return out;
}

void MemoryStorage::write(StorageHandle handle, const SliceTuple& region, const Array& data)
{
    Block& b = block(handle);
    std::vector<std::size_t> shp(b.data.shape().begin(), b.data.shape().end());
    auto view = xt::strided_view(b.data, toSliceVector(region, shp));
    if (!std::equal(
            view.shape().begin(), view.shape().end(), data.shape().begin(), data.shape().end())) {
        throw std::invalid_argument(
            "data written to region " + toString(region) + " has the wrong shape");
    }
    view = data;
}

void MemoryStorage::release(StorageHandle handle)
{
    blocks_.erase(handle);
}

std::vector<std::size_t> MemoryStorage::shape(StorageHandle handle) const
{
    const Block& b = block(handle);
    return std::vector<std::size_t>(b.data.shape().begin(), b.data.shape().end());
}

std::size_t MemoryStorage::bytesAllocated() const
{
    return std::accumulate(
        blocks_.begin(), blocks_.end(), std::size_t{0}, [](std::size_t acc, const auto& kv) {
            return acc + kv.second.data.size() * dtypeSize(kv.second.dtype);
        });
}

const MemoryStorage::Block& MemoryStorage::block(StorageHandle handle) const
{
    auto it = blocks_.find(handle);
    if (it == blocks_.end()) {
        throw std::out_of_range("unknown storage handle " + std::to_string(handle));
    }
    return it->second;
}

MemoryStorage::Block& MemoryStorage::block(StorageHandle handle)
{
    auto it = blocks_.find(handle);
    if (it == blocks_.end()) {
        throw std::out_of_range("unknown storage handle " + std::to_string(handle));
    }
    return it->second;
}

}  // namespace tc
