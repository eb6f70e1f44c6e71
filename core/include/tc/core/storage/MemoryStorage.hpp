#pragma once

#include <cstddef>
#include <map>
#include <vector>

#include "tc/core/storage/StorageBackend.hpp"

namespace tc
{

/**
 * @brief StorageBackend keeping every allocation in an xtensor array.
 *
 * Values are held as float whatever the declared dtype; the dtype is kept for
 * accounting. Handles are never reused.
 */
class MemoryStorage final : public StorageBackend
{
public:
    MemoryStorage() = default;

    MemoryStorage(const MemoryStorage&) = delete;
    MemoryStorage& operator=(const MemoryStorage&) = delete;

    StorageHandle allocate(const std::vector<std::size_t>& shape, Dtype dtype) override;
    [[nodiscard]] Array read(StorageHandle handle, const SliceTuple& region) const override;
    void write(StorageHandle handle, const SliceTuple& region, const Array& data) override;
    void release(StorageHandle handle) override;
    [[nodiscard]] std::vector<std::size_t> shape(StorageHandle handle) const override;

    [[nodiscard]] bool contains(StorageHandle handle) const { return blocks_.contains(handle); }
    [[nodiscard]] std::size_t allocations() const { return blocks_.size(); }

    // Bytes the live allocations would occupy at their declared dtype
    [[nodiscard]] std::size_t bytesAllocated() const;

private:
    struct Block {
        Array data;
        Dtype dtype{Dtype::Float32};
    };

    const Block& block(StorageHandle handle) const;
    Block& block(StorageHandle handle);

    std::map<StorageHandle, Block> blocks_;
    StorageHandle next_ = kNoStorage + 1;
};

}  // namespace tc
