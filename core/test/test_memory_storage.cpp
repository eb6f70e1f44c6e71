#include "test.hpp"

#include <stdexcept>
#include <vector>

#include <xtensor/containers/xarray.hpp>
#include <xtensor/generators/xbuilder.hpp>

#include "tc/core/storage/MemoryStorage.hpp"
#include "tc/core/types/Dataset.hpp"

using tc::Array;
using tc::MemoryStorage;
using tc::SliceIndex;
using tc::SliceTuple;
using Dims = std::vector<std::size_t>;

namespace
{

// 4 x 3 array holding 10 * row + col
Array grid()
{
    Array a = xt::zeros<float>({4, 3});
    for (std::size_t r = 0; r < 4; ++r) {
        for (std::size_t c = 0; c < 3; ++c) {
            a(r, c) = float(10 * r + c);
        }
    }
    return a;
}

SliceTuple everything() { return SliceTuple(2, SliceIndex::full()); }

}  // namespace

TEST(MemoryStorage, AllocatesZeroedBlocks)
{
    MemoryStorage storage;
    auto h = storage.allocate({4, 3}, tc::Dtype::UInt16);
    EXPECT_NE(h, tc::kNoStorage);
    EXPECT_TRUE(storage.contains(h));
    EXPECT_EQ(storage.shape(h), (Dims{4, 3}));
    EXPECT_EQ(storage.bytesAllocated(), 4u * 3u * 2u);

    Array data = storage.read(h, everything());
    EXPECT_FLOAT_EQ(data(3, 2), 0.0f);
}

TEST(MemoryStorage, UnknownDtypeIsRejected)
{
    MemoryStorage storage;
    EXPECT_THROW(storage.allocate({2}, tc::Dtype::Unknown), std::invalid_argument);
}

TEST(MemoryStorage, ReadsRegions)
{
    MemoryStorage storage;
    auto h = storage.allocate({4, 3}, tc::Dtype::Float32);
    storage.write(h, everything(), grid());

    Array row = storage.read(h, {SliceIndex::single(2), SliceIndex::full()});
    ASSERT_EQ(row.dimension(), 2u);
    EXPECT_EQ(row.shape()[0], 1u);
    EXPECT_FLOAT_EQ(row(0, 1), 21.0f);

    Array strided = storage.read(h, {SliceIndex::range(0, 4, 2), SliceIndex::single(1)});
    EXPECT_EQ(strided.shape()[0], 2u);
    EXPECT_FLOAT_EQ(strided(1, 0), 21.0f);
}

TEST(MemoryStorage, WritesRegions)
{
    MemoryStorage storage;
    auto h = storage.allocate({4, 3}, tc::Dtype::Float32);
    Array frames = xt::ones<float>({2, 3});
    storage.write(h, {SliceIndex::range(1, 3, 1), SliceIndex::full()}, frames);

    Array all = storage.read(h, everything());
    EXPECT_FLOAT_EQ(all(0, 0), 0.0f);
    EXPECT_FLOAT_EQ(all(1, 2), 1.0f);
    EXPECT_FLOAT_EQ(all(2, 0), 1.0f);
    EXPECT_FLOAT_EQ(all(3, 0), 0.0f);
}

TEST(MemoryStorage, RejectsBadRegions)
{
    MemoryStorage storage;
    auto h = storage.allocate({4, 3}, tc::Dtype::Float32);
    EXPECT_THROW((void)storage.read(h, {SliceIndex::full()}), std::invalid_argument);
    EXPECT_THROW((void)storage.read(h, {SliceIndex::single(4), SliceIndex::full()}), std::out_of_range);
    // a range running past the extent is not cut short
    EXPECT_THROW(
        (void)storage.read(h, {SliceIndex::range(3, 9, 1), SliceIndex::full()}), std::out_of_range);
    EXPECT_THROW(
        storage.write(h, {SliceIndex::range(2, 5, 1), SliceIndex::full()}, xt::ones<float>({3, 3})),
        std::out_of_range);

    Array wrong = xt::ones<float>({3, 3});
    EXPECT_THROW(
        storage.write(h, {SliceIndex::range(0, 2, 1), SliceIndex::full()}, wrong),
        std::invalid_argument);
}

TEST(MemoryStorage, ReleaseForgetsTheBlock)
{
    MemoryStorage storage;
    auto a = storage.allocate({2}, tc::Dtype::Float32);
    auto b = storage.allocate({2}, tc::Dtype::Float32);
    EXPECT_NE(a, b);
    storage.release(a);
    EXPECT_FALSE(storage.contains(a));
    EXPECT_EQ(storage.allocations(), 1u);
    EXPECT_THROW((void)storage.read(a, {SliceIndex::full()}), std::out_of_range);
}

TEST(MemoryStorage, ReplicatedReadsBroadcast)
{
    MemoryStorage storage;
    tc::Dataset flat("flat");
    flat.setShape({4, 3});
    flat.setStorage(storage.allocate(flat.storageShape(), flat.dtype()));
    tc::writeRegion(storage, flat, everything(), grid());
    flat.replicate(5);

    Array frames = tc::readRegion(
        storage, flat, {SliceIndex::range(1, 4, 1), SliceIndex::single(2), SliceIndex::full()});
    ASSERT_EQ(frames.dimension(), 3u);
    EXPECT_EQ(frames.shape()[0], 3u);
    EXPECT_EQ(frames.shape()[1], 1u);
    EXPECT_FLOAT_EQ(frames(0, 0, 1), 21.0f);
    EXPECT_FLOAT_EQ(frames(2, 0, 1), 21.0f);

    EXPECT_THROW(tc::writeRegion(storage, flat, {SliceIndex::single(0), SliceIndex::full(), SliceIndex::full()}, grid()),
                 std::logic_error);
}

TEST(MemoryStorage, DatasetWithoutStorage)
{
    MemoryStorage storage;
    tc::Dataset ds("empty");
    ds.setShape({2, 2});
    EXPECT_THROW(tc::readRegion(storage, ds, everything()), std::logic_error);
    EXPECT_THROW(tc::writeRegion(storage, ds, everything(), xt::zeros<float>({2, 2})), std::logic_error);
}
