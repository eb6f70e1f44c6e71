#include "tc/core/util/SlicingStrategy.hpp"

#include <algorithm>
#include <array>
#include <sstream>

#include "tc/core/util/Errors.hpp"

namespace tc
{

namespace
{

std::string directions(const std::vector<std::size_t>& dims)
{
    std::ostringstream out;
    out << "(";
    for (std::size_t i = 0; i < dims.size(); ++i) {
        out << (i ? ", " : "") << dims[i];
    }
    out << ")";
    return out.str();
}

std::vector<SliceTuple> plainSlices(const Dataset& ds, const Pattern& p)
{
    return enumerateSlices(ds.shape(), p, ds.preview());
}

// Dark and flat frames interleaved with the projections are dropped
std::vector<SliceTuple> rawSlices(const Dataset& ds, const Pattern& p)
{
    const auto& excluded = ds.excludedFrames();
    const std::size_t axis = ds.frameAxis();
    if (excluded.empty()) {
        return plainSlices(ds, p);
    }
    if (!p.isSlice(axis)) {
        throw InvalidPatternError(
            "raw dataset '" + ds.name() + "' with pattern '" + p.name() +
            "' does not support slicing in directions " + directions(p.sliceDims()) +
            ": frame axis " + std::to_string(axis) + " is a core dimension");
    }

    auto slices = plainSlices(ds, p);
    std::erase_if(slices, [&](const SliceTuple& t) {
        return excluded.contains(t[axis].start);
    });
    return slices;
}

std::vector<SliceTuple> replicatedSlices(const Dataset& ds, const Pattern& p)
{
    if (!p.isSlice(0)) {
        throw InvalidPatternError(
            "replicated dataset '" + ds.name() + "' with pattern '" + p.name() +
            "' does not support slicing in directions " + directions(p.sliceDims()) +
            ": the replica axis must be a slice dimension");
    }
    return plainSlices(ds, p);
}

using SliceStrategy = std::vector<SliceTuple> (*)(const Dataset&, const Pattern&);

// Indexed by DatasetKind
constexpr std::array<SliceStrategy, 3> kStrategies = {
    &plainSlices,
    &rawSlices,
    &replicatedSlices,
};

}  // namespace

std::vector<SliceTuple> sliceListFor(const Dataset& ds)
{
    const Pattern& p = ds.currentPattern();
    return kStrategies.at(static_cast<std::size_t>(ds.kind()))(ds, p);
}

std::vector<WorkBatch> groupedSliceListFor(const Dataset& ds, std::size_t maxBatch)
{
    return groupSlices(sliceListFor(ds), maxBatch);
}

}  // namespace tc
