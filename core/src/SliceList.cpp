#include "tc/core/util/SliceList.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "tc/core/util/Errors.hpp"

namespace tc
{

std::size_t SliceIndex::count(std::size_t extent) const
{
    switch (kind) {
        case Kind::Full:
            return extent;
        case Kind::Single:
            return 1;
        case Kind::Range:
            return DimSelection{start, stop, step}.count();
    }
    return 0;
}

std::string toString(const SliceIndex& index)
{
    switch (index.kind) {
        case SliceIndex::Kind::Full:
            return ":";
        case SliceIndex::Kind::Single:
            return std::to_string(index.start);
        case SliceIndex::Kind::Range:
            return std::to_string(index.start) + ":" + std::to_string(index.stop) + ":" +
                   std::to_string(index.step);
    }
    return "?";
}

std::string toString(const SliceTuple& tuple)
{
    std::ostringstream out;
    out << "(";
    for (std::size_t i = 0; i < tuple.size(); ++i) {
        if (i != 0) {
            out << ", ";
        }
        out << toString(tuple[i]);
    }
    out << ")";
    return out.str();
}

std::size_t WorkBatch::frames() const
{
    if (!axis) {
        return 1;
    }
    return region[*axis].count(0);
}

std::vector<SliceTuple> WorkBatch::expand() const
{
    if (!axis) {
        return {region};
    }
    const auto& r = region[*axis];
    std::vector<SliceTuple> out;
    out.reserve(frames());
    for (std::size_t i = r.start; i < r.stop; i += r.step) {
        SliceTuple t = region;
        t[*axis] = SliceIndex::single(i);
        out.push_back(std::move(t));
    }
    return out;
}

std::vector<SliceTuple> enumerateSlices(
    const std::vector<std::size_t>& shape, const Pattern& pattern, const Preview& preview)
{
    pattern.validate(shape.size());
    preview.validate(shape, "<unnamed>");

    std::vector<std::size_t> sliceDims = pattern.sliceDims();
    std::sort(sliceDims.begin(), sliceDims.end());

    SliceTuple base(shape.size(), SliceIndex::full());
    std::size_t total = 1;
    std::vector<DimSelection> selections;
    selections.reserve(sliceDims.size());
    for (std::size_t d = 0; d < shape.size(); ++d) {
        DimSelection sel = preview.selection(d, shape[d]);
        if (pattern.isSlice(d)) {
            selections.push_back(sel);
            total *= sel.count();
        } else if (preview.restricts(d, shape[d])) {
            base[d] = SliceIndex::range(sel.start, sel.stop, sel.step);
        }
    }

    std::vector<SliceTuple> out;
    out.reserve(total);
    std::vector<std::size_t> counter(sliceDims.size(), 0);
    for (std::size_t n = 0; n < total; ++n) {
        SliceTuple t = base;
        for (std::size_t k = 0; k < sliceDims.size(); ++k) {
            t[sliceDims[k]] =
                SliceIndex::single(selections[k].start + counter[k] * selections[k].step);
        }
        out.push_back(std::move(t));

        // odometer, last slice dimension fastest
        for (std::size_t k = sliceDims.size(); k-- > 0;) {
            if (++counter[k] < selections[k].count()) {
                break;
            }
            counter[k] = 0;
        }
    }
    return out;
}

namespace
{

struct Step {
    std::size_t movingAxes{0};
    std::size_t axis{0};
    std::size_t delta{0};
};

// Differences between two consecutive tuples; rejects anything that is not a
// strictly increasing row-major successor.
Step stepBetween(const SliceTuple& prev, const SliceTuple& next)
{
    if (prev.size() != next.size()) {
        throw UngroupableSequenceError(
            "slice " + toString(next) + " has a different rank than " + toString(prev));
    }

    Step step;
    bool ordered = false;
    bool decided = false;
    for (std::size_t d = 0; d < prev.size(); ++d) {
        const auto& a = prev[d];
        const auto& b = next[d];
        if (a.isSingle() != b.isSingle() || (!a.isSingle() && !(a == b))) {
            throw UngroupableSequenceError(
                "slices " + toString(prev) + " and " + toString(next) +
                " differ in a fixed dimension " + std::to_string(d));
        }
        if (!a.isSingle() || a.start == b.start) {
            continue;
        }
        if (!decided) {
            ordered = b.start > a.start;
            decided = true;
        }
        ++step.movingAxes;
        step.axis = d;
        step.delta = b.start > a.start ? b.start - a.start : a.start - b.start;
    }

    if (!decided || !ordered) {
        throw UngroupableSequenceError(
            "slice " + toString(next) + " does not follow " + toString(prev) +
            " in row-major order");
    }
    return step;
}

void closeBatch(
    const std::vector<const SliceTuple*>& batch,
    std::size_t axis,
    std::size_t step,
    std::size_t maxBatch,
    std::vector<WorkBatch>& out)
{
    const SliceTuple& first = *batch.front();

    if (batch.size() == 1) {
        std::optional<std::size_t> last;
        for (std::size_t d = 0; d < first.size(); ++d) {
            if (first[d].isSingle()) {
                last = d;
            }
        }
        WorkBatch wb{first, last};
        if (last) {
            wb.region[*last] = SliceIndex::range(first[*last].start, first[*last].start + 1, 1);
        }
        out.push_back(std::move(wb));
        return;
    }

    // counted in frames so that no index arithmetic can wrap
    const std::size_t start = first[axis].start;
    const std::size_t frames = batch.size();
    std::size_t i = 0;
    while (i < frames) {
        const std::size_t len = std::min(maxBatch, frames - i);
        const std::size_t lo = start + i * step;
        WorkBatch wb{first, axis};
        wb.region[axis] = SliceIndex::range(lo, lo + (len - 1) * step + 1, step);
        out.push_back(std::move(wb));
        i += len;
    }
}

}  // namespace

std::vector<WorkBatch> groupSlices(const std::vector<SliceTuple>& slices, std::size_t maxBatch)
{
    if (maxBatch == 0) {
        throw std::invalid_argument("maximum batch size must be at least one frame");
    }

    std::vector<WorkBatch> grouped;
    std::vector<const SliceTuple*> batch;
    std::size_t axis = 0;
    std::size_t step = 0;

    for (const auto& sl : slices) {
        if (batch.empty()) {
            batch.push_back(&sl);
            continue;
        }

        const Step next = stepBetween(*batch.back(), sl);
        if (next.movingAxes == 1) {
            if (batch.size() == 1) {
                axis = next.axis;
                step = next.delta;
                batch.push_back(&sl);
                continue;
            }
            if (next.axis == axis && next.delta == step) {
                batch.push_back(&sl);
                continue;
            }
        }

        // several axes moved, or the step changed: never guess an axis
        closeBatch(batch, axis, step, maxBatch, grouped);
        batch.assign(1, &sl);
    }
    if (!batch.empty()) {
        closeBatch(batch, axis, step, maxBatch, grouped);
    }
    return grouped;
}

}  // namespace tc
