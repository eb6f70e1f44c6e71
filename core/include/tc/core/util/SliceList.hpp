#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tc/core/types/Dataset.hpp"
#include "tc/core/types/Pattern.hpp"

namespace tc
{

/**
 * @brief Index along one dimension of a SliceTuple.
 *
 * Full selects the whole extent (core dimensions), Single one index (slice
 * dimensions), Range a strided half-open run [start, stop) (batched slice
 * dimensions, or core dimensions under a preview).
 */
struct SliceIndex {
    enum class Kind : std::uint8_t { Full, Single, Range };

    Kind kind{Kind::Full};
    std::size_t start{0};
    std::size_t stop{0};
    std::size_t step{1};

    static SliceIndex full() { return {}; }
    static SliceIndex single(std::size_t index) { return {Kind::Single, index, index + 1, 1}; }
    static SliceIndex range(std::size_t start, std::size_t stop, std::size_t step)
    {
        return {Kind::Range, start, stop, step};
    }

    [[nodiscard]] bool isSingle() const { return kind == Kind::Single; }

    // Number of indices selected from a dimension of the given extent
    [[nodiscard]] std::size_t count(std::size_t extent) const;

    bool operator==(const SliceIndex&) const = default;
};

// One entry per dimension, in shape order
using SliceTuple = std::vector<SliceIndex>;

std::string toString(const SliceIndex& index);
std::string toString(const SliceTuple& tuple);

/**
 * @brief A grouped, size-bounded run of frames.
 *
 * Every entry of region is fixed except region[*axis], a Range advancing by a
 * constant non-zero step whose stop is one past its last frame. axis is empty only for a tuple that has no slice
 * dimension at all (a pattern whose dimensions are all core).
 */
struct WorkBatch {
    SliceTuple region;
    std::optional<std::size_t> axis;

    [[nodiscard]] std::size_t frames() const;

    // The individual single-index tuples covered by this batch, in order
    [[nodiscard]] std::vector<SliceTuple> expand() const;

    bool operator==(const WorkBatch&) const = default;
};

/**
 * @brief Enumerate every independent core block of a dataset.
 *
 * Slice dimensions are walked row-major (last axis fastest). The sequence
 * holds the product of the slice extents (previewed extents when a preview is
 * set) tuples; indices are in the dataset's own coordinates.
 *
 * @throws InvalidPatternError if the pattern has no core dimension or names a
 *         dimension outside [0, rank)
 * @throws ShapeMismatchError if the pattern leaves a dimension unassigned
 */
std::vector<SliceTuple> enumerateSlices(
    const std::vector<std::size_t>& shape,
    const Pattern& pattern,
    const Preview& preview = Preview());

/**
 * @brief Coalesce consecutive tuples stepping along exactly one axis.
 *
 * Runs are closed as soon as the step changes or more than one axis moves,
 * then split into batches of at most maxBatch frames.
 *
 * @throws UngroupableSequenceError if the sequence is malformed (mixed ranks,
 *         mismatching fixed entries, duplicates or out-of-order tuples)
 * @throws std::invalid_argument if maxBatch is zero
 */
std::vector<WorkBatch> groupSlices(const std::vector<SliceTuple>& slices, std::size_t maxBatch);

}  // namespace tc
