#pragma once

#include <cstddef>
#include <vector>

#include "tc/core/types/Dataset.hpp"
#include "tc/core/util/SliceList.hpp"

namespace tc
{

/**
 * @brief Slice list of a dataset under its current pattern.
 *
 * The single dispatch point over DatasetKind: the kind selects the strategy
 * from a fixed table (plain enumeration, raw frame filtering, replicated).
 *
 * @throws InvalidPatternError if the dataset has no current pattern, or the
 *         kind does not support slicing in the pattern's directions
 */
std::vector<SliceTuple> sliceListFor(const Dataset& ds);

// sliceListFor() grouped into batches of at most maxBatch frames
std::vector<WorkBatch> groupedSliceListFor(const Dataset& ds, std::size_t maxBatch);

}  // namespace tc
