#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "tc/core/util/SliceList.hpp"

namespace tc
{

/** @brief The contiguous part of a grouped slice list assigned to one rank */
struct WorkShare {
    std::vector<WorkBatch> batches;
    // [begin, end) indices into the full batch list
    std::size_t begin{0};
    std::size_t end{0};
    // Length of the full batch list every rank shares
    std::size_t total{0};

    [[nodiscard]] std::size_t size() const { return end - begin; }
    [[nodiscard]] bool empty() const { return begin == end; }
};

/**
 * @brief Bounds of rank's partition of [0, count).
 *
 * Partitions are contiguous and their sizes differ by at most one; the first
 * count % totalRanks ranks hold the larger size.
 *
 * @throws InvalidRankError if totalRanks < 1 or rank is outside [0, totalRanks)
 */
std::pair<std::size_t, std::size_t> shareBounds(std::size_t count, int rank, int totalRanks);

/** @brief Select rank's share of the grouped batch list */
WorkShare distribute(const std::vector<WorkBatch>& batches, int rank, int totalRanks);

}  // namespace tc
