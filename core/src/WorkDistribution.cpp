#include "tc/core/util/WorkDistribution.hpp"

#include <algorithm>

#include "tc/core/util/Errors.hpp"

namespace tc
{

std::pair<std::size_t, std::size_t> shareBounds(std::size_t count, int rank, int totalRanks)
{
    if (totalRanks < 1 || rank < 0 || rank >= totalRanks) {
        throw InvalidRankError(rank, totalRanks);
    }

    const auto ranks = static_cast<std::size_t>(totalRanks);
    const auto r = static_cast<std::size_t>(rank);
    const std::size_t base = count / ranks;
    const std::size_t extra = count % ranks;

    const std::size_t begin = r * base + std::min(r, extra);
    const std::size_t size = base + (r < extra ? 1 : 0);
    return {begin, begin + size};
}

WorkShare distribute(const std::vector<WorkBatch>& batches, int rank, int totalRanks)
{
    auto [begin, end] = shareBounds(batches.size(), rank, totalRanks);

    WorkShare share;
    share.begin = begin;
    share.end = end;
    share.total = batches.size();
    share.batches.assign(
        batches.begin() + static_cast<std::ptrdiff_t>(begin),
        batches.begin() + static_cast<std::ptrdiff_t>(end));
    return share;
}

}  // namespace tc
