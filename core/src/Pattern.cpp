#include "tc/core/types/Pattern.hpp"

#include <algorithm>
#include <set>

#include <nlohmann/json.hpp>

#include "tc/core/util/Errors.hpp"

namespace tc
{

Pattern::Pattern(std::string name, std::vector<std::size_t> coreDims, std::vector<std::size_t> sliceDims)
    : name_(std::move(name)), core_(std::move(coreDims)), slice_(std::move(sliceDims))
{
}

bool Pattern::isSlice(std::size_t dim) const
{
    return std::find(slice_.begin(), slice_.end(), dim) != slice_.end();
}

void Pattern::validate(std::size_t rank, const std::string& dataset) const
{
    if (core_.empty()) {
        throw InvalidPatternError(
            "pattern '" + name_ + "' of dataset '" + dataset + "' has no core dimensions");
    }

    std::set<std::size_t> seen;
    auto check = [&](std::size_t dim) {
        if (dim >= rank) {
            throw InvalidPatternError(
                "pattern '" + name_ + "' of dataset '" + dataset + "' references dimension " +
                std::to_string(dim) + " of a rank " + std::to_string(rank) + " dataset");
        }
        if (!seen.insert(dim).second) {
            throw InvalidPatternError(
                "pattern '" + name_ + "' of dataset '" + dataset + "' assigns dimension " +
                std::to_string(dim) + " more than once");
        }
    };
    std::for_each(core_.begin(), core_.end(), check);
    std::for_each(slice_.begin(), slice_.end(), check);

    if (seen.size() != rank) {
        throw ShapeMismatchError(
            dataset, name_,
            "pattern covers " + std::to_string(seen.size()) + " of " + std::to_string(rank) +
                " dimensions");
    }
}

nlohmann::json Pattern::toJson() const
{
    return {{"name", name_}, {"core_dims", core_}, {"slice_dims", slice_}};
}

Pattern Pattern::fromJson(const nlohmann::json& j)
{
    return Pattern(
        j.at("name").get<std::string>(),
        j.at("core_dims").get<std::vector<std::size_t>>(),
        j.at("slice_dims").get<std::vector<std::size_t>>());
}

}  // namespace tc
