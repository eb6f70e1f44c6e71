#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace tc
{

/**
 * @brief Named classification of a dataset's dimensions into core and slice roles.
 *
 * Core dimensions are always taken whole by a unit of work; slice dimensions
 * are divided across work units and ranks. The order of sliceDims() is the
 * order the pattern was declared with; enumeration always walks slice
 * dimensions in shape order.
 */
class Pattern
{
public:
    Pattern() = default;
    Pattern(std::string name, std::vector<std::size_t> coreDims, std::vector<std::size_t> sliceDims);

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::vector<std::size_t>& coreDims() const { return core_; }
    [[nodiscard]] const std::vector<std::size_t>& sliceDims() const { return slice_; }

    [[nodiscard]] bool isSlice(std::size_t dim) const;

    /**
     * @brief Check the pattern against a dataset rank.
     * @throws InvalidPatternError on an empty core set, a dimension outside
     *         [0, rank) or a dimension assigned twice
     * @throws ShapeMismatchError if a dimension of the rank is left unassigned
     */
    void validate(std::size_t rank, const std::string& dataset = "<unnamed>") const;

    [[nodiscard]] nlohmann::json toJson() const;
    static Pattern fromJson(const nlohmann::json& j);

    bool operator==(const Pattern& other) const = default;

private:
    std::string name_;
    std::vector<std::size_t> core_;
    std::vector<std::size_t> slice_;
};

}  // namespace tc
