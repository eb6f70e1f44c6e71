#include "tc/core/types/Dataset.hpp"

#include <algorithm>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "tc/core/util/Errors.hpp"

namespace tc
{

std::string kindToString(DatasetKind kind)
{
    switch (kind) {
        case DatasetKind::Plain:
            return "plain";
        case DatasetKind::Raw:
            return "raw";
        case DatasetKind::Replicated:
            return "replicated";
    }
    return "unknown";
}

std::size_t DimSelection::count() const
{
    if (stop <= start || step == 0) {
        return 0;
    }
    return (stop - start + step - 1) / step;
}

// --- Preview -----------------------------------------------------------------

Preview::Preview(std::vector<DimSelection> dims) : dims_(std::move(dims)) {}

DimSelection Preview::selection(std::size_t dim, std::size_t extent) const
{
    if (dims_.empty()) {
        return {0, extent, 1};
    }
    return dims_.at(dim);
}

bool Preview::restricts(std::size_t dim, std::size_t extent) const
{
    return !(selection(dim, extent) == DimSelection{0, extent, 1});
}

void Preview::validate(const std::vector<std::size_t>& shape, const std::string& dataset) const
{
    if (dims_.empty()) {
        return;
    }
    if (dims_.size() != shape.size()) {
        throw ShapeMismatchError(
            dataset, "preview",
            "preview has " + std::to_string(dims_.size()) + " dimensions, dataset has " +
                std::to_string(shape.size()));
    }
    for (std::size_t d = 0; d < shape.size(); ++d) {
        const auto& sel = dims_[d];
        if (sel.step == 0 || sel.stop > shape[d] || sel.count() == 0) {
            throw ShapeMismatchError(
                dataset, "preview",
                "selection [" + std::to_string(sel.start) + ":" + std::to_string(sel.stop) +
                    ":" + std::to_string(sel.step) + "] is invalid for extent " +
                    std::to_string(shape[d]) + " of dimension " + std::to_string(d));
        }
    }
}

// --- Dataset -----------------------------------------------------------------

Dataset::Dataset(std::string name) : name_(std::move(name)) {}

std::vector<std::size_t> Dataset::storageShape() const
{
    if (kind_ == DatasetKind::Replicated) {
        return std::vector<std::size_t>(shape_.begin() + 1, shape_.end());
    }
    return shape_;
}

void Dataset::setShape(const std::vector<std::size_t>& shape)
{
    if (shape.empty() ||
        std::any_of(shape.begin(), shape.end(), [](std::size_t e) { return e == 0; })) {
        throw std::invalid_argument("dataset '" + name_ + "': extents must be positive");
    }
    if (shape == shape_) {
        return;
    }
    if (hasStorage()) {
        throw std::logic_error(
            "dataset '" + name_ + "': shape cannot change once storage is allocated");
    }
    shape_ = shape;
}

void Dataset::addPattern(const Pattern& pattern)
{
    if (shape_.empty()) {
        throw std::logic_error(
            "dataset '" + name_ + "': shape must be set before declaring pattern '" +
            pattern.name() + "'");
    }
    if (pattern.coreDims().empty()) {
        throw InvalidPatternError(
            "pattern '" + pattern.name() + "' of dataset '" + name_ + "' has no core dimensions");
    }
    auto outOfRange = [this](std::size_t dim) { return dim >= shape_.size(); };
    if (std::any_of(pattern.coreDims().begin(), pattern.coreDims().end(), outOfRange) ||
        std::any_of(pattern.sliceDims().begin(), pattern.sliceDims().end(), outOfRange)) {
        throw ShapeMismatchError(
            name_, pattern.name(),
            "pattern references a dimension beyond rank " + std::to_string(shape_.size()));
    }
    pattern.validate(shape_.size(), name_);
    patterns_.insert_or_assign(pattern.name(), pattern);
}

bool Dataset::hasPattern(const std::string& name) const
{
    return patterns_.contains(name);
}

const Pattern& Dataset::pattern(const std::string& name) const
{
    auto it = patterns_.find(name);
    if (it == patterns_.end()) {
        throw InvalidPatternError(
            "pattern '" + name + "' is not declared for dataset '" + name_ + "'");
    }
    return it->second;
}

void Dataset::setCurrentPattern(const std::string& name)
{
    // throws when undeclared
    const Pattern& p = pattern(name);
    current_ = p.name();
}

const Pattern& Dataset::currentPattern() const
{
    if (!current_) {
        throw InvalidPatternError("dataset '" + name_ + "' has no current pattern");
    }
    return pattern(*current_);
}

void Dataset::markRaw(std::size_t frameAxis, std::set<std::size_t> excludedFrames)
{
    if (kind_ != DatasetKind::Plain) {
        throw std::logic_error(
            "dataset '" + name_ + "' is " + kindToString(kind_) + ", cannot mark it raw");
    }
    if (frameAxis >= shape_.size()) {
        throw std::invalid_argument(
            "dataset '" + name_ + "': frame axis " + std::to_string(frameAxis) +
            " out of range");
    }
    if (!excludedFrames.empty() && *excludedFrames.rbegin() >= shape_[frameAxis]) {
        throw std::invalid_argument(
            "dataset '" + name_ + "': excluded frame " +
            std::to_string(*excludedFrames.rbegin()) + " beyond extent " +
            std::to_string(shape_[frameAxis]));
    }
    kind_ = DatasetKind::Raw;
    frameAxis_ = frameAxis;
    excluded_ = std::move(excludedFrames);
}

void Dataset::replicate(std::size_t replicas)
{
    if (kind_ != DatasetKind::Plain) {
        throw std::logic_error(
            "dataset '" + name_ + "' is " + kindToString(kind_) + ", cannot replicate it");
    }
    if (replicas == 0 || shape_.empty()) {
        throw std::invalid_argument(
            "dataset '" + name_ + "': replication needs a shape and at least one replica");
    }

    auto shifted = [](const std::vector<std::size_t>& dims) {
        std::vector<std::size_t> out;
        out.reserve(dims.size());
        for (auto d : dims) {
            out.push_back(d + 1);
        }
        return out;
    };

    std::map<std::string, Pattern> patterns;
    for (const auto& [name, p] : patterns_) {
        auto slice = shifted(p.sliceDims());
        slice.insert(slice.begin(), 0);
        patterns.emplace(name, Pattern(name, shifted(p.coreDims()), slice));
    }
    patterns_ = std::move(patterns);

    shape_.insert(shape_.begin(), replicas);
    replicas_ = replicas;
    kind_ = DatasetKind::Replicated;
    preview_.clear();
}

void Dataset::unreplicate()
{
    if (kind_ != DatasetKind::Replicated) {
        return;
    }

    auto dropped = [](const std::vector<std::size_t>& dims) {
        std::vector<std::size_t> out;
        for (auto d : dims) {
            if (d != 0) {
                out.push_back(d - 1);
            }
        }
        return out;
    };

    std::map<std::string, Pattern> patterns;
    for (const auto& [name, p] : patterns_) {
        auto core = dropped(p.coreDims());
        if (core.empty()) {
            continue;
        }
        patterns.emplace(name, Pattern(name, core, dropped(p.sliceDims())));
    }
    patterns_ = std::move(patterns);
    if (current_ && !patterns_.contains(*current_)) {
        current_.reset();
    }

    shape_.erase(shape_.begin());
    replicas_ = 0;
    kind_ = DatasetKind::Plain;
    preview_.clear();
}

void Dataset::setPreview(const Preview& preview)
{
    preview.validate(shape_, name_);
    preview_ = preview;
}

nlohmann::json Dataset::toJson() const
{
    nlohmann::json j;
    j["name"] = name_;
    j["shape"] = shape_;
    j["dtype"] = dtypeToString(dtype_);
    j["kind"] = kindToString(kind_);
    j["patterns"] = nlohmann::json::array();
    for (const auto& [name, p] : patterns_) {
        j["patterns"].push_back(p.toJson());
    }
    j["pattern"] = current_ ? *current_ : std::string();
    return j;
}

}  // namespace tc
