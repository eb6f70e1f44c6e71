#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "tc/core/storage/Dtype.hpp"
#include "tc/core/types/Pattern.hpp"

namespace tc
{

/**
 * @brief Kind of data behind a Dataset.
 *
 * The kind selects the slicing strategy (see SlicingStrategy.hpp):
 * - Plain: every enumerated frame is processed
 * - Raw: frames flagged as darks/flats along the frame axis are skipped
 * - Replicated: one stored copy is presented n times along a leading axis
 */
enum class DatasetKind : std::uint8_t { Plain, Raw, Replicated };

std::string kindToString(DatasetKind kind);

/** @brief Half-open strided selection [start, stop) along one dimension */
struct DimSelection {
    std::size_t start{0};
    std::size_t stop{0};
    std::size_t step{1};

    [[nodiscard]] std::size_t count() const;
    bool operator==(const DimSelection&) const = default;
};

/**
 * @brief Preview selection restricting the processed extent of a dataset.
 *
 * An empty preview selects everything. A non-empty preview holds one
 * selection per dimension.
 */
class Preview
{
public:
    Preview() = default;
    explicit Preview(std::vector<DimSelection> dims);

    [[nodiscard]] bool empty() const { return dims_.empty(); }
    void clear() { dims_.clear(); }
    [[nodiscard]] const std::vector<DimSelection>& dims() const { return dims_; }

    // Selection along dim, or the whole [0, extent) when no preview is set
    [[nodiscard]] DimSelection selection(std::size_t dim, std::size_t extent) const;

    // True if the selection along dim is something other than the whole extent
    [[nodiscard]] bool restricts(std::size_t dim, std::size_t extent) const;

    void validate(const std::vector<std::size_t>& shape, const std::string& dataset) const;

private:
    std::vector<DimSelection> dims_;
};

/**
 * @brief Named, shaped, typed N-dimensional dataset flowing through the stage chain.
 *
 * Holds metadata only; the array itself lives in a StorageBackend and is
 * referenced through storage(). Copying a Dataset copies the metadata and
 * shares the storage handle.
 */
class Dataset
{
public:
    explicit Dataset(std::string name);

    [[nodiscard]] const std::string& name() const { return name_; }
    void setName(const std::string& name) { name_ = name; }

    // Logical shape; for replicated data this includes the leading replica axis
    [[nodiscard]] const std::vector<std::size_t>& shape() const { return shape_; }
    [[nodiscard]] std::size_t rank() const { return shape_.size(); }
    [[nodiscard]] std::vector<std::size_t> storageShape() const;

    /**
     * @throws std::invalid_argument on an empty shape or a zero extent
     * @throws std::logic_error if storage is allocated and the shape differs
     */
    void setShape(const std::vector<std::size_t>& shape);

    [[nodiscard]] Dtype dtype() const { return dtype_; }
    void setDtype(Dtype dtype) { dtype_ = dtype; }

    /**
     * @brief Declare a pattern (replacing one of the same name).
     * @throws InvalidPatternError on an empty core set or a repeated dimension
     * @throws ShapeMismatchError if the pattern does not fit the shape
     */
    void addPattern(const Pattern& pattern);
    [[nodiscard]] bool hasPattern(const std::string& name) const;
    [[nodiscard]] const Pattern& pattern(const std::string& name) const;
    [[nodiscard]] const std::map<std::string, Pattern>& patterns() const { return patterns_; }

    void setCurrentPattern(const std::string& name);
    [[nodiscard]] bool hasCurrentPattern() const { return current_.has_value(); }
    [[nodiscard]] const Pattern& currentPattern() const;

    [[nodiscard]] bool remove() const { return remove_; }
    void setRemove(bool remove) { remove_ = remove; }

    [[nodiscard]] StorageHandle storage() const { return storage_; }
    [[nodiscard]] bool hasStorage() const { return storage_ != kNoStorage; }
    void setStorage(StorageHandle handle) { storage_ = handle; }

    [[nodiscard]] DatasetKind kind() const { return kind_; }

    /**
     * @brief Mark as raw data whose listed frames along frameAxis are not data frames.
     * @throws std::logic_error unless the dataset is Plain
     * @throws std::invalid_argument for an axis or frame index out of range
     */
    void markRaw(std::size_t frameAxis, std::set<std::size_t> excludedFrames);
    [[nodiscard]] std::size_t frameAxis() const { return frameAxis_; }
    [[nodiscard]] const std::set<std::size_t>& excludedFrames() const { return excluded_; }

    /**
     * @brief Present the stored data replicas times along a new leading axis.
     *
     * Declared patterns are shifted by one dimension and gain axis 0 as a
     * slice dimension.
     */
    void replicate(std::size_t replicas);

    /**
     * @brief Undo replicate(): back to Plain with the stored shape.
     *
     * Axis 0 is dropped from every pattern; patterns left without a core
     * dimension are discarded. No-op for datasets that are not replicated.
     */
    void unreplicate();
    [[nodiscard]] std::size_t replicas() const { return replicas_; }

    [[nodiscard]] const Preview& preview() const { return preview_; }
    void setPreview(const Preview& preview);
    void clearPreview() { preview_.clear(); }

    [[nodiscard]] nlohmann::json toJson() const;

private:
    std::string name_;
    std::vector<std::size_t> shape_;
    Dtype dtype_ = Dtype::Float32;
    std::map<std::string, Pattern> patterns_;
    std::optional<std::string> current_;
    bool remove_ = false;
    StorageHandle storage_ = kNoStorage;
    DatasetKind kind_ = DatasetKind::Plain;
    std::size_t frameAxis_ = 0;
    std::set<std::size_t> excluded_;
    std::size_t replicas_ = 0;
    Preview preview_;
};

}  // namespace tc
