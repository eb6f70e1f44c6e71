#pragma once

#include <cstddef>
#include <string>

#include "tc/core/storage/StorageBackend.hpp"
#include "tc/core/types/DatasetRegistry.hpp"
#include "tc/core/util/SliceList.hpp"

namespace tc
{

class Coordinator;

/**
 * @brief Everything a stage may touch while it runs.
 *
 * Owns the dataset registry; refers to the storage backend and the
 * coordinator owned by the caller. Passed explicitly to every stage hook.
 */
class PipelineContext
{
public:
    PipelineContext(StorageBackend& storage, const Coordinator& coordinator);

    PipelineContext(const PipelineContext&) = delete;
    PipelineContext& operator=(const PipelineContext&) = delete;

    DatasetRegistry& registry() { return registry_; }
    [[nodiscard]] const DatasetRegistry& registry() const { return registry_; }
    StorageBackend& storage() { return storage_; }
    [[nodiscard]] const Coordinator& coordinator() const { return coordinator_; }

    [[nodiscard]] int rank() const;
    [[nodiscard]] int totalRanks() const;

    // --- stage bookkeeping, maintained by the driver ---
    [[nodiscard]] const std::string& stageName() const { return stageName_; }
    [[nodiscard]] std::size_t stageIndex() const { return stageIndex_; }
    void enterStage(std::size_t index, const std::string& name);

    // False while the layout is fixed, true once stages actually run
    [[nodiscard]] bool executing() const { return executing_; }
    void setExecuting(bool executing) { executing_ = executing; }

    [[nodiscard]] std::size_t iteration() const { return iteration_; }
    void setIteration(std::size_t iteration) { iteration_ = iteration; }

    // --- data access ---

    // Allocate zeroed storage for ds unless it already has some
    void allocate(Dataset& ds);

    /**
     * @brief Read a region of a dataset; inputs are searched before outputs.
     * @throws UnknownDatasetError if the name is neither
     */
    [[nodiscard]] Array read(const std::string& name, const SliceTuple& region) const;

    // Write a region of an output
    void write(const std::string& name, const SliceTuple& region, const Array& data);

    // Buffers of an alternating pair for the current iteration
    [[nodiscard]] const std::string& alternatingWriter(const std::string& visible) const;
    [[nodiscard]] const std::string& alternatingReader(const std::string& visible) const;

private:
    DatasetRegistry registry_;
    StorageBackend& storage_;
    const Coordinator& coordinator_;
    std::string stageName_;
    std::size_t stageIndex_ = 0;
    std::size_t iteration_ = 0;
    bool executing_ = false;
};

}  // namespace tc
