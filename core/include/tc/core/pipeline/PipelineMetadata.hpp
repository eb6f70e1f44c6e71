#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace tc
{

/** @brief How one stage sees one of its datasets */
struct DatasetEntry {
    std::string name;
    std::string pattern;
    std::vector<std::size_t> shape;
    std::string dtype;
    // Pattern a later stage reads this output with; empty if nobody does
    std::string nextPattern;

    bool operator==(const DatasetEntry&) const = default;
};

struct StageEntry {
    std::size_t index{0};
    std::string name;
    std::size_t maxBatch{1};
    std::vector<DatasetEntry> inputs;
    std::vector<DatasetEntry> outputs;

    bool operator==(const StageEntry&) const = default;
};

/**
 * @brief Layout of the whole chain, fixed before any stage executes.
 *
 * Written once by the coordinator rank and read back by every rank.
 */
class PipelineMetadata
{
public:
    void addStage(StageEntry entry);
    [[nodiscard]] const std::vector<StageEntry>& stages() const { return stages_; }
    [[nodiscard]] std::size_t stageCount() const { return stages_.size(); }
    void clear() { stages_.clear(); }

    /**
     * @brief Fill in DatasetEntry::nextPattern of every output.
     *
     * The next pattern is the one the first later stage declares for an
     * input of that name. The search stops at a later stage that outputs the
     * same name again.
     */
    void resolveNextPatterns();

    [[nodiscard]] nlohmann::json toJson() const;

    /** @throws std::runtime_error on a malformed document */
    static PipelineMetadata fromJson(const nlohmann::json& j);

    /** @throws std::runtime_error if the file cannot be written */
    void save(const std::filesystem::path& path) const;

    /** @throws std::runtime_error if the file is missing or malformed */
    static PipelineMetadata load(const std::filesystem::path& path);

private:
    std::vector<StageEntry> stages_;
};

}  // namespace tc
