#include "tc/core/pipeline/PipelineMetadata.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "tc/core/util/LoadJson.hpp"

namespace tc
{

namespace
{

nlohmann::json datasetToJson(const DatasetEntry& d)
{
    nlohmann::json j;
    j["name"] = d.name;
    j["pattern"] = d.pattern;
    j["shape"] = d.shape;
    j["dtype"] = d.dtype;
    j["next_pattern"] = d.nextPattern;
    return j;
}

DatasetEntry datasetFromJson(const nlohmann::json& j, const std::string& context)
{
    json::require_fields(j, {"name", "pattern", "shape"}, context);
    DatasetEntry d;
    d.name = j.at("name").get<std::string>();
    d.pattern = j.at("pattern").get<std::string>();
    d.shape = j.at("shape").get<std::vector<std::size_t>>();
    d.dtype = json::string_or(&j, "dtype", "float32");
    d.nextPattern = json::string_or(&j, "next_pattern", "");
    return d;
}

std::vector<DatasetEntry> datasetsFromJson(
    const nlohmann::json& stage, const char* key, const std::string& context)
{
    std::vector<DatasetEntry> out;
    for (const auto& d : stage.at(key)) {
        out.push_back(datasetFromJson(d, context + " " + key));
    }
    return out;
}

}  // namespace

void PipelineMetadata::addStage(StageEntry entry)
{
    entry.index = stages_.size();
    stages_.push_back(std::move(entry));
}

void PipelineMetadata::resolveNextPatterns()
{
    for (std::size_t k = 0; k < stages_.size(); ++k) {
        for (auto& out : stages_[k].outputs) {
            out.nextPattern.clear();
            for (std::size_t j = k + 1; j < stages_.size(); ++j) {
                bool found = false;
                for (const auto& in : stages_[j].inputs) {
                    if (in.name == out.name) {
                        out.nextPattern = in.pattern;
                        found = true;
                        break;
                    }
                }
                if (found) {
                    break;
                }
                bool overwritten = false;
                for (const auto& later : stages_[j].outputs) {
                    overwritten = overwritten || later.name == out.name;
                }
                if (overwritten) {
                    break;
                }
            }
        }
    }
}

nlohmann::json PipelineMetadata::toJson() const
{
    nlohmann::json j;
    j["stages"] = nlohmann::json::array();
    for (const auto& s : stages_) {
        nlohmann::json sj;
        sj["index"] = s.index;
        sj["name"] = s.name;
        sj["max_batch"] = s.maxBatch;
        sj["inputs"] = nlohmann::json::array();
        for (const auto& d : s.inputs) {
            sj["inputs"].push_back(datasetToJson(d));
        }
        sj["outputs"] = nlohmann::json::array();
        for (const auto& d : s.outputs) {
            sj["outputs"].push_back(datasetToJson(d));
        }
        j["stages"].push_back(std::move(sj));
    }
    return j;
}

PipelineMetadata PipelineMetadata::fromJson(const nlohmann::json& j)
{
    json::require_fields(j, {"stages"}, "pipeline metadata");
    PipelineMetadata meta;
    try {
        for (const auto& sj : j.at("stages")) {
            const std::string context = "pipeline metadata stage";
            json::require_fields(sj, {"name", "inputs", "outputs"}, context);
            StageEntry s;
            s.name = sj.at("name").get<std::string>();
            s.maxBatch = static_cast<std::size_t>(json::number_or(&sj, "max_batch", 1));
            s.inputs = datasetsFromJson(sj, "inputs", context + " '" + s.name + "'");
            s.outputs = datasetsFromJson(sj, "outputs", context + " '" + s.name + "'");
            meta.addStage(std::move(s));
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("malformed pipeline metadata: ") + e.what());
    }
    return meta;
}

void PipelineMetadata::save(const std::filesystem::path& path) const
{
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot write pipeline metadata: " + path.string());
    }
    out << toJson().dump(2) << '\n';
    if (!out) {
        throw std::runtime_error("Failed writing pipeline metadata: " + path.string());
    }
}

PipelineMetadata PipelineMetadata::load(const std::filesystem::path& path)
{
    return fromJson(json::load_json_file(path));
}

}  // namespace tc
