#include "tc/core/util/RunConfig.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "tc/core/util/LoadJson.hpp"
#include "tc/core/util/Logging.hpp"

namespace tc
{

RunConfig RunConfig::fromJson(const nlohmann::json& j)
{
    if (!j.is_object()) {
        throw std::runtime_error("run configuration must be a JSON object");
    }
    RunConfig cfg;
    cfg.logLevel = json::string_or(&j, "log_level", cfg.logLevel);
    cfg.logFile = json::string_or(&j, "log_file", "");
    cfg.metadataFile = json::string_or(&j, "metadata_file", "");
    cfg.mpi = json::bool_or(&j, "mpi", cfg.mpi);

    const double frames = json::number_or(&j, "default_max_frames", 1);
    // 2^digits is the first value past the size_t range that a double holds exactly
    const double limit = std::ldexp(1.0, std::numeric_limits<std::size_t>::digits);
    if (!std::isfinite(frames) || frames < 1 || frames >= limit || frames != std::floor(frames)) {
        throw std::runtime_error(
            "default_max_frames must be a whole number of frames, at least 1");
    }
    cfg.defaultMaxFrames = static_cast<std::size_t>(frames);
    return cfg;
}

RunConfig RunConfig::load(const std::filesystem::path& path)
{
    return fromJson(json::load_json_file(path));
}

void RunConfig::applyLogging() const
{
    SetLogLevel(logLevel);
    if (!logFile.empty()) {
        AddLogFile(logFile);
    }
}

}  // namespace tc
