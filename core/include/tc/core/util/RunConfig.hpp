#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace tc
{

/**
 * @brief Settings of one pipeline run.
 *
 * Every key is optional:
 * @code
 * {
 *   "log_level": "debug",
 *   "log_file": "run.log",
 *   "metadata_file": "pipeline.json",
 *   "mpi": true,
 *   "default_max_frames": 4
 * }
 * @endcode
 */
struct RunConfig {
    std::string logLevel = "info";
    std::filesystem::path logFile;
    // Empty keeps the pipeline metadata in memory only
    std::filesystem::path metadataFile;
    bool mpi = false;
    std::size_t defaultMaxFrames = 1;

    static RunConfig fromJson(const nlohmann::json& j);

    /** @throws std::runtime_error on a missing or invalid file */
    static RunConfig load(const std::filesystem::path& path);

    // Install the log level and log file on the process logger
    void applyLogging() const;
};

}  // namespace tc
