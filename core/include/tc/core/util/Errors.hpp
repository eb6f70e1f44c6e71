#pragma once

#include <stdexcept>
#include <string>

namespace tc
{

/** @brief Base class of every configuration error raised by the pipeline core */
class PipelineError : public std::runtime_error
{
public:
    explicit PipelineError(const std::string& msg) : std::runtime_error(msg) {}
};

/** @brief Pattern has no core dimension, or names a dimension that does not exist */
class InvalidPatternError : public PipelineError
{
public:
    explicit InvalidPatternError(const std::string& msg) : PipelineError(msg) {}
};

/** @brief Two outputs of the same name were declared by one stage */
class DuplicateDatasetError : public PipelineError
{
public:
    explicit DuplicateDatasetError(const std::string& name)
        : PipelineError("output dataset '" + name + "' declared twice"), name_(name)
    {
    }

    [[nodiscard]] const std::string& datasetName() const noexcept { return name_; }

private:
    std::string name_;
};

/** @brief Work distribution was requested for a rank outside the pool */
class InvalidRankError : public PipelineError
{
public:
    InvalidRankError(int rank, int totalRanks)
        : PipelineError(
              "invalid rank " + std::to_string(rank) + " of " +
              std::to_string(totalRanks) + " ranks")
    {
    }
};

/**
 * @brief Declared pattern does not fit the dataset it is applied to.
 *
 * Carries the offending dataset and pattern so the driver can report them.
 */
class ShapeMismatchError : public PipelineError
{
public:
    ShapeMismatchError(
        const std::string& dataset, const std::string& pattern, const std::string& detail)
        : PipelineError(
              "dataset '" + dataset + "', pattern '" + pattern + "': " + detail),
          dataset_(dataset),
          pattern_(pattern)
    {
    }

    [[nodiscard]] const std::string& datasetName() const noexcept { return dataset_; }
    [[nodiscard]] const std::string& patternName() const noexcept { return pattern_; }

private:
    std::string dataset_;
    std::string pattern_;
};

/** @brief Slice list handed to the grouper is malformed */
class UngroupableSequenceError : public PipelineError
{
public:
    explicit UngroupableSequenceError(const std::string& msg) : PipelineError(msg) {}
};

/** @brief Lookup of a dataset name that is not registered in the requested role */
class UnknownDatasetError : public PipelineError
{
public:
    explicit UnknownDatasetError(const std::string& msg) : PipelineError(msg) {}
};

}  // namespace tc
