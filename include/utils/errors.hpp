#pragma once

#include <stdexcept>
#include <string>

namespace NewsCube {

/**
 * @brief Input does not carry a column the pipeline cannot run without.
 */
class SchemaError : public std::runtime_error {
public:
    explicit SchemaError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Batch protocol misuse (scan after finalize, double finalize, ...).
 */
class PipelineStateError : public std::logic_error {
public:
    explicit PipelineStateError(const std::string& what) : std::logic_error(what) {}
};

} // namespace NewsCube
