#pragma once

#include <stdexcept>
#include <string>

namespace vera::core {

/**
 * @brief Raised when an audio signal cannot be analysed at all.
 *
 * Covers undecodable files, empty signals, non-positive sample rates and
 * non-finite samples. Sub-feature failures never raise this; they degrade to
 * neutral defaults instead.
 */
class ExtractionError : public std::runtime_error {
public:
    explicit ExtractionError(const std::string& message)
        : std::runtime_error("Failed to extract audio features: " + message) {}
};

/**
 * @brief Raised on an illegal job status transition or a re-entrant start.
 */
class JobStateError : public std::logic_error {
public:
    explicit JobStateError(const std::string& message)
        : std::logic_error(message) {}
};

/**
 * @brief Raised when the job store cannot read or commit a record.
 */
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace vera::core
