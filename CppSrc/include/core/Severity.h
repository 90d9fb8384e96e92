#pragma once

#include <string>

namespace vera::core {

/**
 * @brief Severity shared by stress indicators, chart inconsistencies and discrepancies.
 */
enum class Severity {
    Low,
    Medium,
    High
};

/** @brief "low", "medium" or "high". */
std::string toString(Severity severity);

/**
 * @brief Parses a severity label (case-insensitive).
 * @param label The label to parse.
 * @param fallback Returned for unknown labels.
 */
Severity severityFromString(const std::string& label, Severity fallback = Severity::Medium);

} // namespace vera::core
