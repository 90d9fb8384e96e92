#include "../../include/core/Severity.h"
#include <algorithm>
#include <cctype>

namespace vera::core {

std::string toString(Severity severity) {
    switch (severity) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
    }
    return "medium";
}

Severity severityFromString(const std::string& label, Severity fallback) {
    std::string lower = label;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "low") return Severity::Low;
    if (lower == "medium") return Severity::Medium;
    if (lower == "high") return Severity::High;
    return fallback;
}

} // namespace vera::core
