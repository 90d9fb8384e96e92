#pragma once

#include "../core/AudioFeatures.h"
#include "../core/Collaborators.h"
#include "../fusion/FusionEngine.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace vera::narrative {

enum class Section {
    ExecutiveSummary,
    RiskIndicators,
    Opportunities,
    RedFlags,
    ConfidenceAssessment,
    OverallRecommendation
};

/** @brief Upper-case header text, e.g. "RED FLAGS". */
std::string headerOf(Section section);

/** @brief True for the sections holding bullet lists. */
bool isListSection(Section section);

/**
 * @brief The narrative for a reviewer, split into its six sections.
 */
struct NarrativeReport {
    std::string executiveSummary;
    std::vector<std::string> riskIndicators;
    std::vector<std::string> opportunities;
    std::vector<std::string> redFlags;
    std::string confidenceAssessment;
    std::string overallRecommendation;
    bool fallback = false; ///< Built from the fusion result, not from synthesized text.

    bool empty() const;
};

void to_json(nlohmann::json& j, const NarrativeReport& v);
void from_json(const nlohmann::json& j, NarrativeReport& v);

/**
 * @brief Everything upstream of the narrative stage.
 */
struct NarrativeRequest {
    std::string companyName;
    std::string companyContext;
    core::Transcript transcript;
    core::AudioFeatures audio;
    core::SentimentSummary sentiment;
    core::ChartSummary chart;
    fusion::FusionResult fusion;
};

/**
 * @brief Splits free narrative text into sections.
 *
 * A header is a line starting with '#' that contains a section name (any
 * case). Text sections keep their non-empty lines joined by newlines. List
 * sections keep lines starting with '-', '*' or a bullet, minus the marker;
 * "none" and "none identified" items are skipped. Text before the first header
 * and sections that never appear are ignored. Never throws.
 */
NarrativeReport parseNarrative(const std::string& text);

/**
 * @brief Deterministic report built from the fusion result alone.
 *
 * Used when narrative synthesis fails; the failure reason is quoted (at most
 * 200 characters) in the executive summary.
 */
NarrativeReport buildFallbackNarrative(const std::string& companyName,
                                       const fusion::FusionResult& fusion,
                                       double audioConfidence,
                                       core::Sentiment overallSentiment,
                                       const std::string& failureReason);

} // namespace vera::narrative
