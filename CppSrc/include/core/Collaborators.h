#pragma once

#include "Severity.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace vera::core {

// ============================================================================
// Data exchanged with the external collaborators
// ============================================================================

struct TranscriptSegment {
    std::string text;
    double startTime = 0.0;
    double endTime = 0.0;
    std::optional<std::string> speaker;
};

struct Transcript {
    std::string fullText;
    std::vector<TranscriptSegment> segments;
    std::string language = "en";
    double duration = 0.0;
};

enum class Sentiment {
    Positive,
    Neutral,
    Negative
};

std::string toString(Sentiment sentiment);
/** @brief Unknown labels read as Neutral. */
Sentiment sentimentFromString(const std::string& label);

struct SentimentSegment {
    TranscriptSegment segment;
    Sentiment sentiment = Sentiment::Neutral;
    double sentimentScore = 0.0;
    std::string segmentType; ///< "prepared_statement", "qa" or empty.
};

/** @brief Share of each label; missing keys read as 0.33. */
struct SentimentDistribution {
    double positive = 0.33;
    double neutral = 0.33;
    double negative = 0.33;
};

struct DiscourseAnalysis {
    SentimentDistribution prepared{0.0, 0.0, 0.0};
    SentimentDistribution qa{0.0, 0.0, 0.0};
    std::string sentimentShift = "stable"; ///< more_negative, more_positive or stable
};

struct SentimentSummary {
    std::vector<SentimentSegment> segments;
    Sentiment overallSentiment = Sentiment::Neutral;
    SentimentDistribution distribution;
    std::vector<std::string> keyTopics;
    std::vector<nlohmann::json> financialMetrics;
    std::optional<DiscourseAnalysis> discourseAnalysis;
};

/**
 * @brief Compares prepared statements against Q&A sentiment.
 *
 * A share is 0 when the group has no segments. The shift is more_negative
 * when (qa positive - negative) falls more than 0.1 below the prepared
 * balance, more_positive when it rises more than 0.1, stable otherwise.
 */
DiscourseAnalysis computeDiscourseAnalysis(const std::vector<SentimentSegment>& segments);

struct ChartInconsistency {
    std::string type;
    std::string description;
    Severity severity = Severity::Medium;
};

struct ChartSummary {
    std::vector<std::string> chartDescriptions;
    std::vector<nlohmann::json> extractedData;
    std::vector<ChartInconsistency> inconsistencies;
};

void to_json(nlohmann::json& j, const TranscriptSegment& v);
void from_json(const nlohmann::json& j, TranscriptSegment& v);
void to_json(nlohmann::json& j, const Transcript& v);
void from_json(const nlohmann::json& j, Transcript& v);
void to_json(nlohmann::json& j, const SentimentSegment& v);
void from_json(const nlohmann::json& j, SentimentSegment& v);
void to_json(nlohmann::json& j, const SentimentDistribution& v);
void from_json(const nlohmann::json& j, SentimentDistribution& v);
void to_json(nlohmann::json& j, const DiscourseAnalysis& v);
void from_json(const nlohmann::json& j, DiscourseAnalysis& v);
void to_json(nlohmann::json& j, const SentimentSummary& v);
void from_json(const nlohmann::json& j, SentimentSummary& v);
void to_json(nlohmann::json& j, const ChartInconsistency& v);
void from_json(const nlohmann::json& j, ChartInconsistency& v);
void to_json(nlohmann::json& j, const ChartSummary& v);
void from_json(const nlohmann::json& j, ChartSummary& v);

} // namespace vera::core
