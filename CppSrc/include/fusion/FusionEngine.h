#pragma once

#include "../core/AnalysisConfig.h"
#include "../core/AudioFeatures.h"
#include "../core/Collaborators.h"
#include "../core/Severity.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace vera::fusion {

enum class RiskLevel {
    Low,
    Medium,
    High
};

std::string toString(RiskLevel level);
/** @throw std::invalid_argument on an unknown label. */
RiskLevel riskLevelFromString(const std::string& label);

/**
 * @brief A disagreement between two or more modalities.
 */
struct Discrepancy {
    std::string type; ///< audio_text_mismatch, chart_verbal_mismatch, stress_sentiment_mismatch
    core::Severity severity = core::Severity::Medium;
    std::string description;
    std::vector<std::string> modalities;
    nlohmann::json details = nlohmann::json::object();
};

struct AttentionWeights {
    double audio = 1.0 / 3.0;
    double text = 1.0 / 3.0;
    double chart = 1.0 / 3.0;
};

struct FusionResult {
    double credibilityScore = 0.0;
    RiskLevel riskLevel = RiskLevel::Low;
    std::vector<Discrepancy> discrepancies;
    std::vector<std::string> insights;
    AttentionWeights attentionWeights;
};

void to_json(nlohmann::json& j, const Discrepancy& v);
void from_json(const nlohmann::json& j, Discrepancy& v);
void to_json(nlohmann::json& j, const AttentionWeights& v);
void from_json(const nlohmann::json& j, AttentionWeights& v);
void to_json(nlohmann::json& j, const FusionResult& v);
void from_json(const nlohmann::json& j, FusionResult& v);

/**
 * @brief Combines the acoustic, textual and visual signals of a job.
 *
 * fuse() is a pure function of its inputs and the config: it keeps no state
 * and may be called from several threads at once.
 */
class FusionEngine {
public:
    explicit FusionEngine(core::FusionConfig config = core::FusionConfig());

    FusionResult fuse(const core::AudioFeatures& audio,
                      const core::SentimentSummary& sentiment,
                      const core::ChartSummary& chart) const;

    double credibilityScore(double audioConfidence,
                            const core::SentimentDistribution& distribution,
                            size_t inconsistencyCount) const;

    std::vector<Discrepancy> detectDiscrepancies(double audioConfidence,
                                                 core::Sentiment sentiment,
                                                 const core::ChartSummary& chart,
                                                 size_t stressCount) const;

    RiskLevel riskLevel(double credibility,
                        const std::vector<Discrepancy>& discrepancies,
                        core::Sentiment sentiment,
                        size_t stressCount) const;

    AttentionWeights attentionWeights(size_t stressCount,
                                      size_t distinctTopics,
                                      size_t inconsistencyCount) const;

    const core::FusionConfig& config() const { return m_config; }

private:
    std::vector<std::string> insights(const core::AudioFeatures& audio,
                                      double audioConfidence,
                                      const core::SentimentSummary& sentiment,
                                      const core::ChartSummary& chart,
                                      const std::vector<Discrepancy>& discrepancies) const;

    core::FusionConfig m_config;
};

} // namespace vera::fusion
