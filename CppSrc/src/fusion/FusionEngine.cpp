#include "../../include/fusion/FusionEngine.h"
#include "../../include/core/SignalAnalysis.h"
#include <algorithm>
#include <iostream>
#include <set>
#include <stdexcept>

namespace vera::fusion {

std::string toString(RiskLevel level) {
    switch (level) {
        case RiskLevel::Low: return "low";
        case RiskLevel::Medium: return "medium";
        case RiskLevel::High: return "high";
    }
    return "low";
}

RiskLevel riskLevelFromString(const std::string& label) {
    if (label == "low") return RiskLevel::Low;
    if (label == "medium") return RiskLevel::Medium;
    if (label == "high") return RiskLevel::High;
    throw std::invalid_argument("Unknown risk level: " + label);
}

FusionEngine::FusionEngine(core::FusionConfig config)
    : m_config(std::move(config))
{
}

FusionResult FusionEngine::fuse(const core::AudioFeatures& audio,
                                const core::SentimentSummary& sentiment,
                                const core::ChartSummary& chart) const {
    const double audioConfidence = core::dsp::finiteOr(audio.overallConfidence, m_config.defaultAudioConfidence);
    const size_t stressCount = audio.stressIndicators.size();
    const size_t inconsistencyCount = chart.inconsistencies.size();

    std::set<std::string> topics(sentiment.keyTopics.begin(), sentiment.keyTopics.end());

    FusionResult result;
    result.credibilityScore = credibilityScore(audioConfidence, sentiment.distribution, inconsistencyCount);
    result.discrepancies = detectDiscrepancies(audioConfidence, sentiment.overallSentiment, chart, stressCount);
    result.riskLevel = riskLevel(result.credibilityScore, result.discrepancies,
                                 sentiment.overallSentiment, stressCount);
    result.insights = insights(audio, audioConfidence, sentiment, chart, result.discrepancies);
    result.attentionWeights = attentionWeights(stressCount, topics.size(), inconsistencyCount);

    std::cout << "[Fusion] Credibility: " << result.credibilityScore
              << ", risk: " << toString(result.riskLevel)
              << ", discrepancies: " << result.discrepancies.size() << std::endl;
    return result;
}

double FusionEngine::credibilityScore(double audioConfidence,
                                      const core::SentimentDistribution& distribution,
                                      size_t inconsistencyCount) const {
    const double positive = core::dsp::finiteOr(distribution.positive, m_config.defaultSentimentShare);
    const double negative = core::dsp::finiteOr(distribution.negative, m_config.defaultSentimentShare);
    const double textConfidence = std::clamp(0.5 + positive - negative, 0.0, 1.0);
    const double chartConfidence = std::clamp(
        1.0 - static_cast<double>(inconsistencyCount) * m_config.chartPenaltyPerInconsistency, 0.0, 1.0);

    const double credibility = audioConfidence * m_config.audioWeight +
                               textConfidence * m_config.textWeight +
                               chartConfidence * m_config.chartWeight;
    return core::dsp::roundTo(std::clamp(credibility, 0.0, 1.0), 3);
}

std::vector<Discrepancy> FusionEngine::detectDiscrepancies(double audioConfidence,
                                                           core::Sentiment sentiment,
                                                           const core::ChartSummary& chart,
                                                           size_t stressCount) const {
    std::vector<Discrepancy> discrepancies;
    const std::string sentimentLabel = core::toString(sentiment);

    if (audioConfidence < m_config.lowAudioConfidence && sentiment == core::Sentiment::Positive) {
        discrepancies.push_back({
            "audio_text_mismatch",
            core::Severity::High,
            "Positive verbal statements but low vocal confidence detected",
            {"audio", "text"},
            {{"audioConfidence", audioConfidence}, {"textSentiment", sentimentLabel}}
        });
    }

    if (audioConfidence > m_config.highAudioConfidence && sentiment == core::Sentiment::Negative) {
        discrepancies.push_back({
            "audio_text_mismatch",
            core::Severity::Medium,
            "Negative statements delivered with high confidence - potentially planned bad news",
            {"audio", "text"},
            {{"audioConfidence", audioConfidence}, {"textSentiment", sentimentLabel}}
        });
    }

    for (const auto& inconsistency : chart.inconsistencies) {
        discrepancies.push_back({
            "chart_verbal_mismatch",
            inconsistency.severity,
            inconsistency.description.empty() ? "Chart data doesn't match verbal statements"
                                              : inconsistency.description,
            {"chart", "text"},
            nlohmann::json::object()
        });
    }

    if (stressCount > static_cast<size_t>(m_config.stressMismatchCount) && sentiment == core::Sentiment::Positive) {
        discrepancies.push_back({
            "stress_sentiment_mismatch",
            core::Severity::Medium,
            "Detected " + std::to_string(stressCount) + " vocal stress indicators despite positive language",
            {"audio", "text"},
            {{"stressCount", stressCount}}
        });
    }

    return discrepancies;
}

RiskLevel FusionEngine::riskLevel(double credibility,
                                  const std::vector<Discrepancy>& discrepancies,
                                  core::Sentiment sentiment,
                                  size_t stressCount) const {
    int score = 0;

    if (credibility < m_config.lowCredibility) {
        score += m_config.lowCredibilityPoints;
    } else if (credibility < m_config.moderateCredibility) {
        score += m_config.moderateCredibilityPoints;
    }

    // High severity discrepancies count twice: once here and once below
    const auto highCount = std::count_if(discrepancies.begin(), discrepancies.end(),
                                         [](const Discrepancy& d) { return d.severity == core::Severity::High; });
    score += static_cast<int>(highCount) * m_config.highSeverityPoints;
    score += static_cast<int>(discrepancies.size()) * m_config.perDiscrepancyPoints;

    if (sentiment == core::Sentiment::Negative) {
        score += m_config.negativeSentimentPoints;
    }

    if (stressCount > static_cast<size_t>(m_config.manyStressCount)) {
        score += m_config.manyStressPoints;
    } else if (stressCount > static_cast<size_t>(m_config.someStressCount)) {
        score += m_config.someStressPoints;
    }

    if (score >= m_config.highRiskScore) return RiskLevel::High;
    if (score >= m_config.mediumRiskScore) return RiskLevel::Medium;
    return RiskLevel::Low;
}

AttentionWeights FusionEngine::attentionWeights(size_t stressCount,
                                                size_t distinctTopics,
                                                size_t inconsistencyCount) const {
    AttentionWeights w;

    if (stressCount > static_cast<size_t>(m_config.stressMismatchCount)) w.audio += m_config.attentionStressBump;
    if (distinctTopics > static_cast<size_t>(m_config.richTopicCount)) w.text += m_config.attentionTopicBump;
    if (inconsistencyCount > 0) w.chart += m_config.attentionChartBump;

    const double total = w.audio + w.text + w.chart;
    w.audio = core::dsp::roundTo(w.audio / total, 3);
    w.text = core::dsp::roundTo(w.text / total, 3);
    w.chart = core::dsp::roundTo(w.chart / total, 3);
    return w;
}

std::vector<std::string> FusionEngine::insights(const core::AudioFeatures& audio,
                                                double audioConfidence,
                                                const core::SentimentSummary& sentiment,
                                                const core::ChartSummary& chart,
                                                const std::vector<Discrepancy>& discrepancies) const {
    std::vector<std::string> out;

    if (audioConfidence > m_config.confidentDelivery) {
        out.push_back("Executive team demonstrated high vocal confidence throughout the call");
    } else if (audioConfidence < m_config.hesitantDelivery) {
        out.push_back("Vocal analysis reveals hesitation and uncertainty in delivery");
    }

    if (sentiment.overallSentiment == core::Sentiment::Positive &&
        sentiment.distribution.positive > m_config.dominantPositiveShare) {
        out.push_back("Overwhelmingly positive language used throughout the call");
    } else if (sentiment.overallSentiment == core::Sentiment::Negative) {
        out.push_back("Negative sentiment detected - management acknowledging challenges");
    }

    if (!discrepancies.empty()) {
        out.push_back("Found " + std::to_string(discrepancies.size()) +
                      " cross-modal inconsistencies requiring attention");
    }

    if (!chart.chartDescriptions.empty()) {
        out.push_back("Visual data analysis of " + std::to_string(chart.chartDescriptions.size()) +
                      " charts completed");
    }

    const auto& stress = audio.stressIndicators;
    if (stress.size() > static_cast<size_t>(m_config.stressMismatchCount)) {
        std::string types;
        const size_t listed = std::min(stress.size(), m_config.maxListedStressTypes);
        for (size_t i = 0; i < listed; ++i) {
            if (i > 0) types += ", ";
            types += core::toString(stress[i].type);
        }
        out.push_back("Multiple vocal stress indicators detected: " + types);
    }

    return out;
}

// ----------------------------------------------------------------------------
// JSON mapping
// ----------------------------------------------------------------------------

void to_json(nlohmann::json& j, const Discrepancy& v) {
    j = {
        {"type", v.type},
        {"severity", core::toString(v.severity)},
        {"description", v.description},
        {"modalities", v.modalities},
        {"details", v.details}
    };
}

void from_json(const nlohmann::json& j, Discrepancy& v) {
    v.type = j.value("type", std::string());
    v.severity = core::severityFromString(j.value("severity", std::string("medium")));
    v.description = j.value("description", std::string());
    v.modalities = j.value("modalities", std::vector<std::string>{});
    v.details = j.value("details", nlohmann::json::object());
}

void to_json(nlohmann::json& j, const AttentionWeights& v) {
    j = {
        {"audio", v.audio},
        {"text", v.text},
        {"chart", v.chart}
    };
}

void from_json(const nlohmann::json& j, AttentionWeights& v) {
    v.audio = j.value("audio", 1.0 / 3.0);
    v.text = j.value("text", 1.0 / 3.0);
    v.chart = j.value("chart", 1.0 / 3.0);
}

void to_json(nlohmann::json& j, const FusionResult& v) {
    j = {
        {"credibilityScore", v.credibilityScore},
        {"riskLevel", toString(v.riskLevel)},
        {"discrepancies", v.discrepancies},
        {"fusionInsights", v.insights},
        {"attentionWeights", v.attentionWeights}
    };
}

void from_json(const nlohmann::json& j, FusionResult& v) {
    v.credibilityScore = j.value("credibilityScore", 0.0);
    v.riskLevel = riskLevelFromString(j.value("riskLevel", std::string("low")));
    v.discrepancies = j.value("discrepancies", std::vector<Discrepancy>{});
    v.insights = j.value("fusionInsights", std::vector<std::string>{});
    v.attentionWeights = j.contains("attentionWeights")
        ? j["attentionWeights"].get<AttentionWeights>()
        : AttentionWeights();
}

} // namespace vera::fusion
