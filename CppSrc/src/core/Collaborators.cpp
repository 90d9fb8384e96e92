#include "../../include/core/Collaborators.h"

namespace vera::core {

std::string toString(Sentiment sentiment) {
    switch (sentiment) {
        case Sentiment::Positive: return "positive";
        case Sentiment::Neutral: return "neutral";
        case Sentiment::Negative: return "negative";
    }
    return "neutral";
}

Sentiment sentimentFromString(const std::string& label) {
    if (label == "positive") return Sentiment::Positive;
    if (label == "negative") return Sentiment::Negative;
    return Sentiment::Neutral;
}

namespace {

SentimentDistribution shareOfLabels(const std::vector<const SentimentSegment*>& group) {
    SentimentDistribution d{0.0, 0.0, 0.0};
    if (group.empty()) return d;

    for (const auto* s : group) {
        switch (s->sentiment) {
            case Sentiment::Positive: d.positive += 1.0; break;
            case Sentiment::Neutral: d.neutral += 1.0; break;
            case Sentiment::Negative: d.negative += 1.0; break;
        }
    }
    const double total = static_cast<double>(group.size());
    d.positive /= total;
    d.neutral /= total;
    d.negative /= total;
    return d;
}

} // namespace

DiscourseAnalysis computeDiscourseAnalysis(const std::vector<SentimentSegment>& segments) {
    std::vector<const SentimentSegment*> prepared, qa;
    for (const auto& s : segments) {
        if (s.segmentType == "prepared_statement") prepared.push_back(&s);
        else if (s.segmentType == "qa") qa.push_back(&s);
    }

    DiscourseAnalysis analysis;
    analysis.prepared = shareOfLabels(prepared);
    analysis.qa = shareOfLabels(qa);

    const double preparedBalance = analysis.prepared.positive - analysis.prepared.negative;
    const double qaBalance = analysis.qa.positive - analysis.qa.negative;
    const double diff = qaBalance - preparedBalance;

    if (diff < -0.1) analysis.sentimentShift = "more_negative";
    else if (diff > 0.1) analysis.sentimentShift = "more_positive";
    else analysis.sentimentShift = "stable";
    return analysis;
}

// ----------------------------------------------------------------------------
// JSON mapping
// ----------------------------------------------------------------------------

void to_json(nlohmann::json& j, const TranscriptSegment& v) {
    j = {
        {"text", v.text},
        {"startTime", v.startTime},
        {"endTime", v.endTime}
    };
    if (v.speaker) j["speaker"] = *v.speaker;
}

void from_json(const nlohmann::json& j, TranscriptSegment& v) {
    v.text = j.value("text", std::string());
    v.startTime = j.value("startTime", 0.0);
    v.endTime = j.value("endTime", 0.0);
    if (j.contains("speaker") && j["speaker"].is_string()) {
        v.speaker = j["speaker"].get<std::string>();
    } else {
        v.speaker.reset();
    }
}

void to_json(nlohmann::json& j, const Transcript& v) {
    j = {
        {"fullText", v.fullText},
        {"segments", v.segments},
        {"language", v.language},
        {"duration", v.duration}
    };
}

void from_json(const nlohmann::json& j, Transcript& v) {
    v.fullText = j.value("fullText", std::string());
    v.segments = j.value("segments", std::vector<TranscriptSegment>{});
    v.language = j.value("language", std::string("en"));
    v.duration = j.value("duration", 0.0);
}

void to_json(nlohmann::json& j, const SentimentSegment& v) {
    to_json(j, v.segment);
    j["sentiment"] = toString(v.sentiment);
    j["sentimentScore"] = v.sentimentScore;
    if (!v.segmentType.empty()) j["segmentType"] = v.segmentType;
}

void from_json(const nlohmann::json& j, SentimentSegment& v) {
    from_json(j, v.segment);
    v.sentiment = sentimentFromString(j.value("sentiment", std::string("neutral")));
    v.sentimentScore = j.value("sentimentScore", 0.0);
    v.segmentType = j.value("segmentType", std::string());
}

void to_json(nlohmann::json& j, const SentimentDistribution& v) {
    j = {
        {"positive", v.positive},
        {"neutral", v.neutral},
        {"negative", v.negative}
    };
}

void from_json(const nlohmann::json& j, SentimentDistribution& v) {
    v.positive = j.value("positive", 0.33);
    v.neutral = j.value("neutral", 0.33);
    v.negative = j.value("negative", 0.33);
}

void to_json(nlohmann::json& j, const DiscourseAnalysis& v) {
    j = {
        {"preparedSentiment", v.prepared},
        {"qaSentiment", v.qa},
        {"sentimentShift", v.sentimentShift}
    };
}

void from_json(const nlohmann::json& j, DiscourseAnalysis& v) {
    const SentimentDistribution empty{0.0, 0.0, 0.0};
    v.prepared = j.contains("preparedSentiment") ? j["preparedSentiment"].get<SentimentDistribution>() : empty;
    v.qa = j.contains("qaSentiment") ? j["qaSentiment"].get<SentimentDistribution>() : empty;
    v.sentimentShift = j.value("sentimentShift", std::string("stable"));
}

void to_json(nlohmann::json& j, const SentimentSummary& v) {
    j = {
        {"segments", v.segments},
        {"overallSentiment", toString(v.overallSentiment)},
        {"sentimentDistribution", v.distribution},
        {"keyTopics", v.keyTopics},
        {"financialMetrics", v.financialMetrics}
    };
    if (v.discourseAnalysis) j["discourseAnalysis"] = *v.discourseAnalysis;
}

void from_json(const nlohmann::json& j, SentimentSummary& v) {
    v.segments = j.value("segments", std::vector<SentimentSegment>{});
    v.overallSentiment = sentimentFromString(j.value("overallSentiment", std::string("neutral")));
    v.distribution = j.contains("sentimentDistribution")
        ? j["sentimentDistribution"].get<SentimentDistribution>()
        : SentimentDistribution();
    v.keyTopics = j.value("keyTopics", std::vector<std::string>{});
    v.financialMetrics = j.value("financialMetrics", std::vector<nlohmann::json>{});
    if (j.contains("discourseAnalysis") && j["discourseAnalysis"].is_object()) {
        v.discourseAnalysis = j["discourseAnalysis"].get<DiscourseAnalysis>();
    } else {
        v.discourseAnalysis.reset();
    }
}

void to_json(nlohmann::json& j, const ChartInconsistency& v) {
    j = {
        {"type", v.type},
        {"description", v.description},
        {"severity", toString(v.severity)}
    };
}

void from_json(const nlohmann::json& j, ChartInconsistency& v) {
    v.type = j.value("type", std::string("data_mismatch"));
    v.description = j.value("description", std::string());
    v.severity = severityFromString(j.value("severity", std::string("medium")));
}

void to_json(nlohmann::json& j, const ChartSummary& v) {
    j = {
        {"chartDescriptions", v.chartDescriptions},
        {"extractedData", v.extractedData},
        {"inconsistencies", v.inconsistencies}
    };
}

void from_json(const nlohmann::json& j, ChartSummary& v) {
    v.chartDescriptions = j.value("chartDescriptions", std::vector<std::string>{});
    v.extractedData = j.value("extractedData", std::vector<nlohmann::json>{});
    v.inconsistencies = j.value("inconsistencies", std::vector<ChartInconsistency>{});
}

} // namespace vera::core
