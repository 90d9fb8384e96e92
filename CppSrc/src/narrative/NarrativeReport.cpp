#include "../../include/narrative/NarrativeReport.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <optional>
#include <sstream>

namespace vera::narrative {

namespace {

constexpr std::array<Section, 6> kSections = {
    Section::ExecutiveSummary,
    Section::RiskIndicators,
    Section::Opportunities,
    Section::RedFlags,
    Section::ConfidenceAssessment,
    Section::OverallRecommendation
};

const std::string kBullet = "\xE2\x80\xA2"; // U+2022

std::string trim(const std::string& s) {
    const auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    const auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
}

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

/** First maxBytes bytes of s, cut back so no UTF-8 sequence is split. */
std::string truncateUtf8(const std::string& s, size_t maxBytes) {
    if (s.size() <= maxBytes) return s;
    size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return s.substr(0, cut);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::optional<Section> matchHeader(const std::string& line) {
    if (line.empty() || line[0] != '#') return std::nullopt;
    const std::string upper = toUpper(line);
    for (Section s : kSections) {
        if (upper.find(headerOf(s)) != std::string::npos) return s;
    }
    return std::nullopt;
}

/** Removes every leading '-', '*' and bullet, then surrounding whitespace. */
std::string stripMarkers(std::string item) {
    for (;;) {
        if (!item.empty() && (item[0] == '-' || item[0] == '*')) {
            item.erase(0, 1);
        } else if (startsWith(item, kBullet)) {
            item.erase(0, kBullet.size());
        } else {
            break;
        }
    }
    return trim(item);
}

void store(NarrativeReport& report, Section section, const std::vector<std::string>& lines) {
    if (isListSection(section)) {
        std::vector<std::string> items;
        for (const auto& line : lines) {
            if (!(line[0] == '-' || line[0] == '*' || startsWith(line, kBullet))) continue;
            std::string item = stripMarkers(line);
            const std::string lower = toLower(item);
            if (item.empty() || lower == "none" || lower == "none identified") continue;
            items.push_back(std::move(item));
        }
        switch (section) {
            case Section::RiskIndicators: report.riskIndicators = std::move(items); break;
            case Section::Opportunities: report.opportunities = std::move(items); break;
            case Section::RedFlags: report.redFlags = std::move(items); break;
            default: break;
        }
        return;
    }

    std::string text;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) text += "\n";
        text += lines[i];
    }
    switch (section) {
        case Section::ExecutiveSummary: report.executiveSummary = std::move(text); break;
        case Section::ConfidenceAssessment: report.confidenceAssessment = std::move(text); break;
        case Section::OverallRecommendation: report.overallRecommendation = std::move(text); break;
        default: break;
    }
}

std::string formatFixed(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

} // namespace

std::string headerOf(Section section) {
    switch (section) {
        case Section::ExecutiveSummary: return "EXECUTIVE SUMMARY";
        case Section::RiskIndicators: return "RISK INDICATORS";
        case Section::Opportunities: return "OPPORTUNITIES";
        case Section::RedFlags: return "RED FLAGS";
        case Section::ConfidenceAssessment: return "CONFIDENCE ASSESSMENT";
        case Section::OverallRecommendation: return "OVERALL RECOMMENDATION";
    }
    return "";
}

bool isListSection(Section section) {
    return section == Section::RiskIndicators ||
           section == Section::Opportunities ||
           section == Section::RedFlags;
}

bool NarrativeReport::empty() const {
    return executiveSummary.empty() && riskIndicators.empty() && opportunities.empty() &&
           redFlags.empty() && confidenceAssessment.empty() && overallRecommendation.empty();
}

NarrativeReport parseNarrative(const std::string& text) {
    NarrativeReport report;
    std::optional<Section> current;
    std::vector<std::string> content;

    std::istringstream in(text);
    std::string raw;
    while (std::getline(in, raw)) {
        const std::string line = trim(raw);
        if (auto header = matchHeader(line)) {
            if (current) store(report, *current, content);
            current = header;
            content.clear();
        } else if (!line.empty()) {
            content.push_back(line);
        }
    }
    if (current) store(report, *current, content);

    return report;
}

NarrativeReport buildFallbackNarrative(const std::string& companyName,
                                       const fusion::FusionResult& fusion,
                                       double audioConfidence,
                                       core::Sentiment overallSentiment,
                                       const std::string& failureReason) {
    NarrativeReport report;
    report.fallback = true;

    report.executiveSummary =
        "Multi-modal analysis complete for " + (companyName.empty() ? std::string("the company") : companyName) +
        ". Overall credibility score: " + formatFixed(fusion.credibilityScore) +
        ". Risk level: " + fusion::toString(fusion.riskLevel) +
        ". Narrative synthesis failed: " + truncateUtf8(failureReason, 200);

    const size_t top = std::min<size_t>(fusion.discrepancies.size(), 3);
    for (size_t i = 0; i < top; ++i) {
        report.riskIndicators.push_back(fusion.discrepancies[i].description);
    }

    report.confidenceAssessment =
        "Multi-modal credibility: " + formatFixed(fusion.credibilityScore) +
        "/1.0, Audio confidence: " + formatFixed(audioConfidence) +
        "/1.0, Sentiment: " + core::toString(overallSentiment);
    report.overallRecommendation = "Review detailed multi-modal analysis sections for insights.";
    return report;
}

void to_json(nlohmann::json& j, const NarrativeReport& v) {
    j = {
        {"executiveSummary", v.executiveSummary},
        {"riskIndicators", v.riskIndicators},
        {"opportunities", v.opportunities},
        {"redFlags", v.redFlags},
        {"confidenceAssessment", v.confidenceAssessment},
        {"overallRecommendation", v.overallRecommendation},
        {"fallback", v.fallback}
    };
}

void from_json(const nlohmann::json& j, NarrativeReport& v) {
    v.executiveSummary = j.value("executiveSummary", std::string());
    v.riskIndicators = j.value("riskIndicators", std::vector<std::string>{});
    v.opportunities = j.value("opportunities", std::vector<std::string>{});
    v.redFlags = j.value("redFlags", std::vector<std::string>{});
    v.confidenceAssessment = j.value("confidenceAssessment", std::string());
    v.overallRecommendation = j.value("overallRecommendation", std::string());
    v.fallback = j.value("fallback", false);
}

} // namespace vera::narrative
