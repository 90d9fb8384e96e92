#include <iostream>
#include <string>
#include "../include/narrative/NarrativeReport.h"

using vera::narrative::NarrativeReport;

bool test_narrative_parses_sections() {
    const std::string text =
        "Here is the requested analysis.\n"
        "\n"
        "## Executive Summary\n"
        "Management sounded assured.\n"
        "Guidance was reiterated.\n"
        "\n"
        "## RISK INDICATORS\n"
        "- Hesitation around margins\n"
        "* Deferred revenue questions dodged\n"
        "\xE2\x80\xA2 Short answers in Q&A\n"
        "unmarked line is ignored\n"
        "### Red Flags\n"
        "- None identified\n"
        "- none\n"
        "# Opportunities\n"
        "-   New product line\n"
        "## Overall Recommendation\n"
        "Monitor next quarter.\n";

    NarrativeReport r = vera::narrative::parseNarrative(text);
    bool ok = r.executiveSummary == "Management sounded assured.\nGuidance was reiterated." &&
              r.riskIndicators == std::vector<std::string>({
                  "Hesitation around margins", "Deferred revenue questions dodged", "Short answers in Q&A"}) &&
              r.redFlags.empty() &&
              r.opportunities == std::vector<std::string>({"New product line"}) &&
              r.overallRecommendation == "Monitor next quarter." &&
              r.confidenceAssessment.empty() &&
              !r.fallback && !r.empty();
    if (!ok) std::cerr << "Parsed narrative: " << nlohmann::json(r).dump(2) << std::endl;
    return ok;
}

bool test_narrative_without_headers_is_empty() {
    NarrativeReport r = vera::narrative::parseNarrative("Just a paragraph with no structure.\n- a bullet\n");
    NarrativeReport blank = vera::narrative::parseNarrative("");
    return r.empty() && blank.empty();
}

bool test_fallback_narrative() {
    vera::fusion::FusionResult fusion;
    fusion.credibilityScore = 0.4567;
    fusion.riskLevel = vera::fusion::RiskLevel::High;
    for (const char* d : {"first", "second", "third", "fourth"}) {
        vera::fusion::Discrepancy disc;
        disc.description = d;
        fusion.discrepancies.push_back(disc);
    }

    const std::string reason(300, 'x');
    NarrativeReport r = vera::narrative::buildFallbackNarrative(
        "", fusion, 0.8, vera::core::Sentiment::Negative, reason);

    const std::string expectedSummary =
        "Multi-modal analysis complete for the company. Overall credibility score: 0.46. "
        "Risk level: high. Narrative synthesis failed: " + std::string(200, 'x');
    bool ok = r.fallback &&
              r.executiveSummary == expectedSummary &&
              r.riskIndicators == std::vector<std::string>({"first", "second", "third"}) &&
              r.opportunities.empty() && r.redFlags.empty() &&
              r.confidenceAssessment ==
                  "Multi-modal credibility: 0.46/1.0, Audio confidence: 0.80/1.0, Sentiment: negative" &&
              !r.overallRecommendation.empty();

    NarrativeReport named = vera::narrative::buildFallbackNarrative(
        "Acme Corp", vera::fusion::FusionResult(), 0.5, vera::core::Sentiment::Neutral, "timeout");
    ok = ok && named.executiveSummary.find("complete for Acme Corp.") != std::string::npos &&
         named.executiveSummary.find("failed: timeout") != std::string::npos &&
         named.riskIndicators.empty();
    if (!ok) std::cerr << "Fallback narrative: " << nlohmann::json(r).dump(2) << std::endl;
    return ok;
}

bool test_fallback_keeps_multibyte_characters_whole() {
    // 'é' is two bytes and straddles the 200 byte cut
    const std::string reason = std::string(199, 'a') + "\xC3\xA9 quota";
    NarrativeReport r = vera::narrative::buildFallbackNarrative(
        "", vera::fusion::FusionResult(), 0.5, vera::core::Sentiment::Neutral, reason);

    const std::string tail = "Narrative synthesis failed: " + std::string(199, 'a');
    const std::string& summary = r.executiveSummary;
    bool ok = summary.size() >= tail.size() &&
              summary.compare(summary.size() - tail.size(), tail.size(), tail) == 0;
    try {
        (void)nlohmann::json(r).dump();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Fallback narrative not serialisable: " << e.what() << std::endl;
        ok = false;
    }

    // A reason ending in a complete multi-byte character is kept intact
    const std::string whole = std::string(198, 'b') + "\xC3\xA9";
    NarrativeReport exact = vera::narrative::buildFallbackNarrative(
        "", vera::fusion::FusionResult(), 0.5, vera::core::Sentiment::Neutral, whole);
    const std::string& s = exact.executiveSummary;
    return ok && s.size() >= whole.size() && s.compare(s.size() - whole.size(), whole.size(), whole) == 0;
}
