#include "../../include/collaborators/JsonFileCollaborators.h"
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace vera::collaborators {

CollaboratorPaths CollaboratorPaths::fromJson(const nlohmann::json& section) {
    CollaboratorPaths p;
    if (!section.is_object()) {
        return p;
    }
    p.transcript = section.value("transcript", std::string());
    p.sentiment = section.value("sentiment", std::string());
    p.charts = section.value("charts", std::string());
    p.narrative = section.value("narrative", std::string());
    return p;
}

nlohmann::json readJsonFixture(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Could not open fixture: " + path);
    }
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse fixture '" + path + "': " + e.what());
    }
    return j;
}

JsonFileTranscriber::JsonFileTranscriber(std::string fixturePath)
    : m_path(std::move(fixturePath)) {}

core::Transcript JsonFileTranscriber::transcribe(const std::string& audioPath) {
    if (m_path.empty()) {
        throw std::runtime_error("No transcript available for " + audioPath);
    }
    auto transcript = readJsonFixture(m_path).get<core::Transcript>();
    std::cout << "[Collaborators] Transcript loaded: " << transcript.segments.size() << " segments" << std::endl;
    return transcript;
}

JsonFileSentimentAnalyzer::JsonFileSentimentAnalyzer(std::string fixturePath)
    : m_path(std::move(fixturePath)) {}

core::SentimentSummary JsonFileSentimentAnalyzer::analyze(const std::vector<core::TranscriptSegment>& segments) {
    if (m_path.empty()) {
        throw std::runtime_error("No sentiment analysis available for " +
                                 std::to_string(segments.size()) + " segments");
    }
    return readJsonFixture(m_path).get<core::SentimentSummary>();
}

JsonFileChartAnalyzer::JsonFileChartAnalyzer(std::string fixturePath)
    : m_path(std::move(fixturePath)) {}

core::ChartSummary JsonFileChartAnalyzer::analyze(const std::vector<std::string>& chartPaths,
                                                  const std::string& /*transcriptText*/,
                                                  const std::string& /*companyContext*/) {
    if (chartPaths.empty() || m_path.empty()) {
        return {};
    }
    return readJsonFixture(m_path).get<core::ChartSummary>();
}

TextFileNarrativeSynthesizer::TextFileNarrativeSynthesizer(std::string fixturePath)
    : m_path(std::move(fixturePath)) {}

std::string TextFileNarrativeSynthesizer::synthesize(const narrative::NarrativeRequest& request) {
    std::ifstream in(m_path);
    if (m_path.empty() || !in.is_open()) {
        throw std::runtime_error("No narrative available for " +
                                 (request.companyName.empty() ? std::string("the company") : request.companyName));
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace vera::collaborators
