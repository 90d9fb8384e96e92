#pragma once

#include "ICollaborators.h"
#include <nlohmann/json.hpp>
#include <string>

namespace vera::collaborators {

/**
 * @brief Fixture files standing in for the external services.
 *
 * Read from the "collaborators" config section:
 * {"transcript": path, "sentiment": path, "charts": path, "narrative": path}.
 * An empty chart path yields an empty ChartSummary; an empty narrative path
 * makes synthesis fail, which exercises the fallback report.
 */
struct CollaboratorPaths {
    std::string transcript;
    std::string sentiment;
    std::string charts;
    std::string narrative;

    static CollaboratorPaths fromJson(const nlohmann::json& section);
};

/** @brief Parses a JSON fixture. @throw std::runtime_error if unreadable. */
nlohmann::json readJsonFixture(const std::string& path);

class JsonFileTranscriber : public ITranscriber {
public:
    explicit JsonFileTranscriber(std::string fixturePath);
    core::Transcript transcribe(const std::string& audioPath) override;

private:
    std::string m_path;
};

class JsonFileSentimentAnalyzer : public ISentimentAnalyzer {
public:
    explicit JsonFileSentimentAnalyzer(std::string fixturePath);
    core::SentimentSummary analyze(const std::vector<core::TranscriptSegment>& segments) override;

private:
    std::string m_path;
};

class JsonFileChartAnalyzer : public IChartAnalyzer {
public:
    explicit JsonFileChartAnalyzer(std::string fixturePath);
    core::ChartSummary analyze(const std::vector<std::string>& chartPaths,
                               const std::string& transcriptText,
                               const std::string& companyContext) override;

private:
    std::string m_path;
};

/**
 * @brief Returns the contents of a text file as the narrative.
 */
class TextFileNarrativeSynthesizer : public INarrativeSynthesizer {
public:
    explicit TextFileNarrativeSynthesizer(std::string fixturePath);
    std::string synthesize(const narrative::NarrativeRequest& request) override;

private:
    std::string m_path;
};

} // namespace vera::collaborators
