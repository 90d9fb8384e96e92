#pragma once

#include "../core/Collaborators.h"
#include "../narrative/NarrativeReport.h"
#include <string>
#include <vector>

namespace vera::collaborators {

/**
 * @brief Speech-to-text service.
 */
class ITranscriber {
public:
    virtual ~ITranscriber() = default;

    /** @throw std::exception on failure; fails the job. */
    virtual core::Transcript transcribe(const std::string& audioPath) = 0;
};

/**
 * @brief Per-segment sentiment classifier.
 *
 * The returned summary's discourse analysis is recomputed by the orchestrator
 * from the labelled segments.
 */
class ISentimentAnalyzer {
public:
    virtual ~ISentimentAnalyzer() = default;

    virtual core::SentimentSummary analyze(const std::vector<core::TranscriptSegment>& segments) = 0;
};

/**
 * @brief Reads chart images and compares them with the transcript.
 */
class IChartAnalyzer {
public:
    virtual ~IChartAnalyzer() = default;

    virtual core::ChartSummary analyze(const std::vector<std::string>& chartPaths,
                                       const std::string& transcriptText,
                                       const std::string& companyContext) = 0;
};

/**
 * @brief Produces the free-text narrative from all upstream results.
 *
 * Failures are recoverable: the orchestrator substitutes a fallback report.
 */
class INarrativeSynthesizer {
public:
    virtual ~INarrativeSynthesizer() = default;

    virtual std::string synthesize(const narrative::NarrativeRequest& request) = 0;
};

} // namespace vera::collaborators
