#include "../../include/jobs/JobOrchestrator.h"
#include "../../include/core/Errors.h"
#include "../../include/core/JsonContract.h"
#include "../../include/narrative/NarrativeReport.h"
#include <iostream>
#include <stdexcept>

namespace vera::jobs {

namespace {

constexpr double kTranscribed = 20.0;
constexpr double kFeaturesExtracted = 35.0;
constexpr double kSentimentAnalysed = 50.0;
constexpr double kChartsAnalysed = 65.0;
constexpr double kFused = 75.0;
constexpr double kNarrated = 90.0;
constexpr double kFinished = 100.0;

} // namespace

JobOrchestrator::JobOrchestrator(JobStore& store,
                                 pipeline::FeatureExtractor extractor,
                                 fusion::FusionEngine fusion,
                                 CollaboratorSet collaborators)
    : m_store(store),
      m_extractor(std::move(extractor)),
      m_fusion(std::move(fusion)),
      m_collaborators(std::move(collaborators))
{
    if (!m_collaborators.transcriber || !m_collaborators.sentiment ||
        !m_collaborators.charts || !m_collaborators.narrative) {
        throw std::invalid_argument("JobOrchestrator requires all four collaborators");
    }
}

Job JobOrchestrator::createJob(const JobRequest& request) {
    Job job = Job::fromRequest(request);
    m_store.create(job);
    std::cout << "[Orchestrator] Created job " << job.id << " for " << job.companyName << std::endl;
    return job;
}

void JobOrchestrator::submit(WorkerPool& pool, const std::string& jobId) {
    const Job job = m_store.get(jobId);
    if (job.status != JobStatus::Pending) {
        throw core::JobStateError("Job " + jobId + " cannot start: status is " + toString(job.status));
    }
    pool.submit(jobId, [this, jobId] { run(jobId); });
}

Job JobOrchestrator::run(const std::string& jobId) {
    const Job job = m_store.claim(jobId, core::JsonContract::currentTimestamp());
    std::cout << "[Orchestrator] Starting job " << jobId << std::endl;
    return runStages(jobId, job);
}

Job JobOrchestrator::runStages(const std::string& jobId, const Job& job) {
    std::string stage = "transcription";
    try {
        // 1. Transcription
        const core::Transcript transcript = m_collaborators.transcriber->transcribe(job.audioPath);
        m_store.update(jobId, [&](Job& j) {
            j.transcript = transcript;
            j.progress = kTranscribed;
        });

        // 2. Acoustic features
        stage = "feature extraction";
        const core::AudioFeatures features = m_extractor.extractFile(job.audioPath);
        m_store.update(jobId, [&](Job& j) {
            j.audioFeatures = features;
            j.progress = kFeaturesExtracted;
        });

        // 3. Sentiment
        stage = "sentiment analysis";
        core::SentimentSummary sentiment = m_collaborators.sentiment->analyze(transcript.segments);
        sentiment.discourseAnalysis = core::computeDiscourseAnalysis(sentiment.segments);
        m_store.update(jobId, [&](Job& j) {
            j.sentimentAnalysis = sentiment;
            j.progress = kSentimentAnalysed;
        });

        // 4. Charts
        stage = "chart analysis";
        const core::ChartSummary chart = job.chartPaths.empty()
            ? core::ChartSummary()
            : m_collaborators.charts->analyze(job.chartPaths, transcript.fullText, job.companyContext);
        m_store.update(jobId, [&](Job& j) {
            j.chartAnalysis = chart;
            j.progress = kChartsAnalysed;
        });

        // 5. Fusion
        stage = "fusion";
        const fusion::FusionResult fused = m_fusion.fuse(features, sentiment, chart);
        m_store.update(jobId, [&](Job& j) {
            j.fusionResults = fused;
            j.overallConfidence = features.overallConfidence;
            j.overallSentiment = core::toString(sentiment.overallSentiment);
            j.riskLevel = fusion::toString(fused.riskLevel);
            j.progress = kFused;
        });

        // 6. Narrative, recoverable
        stage = "narrative synthesis";
        const narrative::NarrativeRequest request{
            job.companyName, job.companyContext, transcript, features, sentiment, chart, fused
        };
        narrative::NarrativeReport report;
        std::string failure;
        try {
            report = narrative::parseNarrative(m_collaborators.narrative->synthesize(request));
            if (report.empty()) {
                failure = "narrative text contained no recognised sections";
            }
        } catch (const std::exception& e) {
            failure = e.what();
        } catch (...) {
            failure = "unknown error";
        }
        if (!failure.empty()) {
            std::cerr << "[Orchestrator] Narrative synthesis failed for job " << jobId
                      << ", using fallback report: " << failure << std::endl;
            report = narrative::buildFallbackNarrative(job.companyName, fused, features.overallConfidence,
                                                       sentiment.overallSentiment, failure);
        }
        m_store.update(jobId, [&](Job& j) {
            j.narrative = report;
            j.progress = kNarrated;
        });

        // 7. Finalize
        stage = "finalize";
        const Job done = m_store.update(jobId, [&](Job& j) {
            j.status = JobStatus::Completed;
            j.progress = kFinished;
            j.completedAt = core::JsonContract::currentTimestamp();
        });
        std::cout << "[Orchestrator] Job " << jobId << " completed. Credibility: "
                  << fused.credibilityScore << ", risk: " << fusion::toString(fused.riskLevel) << std::endl;
        return done;
    } catch (const std::exception& e) {
        return fail(jobId, stage, e.what());
    } catch (...) {
        return fail(jobId, stage, "unknown error");
    }
}

Job JobOrchestrator::fail(const std::string& jobId, const std::string& stage, const std::string& message) {
    std::cerr << "[Orchestrator] Job " << jobId << " failed during " << stage << ": " << message << std::endl;
    const auto markFailed = [&](Job& j) {
        j.status = JobStatus::Failed;
        j.errorMessage = message;
        j.completedAt = core::JsonContract::currentTimestamp();
    };
    try {
        return m_store.update(jobId, markFailed);
    } catch (const core::StoreError& e) {
        // One retry; a second StoreError reaches the caller
        std::cerr << "[Orchestrator] Could not record failure of job " << jobId
                  << ", retrying: " << e.what() << std::endl;
    }
    return m_store.update(jobId, markFailed);
}

} // namespace vera::jobs
