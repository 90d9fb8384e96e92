#pragma once

#include "Job.h"
#include "JobStore.h"
#include "WorkerPool.h"
#include "../collaborators/ICollaborators.h"
#include "../fusion/FusionEngine.h"
#include "../pipeline/FeatureExtractor.h"
#include <memory>
#include <string>

namespace vera::jobs {

/**
 * @brief The external services a job needs.
 */
struct CollaboratorSet {
    std::shared_ptr<collaborators::ITranscriber> transcriber;
    std::shared_ptr<collaborators::ISentimentAnalyzer> sentiment;
    std::shared_ptr<collaborators::IChartAnalyzer> charts;
    std::shared_ptr<collaborators::INarrativeSynthesizer> narrative;
};

/**
 * @brief Drives a job through its stages.
 *
 * Stage checkpoints (progress after the stage):
 *   transcription 20, feature extraction 35, sentiment 50, charts 65,
 *   fusion 75, narrative 90, finalize 100.
 * Each stage's output is committed on its own as soon as the stage succeeds.
 * A failing stage fails the job, except the narrative stage, which falls back
 * to a report built from the fusion result.
 */
class JobOrchestrator {
public:
    /** @throw std::invalid_argument if a collaborator is missing. */
    JobOrchestrator(JobStore& store,
                    pipeline::FeatureExtractor extractor,
                    fusion::FusionEngine fusion,
                    CollaboratorSet collaborators);

    /** @brief Stores a new pending job. */
    Job createJob(const JobRequest& request);

    /**
     * @brief Runs a pending job to completion on the calling thread.
     *
     * Stage failures end in a failed job, not an exception.
     *
     * @return The job as last committed.
     * @throw core::JobStateError if the job is not pending.
     * @throw core::StoreError if the store cannot be read or written. Recording
     *        a failure is attempted twice before this propagates.
     */
    Job run(const std::string& jobId);

    /**
     * @brief Queues run(jobId) on a worker.
     * @throw core::JobStateError if the job is not pending or already queued.
     */
    void submit(WorkerPool& pool, const std::string& jobId);

private:
    Job runStages(const std::string& jobId, const Job& job);
    Job fail(const std::string& jobId, const std::string& stage, const std::string& message);

    JobStore& m_store;
    pipeline::FeatureExtractor m_extractor;
    fusion::FusionEngine m_fusion;
    CollaboratorSet m_collaborators;
};

} // namespace vera::jobs
