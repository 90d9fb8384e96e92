#include "../../include/jobs/Job.h"
#include "../../include/core/Errors.h"
#include "../../include/core/JsonContract.h"
#include <stdexcept>

namespace vera::jobs {

std::string toString(JobStatus status) {
    switch (status) {
        case JobStatus::Pending: return "pending";
        case JobStatus::Processing: return "processing";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed: return "failed";
    }
    return "pending";
}

JobStatus jobStatusFromString(const std::string& label) {
    if (label == "pending") return JobStatus::Pending;
    if (label == "processing") return JobStatus::Processing;
    if (label == "completed") return JobStatus::Completed;
    if (label == "failed") return JobStatus::Failed;
    throw std::invalid_argument("Unknown job status: " + label);
}

bool isTerminal(JobStatus status) {
    return status == JobStatus::Completed || status == JobStatus::Failed;
}

void checkTransition(JobStatus from, JobStatus to) {
    const bool allowed =
        (from == JobStatus::Pending && to == JobStatus::Processing) ||
        (from == JobStatus::Processing && (to == JobStatus::Completed || to == JobStatus::Failed));
    if (!allowed) {
        throw core::JobStateError("Illegal job transition: " + toString(from) + " -> " + toString(to));
    }
}

Job Job::fromRequest(const JobRequest& request) {
    Job job;
    job.id = request.id.empty() ? core::JsonContract::generateId("job") : request.id;
    if (!request.companyName.empty()) job.companyName = request.companyName;
    job.companyContext = request.companyContext;
    job.audioPath = request.audioPath;
    job.chartPaths = request.chartPaths;
    job.createdAt = core::JsonContract::currentTimestamp();
    return job;
}

nlohmann::json recordJson(const Job& job) {
    nlohmann::json j = {
        {"id", job.id},
        {"companyName", job.companyName},
        {"companyContext", job.companyContext},
        {"audioPath", job.audioPath},
        {"chartPaths", job.chartPaths},
        {"status", toString(job.status)},
        {"progress", job.progress},
        {"createdAt", job.createdAt}
    };
    if (job.errorMessage) j["errorMessage"] = *job.errorMessage;
    if (job.startedAt) j["startedAt"] = *job.startedAt;
    if (job.completedAt) j["completedAt"] = *job.completedAt;
    if (job.overallConfidence) j["overallConfidence"] = *job.overallConfidence;
    if (job.overallSentiment) j["overallSentiment"] = *job.overallSentiment;
    if (job.riskLevel) j["riskLevel"] = *job.riskLevel;
    return j;
}

nlohmann::json resultsJson(const Job& job) {
    return {
        {"transcript", job.transcript},
        {"audioFeatures", job.audioFeatures},
        {"sentimentAnalysis", job.sentimentAnalysis},
        {"chartAnalysis", job.chartAnalysis},
        {"fusionResults", job.fusionResults},
        {"narrative", job.narrative}
    };
}

} // namespace vera::jobs
