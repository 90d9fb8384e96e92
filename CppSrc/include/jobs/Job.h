#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace vera::jobs {

enum class JobStatus {
    Pending,
    Processing,
    Completed,
    Failed
};

std::string toString(JobStatus status);
/** @throw std::invalid_argument on an unknown label. */
JobStatus jobStatusFromString(const std::string& label);

bool isTerminal(JobStatus status);

/**
 * @brief Rejects anything but pending -> processing -> {completed, failed}.
 * @throw core::JobStateError on an illegal transition.
 */
void checkTransition(JobStatus from, JobStatus to);

/**
 * @brief What a client asks to have analysed.
 */
struct JobRequest {
    std::string id; ///< Generated when empty.
    std::string companyName;
    std::string companyContext;
    std::string audioPath;
    std::vector<std::string> chartPaths;
};

/**
 * @brief One analysis request and everything produced for it.
 *
 * Stage outputs are stored as JSON; a null value means the stage has not
 * committed yet.
 */
struct Job {
    std::string id;
    std::string companyName = "Unknown Company";
    std::string companyContext;
    std::string audioPath;
    std::vector<std::string> chartPaths;

    JobStatus status = JobStatus::Pending;
    double progress = 0.0; ///< 0..100
    std::optional<std::string> errorMessage;

    std::string createdAt;
    std::optional<std::string> startedAt;
    std::optional<std::string> completedAt;

    // Summary metrics copied from the fusion stage
    std::optional<double> overallConfidence;
    std::optional<std::string> overallSentiment;
    std::optional<std::string> riskLevel;

    nlohmann::json transcript;
    nlohmann::json audioFeatures;
    nlohmann::json sentimentAnalysis;
    nlohmann::json chartAnalysis;
    nlohmann::json fusionResults;
    nlohmann::json narrative;

    static Job fromRequest(const JobRequest& request);
};

/** @brief Job record without the stage outputs. */
nlohmann::json recordJson(const Job& job);

/** @brief Stage outputs keyed by their report names. */
nlohmann::json resultsJson(const Job& job);

} // namespace vera::jobs
