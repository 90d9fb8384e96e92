#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <chrono>
#include <atomic>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace vera::core {

/**
 * @brief Manages the JSON contract for the job report.
 *
 * This class handles versioning, structure creation and validation of the
 * report written for a job.
 */
class JsonContract {
public:
    /** @brief The current version number of the JSON contract schema. */
    static constexpr int CURRENT_VERSION = 1;

    /**
     * @brief Creates the report from a job record and its stage outputs.
     *
     * Stage outputs that were never produced are written as null.
     *
     * @param jobRecord The job's status, context and summary metrics.
     * @param results Stage outputs keyed by report name (transcript, audioFeatures, ...).
     * @param analysisId An optional, unique ID for the report. If empty, the job id is used.
     * @return The final, structured JSON report.
     */
    static nlohmann::json createOutput(
        const nlohmann::json& jobRecord,
        const nlohmann::json& results,
        const std::string& analysisId = ""
    ) {
        nlohmann::json output;

        // Metadata
        output["version"] = CURRENT_VERSION;
        output["timestamp"] = currentTimestamp();
        output["analysisId"] = !analysisId.empty() ? analysisId
                             : jobRecord.value("id", generateId("analysis"));

        output["job"] = jobRecord;

        output["results"] = nlohmann::json::object();
        for (const char* key : RESULT_KEYS) {
            output["results"][key] = results.contains(key) ? results[key] : nlohmann::json();
        }

        return output;
    }

    /**
     * @brief Validates the given JSON against a specified contract version.
     *
     * Checks required top-level fields and, for completed jobs, that the
     * fusion result and narrative are present.
     * @param json The JSON object to validate.
     * @param version The schema version to validate against (defaults to CURRENT_VERSION).
     * @return true if the JSON satisfies the contract.
     */
    static bool validate(const nlohmann::json& json, int version = CURRENT_VERSION) {
        if (!json.is_object() || !json.contains("version") || json["version"] != version) {
            return false;
        }

        if (version == 1) {
            if (!(json.contains("timestamp") && json.contains("analysisId") &&
                  json.contains("job") && json["job"].is_object() &&
                  json.contains("results") && json["results"].is_object())) {
                return false;
            }
            for (const char* key : RESULT_KEYS) {
                if (!json["results"].contains(key)) return false;
            }
            if (json["job"].value("status", std::string()) == "completed") {
                return json["results"]["fusionResults"].is_object() &&
                       json["results"]["narrative"].is_object();
            }
            return true;
        }

        return false;
    }

    /**
     * @brief Current time as an ISO 8601 string (UTC), "YYYY-MM-DDTHH:MM:SSZ".
     */
    static std::string currentTimestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        std::tm utc{};
        gmtime_r(&time_t, &utc);
        std::stringstream ss;
        ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    /**
     * @brief Generates a unique identifier from the wall clock in milliseconds
     * and a process-wide sequence number.
     */
    static std::string generateId(const std::string& prefix) {
        static std::atomic<unsigned long> sequence{0};
        auto now = std::chrono::system_clock::now();
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count();
        return prefix + "_" + std::to_string(millis) + "_" + std::to_string(sequence++);
    }

private:
    static constexpr const char* RESULT_KEYS[] = {
        "transcript", "audioFeatures", "sentimentAnalysis",
        "chartAnalysis", "fusionResults", "narrative"
    };
};

/**
 * @brief JSON Schema for version 1 of the job report.
 */
const std::string JSON_SCHEMA_V1 = R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "required": ["version", "timestamp", "analysisId", "job", "results"],
  "properties": {
    "version": {"type": "integer", "const": 1},
    "timestamp": {"type": "string"},
    "analysisId": {"type": "string"},
    "job": {
      "type": "object",
      "required": ["id", "status", "progress", "createdAt"],
      "properties": {
        "id": {"type": "string"},
        "companyName": {"type": "string"},
        "status": {"enum": ["pending", "processing", "completed", "failed"]},
        "progress": {"type": "number"},
        "errorMessage": {"type": "string"},
        "overallConfidence": {"type": "number"},
        "overallSentiment": {"type": "string"},
        "riskLevel": {"enum": ["low", "medium", "high"]}
      }
    },
    "results": {
      "type": "object",
      "properties": {
        "transcript": {"type": ["object", "null"]},
        "audioFeatures": {"type": ["object", "null"]},
        "sentimentAnalysis": {"type": ["object", "null"]},
        "chartAnalysis": {"type": ["object", "null"]},
        "fusionResults": {"type": ["object", "null"]},
        "narrative": {"type": ["object", "null"]}
      }
    }
  }
})";

} // namespace vera::core
