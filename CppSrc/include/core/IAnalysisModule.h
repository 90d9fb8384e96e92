#pragma once

#include <memory>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

namespace vera::core {

// Forward declarations
class AudioBuffer;

/**
 * @brief Context shared between the acoustic analysis modules of one run.
 *
 * Holds the sample rate, the extractor configuration and the results of the
 * modules that already ran, so a module can reuse the tracks its
 * dependencies computed.
 */
class AnalysisContext {
public:
    /** @brief The sample rate of the input audio data in Hz. */
    float sampleRate = 16000.0f;

    /** @brief Results (as JSON) of the modules executed so far. */
    std::map<std::string, nlohmann::json> moduleResults;

    /** @brief Global configuration parameters for the analysis pipeline. */
    nlohmann::json globalConfig;

    /**
     * @brief Retrieves the analysis result from a specific module.
     *
     * @param moduleName The unique name of the module whose result is sought.
     * @return The module's result if it ran, otherwise std::nullopt.
     */
    std::optional<nlohmann::json> getModuleResult(const std::string& moduleName) const {
        auto it = moduleResults.find(moduleName);
        if (it != moduleResults.end()) {
            return it->second;
        }
        return std::nullopt;
    }
};

/**
 * @brief Base interface for the acoustic sub-feature modules.
 *
 * Each module computes one sub-feature of AudioFeatures (pitch, energy,
 * cepstral statistics...). A module that throws from process() is not fatal:
 * the pipeline stores neutralResult() in its place and reports the module as
 * degraded.
 */
class IAnalysisModule {
public:
    virtual ~IAnalysisModule() = default;

    /**
     * @brief Returns the unique name of the module (e.g. "Pitch").
     */
    virtual std::string getName() const = 0;

    /**
     * @brief Returns the version string of the module.
     */
    virtual std::string getVersion() const = 0;

    /**
     * @brief Initializes the module with the extractor configuration.
     *
     * Called once before each analysis run.
     * @param config The serialised ExtractorConfig, possibly with module overrides.
     * @return true on successful initialization, false otherwise.
     */
    virtual bool initialize(const nlohmann::json& config) = 0;

    /**
     * @brief Resets the module's internal state before a new recording.
     */
    virtual void reset() = 0;

    /**
     * @brief Computes the sub-feature for the whole recording.
     *
     * @param audio The recording to analyse.
     * @param context Results of the modules that already ran.
     * @return A JSON object with the sub-feature statistics.
     * @throw std::exception on any computation failure.
     */
    virtual nlohmann::json process(const AudioBuffer& audio,
                                   const AnalysisContext& context) = 0;

    /**
     * @brief Checks that an output carries every required field with finite values.
     */
    virtual bool validateOutput(const nlohmann::json& output) const = 0;

    /**
     * @brief The documented neutral result substituted when process() fails.
     */
    virtual nlohmann::json neutralResult() const = 0;

    /**
     * @brief Names of the modules whose results this module reads, if present.
     *
     * A dependency that is disabled or not registered counts as satisfied;
     * the module then computes what it needs itself.
     */
    virtual std::vector<std::string> getDependencies() const {
        return {};
    }
};

} // namespace vera::core
