#pragma once

#include "../core/IAnalysisModule.h"
#include "../core/AudioBuffer.h"
#include <memory>
#include <vector>
#include <map>
#include <functional>
#include <nlohmann/json.hpp>

namespace vera::pipeline {

/**
 * @brief Progress reporting callback.
 * @param module The name of the module about to run ("Complete" at the end).
 * @param progress Fraction of modules already executed, in [0, 1].
 */
using ProgressCallback = std::function<void(const std::string& module, float progress)>;

/**
 * @brief Runs the acoustic analysis modules over one recording.
 *
 * Responsible for module registration, configuration, dependency resolution
 * and sequencing. A module that throws, or whose output fails validation, does
 * not abort the run: its neutral result is stored instead and the module is
 * reported under "degraded". Disabled modules are reported the same way.
 */
class AnalysisPipeline {
public:
    AnalysisPipeline();
    ~AnalysisPipeline();

    /**
     * @brief Registers a module. A module with the same name is replaced.
     * @param module A unique pointer to the IAnalysisModule instance.
     */
    void registerModule(std::unique_ptr<core::IAnalysisModule> module);

    /**
     * @brief Enables or disables a registered module.
     * @param name The unique name of the module.
     * @param enabled If true, the module is enabled.
     */
    void enableModule(const std::string& name, bool enabled = true);

    /**
     * @brief Checks if a specific module is registered and enabled.
     */
    bool isModuleEnabled(const std::string& name) const;

    /**
     * @brief Retrieves a list of all registered module names.
     */
    std::vector<std::string> getModuleNames() const;

    /**
     * @brief Sets the global configuration accessible by all modules via the AnalysisContext.
     * @param config Merged into the current global configuration (JSON merge-patch).
     */
    void setGlobalConfig(const nlohmann::json& config);

    /**
     * @brief Sets the configuration passed to one module's initialize().
     */
    void setModuleConfig(const std::string& moduleName, const nlohmann::json& config);

    /**
     * @brief Executes every enabled module in dependency order.
     *
     * @param audio The recording to analyse.
     * @param progress An optional callback reporting progress.
     * @return {"audio": {sampleRate, duration, channels}, "modules": {name: result},
     *          "degraded": [names], "executionOrder": [names]}
     * @throw std::runtime_error if no module can run, the dependency graph has a
     *        cycle, or a module rejects its configuration.
     */
    nlohmann::json analyze(const core::AudioBuffer& audio,
                           ProgressCallback progress = nullptr);

    /**
     * @brief Module names in a valid execution order (topological sort).
     * @return The order, or an empty vector if the graph has a cycle.
     */
    std::vector<std::string> getExecutionOrder() const;

    /**
     * @brief true if the dependency graph between enabled modules is acyclic.
     */
    bool validateDependencies() const;

private:
    struct ModuleInfo {
        std::unique_ptr<core::IAnalysisModule> module;
        nlohmann::json config;
        bool enabled = true;
        std::vector<std::string> dependencies;
    };

    std::map<std::string, ModuleInfo> m_modules;
    nlohmann::json m_globalConfig;

    /**
     * @brief Kahn's algorithm over the enabled modules.
     *
     * Dependencies that are disabled or not registered count as satisfied.
     */
    std::vector<std::string> topologicalSort() const;

    bool hasCycles() const;

    /**
     * @brief Runs one module and validates its output.
     * @throw std::runtime_error if the output fails validation.
     */
    nlohmann::json executeModule(const std::string& name,
                                 const core::AudioBuffer& audio,
                                 core::AnalysisContext& context);
};

/**
 * @brief Builder for the acoustic analysis pipeline.
 */
class PipelineBuilder {
public:
    /**
     * @brief Registers the six standard acoustic modules
     * (Cepstral, Pitch, Energy, VoiceQuality, Prosody, ConfidenceTimeline).
     */
    PipelineBuilder& withAcousticModules();

    /**
     * @brief Registers a custom module, replacing a standard one of the same name.
     */
    PipelineBuilder& withModule(std::unique_ptr<core::IAnalysisModule> module);

    /**
     * @brief Base configuration handed to every module (a serialised ExtractorConfig).
     */
    PipelineBuilder& withConfig(const nlohmann::json& config);

    /**
     * @brief Per-module settings: {name: {"enabled": bool, "config": {...}}}.
     *
     * A module's "config" is merged over the base configuration.
     */
    PipelineBuilder& withModuleSettings(const nlohmann::json& settings);

    /**
     * @brief Finalizes the construction and returns the configured pipeline.
     */
    std::unique_ptr<AnalysisPipeline> build();

private:
    std::unique_ptr<AnalysisPipeline> m_pipeline;
    nlohmann::json m_config = nlohmann::json::object();
    nlohmann::json m_settings = nlohmann::json::object();

    AnalysisPipeline& pipeline();
};

} // namespace vera::pipeline
