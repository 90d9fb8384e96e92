#include "../../include/pipeline/AnalysisPipeline.h"
#include "../../include/modules/CepstralModule.h"
#include "../../include/modules/PitchModule.h"
#include "../../include/modules/EnergyModule.h"
#include "../../include/modules/VoiceQualityModule.h"
#include "../../include/modules/ProsodyModule.h"
#include "../../include/modules/ConfidenceTimelineModule.h"
#include <iostream>
#include <queue>
#include <algorithm>
#include <stdexcept>

namespace vera::pipeline {

AnalysisPipeline::AnalysisPipeline()
    : m_globalConfig({
        {"version", 1},
        {"debug", false}
    })
{
}

AnalysisPipeline::~AnalysisPipeline() = default;

void AnalysisPipeline::registerModule(std::unique_ptr<core::IAnalysisModule> module) {
    if (!module) return;

    std::string name = module->getName();
    ModuleInfo info;
    info.module = std::move(module);
    info.dependencies = info.module->getDependencies();
    info.enabled = true;
    info.config = nlohmann::json::object();

    m_modules[name] = std::move(info);
    std::cout << "[Pipeline] Registered module: " << name << std::endl;
}

void AnalysisPipeline::enableModule(const std::string& name, bool enabled) {
    if (m_modules.count(name)) {
        m_modules[name].enabled = enabled;
    }
}

bool AnalysisPipeline::isModuleEnabled(const std::string& name) const {
    auto it = m_modules.find(name);
    return it != m_modules.end() && it->second.enabled;
}

std::vector<std::string> AnalysisPipeline::getModuleNames() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : m_modules) {
        names.push_back(name);
    }
    return names;
}

void AnalysisPipeline::setGlobalConfig(const nlohmann::json& config) {
    m_globalConfig.merge_patch(config);
}

void AnalysisPipeline::setModuleConfig(const std::string& moduleName,
                                       const nlohmann::json& config) {
    if (m_modules.count(moduleName)) {
        m_modules[moduleName].config = config;
    }
}

nlohmann::json AnalysisPipeline::analyze(const core::AudioBuffer& audio,
                                         ProgressCallback progress) {
    std::cout << "[Pipeline] Starting analysis..." << std::endl;

    core::AnalysisContext context;
    context.sampleRate = audio.getSampleRate();
    context.globalConfig = m_globalConfig;

    auto executionOrder = getExecutionOrder();
    if (executionOrder.empty()) {
        throw std::runtime_error("No modules to execute or circular dependency detected");
    }

    for (const auto& name : executionOrder) {
        auto& moduleInfo = m_modules[name];
        moduleInfo.module->reset();
        if (!moduleInfo.module->initialize(moduleInfo.config)) {
            throw std::runtime_error("Failed to initialize module: " + name);
        }
    }

    std::vector<std::string> degraded;
    size_t moduleIndex = 0;
    for (const auto& name : executionOrder) {
        if (progress) {
            progress(name, moduleIndex / static_cast<float>(executionOrder.size()));
        }

        std::cout << "[Pipeline] Executing: " << name << std::endl;

        nlohmann::json result;
        try {
            result = executeModule(name, audio, context);
        } catch (const std::exception& e) {
            std::cerr << "[Pipeline] Module " << name << " failed, using neutral defaults: "
                      << e.what() << std::endl;
            result = m_modules[name].module->neutralResult();
            degraded.push_back(name);
        }
        // Store the result for use by subsequent dependent modules
        context.moduleResults[name] = result;

        moduleIndex++;
    }

    // Disabled modules still contribute their neutral result
    for (auto& [name, info] : m_modules) {
        if (info.enabled) continue;
        std::cout << "[Pipeline] Module " << name << " is disabled, using neutral defaults" << std::endl;
        if (!info.module->initialize(info.config)) {
            throw std::runtime_error("Failed to initialize module: " + name);
        }
        context.moduleResults[name] = info.module->neutralResult();
        degraded.push_back(name);
    }

    if (progress) {
        progress("Complete", 1.0f);
    }

    return {
        {"audio", {
            {"sampleRate", audio.getSampleRate()},
            {"duration", audio.getDuration()},
            {"channels", audio.getChannelCount()}
        }},
        {"modules", context.moduleResults},
        {"degraded", degraded},
        {"executionOrder", executionOrder}
    };
}

std::vector<std::string> AnalysisPipeline::getExecutionOrder() const {
    return topologicalSort();
}

bool AnalysisPipeline::validateDependencies() const {
    return !hasCycles();
}

std::vector<std::string> AnalysisPipeline::topologicalSort() const {
    std::vector<std::string> result;
    // Number of unmet dependencies for each module
    std::map<std::string, size_t> inDegree;
    // A -> [B, C] means A must run before B and C
    std::map<std::string, std::vector<std::string>> adjacency;

    for (const auto& [name, info] : m_modules) {
        if (!info.enabled) continue;

        inDegree[name] = 0;
        for (const auto& dep : info.dependencies) {
            if (m_modules.count(dep) && m_modules.at(dep).enabled) {
                adjacency[dep].push_back(name);
                inDegree[name]++;
            }
        }
    }

    std::queue<std::string> queue;
    for (const auto& [name, degree] : inDegree) {
        if (degree == 0) {
            queue.push(name);
        }
    }

    while (!queue.empty()) {
        std::string current = queue.front();
        queue.pop();
        result.push_back(current);

        if (adjacency.count(current)) {
            for (const auto& dependent : adjacency[current]) {
                inDegree[dependent]--;
                if (inDegree[dependent] == 0) {
                    queue.push(dependent);
                }
            }
        }
    }

    if (result.size() != inDegree.size()) {
        // Cycle detected
        return {};
    }

    return result;
}

bool AnalysisPipeline::hasCycles() const {
    return getExecutionOrder().empty() &&
           std::any_of(m_modules.begin(), m_modules.end(),
                       [](const auto& entry) { return entry.second.enabled; });
}

nlohmann::json AnalysisPipeline::executeModule(const std::string& name,
                                               const core::AudioBuffer& audio,
                                               core::AnalysisContext& context) {
    auto& moduleInfo = m_modules[name];

    auto result = moduleInfo.module->process(audio, context);

    if (!moduleInfo.module->validateOutput(result)) {
        throw std::runtime_error("Module output validation failed: " + name);
    }

    return result;
}

// ============================================================================
// PipelineBuilder Implementation
// ============================================================================

AnalysisPipeline& PipelineBuilder::pipeline() {
    if (!m_pipeline) {
        m_pipeline = std::make_unique<AnalysisPipeline>();
    }
    return *m_pipeline;
}

PipelineBuilder& PipelineBuilder::withAcousticModules() {
    auto& p = pipeline();
    p.registerModule(modules::createCepstralModule());
    p.registerModule(modules::createPitchModule());
    p.registerModule(modules::createEnergyModule());
    p.registerModule(modules::createVoiceQualityModule());
    p.registerModule(modules::createProsodyModule());
    p.registerModule(modules::createConfidenceTimelineModule());
    return *this;
}

PipelineBuilder& PipelineBuilder::withModule(std::unique_ptr<core::IAnalysisModule> module) {
    pipeline().registerModule(std::move(module));
    return *this;
}

PipelineBuilder& PipelineBuilder::withConfig(const nlohmann::json& config) {
    m_config.merge_patch(config);
    return *this;
}

PipelineBuilder& PipelineBuilder::withModuleSettings(const nlohmann::json& settings) {
    if (settings.is_object()) {
        m_settings.merge_patch(settings);
    }
    return *this;
}

std::unique_ptr<AnalysisPipeline> PipelineBuilder::build() {
    auto& p = pipeline();
    p.setGlobalConfig(m_config);

    for (const auto& name : p.getModuleNames()) {
        nlohmann::json moduleConfig = m_config;
        bool enabled = true;
        if (m_settings.contains(name) && m_settings[name].is_object()) {
            const auto& s = m_settings[name];
            if (s.contains("enabled") && s["enabled"].is_boolean()) {
                enabled = s["enabled"].get<bool>();
            }
            if (s.contains("config") && s["config"].is_object()) {
                moduleConfig.merge_patch(s["config"]);
            }
        }
        p.setModuleConfig(name, moduleConfig);
        p.enableModule(name, enabled);
        if (!enabled) {
            std::cout << "[Config] Module '" << name << "' is DISABLED" << std::endl;
        }
    }

    return std::move(m_pipeline);
}

} // namespace vera::pipeline
