#include <iostream>
#include <fstream>
#include <chrono>
#include <memory>
#include "../include/core/AnalysisConfig.h"
#include "../include/core/Errors.h"
#include "../include/core/JsonContract.h"
#include "../include/collaborators/JsonFileCollaborators.h"
#include "../include/fusion/FusionEngine.h"
#include "../include/jobs/JobOrchestrator.h"
#include "../include/jobs/JobStore.h"
#include "../include/jobs/WorkerPool.h"
#include "../include/pipeline/FeatureExtractor.h"
#include <nlohmann/json.hpp>

/**
 * @brief Reads the job request from the "job" config section.
 *
 * @param section {"id", "companyName", "companyContext", "chartPaths"}; all optional.
 * @param audioPath The recording to analyse.
 */
vera::jobs::JobRequest requestFromConfig(const nlohmann::json& section, const std::string& audioPath) {
    vera::jobs::JobRequest request;
    request.audioPath = audioPath;
    if (section.is_object()) {
        request.id = section.value("id", std::string());
        request.companyName = section.value("companyName", std::string());
        request.companyContext = section.value("companyContext", std::string());
        request.chartPaths = section.value("chartPaths", std::vector<std::string>{});
    }
    return request;
}

/**
 * @brief Main function for the veracity analysis executable.
 *
 * Loads the JSON configuration, runs one job for the given recording through
 * the worker pool and writes the job report.
 * @param argc The number of command-line arguments.
 * @param argv The command-line arguments.
 * @return 0 when the job completed, 1 when it failed, 2-4 on usage or config errors.
 */
int main(int argc, char* argv[]) {
    if (argc == 2 && std::string(argv[1]) == "--schema") {
        std::cout << vera::core::JSON_SCHEMA_V1 << std::endl;
        return 0;
    }

    std::cout << "=== Veracity - Credibility Analysis ===" << std::endl;
    std::cout << "Version: 1.0.0" << std::endl << std::endl;

    // Parse arguments (inputPath, outputPath, configPath) - config path is required
    if (argc < 4) {
        std::cerr << "Usage: " << argv[0] << " <input.wav> <output.json> <config.json>" << std::endl;
        std::cerr << "       " << argv[0] << " --schema" << std::endl;
        std::cerr << "Error: Configuration file path must be provided as the 3rd argument." << std::endl;
        return 2;
    }
    std::string inputFile = argv[1];
    std::string outputFile = argv[2];
    std::string configPath = argv[3];

    nlohmann::json cfg;
    try {
        cfg = vera::core::loadConfigFile(configPath);
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << std::endl;
        return 3;
    }

    vera::core::ExtractorConfig extractorConfig;
    vera::core::FusionConfig fusionConfig;
    vera::core::JobsConfig jobsConfig;
    vera::collaborators::CollaboratorPaths paths;
    std::unique_ptr<vera::pipeline::FeatureExtractor> extractor;
    try {
        extractorConfig = vera::core::ExtractorConfig::fromJson(cfg.value("extractor", nlohmann::json()));
        fusionConfig = vera::core::FusionConfig::fromJson(cfg.value("fusion", nlohmann::json()));
        jobsConfig = vera::core::JobsConfig::fromJson(cfg.value("jobs", nlohmann::json()));
        paths = vera::collaborators::CollaboratorPaths::fromJson(cfg.value("collaborators", nlohmann::json()));
        extractor = std::make_unique<vera::pipeline::FeatureExtractor>(
            extractorConfig, cfg.value("modules", nlohmann::json::object()));
    } catch (const std::exception& e) {
        std::cerr << "[Config] Invalid configuration ('" << configPath << "'): " << e.what() << std::endl;
        return 4;
    }

    if (!cfg.contains("modules")) {
        std::cerr << "[Config] No 'modules' object found in configuration; using defaults for all modules." << std::endl;
    }

    try {
        auto startTime = std::chrono::high_resolution_clock::now();

        // 1. Store and services
        vera::jobs::JobStore store(jobsConfig.databasePath);
        vera::jobs::CollaboratorSet collaborators{
            std::make_shared<vera::collaborators::JsonFileTranscriber>(paths.transcript),
            std::make_shared<vera::collaborators::JsonFileSentimentAnalyzer>(paths.sentiment),
            std::make_shared<vera::collaborators::JsonFileChartAnalyzer>(paths.charts),
            std::make_shared<vera::collaborators::TextFileNarrativeSynthesizer>(paths.narrative)
        };
        vera::jobs::JobOrchestrator orchestrator(store, *extractor,
                                                 vera::fusion::FusionEngine(fusionConfig),
                                                 collaborators);

        // 2. Create and run the job
        const vera::jobs::Job created = orchestrator.createJob(requestFromConfig(cfg.value("job", nlohmann::json()), inputFile));
        {
            vera::jobs::WorkerPool pool(jobsConfig.workers);
            orchestrator.submit(pool, created.id);
            pool.waitIdle();
        }
        const vera::jobs::Job job = store.get(created.id);

        // 3. Build and validate the report
        nlohmann::json report = vera::core::JsonContract::createOutput(
            vera::jobs::recordJson(job), vera::jobs::resultsJson(job));

        auto endTime = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            endTime - startTime).count();
        report["processingTime"] = duration / 1000.0;

        if (!vera::core::JsonContract::validate(report)) {
            std::cerr << "Warning: Output validation failed! The result may not conform to the expected schema." << std::endl;
        }

        // 4. Save results to file
        std::cout << "\nSaving results to: " << outputFile << std::endl;
        std::ofstream outFile(outputFile);
        if (!outFile.is_open()) {
            std::cerr << "Error: could not write " << outputFile << std::endl;
            return 1;
        }
        outFile << report.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
        outFile.close();

        // 5. Print summary of key results
        std::cout << "\n=== Analysis " << (job.status == vera::jobs::JobStatus::Completed ? "Complete" : "Failed")
                  << " ===" << std::endl;
        std::cout << "Job: " << job.id << " (" << vera::jobs::toString(job.status) << ", "
                  << job.progress << "%)" << std::endl;
        std::cout << "Processing time: " << duration / 1000.0 << " seconds" << std::endl;

        if (job.errorMessage) {
            std::cout << "Error: " << *job.errorMessage << std::endl;
        }
        if (job.overallConfidence) {
            std::cout << "Vocal confidence: " << *job.overallConfidence << std::endl;
        }
        if (job.fusionResults.is_object()) {
            std::cout << "Credibility: " << job.fusionResults["credibilityScore"]
                      << " (risk: " << job.fusionResults["riskLevel"].get<std::string>() << ")" << std::endl;
            std::cout << "Discrepancies: " << job.fusionResults["discrepancies"].size() << std::endl;
        }
        if (job.narrative.is_object() && job.narrative.value("fallback", false)) {
            std::cout << "Narrative: fallback report" << std::endl;
        }

        std::cout << "\nOutput saved to: " << outputFile << std::endl;
        return job.status == vera::jobs::JobStatus::Completed ? 0 : 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
