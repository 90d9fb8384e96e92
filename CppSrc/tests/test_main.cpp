#include <iostream>
#include <cstdlib>
#include <exception>
#include <string>

// Declarations of test functions
bool test_frame_count_centred();
bool test_rms_of_sine();
bool test_zero_crossing_rate_of_sine();
bool test_pitch_tracker_on_sine();
bool test_pitch_tracker_silence_unvoiced();
bool test_pitch_tracker_rejects_empty_range();
bool test_hnr_sine_above_noise();
bool test_statistics_helpers();
bool test_audio_buffer_mono_mixdown();
bool test_cepstral_shape_on_noise();
bool test_cepstral_rejects_bad_config();
bool test_pitch_on_sine_150hz();
bool test_pitch_on_silence_is_zero();
bool test_energy_on_sine();
bool test_voice_quality_on_sine();
bool test_prosody_on_bursts();
bool test_timeline_window_counts();
bool test_timeline_steady_tone_is_stable();
bool test_neutral_results_are_valid();
bool test_pipeline_dependency_order();
bool test_pipeline_detects_cycles();
bool test_pipeline_failed_module_degrades();
bool test_pipeline_disabled_module_is_neutral();
bool test_pipeline_register_replaces_same_name();
bool test_pipeline_reports_progress();
bool test_extractor_sine_is_bounded();
bool test_extractor_glide_raises_pitch_variation();
bool test_extractor_silence_low_energy();
bool test_extractor_rejects_unusable_signals();
bool test_extractor_failed_module_is_neutral();
bool test_extractor_disabled_module_is_neutral();
bool test_extractor_rejects_bad_module_override();
bool test_stress_thresholds_are_strict();
bool test_overall_confidence_formula();
bool test_fusion_positive_words_hesitant_voice();
bool test_fusion_confident_neutral_call();
bool test_fusion_is_pure();
bool test_fusion_attention_weights_normalised();
bool test_fusion_risk_is_monotonic_in_credibility();
bool test_fusion_chart_inconsistencies();
bool test_fusion_negative_and_stress_mismatches();
bool test_discourse_shift();
bool test_narrative_parses_sections();
bool test_narrative_without_headers_is_empty();
bool test_fallback_narrative();
bool test_store_persists_across_reopen();
bool test_store_rejects_illegal_changes();
bool test_orchestrator_happy_path();
bool test_orchestrator_narrative_fallback();
bool test_orchestrator_stage_failures();
bool test_orchestrator_single_run_under_contention();
bool test_worker_pool_rejects_duplicates();
bool test_orchestrator_runs_jobs_through_pool();
bool test_fallback_keeps_multibyte_characters_whole();
bool test_store_round_trips_stage_outputs();
bool test_orchestrator_outputs_survive_reopen();
bool test_orchestrator_fallback_with_multibyte_reason();
bool test_orchestrator_stores_invalid_utf8_narrative();
bool test_orchestrator_non_standard_exceptions();
bool test_orchestrator_retries_failure_record();
bool test_config_defaults_and_overrides();
bool test_config_rejects_invalid_values();
bool test_config_file_loading();
bool test_file_collaborators();

int main() {
    int failed = 0;
    int total = 0;

    const char* quietEnv = std::getenv("VERA_TEST_QUIET");
    bool quiet = quietEnv && std::string(quietEnv) != "0";

    if (!quiet) std::cout << "Running tests..." << std::endl;

    auto run_test = [&](const char* name, bool (*fn)()) {
        ++total;
        bool ok = false;
        try {
            ok = fn();
        } catch (const std::exception& e) {
            std::cerr << name << " threw: " << e.what() << std::endl;
        }
        if (!quiet) {
            std::cout << "- " << name << ": " << (ok ? "PASS" : "FAIL") << std::endl;
        }
        if (!ok) ++failed;
    };

    run_test("test_frame_count_centred", &test_frame_count_centred);
    run_test("test_rms_of_sine", &test_rms_of_sine);
    run_test("test_zero_crossing_rate_of_sine", &test_zero_crossing_rate_of_sine);
    run_test("test_pitch_tracker_on_sine", &test_pitch_tracker_on_sine);
    run_test("test_pitch_tracker_silence_unvoiced", &test_pitch_tracker_silence_unvoiced);
    run_test("test_pitch_tracker_rejects_empty_range", &test_pitch_tracker_rejects_empty_range);
    run_test("test_hnr_sine_above_noise", &test_hnr_sine_above_noise);
    run_test("test_statistics_helpers", &test_statistics_helpers);
    run_test("test_audio_buffer_mono_mixdown", &test_audio_buffer_mono_mixdown);
    run_test("test_cepstral_shape_on_noise", &test_cepstral_shape_on_noise);
    run_test("test_cepstral_rejects_bad_config", &test_cepstral_rejects_bad_config);
    run_test("test_pitch_on_sine_150hz", &test_pitch_on_sine_150hz);
    run_test("test_pitch_on_silence_is_zero", &test_pitch_on_silence_is_zero);
    run_test("test_energy_on_sine", &test_energy_on_sine);
    run_test("test_voice_quality_on_sine", &test_voice_quality_on_sine);
    run_test("test_prosody_on_bursts", &test_prosody_on_bursts);
    run_test("test_timeline_window_counts", &test_timeline_window_counts);
    run_test("test_timeline_steady_tone_is_stable", &test_timeline_steady_tone_is_stable);
    run_test("test_neutral_results_are_valid", &test_neutral_results_are_valid);
    run_test("test_pipeline_dependency_order", &test_pipeline_dependency_order);
    run_test("test_pipeline_detects_cycles", &test_pipeline_detects_cycles);
    run_test("test_pipeline_failed_module_degrades", &test_pipeline_failed_module_degrades);
    run_test("test_pipeline_disabled_module_is_neutral", &test_pipeline_disabled_module_is_neutral);
    run_test("test_pipeline_register_replaces_same_name", &test_pipeline_register_replaces_same_name);
    run_test("test_pipeline_reports_progress", &test_pipeline_reports_progress);
    run_test("test_extractor_sine_is_bounded", &test_extractor_sine_is_bounded);
    run_test("test_extractor_glide_raises_pitch_variation", &test_extractor_glide_raises_pitch_variation);
    run_test("test_extractor_silence_low_energy", &test_extractor_silence_low_energy);
    run_test("test_extractor_rejects_unusable_signals", &test_extractor_rejects_unusable_signals);
    run_test("test_extractor_failed_module_is_neutral", &test_extractor_failed_module_is_neutral);
    run_test("test_extractor_disabled_module_is_neutral", &test_extractor_disabled_module_is_neutral);
    run_test("test_extractor_rejects_bad_module_override", &test_extractor_rejects_bad_module_override);
    run_test("test_stress_thresholds_are_strict", &test_stress_thresholds_are_strict);
    run_test("test_overall_confidence_formula", &test_overall_confidence_formula);
    run_test("test_fusion_positive_words_hesitant_voice", &test_fusion_positive_words_hesitant_voice);
    run_test("test_fusion_confident_neutral_call", &test_fusion_confident_neutral_call);
    run_test("test_fusion_is_pure", &test_fusion_is_pure);
    run_test("test_fusion_attention_weights_normalised", &test_fusion_attention_weights_normalised);
    run_test("test_fusion_risk_is_monotonic_in_credibility", &test_fusion_risk_is_monotonic_in_credibility);
    run_test("test_fusion_chart_inconsistencies", &test_fusion_chart_inconsistencies);
    run_test("test_fusion_negative_and_stress_mismatches", &test_fusion_negative_and_stress_mismatches);
    run_test("test_discourse_shift", &test_discourse_shift);
    run_test("test_narrative_parses_sections", &test_narrative_parses_sections);
    run_test("test_narrative_without_headers_is_empty", &test_narrative_without_headers_is_empty);
    run_test("test_fallback_narrative", &test_fallback_narrative);
    run_test("test_store_persists_across_reopen", &test_store_persists_across_reopen);
    run_test("test_store_rejects_illegal_changes", &test_store_rejects_illegal_changes);
    run_test("test_orchestrator_happy_path", &test_orchestrator_happy_path);
    run_test("test_orchestrator_narrative_fallback", &test_orchestrator_narrative_fallback);
    run_test("test_orchestrator_stage_failures", &test_orchestrator_stage_failures);
    run_test("test_orchestrator_single_run_under_contention", &test_orchestrator_single_run_under_contention);
    run_test("test_worker_pool_rejects_duplicates", &test_worker_pool_rejects_duplicates);
    run_test("test_orchestrator_runs_jobs_through_pool", &test_orchestrator_runs_jobs_through_pool);
    run_test("test_fallback_keeps_multibyte_characters_whole", &test_fallback_keeps_multibyte_characters_whole);
    run_test("test_store_round_trips_stage_outputs", &test_store_round_trips_stage_outputs);
    run_test("test_orchestrator_outputs_survive_reopen", &test_orchestrator_outputs_survive_reopen);
    run_test("test_orchestrator_fallback_with_multibyte_reason", &test_orchestrator_fallback_with_multibyte_reason);
    run_test("test_orchestrator_stores_invalid_utf8_narrative", &test_orchestrator_stores_invalid_utf8_narrative);
    run_test("test_orchestrator_non_standard_exceptions", &test_orchestrator_non_standard_exceptions);
    run_test("test_orchestrator_retries_failure_record", &test_orchestrator_retries_failure_record);

    run_test("test_config_defaults_and_overrides", &test_config_defaults_and_overrides);
    run_test("test_config_rejects_invalid_values", &test_config_rejects_invalid_values);
    run_test("test_config_file_loading", &test_config_file_loading);
    run_test("test_file_collaborators", &test_file_collaborators);

    int passed = total - failed;
    std::cout << "Summary: " << passed << "/" << total << " passed, " << failed << " failed" << std::endl;

    return failed == 0 ? 0 : 1;
}
