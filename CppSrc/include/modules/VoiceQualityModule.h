#ifndef VERACITY_VOICEQUALITYMODULE_H
#define VERACITY_VOICEQUALITYMODULE_H

#include <memory>

namespace vera { namespace core { class IAnalysisModule; } }

namespace vera { namespace modules {
    /**
     * @brief Factory function to create the voice quality module ("VoiceQuality").
     *
     * Spectral centroid, rolloff, bandwidth and contrast, jitter and shimmer
     * approximations, and the harmonic-to-noise ratio.
     * @return A unique pointer to the module.
     */
    std::unique_ptr<vera::core::IAnalysisModule> createVoiceQualityModule();
} }

#endif //VERACITY_VOICEQUALITYMODULE_H
