#ifndef VERACITY_PITCHMODULE_H
#define VERACITY_PITCHMODULE_H

#include <memory>

namespace vera { namespace core { class IAnalysisModule; } }

namespace vera { namespace modules {
    /**
     * @brief Factory function to create the fundamental frequency module ("Pitch").
     *
     * Tracks f0 over the whole clip with a bounded-range YIN estimator and
     * reports mean, spread, range, variation and voiced percentage. The voiced
     * f0 track is exposed under "voicedF0" for dependent modules.
     * @return A unique pointer to the module.
     */
    std::unique_ptr<vera::core::IAnalysisModule> createPitchModule();
} }

#endif //VERACITY_PITCHMODULE_H
