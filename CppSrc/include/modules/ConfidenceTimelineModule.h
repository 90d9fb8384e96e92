#ifndef VERACITY_CONFIDENCETIMELINEMODULE_H
#define VERACITY_CONFIDENCETIMELINEMODULE_H

#include <memory>

namespace vera { namespace core { class IAnalysisModule; } }

namespace vera { namespace modules {
    /**
     * @brief Factory function to create the confidence timeline module ("ConfidenceTimeline").
     *
     * Scores consecutive one second windows for pitch stability, energy level
     * and voice quality.
     * @return A unique pointer to the module.
     */
    std::unique_ptr<vera::core::IAnalysisModule> createConfidenceTimelineModule();
} }

#endif //VERACITY_CONFIDENCETIMELINEMODULE_H
