#ifndef VERACITY_ENERGYMODULE_H
#define VERACITY_ENERGYMODULE_H

#include <memory>

namespace vera { namespace core { class IAnalysisModule; } }

namespace vera { namespace modules {
    /**
     * @brief Factory function to create the energy module ("Energy").
     *
     * Frame RMS and zero-crossing rate statistics. The RMS track is exposed
     * under "rms" for the voice quality and prosody modules.
     * @return A unique pointer to the module.
     */
    std::unique_ptr<vera::core::IAnalysisModule> createEnergyModule();
} }

#endif //VERACITY_ENERGYMODULE_H
