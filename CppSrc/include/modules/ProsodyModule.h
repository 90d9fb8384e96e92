#ifndef VERACITY_PROSODYMODULE_H
#define VERACITY_PROSODYMODULE_H

#include <memory>

namespace vera { namespace core { class IAnalysisModule; } }

namespace vera { namespace modules {
    /**
     * @brief Factory function to create the prosody module ("Prosody").
     *
     * Speech rate and pause percentage from an energy threshold at a fixed
     * fraction of the mean frame RMS.
     * @return A unique pointer to the module.
     */
    std::unique_ptr<vera::core::IAnalysisModule> createProsodyModule();
} }

#endif //VERACITY_PROSODYMODULE_H
