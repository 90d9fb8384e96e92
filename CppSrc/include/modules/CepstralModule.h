#ifndef VERACITY_CEPSTRALMODULE_H
#define VERACITY_CEPSTRALMODULE_H

#include <memory>

namespace vera { namespace core { class IAnalysisModule; } }

namespace vera { namespace modules {
    /**
     * @brief Factory function to create the cepstral statistics module ("Cepstral").
     *
     * Computes MFCCs from a mel filterbank on the STFT power spectrum and
     * summarises them, with their first and second order deltas, as per
     * coefficient mean and standard deviation.
     * @return A unique pointer to the module.
     */
    std::unique_ptr<vera::core::IAnalysisModule> createCepstralModule();
} }

#endif //VERACITY_CEPSTRALMODULE_H
