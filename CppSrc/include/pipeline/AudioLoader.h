#ifndef VERACITY_AUDIOLOADER_H
#define VERACITY_AUDIOLOADER_H

#include <string>
#include "../core/AudioBuffer.h"

namespace vera::pipeline {

    /**
     * @brief Loads recordings into an AudioBuffer.
     *
     * Only uncompressed WAV is supported.
     */
    class AudioLoader {
    public:
        /**
         * @brief Decodes a WAV file.
         *
         * Handles PCM 16/24-bit and IEEE float 32-bit little-endian data with
         * any number of channels. Samples are normalised to [-1, 1].
         *
         * @param path The file path to the WAV file.
         * @return The decoded buffer, channels kept separate.
         * @throws core::ExtractionError If the file cannot be opened, is truncated
         *         or corrupted, or uses an unsupported format.
         */
        static core::AudioBuffer loadWav(const std::string& path);
    };

} // namespace vera::pipeline

#endif //VERACITY_AUDIOLOADER_H
