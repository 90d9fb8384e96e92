#include "../../include/pipeline/AudioLoader.h"
#include "../../include/core/Errors.h"
#include <fstream>
#include <cstdint>
#include <vector>
#include <string>
#include <cstring>

namespace vera::pipeline {

namespace {

uint32_t read_u32_le(std::ifstream& f) {
    uint8_t b[4] = {0, 0, 0, 0};
    f.read(reinterpret_cast<char*>(b), 4);
    return static_cast<uint32_t>(b[0]) | (static_cast<uint32_t>(b[1]) << 8) |
           (static_cast<uint32_t>(b[2]) << 16) | (static_cast<uint32_t>(b[3]) << 24);
}

uint16_t read_u16_le(std::ifstream& f) {
    uint8_t b[2] = {0, 0};
    f.read(reinterpret_cast<char*>(b), 2);
    return static_cast<uint16_t>(b[0] | (b[1] << 8));
}

} // namespace

/**
 * Walks the RIFF chunks to find 'fmt ' and 'data', then decodes the
 * interleaved samples of the data chunk into planar channels.
 */
core::AudioBuffer AudioLoader::loadWav(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw core::ExtractionError("cannot open WAV file: " + path);

    char riff[4]; f.read(riff, 4);
    if (f.gcount() != 4 || std::string(riff, 4) != "RIFF") throw core::ExtractionError("not a RIFF file: " + path);
    (void)read_u32_le(f);
    char wave[4]; f.read(wave, 4);
    if (f.gcount() != 4 || std::string(wave, 4) != "WAVE") throw core::ExtractionError("not a WAVE file: " + path);

    uint16_t audioFormat = 0, numChannels = 0, bitsPerSample = 0;
    uint32_t sampleRate = 0, dataSize = 0;
    std::streampos dataPos = 0;
    bool haveData = false;

    while (f) {
        char id[4]; f.read(id, 4);
        if (f.gcount() != 4) break;
        const uint32_t chunkSize = read_u32_le(f);
        if (!f) break;
        const std::string chunkId(id, 4);
        if (chunkId == "fmt ") {
            if (chunkSize < 16) throw core::ExtractionError("truncated 'fmt ' chunk");
            audioFormat = read_u16_le(f);
            numChannels = read_u16_le(f);
            sampleRate = read_u32_le(f);
            (void)read_u32_le(f); // byte rate
            (void)read_u16_le(f); // block align
            bitsPerSample = read_u16_le(f);
            if (audioFormat == 0xFFFE && chunkSize >= 26) {
                // WAVE_FORMAT_EXTENSIBLE: the real format is the first field of the sub-format GUID
                (void)read_u16_le(f); // extension size
                (void)read_u16_le(f); // valid bits
                (void)read_u32_le(f); // channel mask
                audioFormat = read_u16_le(f);
                f.seekg(chunkSize - 26, std::ios::cur);
            } else if (chunkSize > 16) {
                f.seekg(chunkSize - 16, std::ios::cur);
            }
        } else if (chunkId == "data") {
            dataSize = chunkSize;
            dataPos = f.tellg();
            haveData = true;
            f.seekg(chunkSize, std::ios::cur);
        } else {
            f.seekg(chunkSize, std::ios::cur);
        }
        if (chunkSize % 2 == 1) f.seekg(1, std::ios::cur);
    }

    if (audioFormat == 0 || numChannels == 0 || !haveData) {
        throw core::ExtractionError("invalid WAV, missing 'fmt ' or 'data' chunk: " + path);
    }
    if (sampleRate == 0) throw core::ExtractionError("WAV declares a zero sample rate: " + path);

    const bool pcm16 = audioFormat == 1 && bitsPerSample == 16;
    const bool pcm24 = audioFormat == 1 && bitsPerSample == 24;
    const bool float32 = audioFormat == 3 && bitsPerSample == 32;
    if (!pcm16 && !pcm24 && !float32) {
        throw core::ExtractionError("unsupported audio format or bit depth: Format=" + std::to_string(audioFormat) +
                                    ", Bits=" + std::to_string(bitsPerSample));
    }

    const size_t bytesPerSample = bitsPerSample / 8;
    const size_t frames = dataSize / (bytesPerSample * numChannels);
    core::AudioBuffer buffer(numChannels, frames, static_cast<float>(sampleRate));

    f.clear();
    f.seekg(dataPos);

    std::vector<uint8_t> raw(frames * numChannels * bytesPerSample);
    f.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(raw.size()));
    if (static_cast<size_t>(f.gcount()) != raw.size()) {
        throw core::ExtractionError("truncated WAV data chunk: " + path);
    }

    const uint8_t* p = raw.data();
    for (size_t i = 0; i < frames; ++i) {
        for (size_t ch = 0; ch < numChannels; ++ch) {
            float sample = 0.0f;
            if (pcm16) {
                const int16_t s = static_cast<int16_t>(p[0] | (p[1] << 8));
                sample = static_cast<float>(s) / 32768.0f;
            } else if (pcm24) {
                int32_t v = p[0] | (p[1] << 8) | (p[2] << 16);
                if (v & 0x800000) v |= ~0xFFFFFF;
                sample = static_cast<float>(v) / 8388608.0f;
            } else {
                std::memcpy(&sample, p, 4);
            }
            buffer.getChannel(ch)[i] = sample;
            p += bytesPerSample;
        }
    }
    return buffer;
}

} // namespace vera::pipeline
