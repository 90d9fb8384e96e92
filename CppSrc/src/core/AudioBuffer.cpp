#include "../../include/core/AudioBuffer.h"
#include <algorithm>
#include <cmath>

namespace vera::core {

// ============================================================================
// AudioBuffer Implementation
// ============================================================================

AudioBuffer::AudioBuffer(size_t channels, size_t frames, float sampleRate)
    : m_data(channels * frames, 0.0f)
    , m_channels(channels)
    , m_frames(frames)
    , m_sampleRate(sampleRate) {
}

AudioBuffer AudioBuffer::fromMono(const std::vector<float>& samples, float sampleRate) {
    AudioBuffer buffer(1, samples.size(), sampleRate);
    std::copy(samples.begin(), samples.end(), buffer.m_data.begin());
    return buffer;
}

float* AudioBuffer::getChannel(size_t channel) {
    if (channel >= m_channels) {
        return nullptr;
    }
    return m_data.data() + channel * m_frames;
}

const float* AudioBuffer::getChannel(size_t channel) const {
    if (channel >= m_channels) {
        return nullptr;
    }
    return m_data.data() + channel * m_frames;
}

/**
 * @brief Averages all channels frame by frame.
 *
 * A one-channel buffer is returned as a plain copy so that mono input is
 * passed through bit-exact.
 */
std::vector<float> AudioBuffer::getMono() const {
    if (empty()) {
        return {};
    }

    const float* first = getChannel(0);
    std::vector<float> mono(first, first + m_frames);
    if (m_channels == 1) {
        return mono;
    }

    for (size_t ch = 1; ch < m_channels; ++ch) {
        const float* channel = getChannel(ch);
        for (size_t i = 0; i < m_frames; ++i) {
            mono[i] += channel[i];
        }
    }

    const float scale = 1.0f / static_cast<float>(m_channels);
    for (float& sample : mono) {
        sample *= scale;
    }
    return mono;
}

AudioBuffer AudioBuffer::slice(size_t startFrame, size_t endFrame) const {
    endFrame = std::min(endFrame, m_frames);
    if (startFrame >= endFrame) {
        return AudioBuffer(m_channels, 0, m_sampleRate);
    }

    const size_t sliceFrames = endFrame - startFrame;
    AudioBuffer sliced(m_channels, sliceFrames, m_sampleRate);
    for (size_t ch = 0; ch < m_channels; ++ch) {
        const float* src = getChannel(ch) + startFrame;
        std::copy(src, src + sliceFrames, sliced.getChannel(ch));
    }
    return sliced;
}

// ============================================================================
// Window Functions Implementation
// ============================================================================

namespace window {

std::vector<double> hann(size_t size) {
    std::vector<double> w(size, 1.0);
    if (size < 2) {
        return w;
    }
    // Periodic form: 0.5 * (1 - cos(2*pi*i / N))
    for (size_t i = 0; i < size; ++i) {
        w[i] = 0.5 * (1.0 - std::cos(2.0 * M_PI * static_cast<double>(i) / static_cast<double>(size)));
    }
    return w;
}

} // namespace window

} // namespace vera::core
