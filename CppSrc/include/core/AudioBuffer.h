#pragma once

#include <vector>
#include <cstddef>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace vera::core {

/**
 * @brief Planar multi-channel audio buffer with its sample rate.
 *
 * Channels are stored one after another (L L L ... R R R ...). The feature
 * extractor only ever consumes the mono mixdown.
 */
class AudioBuffer {
public:
    /**
     * @brief Default constructor, creates an empty buffer.
     */
    AudioBuffer() = default;

    /**
     * @brief Constructs a zeroed AudioBuffer with the given dimensions.
     *
     * @param channels The number of audio channels.
     * @param frames The number of sample frames per channel.
     * @param sampleRate The sample rate of the audio data in Hz (default 16000).
     */
    AudioBuffer(size_t channels, size_t frames, float sampleRate = 16000.0f);

    /**
     * @brief Wraps an already decoded mono signal.
     *
     * @param samples Mono samples, nominally in [-1, 1].
     * @param sampleRate Sample rate in Hz.
     * @return A one-channel AudioBuffer holding a copy of the samples.
     */
    static AudioBuffer fromMono(const std::vector<float>& samples, float sampleRate);

    /**
     * @brief Gets a pointer to the start of the specified channel's data.
     * @param channel Channel index.
     * @return Pointer to the channel's samples, or nullptr if out of range.
     */
    float* getChannel(size_t channel);

    /** @copydoc getChannel(size_t) */
    const float* getChannel(size_t channel) const;

    /**
     * @brief Returns the average of all channels for each frame.
     * @return The mono mixdown, empty if the buffer is empty.
     */
    std::vector<float> getMono() const;

    /** @brief Number of channels. */
    size_t getChannelCount() const { return m_channels; }

    /** @brief Number of frames (samples per channel). */
    size_t getFrameCount() const { return m_frames; }

    /** @brief Sample rate in Hz. */
    float getSampleRate() const { return m_sampleRate; }

    /** @brief Duration in seconds. */
    double getDuration() const {
        return m_sampleRate > 0.0f ? m_frames / static_cast<double>(m_sampleRate) : 0.0;
    }

    /** @brief true when the buffer holds no frames. */
    bool empty() const { return m_frames == 0 || m_channels == 0; }

    /**
     * @brief Copies the frames [startFrame, endFrame) into a new buffer.
     *
     * endFrame is clipped to the frame count.
     * @return The slice, or an empty buffer if the range is empty.
     */
    AudioBuffer slice(size_t startFrame, size_t endFrame) const;

private:
    std::vector<float> m_data;
    size_t m_channels = 0;
    size_t m_frames = 0;
    float m_sampleRate = 16000.0f;
};

/**
 * @brief Window functions used by the spectral kernels.
 */
namespace window {

    /**
     * @brief Generates a periodic Hann window (suitable for STFT overlap-add).
     * @param size Number of points.
     * @return The window coefficients.
     */
    std::vector<double> hann(size_t size);

} // namespace window

} // namespace vera::core
