#pragma once

#include <cstddef>
#include <vector>

namespace vera::core::dsp {

/**
 * @brief Framing parameters shared by every frame-wise kernel.
 *
 * Frames are centred: the signal is zero padded by frameLength / 2 on both
 * sides, so a signal of n samples yields 1 + n / hopLength frames.
 */
struct FrameParams {
    size_t frameLength = 2048; ///< Samples per analysis frame (also the FFT size).
    size_t hopLength = 512;    ///< Samples between consecutive frame starts.
};

/**
 * @brief Number of centred frames for a signal of the given length.
 */
size_t frameCount(size_t numSamples, const FrameParams& params);

/**
 * @brief Frame-wise root mean square amplitude.
 */
std::vector<double> frameRms(const std::vector<float>& signal, const FrameParams& params);

/**
 * @brief Frame-wise zero-crossing rate (sign changes per sample).
 */
std::vector<double> zeroCrossingRate(const std::vector<float>& signal, const FrameParams& params);

/**
 * @brief Magnitude spectrogram, stored frame-major.
 */
struct Spectrogram {
    size_t numFrames = 0;
    size_t numBins = 0;
    size_t fftSize = 0;
    float sampleRate = 0.0f;
    std::vector<double> magnitudes; ///< numFrames * numBins values.

    double at(size_t frame, size_t bin) const { return magnitudes[frame * numBins + bin]; }
    double& at(size_t frame, size_t bin) { return magnitudes[frame * numBins + bin]; }

    /** @brief Centre frequency of a bin in Hz. */
    double binFrequency(size_t bin) const {
        return static_cast<double>(bin) * sampleRate / static_cast<double>(fftSize);
    }

    bool empty() const { return numFrames == 0 || numBins == 0; }
};

/**
 * @brief Hann-windowed short-time Fourier transform magnitudes (FFTW3).
 *
 * @param signal Mono input.
 * @param sampleRate Sample rate in Hz.
 * @param params Framing; frameLength is the FFT size.
 * @return The magnitude spectrogram, empty for an empty signal.
 */
Spectrogram magnitudeSpectrogram(const std::vector<float>& signal, float sampleRate,
                                 const FrameParams& params);

/**
 * @brief Frame-wise fundamental frequency estimate.
 *
 * f0[i] is 0 for an unvoiced frame.
 */
struct PitchTrack {
    std::vector<double> f0;

    /** @brief The voiced f0 values in frame order. */
    std::vector<double> voiced() const;

    /** @brief Fraction of frames that are voiced, in [0, 1]. */
    double voicedFraction() const;
};

/**
 * @brief Bounded-range YIN pitch tracker.
 *
 * The difference function is computed from FFT cross-correlation over a fixed
 * integration window of half a frame. A frame is voiced when the cumulative
 * mean normalised difference drops below the threshold at a lag inside
 * [sampleRate / fmax, sampleRate / fmin].
 *
 * @param signal Mono input.
 * @param sampleRate Sample rate in Hz.
 * @param fmin Lowest admissible f0 in Hz.
 * @param fmax Highest admissible f0 in Hz.
 * @param params Framing.
 * @param threshold Aperiodicity threshold (classic YIN value 0.1).
 * @throw std::invalid_argument if the frequency range is empty.
 */
PitchTrack trackPitch(const std::vector<float>& signal, float sampleRate,
                      double fmin, double fmax, const FrameParams& params,
                      double threshold = 0.1);

/**
 * @brief Energy of the harmonic and percussive parts of a spectrogram.
 */
struct HarmonicPercussiveEnergy {
    double harmonic = 0.0;
    double percussive = 0.0;
};

/**
 * @brief Median-filter harmonic/percussive source separation.
 *
 * Harmonic enhancement filters each bin along time, percussive enhancement
 * filters each frame along frequency; the two are turned into soft masks
 * (power 2) and applied to the magnitudes.
 *
 * @param spectrogram Magnitude spectrogram.
 * @param kernelSize Median kernel length in both directions.
 * @throw std::runtime_error if the spectrogram is empty or yields non-finite energy.
 */
HarmonicPercussiveEnergy separateHarmonicPercussive(const Spectrogram& spectrogram,
                                                    size_t kernelSize = 31);

/**
 * @brief 10 log10(harmonic / percussive) of a signal.
 *
 * @param zeroNoiseDb Value returned when the percussive energy is zero.
 * @throw std::runtime_error when the separation fails.
 */
double harmonicToNoiseRatio(const std::vector<float>& signal, float sampleRate,
                            const FrameParams& params, double zeroNoiseDb);

// Statistics helpers (population standard deviation, as numpy computes it).
double mean(const std::vector<double>& values);
double stddev(const std::vector<double>& values);
std::vector<double> diff(const std::vector<double>& values);

/** @brief Rounds half away from zero to the given number of decimals. */
double roundTo(double value, int decimals);

/** @brief Returns value if it is finite, otherwise fallback. */
double finiteOr(double value, double fallback);

/** @brief true when every value is finite (and for an empty vector). */
bool allFinite(const std::vector<double>& values);

} // namespace vera::core::dsp
