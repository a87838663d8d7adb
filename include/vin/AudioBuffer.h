#pragma once

#include <cstddef>
#include <vector>

namespace vin {

/*! Captured audio, interleaved float samples in the range [-1, 1].
 *
 *  The buffer is move-only. It is created by the AudioWorker, moved through the
 *  StateMachine into a transcription command and dropped by the TranscriptionWorker.
 */
struct AudioBuffer {
    AudioBuffer() = default;
    AudioBuffer(std::vector<float> samples, unsigned sampleRate, unsigned channelCount)
        : samples{std::move(samples)}, sample_rate{sampleRate}, channels{channelCount} {}

    AudioBuffer(const AudioBuffer&) = delete;
    AudioBuffer& operator=(const AudioBuffer&) = delete;

    AudioBuffer(AudioBuffer&& other) noexcept
        : samples{std::move(other.samples)}, sample_rate{other.sample_rate}, channels{other.channels}
    {
        other.samples.clear();
    }

    AudioBuffer& operator=(AudioBuffer&& other) noexcept {
        if (this != &other) {
            samples = std::move(other.samples);
            sample_rate = other.sample_rate;
            channels = other.channels;
            other.samples.clear();
        }
        return *this;
    }

    bool empty() const noexcept {
        return samples.empty();
    }

    size_t frames() const noexcept {
        return channels ? samples.size() / channels : 0;
    }

    // In seconds
    double duration() const noexcept {
        return sample_rate ? static_cast<double>(frames()) / sample_rate : 0.0;
    }

    std::vector<float> samples;
    unsigned sample_rate{};
    unsigned channels{};
};

} // ns
