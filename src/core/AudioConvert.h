#pragma once

#include <span>
#include <vector>

#include "vin/AudioBuffer.h"

namespace vin {

// True if the buffer can be fed to an inference engine
bool isUsable(const AudioBuffer& buffer) noexcept;

// Averages the channels of interleaved samples
std::vector<float> downmixToMono(std::span<const float> samples, unsigned channels);

// Linear interpolation between neighboring samples
std::vector<float> resample(std::span<const float> mono, unsigned fromRate, unsigned toRate);

// Mono at `rate`, ready for inference
std::vector<float> toMono(const AudioBuffer& buffer, unsigned rate);

} // ns
