
#include <cmath>
#include <algorithm>

#include "AudioConvert.h"

using namespace std;

namespace vin {

bool isUsable(const AudioBuffer &buffer) noexcept
{
    if (buffer.empty() || buffer.sample_rate == 0 || buffer.channels == 0) {
        return false;
    }

    if (buffer.samples.size() % buffer.channels != 0) {
        return false;
    }

    return ranges::all_of(buffer.samples, [](float s) { return isfinite(s); });
}

std::vector<float> downmixToMono(std::span<const float> samples, unsigned channels)
{
    if (channels <= 1) {
        return {samples.begin(), samples.end()};
    }

    vector<float> mono;
    mono.reserve(samples.size() / channels);
    for (size_t i = 0; i + channels <= samples.size(); i += channels) {
        float sum = 0.0f;
        for (unsigned c = 0; c < channels; ++c) {
            sum += samples[i + c];
        }
        mono.push_back(sum / static_cast<float>(channels));
    }

    return mono;
}

std::vector<float> resample(std::span<const float> mono, unsigned fromRate, unsigned toRate)
{
    if (fromRate == toRate || mono.empty()) {
        return {mono.begin(), mono.end()};
    }

    const auto ratio = static_cast<double>(fromRate) / static_cast<double>(toRate);
    const auto out_len = static_cast<size_t>(static_cast<double>(mono.size()) / ratio);

    vector<float> out;
    out.reserve(out_len);
    for (size_t i = 0; i < out_len; ++i) {
        const auto pos = static_cast<double>(i) * ratio;
        const auto idx = static_cast<size_t>(pos);
        const auto frac = static_cast<float>(pos - static_cast<double>(idx));

        const float a = mono[min(idx, mono.size() - 1)];
        const float b = mono[min(idx + 1, mono.size() - 1)];
        out.push_back(a + (b - a) * frac);
    }

    return out;
}

std::vector<float> toMono(const AudioBuffer &buffer, unsigned rate)
{
    auto mono = downmixToMono(buffer.samples, buffer.channels);
    if (buffer.sample_rate == rate) {
        return mono;
    }
    return resample(mono, buffer.sample_rate, rate);
}

} // ns
