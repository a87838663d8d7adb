#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include "vin/CaptureDevice.h"
#include "Worker.h"

namespace vin {

/*! Exclusive owner of the capture device.
 *
 *  Samples are collected into a private buffer while recording. On Stop, or when
 *  the buffer reaches the maximum duration, the buffer is moved out in an
 *  `AudioCaptured` event.
 */
class AudioWorker : public Worker<AudioCommand>
{
public:
    struct Config {
        std::chrono::seconds max_recording{std::chrono::minutes{5}};
        std::chrono::milliseconds poll_interval{20};
    };

    AudioWorker(Config config, port_t port, event_sink_t emit, capture_factory_t factory);
    ~AudioWorker() override;

protected:
    void handle(AudioCommand&& cmd) override;
    std::optional<std::chrono::milliseconds> pollInterval() const override;
    void onPoll() override;
    void onExit() override;

private:
    void startCapture();
    void stopCapture();
    void handOver();
    void releaseDevice();
    void collect();

    const Config config_;
    capture_factory_t factory_;
    std::unique_ptr<CaptureDevice> device_;
    std::vector<float> samples_;
    size_t max_samples_{};
    bool capturing_{false};
};

} // ns
