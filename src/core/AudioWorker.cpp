
#include <cassert>
#include <format>

#include "AudioWorker.h"
#include "Overloaded.h"
#include "logging.h"

using namespace std;

namespace vin {

AudioWorker::AudioWorker(Config config, port_t port, event_sink_t emit, capture_factory_t factory)
    : Worker("AudioWorker", std::move(port), std::move(emit))
    , config_{config}
    , factory_{std::move(factory)}
{
    assert(factory_);
}

AudioWorker::~AudioWorker()
{
    stop();
}

void AudioWorker::handle(AudioCommand &&cmd)
{
    visit(overloaded{
        [this](audio_cmd::Start&) { startCapture(); },
        [this](audio_cmd::Stop&) { stopCapture(); },
        [this](audio_cmd::Shutdown&) {
            LOG_DEBUG_EX(*this) << "Shutting down.";
            releaseDevice();
            finish();
        }
    }, cmd);
}

std::optional<chrono::milliseconds> AudioWorker::pollInterval() const
{
    if (capturing_) {
        return config_.poll_interval;
    }
    return nullopt;
}

void AudioWorker::onPoll()
{
    if (capturing_) {
        collect();
    }
}

void AudioWorker::onExit()
{
    releaseDevice();
}

void AudioWorker::startCapture()
{
    if (capturing_) {
        LOG_DEBUG_EX(*this) << "Already capturing. Ignoring Start.";
        return;
    }

    if (!device_) {
        device_ = factory_();
        if (!device_) {
            emit(event::RecordingNeverStarted{"No capture device is available"});
            return;
        }

        if (!device_->open()) {
            const auto error = device_->lastError();
            LOG_WARN_EX(*this) << "Failed to open the capture device: " << error;
            device_.reset();
            emit(event::RecordingNeverStarted{error});
            return;
        }
    }

    if (!device_->start()) {
        const auto error = device_->lastError();
        LOG_WARN_EX(*this) << "Failed to start the capture device: " << error;
        releaseDevice();
        emit(event::RecordingNeverStarted{error});
        return;
    }

    max_samples_ = static_cast<size_t>(config_.max_recording.count())
                   * device_->sampleRate() * device_->channels();
    samples_.clear();
    samples_.reserve(min<size_t>(max_samples_, static_cast<size_t>(device_->sampleRate()) * device_->channels() * 30));
    capturing_ = true;

    LOG_DEBUG_EX(*this) << "Capturing at " << device_->sampleRate() << " Hz, "
                        << device_->channels() << " channel(s), max " << max_samples_ << " samples.";
}

void AudioWorker::stopCapture()
{
    if (!capturing_) {
        LOG_DEBUG_EX(*this) << "Not capturing. Ignoring Stop.";
        return;
    }

    collect();
    if (capturing_) {
        handOver();
    }
}

void AudioWorker::collect()
{
    assert(device_);

    device_->read(samples_);

    if (device_->isLost()) {
        const auto error = device_->lastError();
        LOG_WARN_EX(*this) << "The capture device was lost: " << error;
        capturing_ = false;
        samples_ = {};
        releaseDevice();
        emit(event::RecordingStoppedByDevice{error.empty() ? string{"the audio device was lost"} : error});
        return;
    }

    if (samples_.size() >= max_samples_) {
        LOG_INFO_EX(*this) << "Reached the maximum recording length of "
                           << config_.max_recording.count() << " seconds.";
        samples_.resize(max_samples_);
        handOver();
    }
}

void AudioWorker::handOver()
{
    assert(device_);
    device_->pause();
    capturing_ = false;

    const auto channels = device_->channels();
    if (channels > 1) {
        samples_.resize(samples_.size() - samples_.size() % channels);
    }

    AudioBuffer buffer{std::move(samples_), device_->sampleRate(), channels};
    samples_ = {};

    LOG_DEBUG_EX(*this) << "Handing over " << buffer.duration() << " seconds of audio.";
    emit(event::AudioCaptured{std::move(buffer)});
}

void AudioWorker::releaseDevice()
{
    if (device_) {
        if (capturing_) {
            LOG_DEBUG_EX(*this) << "Discarding " << samples_.size() << " samples.";
            device_->pause();
            capturing_ = false;
            samples_ = {};
        }
        device_->close();
        device_.reset();
    }
}

} // ns
