#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <QAudioDevice>
#include <QAudioFormat>
#include <QByteArray>

#include "vin/CaptureDevice.h"

class QAudioSource;
class QEventLoop;
class QIODevice;

/*! Microphone input through Qt Multimedia.
 *
 *  Lives on the AudioWorker's thread. The audio source is used in pull mode, and
 *  pending Qt events are processed on each read().
 */
class QtCaptureDevice : public vin::CaptureDevice
{
public:
    // A null device means the system default input
    explicit QtCaptureDevice(QAudioDevice device = {});
    ~QtCaptureDevice() override;

    bool open() override;
    bool start() override;
    void pause() override;
    void close() override;
    size_t read(std::vector<float>& out) override;
    bool isLost() const override;

    unsigned sampleRate() const noexcept override {
        return static_cast<unsigned>(format_.sampleRate());
    }

    unsigned channels() const noexcept override {
        return static_cast<unsigned>(format_.channelCount());
    }

    std::string lastError() const override {
        return error_;
    }

    static vin::capture_factory_t factory();

private:
    static QAudioFormat createWhisperFormat(const QAudioDevice& device);
    bool devicePresent() const;
    size_t convert(std::vector<float>& out);

    QAudioDevice device_;
    QAudioFormat format_;
    std::unique_ptr<QEventLoop> loop_;
    std::unique_ptr<QAudioSource> source_;
    QIODevice *io_{};
    QByteArray pending_;
    bool running_{false};

    mutable std::string error_;
    mutable bool present_{true};
    mutable std::chrono::steady_clock::time_point last_presence_check_;
};
