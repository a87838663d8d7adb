#include <QAudioSource>
#include <QEventLoop>
#include <QIODevice>
#include <QMediaDevices>

#include "QtCaptureDevice.h"
#include "logging.h"

using namespace std;

namespace {

constexpr auto presence_check_interval = 500ms;

string toString(QAudio::Error error) {
    switch(error) {
    case QAudio::NoError:
        return {};
    case QAudio::OpenError:
        return "The audio device could not be opened";
    case QAudio::IOError:
        return "I/O error on the audio device";
    case QAudio::UnderrunError:
        return "Audio underrun";
    case QAudio::FatalError:
        return "The audio device is not usable";
    }
    return "Unknown audio error";
}

} // anon ns

QtCaptureDevice::QtCaptureDevice(QAudioDevice device)
    : device_{std::move(device)}
{
}

QtCaptureDevice::~QtCaptureDevice()
{
    close();
}

vin::capture_factory_t QtCaptureDevice::factory()
{
    return [] {
        return make_unique<QtCaptureDevice>();
    };
}

QAudioFormat QtCaptureDevice::createWhisperFormat(const QAudioDevice &device)
{
    QAudioFormat format;
    format.setSampleRate(16000);
    format.setChannelCount(1);
    format.setSampleFormat(QAudioFormat::Int16);

    if (device.isFormatSupported(format)) {
        return format;
    }

    LOG_DEBUG_N << "16 kHz mono is not supported by " << device.description().toStdString()
                << ". Using the preferred format.";
    return device.preferredFormat();
}

bool QtCaptureDevice::open()
{
    // The Qt audio backends need an event dispatcher on this thread
    if (!loop_) {
        loop_ = make_unique<QEventLoop>();
    }

    if (device_.isNull()) {
        device_ = QMediaDevices::defaultAudioInput();
    }

    if (device_.isNull()) {
        error_ = "No audio input device is available";
        LOG_WARN_N << error_;
        return false;
    }

    format_ = createWhisperFormat(device_);
    if (format_.sampleFormat() == QAudioFormat::Unknown || format_.sampleRate() <= 0
        || format_.channelCount() <= 0) {
        error_ = "The audio input device has no usable format";
        LOG_WARN_N << error_;
        return false;
    }

    source_ = make_unique<QAudioSource>(device_, format_);
    present_ = true;
    error_.clear();

    LOG_INFO_N << "Using audio input '" << device_.description().toStdString() << "' at "
               << format_.sampleRate() << " Hz, " << format_.channelCount() << " channel(s), "
               << format_.bytesPerSample() << " bytes per sample.";
    return true;
}

bool QtCaptureDevice::start()
{
    if (!source_) {
        error_ = "The audio input is not open";
        return false;
    }

    pending_.clear();
    io_ = source_->start();
    if (!io_ || source_->error() != QAudio::NoError) {
        error_ = toString(source_->error());
        if (error_.empty()) {
            error_ = "Failed to start the audio input";
        }
        io_ = nullptr;
        return false;
    }

    running_ = true;
    return true;
}

void QtCaptureDevice::pause()
{
    running_ = false;
    if (source_) {
        source_->stop();
    }
    io_ = nullptr;
    pending_.clear();
}

void QtCaptureDevice::close()
{
    pause();
    source_.reset();
}

size_t QtCaptureDevice::read(std::vector<float> &out)
{
    if (loop_) {
        loop_->processEvents(QEventLoop::AllEvents);
    }

    if (!io_) {
        return 0;
    }

    pending_.append(io_->readAll());
    return convert(out);
}

size_t QtCaptureDevice::convert(std::vector<float> &out)
{
    const auto bps = format_.bytesPerSample();
    if (bps <= 0) {
        return 0;
    }

    const auto count = static_cast<size_t>(pending_.size() / bps);
    const auto *p = pending_.constData();
    out.reserve(out.size() + count);
    for (size_t i = 0; i < count; ++i, p += bps) {
        out.push_back(format_.normalizedSampleValue(p));
    }

    // Keep a trailing partial sample for the next read
    pending_.remove(0, static_cast<qsizetype>(count) * bps);
    return count;
}

bool QtCaptureDevice::isLost() const
{
    if (!running_ || !source_) {
        return false;
    }

    if (const auto err = source_->error(); err != QAudio::NoError && err != QAudio::UnderrunError) {
        error_ = toString(err);
        return true;
    }

    if (source_->state() == QAudio::StoppedState) {
        error_ = "The audio input stopped unexpectedly";
        return true;
    }

    if (!devicePresent()) {
        error_ = "The audio input device was removed";
        return true;
    }

    return false;
}

bool QtCaptureDevice::devicePresent() const
{
    const auto now = chrono::steady_clock::now();
    if (now - last_presence_check_ < presence_check_interval) {
        return present_;
    }
    last_presence_check_ = now;

    present_ = false;
    for (const auto& dev : QMediaDevices::audioInputs()) {
        if (dev.id() == device_.id()) {
            present_ = true;
            break;
        }
    }

    return present_;
}
