#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace vin {

/*! Interface to a microphone.
 *
 *  All methods are called from the AudioWorker's thread, which is also the thread
 *  that created the instance.
 */
class CaptureDevice {
public:
    CaptureDevice() = default;
    virtual ~CaptureDevice() = default;

    CaptureDevice(const CaptureDevice&) = delete;
    CaptureDevice& operator=(const CaptureDevice&) = delete;

    virtual bool open() = 0;

    // Starts or resumes the delivery of samples
    virtual bool start() = 0;

    virtual void pause() = 0;

    virtual void close() = 0;

    /*! Appends the samples captured since the last call to `out`.
     *
     *  The samples are interleaved floats in [-1, 1] at sampleRate() and channels().
     *  Must not block for more than a few milliseconds.
     *
     *  @return Number of samples appended.
     */
    virtual size_t read(std::vector<float>& out) = 0;

    // True if the OS or driver took the device away
    virtual bool isLost() const = 0;

    virtual unsigned sampleRate() const noexcept = 0;
    virtual unsigned channels() const noexcept = 0;

    virtual std::string lastError() const = 0;
};

using capture_factory_t = std::function<std::unique_ptr<CaptureDevice>()>;

} // ns
