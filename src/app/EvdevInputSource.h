#pragma once

#include <deque>
#include <string>
#include <vector>

#include <linux/input-event-codes.h>

#include "vin/InputSource.h"

/*! Global hotkeys from the Linux input layer.
 *
 *  Reads key events from every keyboard under /dev/input, or from one configured
 *  device. The user must be allowed to read the devices (usually the `input` group).
 */
class EvdevInputSource : public vin::InputSource
{
public:
    struct Config {
        std::vector<int> modifiers{KEY_LEFTCTRL, KEY_RIGHTCTRL};
        std::vector<int> alt_modifiers{KEY_LEFTALT, KEY_RIGHTALT};
        int trigger{KEY_CAPSLOCK};
        std::string device;     // empty to scan for keyboards
    };

    explicit EvdevInputSource(Config config);
    ~EvdevInputSource() override;

    EvdevInputSource(const EvdevInputSource&) = delete;
    EvdevInputSource& operator=(const EvdevInputSource&) = delete;

    // Opens the device(s). Must succeed before next() is called.
    bool open();

    const std::string& lastError() const noexcept {
        return error_;
    }

    std::optional<vin::KeyEdge> next(std::chrono::milliseconds timeout) override;

private:
    struct Device {
        int fd{-1};
        std::string path;
    };

    bool openDevice(const std::string& path, bool requireTrigger);
    void readDevice(Device& dev);
    std::optional<vin::Key> map(int code) const;
    void closeAll();

    const Config config_;
    std::vector<Device> devices_;
    std::deque<vin::KeyEdge> pending_;
    std::string error_;
};
