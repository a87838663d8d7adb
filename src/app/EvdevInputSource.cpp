#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <stdexcept>

#include <fcntl.h>
#include <linux/input.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include "EvdevInputSource.h"
#include "logging.h"

using namespace std;

namespace {

constexpr size_t bits_per_long = sizeof(unsigned long) * 8;
constexpr size_t key_bits_size = (KEY_MAX + bits_per_long) / bits_per_long;

bool testBit(const array<unsigned long, key_bits_size>& bits, int bit) {
    const auto b = static_cast<size_t>(bit);
    return (bits[b / bits_per_long] >> (b % bits_per_long)) & 1UL;
}

} // anon ns

EvdevInputSource::EvdevInputSource(Config config)
    : config_{std::move(config)}
{
}

EvdevInputSource::~EvdevInputSource()
{
    closeAll();
}

bool EvdevInputSource::open()
{
    closeAll();

    if (!config_.device.empty()) {
        if (!openDevice(config_.device, false)) {
            return false;
        }
        return true;
    }

    error_code ec;
    for (const auto& entry : filesystem::directory_iterator{"/dev/input", ec}) {
        const auto name = entry.path().filename().string();
        if (name.starts_with("event")) {
            openDevice(entry.path().string(), true);
        }
    }

    if (devices_.empty()) {
        if (error_.empty()) {
            error_ = ec ? format("Cannot list /dev/input: {}", ec.message())
                        : string{"No keyboard was found under /dev/input"};
        }
        return false;
    }

    error_.clear();
    return true;
}

bool EvdevInputSource::openDevice(const std::string &path, bool requireTrigger)
{
    const int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        error_ = format("Cannot open {}: {}", path, strerror(errno));
        LOG_DEBUG_N << error_;
        return false;
    }

    if (requireTrigger) {
        array<unsigned long, key_bits_size> bits{};
        if (ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(bits)), bits.data()) < 0
            || !testBit(bits, config_.trigger)) {
            ::close(fd);
            return false;
        }
    }

    array<char, 256> name{};
    if (ioctl(fd, EVIOCGNAME(name.size() - 1), name.data()) < 0) {
        name[0] = 0;
    }

    LOG_INFO_N << "Listening for hotkeys on " << path << " (" << name.data() << ")";
    devices_.push_back({fd, path});
    return true;
}

void EvdevInputSource::closeAll()
{
    for (auto& dev : devices_) {
        ::close(dev.fd);
    }
    devices_.clear();
    pending_.clear();
}

std::optional<vin::KeyEdge> EvdevInputSource::next(std::chrono::milliseconds timeout)
{
    if (pending_.empty()) {
        if (devices_.empty()) {
            throw runtime_error{"No input devices are open"};
        }

        vector<pollfd> fds;
        fds.reserve(devices_.size());
        for (const auto& dev : devices_) {
            fds.push_back({dev.fd, POLLIN, 0});
        }

        const auto rc = ::poll(fds.data(), fds.size(), static_cast<int>(timeout.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                return nullopt;
            }
            throw runtime_error{format("poll() failed: {}", strerror(errno))};
        }

        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].revents & (POLLIN | POLLERR | POLLHUP)) {
                readDevice(devices_[i]);
            }
        }

        // Unplugged keyboards
        erase_if(devices_, [](const Device& d) { return d.fd < 0; });
        if (devices_.empty() && pending_.empty()) {
            throw runtime_error{"All keyboards are gone"};
        }
    }

    if (pending_.empty()) {
        return nullopt;
    }

    const auto edge = pending_.front();
    pending_.pop_front();
    return edge;
}

void EvdevInputSource::readDevice(Device &dev)
{
    array<input_event, 64> events{};
    while (true) {
        const auto bytes = ::read(dev.fd, events.data(), sizeof(events));
        if (bytes < 0) {
            if (errno == EAGAIN || errno == EINTR) {
                return;
            }
            LOG_WARN_N << "Lost input device " << dev.path << ": " << strerror(errno);
            ::close(dev.fd);
            dev.fd = -1;
            return;
        }

        const auto count = static_cast<size_t>(bytes) / sizeof(input_event);
        for (size_t i = 0; i < count; ++i) {
            const auto& ev = events[i];
            if (ev.type != EV_KEY) {
                continue;
            }
            if (const auto key = map(ev.code)) {
                // 0 = release, 1 = press, 2 = auto-repeat
                pending_.push_back({*key, ev.value != 0, ev.value == 2});
            }
        }

        if (count < events.size()) {
            return;
        }
    }
}

std::optional<vin::Key> EvdevInputSource::map(int code) const
{
    if (code == config_.trigger) {
        return vin::Key::Trigger;
    }
    if (ranges::find(config_.modifiers, code) != config_.modifiers.end()) {
        return vin::Key::Modifier;
    }
    if (ranges::find(config_.alt_modifiers, code) != config_.alt_modifiers.end()) {
        return vin::Key::AltModifier;
    }
    return nullopt;
}
