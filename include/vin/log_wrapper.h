#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <format>
#include <functional>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

/*! Minimal log forwarding for the engine wrappers.
 *
 *  The wrappers are built without the application's logger. Their log lines go
 *  to a callback installed by the application, or to std::clog if there is none.
 */

namespace vin_log {

// Same order as logfault::LogLevel
enum class Level { NONE, ERROR, WARN, NOTICE, INFO, DEBUG, TRACE };

struct SourceLoc {
    const char* file{};
    int line{};
    const char* func{};
};

using callback_t = std::function<void(Level lvl, SourceLoc loc, std::string_view msg, std::string_view tag)>;

inline std::string_view to_name(Level l) {
    constexpr static auto names = std::to_array<std::string_view>({
        ""/* None*/, "ERROR", "WARN", "NOTICE", "INFO", "DEBUG", "TRACE"
    });

    return names.at(static_cast<size_t>(l));
}

struct Instance {
    std::mutex mutex;
    callback_t cb;
    std::string tag;
    std::atomic<Level> level{Level::INFO};
};

inline Instance& instance() {
    static Instance s;
    return s;
}

inline void setCallback(callback_t cb, std::string_view tag, Level lvl) {
    auto& i = instance();
    std::lock_guard lock{i.mutex};
    i.tag = tag;
    i.cb = std::move(cb);
    i.level = lvl;
}

inline Level level() noexcept {
    return instance().level.load(std::memory_order_relaxed);
}

class Log {
public:
    Log(Level lvl, SourceLoc loc) : lvl_(lvl), loc_(loc) {}
    ~Log() { flush(); }

    std::ostream& Line() { return ss_; }

private:
    void flush() noexcept {
        const auto msg = ss_.str();
        if (msg.empty()) return;

        auto& i = instance();
        std::lock_guard lock{i.mutex};
        if (i.cb) {
            i.cb(lvl_, loc_, msg, i.tag);
            return;
        }

        std::clog << std::format("{:%FT%T} [{}] {} {}", std::chrono::system_clock::now(), to_name(lvl_), i.tag, msg)
                  << std::endl;
    }

    Level lvl_;
    SourceLoc loc_;
    std::ostringstream ss_;
};

#ifdef _LOGFAULT_H
inline void forward_to_logfault(Level lvl, SourceLoc loc, std::string_view msg, std::string_view tag) {
    const auto lf_level = static_cast<logfault::LogLevel>(lvl);
    if (::logfault::LogManager::Instance().IsRelevant(lf_level)) {
        ::logfault::Log(lf_level, loc.file, loc.line, loc.func).Line() << '[' << tag << "] " << msg;
    }
}
#endif

} // ns

#if defined(VIN_LOG_FORWARDING) && VIN_LOG_FORWARDING

#if defined(__GNUC__) || defined(__clang__)
#define VIN_LOG_FUNC __PRETTY_FUNCTION__
#else
#define VIN_LOG_FUNC __func__
#endif

#define VIN_LOG_RELEVANT(lvl) (lvl <= vin_log::level())

#define LOG_ERROR  VIN_LOG_RELEVANT(vin_log::Level::ERROR) && vin_log::Log(vin_log::Level::ERROR, {__FILE__, __LINE__, VIN_LOG_FUNC}).Line()
#define LOG_WARN   VIN_LOG_RELEVANT(vin_log::Level::WARN) && vin_log::Log(vin_log::Level::WARN, {__FILE__, __LINE__, VIN_LOG_FUNC}).Line()
#define LOG_INFO   VIN_LOG_RELEVANT(vin_log::Level::INFO) && vin_log::Log(vin_log::Level::INFO, {__FILE__, __LINE__, VIN_LOG_FUNC}).Line()
#define LOG_DEBUG  VIN_LOG_RELEVANT(vin_log::Level::DEBUG) && vin_log::Log(vin_log::Level::DEBUG, {__FILE__, __LINE__, VIN_LOG_FUNC}).Line()
#define LOG_TRACE  VIN_LOG_RELEVANT(vin_log::Level::TRACE) && vin_log::Log(vin_log::Level::TRACE, {__FILE__, __LINE__, VIN_LOG_FUNC}).Line()

#endif // VIN_LOG_FORWARDING
