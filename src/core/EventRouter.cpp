
#include <cassert>
#include <format>

#include "EventRouter.h"
#include "logging.h"

using namespace std;

namespace logfault {
std::pair<bool /* json */, std::string /* content or json */> toLog(const vin::EventRouter& r, bool json) {
    if (json) {
        return make_pair(true, format(R"("component":"EventRouter", "gesture":{})", r.gestureActive()));
    }

    return make_pair(false, format("EventRouter{{gesture={}}}", r.gestureActive()));
}
} // logfault ns

namespace vin {

EventRouter::EventRouter(std::shared_ptr<InputSource> source, event_sink_t emit, language_probe_t probe)
    : source_{std::move(source)}, emit_{std::move(emit)}, probe_{std::move(probe)}
{
    assert(emit_);
}

EventRouter::~EventRouter()
{
    stop();
}

void EventRouter::start()
{
    assert(source_);
    assert(!thread_);
    thread_.emplace([this](std::stop_token st) { run(st); });
}

void EventRouter::stop()
{
    if (thread_ && thread_->joinable()) {
        thread_->request_stop();
        thread_->join();
    }
}

void EventRouter::onEdge(const KeyEdge &edge)
{
    if (edge.repeat) {
        return;
    }

    LOG_TRACE_EX(*this) << "Edge: " << edge;

    switch(edge.key) {
    case Key::Modifier:
        track(modifiers_held_, edge.pressed);
        return;
    case Key::AltModifier:
        track(alts_held_, edge.pressed);
        return;
    case Key::Trigger:
        break;
    }

    if (edge.pressed) {
        if (gesture_active_) {
            LOG_TRACE_EX(*this) << "Trigger pressed during an active gesture.";
            return;
        }

        if (modifierHeld()) {
            if (probe_) {
                if (auto lang = probe_(); lang && !lang->empty()) {
                    emit_(event::LanguageDetected{std::move(*lang)});
                }
            }

            LOG_DEBUG_EX(*this) << "Gesture started.";
            gesture_active_ = true;
            emit_(event::StartRecording{});
            return;
        }

        if (alts_held_ > 0) {
            LOG_DEBUG_EX(*this) << "Translate toggled.";
            emit_(event::ToggleTranslate{});
        }
        return;
    }

    if (gesture_active_) {
        LOG_DEBUG_EX(*this) << "Gesture ended.";
        gesture_active_ = false;
        emit_(event::StopRecording{});
    }
}

void EventRouter::track(unsigned &held, bool pressed) noexcept
{
    if (pressed) {
        ++held;
    } else if (held > 0) {
        // A key that was down before we started has no press to match
        --held;
    }
}

void EventRouter::run(std::stop_token stop)
{
    LOG_DEBUG_EX(*this) << "Router thread started.";
    try {
        while (!stop.stop_requested()) {
            if (const auto edge = source_->next(chrono::milliseconds{100})) {
                onEdge(*edge);
            }
        }
    } catch (const exception& ex) {
        LOG_ERROR_EX(*this) << "Caught exception while reading input: " << ex.what();
        emit_(event::WorkerFailed{"EventRouter", ex.what()});
    }
    LOG_DEBUG_EX(*this) << "Router thread done.";
}

} // ns
