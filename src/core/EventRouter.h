#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "vin/InputSource.h"
#include "Worker.h"

namespace vin {

/*! Turns raw key edges into dictation gestures.
 *
 *  Ctrl held + CapsLock pressed starts a gesture and emits `StartRecording`.
 *  Releasing CapsLock ends it with exactly one `StopRecording`, whatever the
 *  modifier is doing. Releasing the modifier never stops a recording.
 *
 *  Alt held + CapsLock pressed emits `ToggleTranslate`.
 *
 *  The key state is only touched by the router's own thread.
 */
class EventRouter
{
public:
    using language_probe_t = std::function<std::optional<std::string>()>;

    EventRouter(std::shared_ptr<InputSource> source, event_sink_t emit, language_probe_t probe = {});
    ~EventRouter();

    EventRouter(const EventRouter&) = delete;
    EventRouter& operator=(const EventRouter&) = delete;

    void start();
    void stop();

    void onEdge(const KeyEdge& edge);

    bool modifierHeld() const noexcept {
        return modifiers_held_ > 0;
    }

    bool gestureActive() const noexcept {
        return gesture_active_;
    }

private:
    void run(std::stop_token stop);
    static void track(unsigned& held, bool pressed) noexcept;

    std::shared_ptr<InputSource> source_;
    event_sink_t emit_;
    language_probe_t probe_;
    std::optional<std::jthread> thread_;

    // Physical keys held. Left and right Ctrl, or two keyboards, count separately.
    unsigned modifiers_held_{0};
    unsigned alts_held_{0};
    bool gesture_active_{false};
};

} // ns
