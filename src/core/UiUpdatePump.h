#pragma once

#include <memory>
#include <optional>
#include <thread>

#include "vin/PresentationSink.h"
#include "Channel.h"

namespace vin {

/*! Moves UI updates from the StateMachine's channel to the presentation layer.
 *
 *  Runs on its own thread, so a slow sink never holds up the StateMachine. The
 *  thread exits when the channel is closed and drained.
 */
class UiUpdatePump
{
public:
    UiUpdatePump(std::shared_ptr<Channel<UIUpdate>> updates, std::shared_ptr<PresentationSink> sink);
    ~UiUpdatePump();

    UiUpdatePump(const UiUpdatePump&) = delete;
    UiUpdatePump& operator=(const UiUpdatePump&) = delete;

    void start();
    void join();

private:
    void run();
    void deliver(const UIUpdate& update);

    std::shared_ptr<Channel<UIUpdate>> updates_;
    std::shared_ptr<PresentationSink> sink_;
    std::optional<std::jthread> thread_;
};

} // ns
