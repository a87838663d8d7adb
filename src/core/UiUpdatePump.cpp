
#include <cassert>

#include "UiUpdatePump.h"
#include "logging.h"

using namespace std;

namespace vin {

UiUpdatePump::UiUpdatePump(std::shared_ptr<Channel<UIUpdate>> updates, std::shared_ptr<PresentationSink> sink)
    : updates_{std::move(updates)}, sink_{std::move(sink)}
{
    assert(updates_);
    assert(sink_);
}

UiUpdatePump::~UiUpdatePump()
{
    updates_->close();
    join();
}

void UiUpdatePump::start()
{
    assert(!thread_);
    thread_.emplace([this] { run(); });
}

void UiUpdatePump::join()
{
    if (thread_ && thread_->joinable()) {
        thread_->join();
    }
}

void UiUpdatePump::run()
{
    LOG_DEBUG_N << "UI update thread started.";

    UIUpdate update;
    while (updates_->pop(update)) {
        deliver(update);
    }

    LOG_DEBUG_N << "UI update thread done.";
}

void UiUpdatePump::deliver(const UIUpdate &update)
{
    LOG_TRACE_N << "Delivering " << update;
    try {
        sink_->render(update);
        if (const auto *result = get_if<ui::TranscriptionResult>(&update); result && !result->text.empty()) {
            sink_->insertText(result->text);
        }
    } catch (const exception& ex) {
        LOG_ERROR_N << "The presentation layer failed to handle " << update << ": " << ex.what();
    }
}

} // ns
