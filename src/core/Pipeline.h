#pragma once

#include <memory>
#include <string>

#include "vin/ArtifactStore.h"
#include "vin/CaptureDevice.h"
#include "vin/InferenceEngine.h"
#include "vin/InputSource.h"
#include "vin/PresentationSink.h"
#include "AudioWorker.h"
#include "EventRouter.h"
#include "ModelWorker.h"
#include "StateMachine.h"
#include "TranscriptionWorker.h"
#include "UiUpdatePump.h"

namespace vin {

/*! Owns the channels and threads of the dictation core, and wires them together.
 *
 *  Shutdown order: the StateMachine tells every worker to stop and closes the UI
 *  channel; wait() then joins the threads.
 */
class Pipeline
{
public:
    struct Config {
        StateMachine::Config state_machine;
        AudioWorker::Config audio;
        ModelWorker::Config model;
        TranscriptionWorker::Config transcription;
        size_t command_capacity{16};
        size_t ui_capacity{64};
    };

    struct Collaborators {
        capture_factory_t capture;
        std::shared_ptr<InferenceEngine> engine;
        std::shared_ptr<ArtifactStore> store;
        std::shared_ptr<InputSource> input;     // optional
        std::shared_ptr<PresentationSink> presentation;
        EventRouter::language_probe_t language_probe;
    };

    Pipeline(Config config, Collaborators collaborators, StateMachine::now_fn_t now = {});
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    void start();

    // Thread safe
    void submit(AppEvent&& event);

    // Thread safe. Same as submit(event::Shutdown{})
    void shutdown();

    // Thread safe. Retries the last requested model after a failure.
    void reloadModel(bool forceDownload = false);

    /*! Thread safe. Switches to another model.
     *
     *  Works from Ready, and from a recoverable error. Ignored while busy.
     */
    void selectModel(const std::string& name);

    // Waits for all the threads to finish after a shutdown
    void wait();

    EventRouter *router() noexcept {
        return router_.get();
    }

private:
    // Declared first, so it goes away last
    std::unique_ptr<StateMachine> sm_;
    std::shared_ptr<Channel<UIUpdate>> ui_;
    std::unique_ptr<AudioWorker> audio_;
    std::unique_ptr<ModelWorker> model_;
    std::unique_ptr<TranscriptionWorker> transcription_;
    std::unique_ptr<UiUpdatePump> pump_;
    std::unique_ptr<EventRouter> router_;
    bool started_{false};
};

} // ns
