
#include <cassert>

#include "Pipeline.h"
#include "logging.h"

using namespace std;

namespace vin {

Pipeline::Pipeline(Config config, Collaborators collaborators, StateMachine::now_fn_t now)
{
    assert(collaborators.capture);
    assert(collaborators.engine);
    assert(collaborators.store);
    assert(collaborators.presentation);

    ui_ = make_shared<Channel<UIUpdate>>("ui", config.ui_capacity, [](const UIUpdate& u) {
        return holds_alternative<ui::ProgressUpdate>(u);
    });

    StateMachine::Ports ports{
        .audio = WorkerPort<AudioCommand>::create("audio", config.command_capacity),
        .model = WorkerPort<ModelCommand>::create("model", config.command_capacity),
        .transcription = WorkerPort<TranscriptionCommand>::create("transcription", config.command_capacity),
        .ui = ui_
    };

    sm_ = make_unique<StateMachine>(config.state_machine, ports, std::move(now));

    auto emit = [sm = sm_.get()](AppEvent&& event) {
        sm->submit(std::move(event));
    };

    audio_ = make_unique<AudioWorker>(config.audio, ports.audio, emit, std::move(collaborators.capture));
    model_ = make_unique<ModelWorker>(config.model, ports.model, emit, std::move(collaborators.store));
    transcription_ = make_unique<TranscriptionWorker>(config.transcription, ports.transcription, emit,
                                                      std::move(collaborators.engine));
    pump_ = make_unique<UiUpdatePump>(ui_, std::move(collaborators.presentation));

    if (collaborators.input) {
        router_ = make_unique<EventRouter>(std::move(collaborators.input), emit,
                                           std::move(collaborators.language_probe));
    }
}

Pipeline::~Pipeline()
{
    if (started_) {
        shutdown();
        wait();
    }
}

void Pipeline::start()
{
    assert(!started_);
    started_ = true;

    LOG_DEBUG_N << "Starting the pipeline.";
    pump_->start();
    audio_->start();
    model_->start();
    transcription_->start();
    sm_->start();
    if (router_) {
        router_->start();
    }
}

void Pipeline::submit(AppEvent &&event)
{
    sm_->submit(std::move(event));
}

void Pipeline::shutdown()
{
    sm_->submit(event::Shutdown{});
}

void Pipeline::reloadModel(bool forceDownload)
{
    LOG_INFO_N << "Reloading the model" << (forceDownload ? " from the network." : ".");
    sm_->submit(event::LoadModel{{}, forceDownload});
}

void Pipeline::selectModel(const std::string &name)
{
    LOG_INFO_N << "Selecting model '" << name << "'";

    // Only one of them applies, depending on the state
    sm_->submit(event::ChangeModel{name});
    sm_->submit(event::LoadModel{name, false});
}

void Pipeline::wait()
{
    sm_->join();

    // The router has no channel to close. It is stopped from here.
    if (router_) {
        router_->stop();
    }

    audio_->join();
    model_->join();
    transcription_->join();
    pump_->join();
    LOG_DEBUG_N << "The pipeline is done.";
}

} // ns
