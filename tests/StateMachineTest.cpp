#include <gtest/gtest.h>

#include "StateMachine.h"
#include "Fakes.h"

using namespace std;
using namespace vin;
using namespace vin::test;

using Kind = AppState::Kind;

namespace {

constexpr auto model_path = "/models/ggml-small.bin";
constexpr auto english_model_path = "/models/ggml-small.en.bin";

AudioBuffer oneSecond() {
    return AudioBuffer{vector<float>(16000, 0.1f), 16000, 1};
}

template <typename T, typename ChT>
vector<T> drain(ChT& ch) {
    vector<T> items;
    T item;
    while (ch.tryPop(item)) {
        items.push_back(std::move(item));
    }
    return items;
}

class StateMachineTest : public ::testing::Test {
protected:
    void SetUp() override {
        create({});
    }

    void create(StateMachine::Config config) {
        ports_ = {
            .audio = WorkerPort<AudioCommand>::create("audio"),
            .model = WorkerPort<ModelCommand>::create("model"),
            .transcription = WorkerPort<TranscriptionCommand>::create("transcription"),
            .ui = make_shared<Channel<UIUpdate>>("ui")
        };
        sm_ = make_unique<StateMachine>(std::move(config), ports_, clock_.fn());
        sm_->begin();
    }

    // Submits the event and processes everything that is queued
    void send(AppEvent&& event) {
        sm_->submit(std::move(event));
        processAll();
    }

    // Extra rounds pick up events the machine queues for itself, like a replayed start
    void processAll() {
        for (int i = 0; i < 4 && sm_->processNext(); ++i)
            ;
    }

    void advance(chrono::milliseconds d) {
        clock_.advance(d);
        sm_->checkDeadlines();
    }

    vector<AudioCommand> audioCommands() {
        return drain<AudioCommand>(*ports_.audio.commands);
    }

    vector<ModelCommand> modelCommands() {
        return drain<ModelCommand>(*ports_.model.commands);
    }

    vector<TranscriptionCommand> transcriptionCommands() {
        return drain<TranscriptionCommand>(*ports_.transcription.commands);
    }

    vector<UIUpdate> uiUpdates() {
        return drain<UIUpdate>(*ports_.ui);
    }

    template <typename T>
    static vector<T> only(vector<UIUpdate> updates) {
        vector<T> matching;
        for (auto& u : updates) {
            if (auto *p = get_if<T>(&u)) {
                matching.push_back(std::move(*p));
            }
        }
        return matching;
    }

    // Answers the initial Load and ends up in Ready
    void loadInitialModel() {
        const auto cmds = modelCommands();
        ASSERT_EQ(cmds.size(), 1u);
        ASSERT_TRUE(holds_alternative<model_cmd::Load>(cmds[0]));
        const auto& load = get<model_cmd::Load>(cmds[0]);
        send(event::ModelLoaded{load.name, load.job, model_path, english_model_path});
        ASSERT_EQ(sm_->state().kind, Kind::Ready);
        uiUpdates();
    }

    // From Ready to Transcribing with a Process command sent. Returns the job id.
    job_id_t recordAndStop() {
        send(event::StartRecording{});
        EXPECT_EQ(sm_->state().kind, Kind::Recording);
        send(event::StopRecording{});
        EXPECT_EQ(sm_->state().kind, Kind::Transcribing);
        send(event::AudioCaptured{oneSecond()});

        job_id_t job{};
        for (auto& cmd : transcriptionCommands()) {
            if (const auto *p = get_if<transcription_cmd::Process>(&cmd)) {
                job = p->job;
            }
        }
        audioCommands();
        uiUpdates();
        return job;
    }

    ManualClock clock_;
    StateMachine::Ports ports_;
    unique_ptr<StateMachine> sm_;
};

} // anon ns

TEST_F(StateMachineTest, StartsByLoadingTheInitialModel) {
    EXPECT_EQ(sm_->state().kind, Kind::LoadingInitialModel);

    const auto cmds = modelCommands();
    ASSERT_EQ(cmds.size(), 1u);
    ASSERT_TRUE(holds_alternative<model_cmd::Load>(cmds[0]));
    EXPECT_EQ(get<model_cmd::Load>(cmds[0]).name, "small");

    const auto updates = uiUpdates();
    const auto states = only<ui::StateChanged>(updates);
    ASSERT_EQ(states.size(), 1u);
    EXPECT_EQ(states[0].state.kind, Kind::LoadingInitialModel);
    EXPECT_EQ(only<ui::TranslateModeChanged>(updates).size(), 1u);
}

TEST_F(StateMachineTest, RedownloadSendsDownload) {
    create({.initial_model = "medium", .redownload = true});

    const auto cmds = modelCommands();
    ASSERT_EQ(cmds.size(), 1u);
    ASSERT_TRUE(holds_alternative<model_cmd::Download>(cmds[0]));
    EXPECT_EQ(get<model_cmd::Download>(cmds[0]).name, "medium");
}

TEST_F(StateMachineTest, ModelLoadedMovesToReady) {
    loadInitialModel();
    EXPECT_EQ(sm_->modelName(), "small");
    EXPECT_EQ(sm_->activeModelPath(), model_path);
}

TEST_F(StateMachineTest, ModelLoadingFailureIsRecoverable) {
    const auto cmds = modelCommands();
    ASSERT_EQ(cmds.size(), 1u);
    const auto job = get<model_cmd::Load>(cmds[0]).job;
    uiUpdates();

    send(event::ModelLoadingFailed{"small", job, "network down", true});

    EXPECT_EQ(sm_->state().kind, Kind::Error);
    EXPECT_TRUE(sm_->state().recoverable);
    EXPECT_EQ(only<ui::ErrorMessage>(uiUpdates()).size(), 1u);
}

TEST_F(StateMachineTest, LoadModelRetriesFromRecoverableError) {
    const auto job = get<model_cmd::Load>(modelCommands().at(0)).job;
    send(event::ModelLoadingFailed{"small", job, "network down", true});

    send(event::LoadModel{});
    EXPECT_EQ(sm_->state().kind, Kind::LoadingInitialModel);

    auto cmds = modelCommands();
    ASSERT_EQ(cmds.size(), 1u);
    ASSERT_TRUE(holds_alternative<model_cmd::Load>(cmds[0]));
    const auto& retry = get<model_cmd::Load>(cmds[0]);
    EXPECT_EQ(retry.name, "small");
    EXPECT_NE(retry.job, job);

    // The answer to the first attempt is stale
    send(event::ModelLoaded{"small", job, model_path, {}});
    EXPECT_EQ(sm_->state().kind, Kind::LoadingInitialModel);

    send(event::ModelLoaded{"small", retry.job, model_path, {}});
    EXPECT_EQ(sm_->state().kind, Kind::Ready);
}

TEST_F(StateMachineTest, LoadModelWithForceDownloadSendsDownload) {
    const auto job = get<model_cmd::Load>(modelCommands().at(0)).job;
    send(event::ModelLoadingFailed{"small", job, "corrupt file", false});

    send(event::LoadModel{"medium", true});

    const auto cmds = modelCommands();
    ASSERT_EQ(cmds.size(), 1u);
    ASSERT_TRUE(holds_alternative<model_cmd::Download>(cmds[0]));
    EXPECT_EQ(get<model_cmd::Download>(cmds[0]).name, "medium");
}

TEST_F(StateMachineTest, LoadModelIsIgnoredOutsideError) {
    loadInitialModel();
    send(event::LoadModel{"medium", false});

    EXPECT_EQ(sm_->state().kind, Kind::Ready);
    EXPECT_TRUE(modelCommands().empty());
}

TEST_F(StateMachineTest, ProgressIsForwardedWhileLoading) {
    uiUpdates();
    send(event::ModelDownloadProgress{"small", 42});

    const auto progress = only<ui::ProgressUpdate>(uiUpdates());
    ASSERT_EQ(progress.size(), 1u);
    EXPECT_EQ(progress[0].percent, 42);
}

TEST_F(StateMachineTest, StartRecordingStartsCaptureAndPreparesTheModel) {
    loadInitialModel();
    send(event::StartRecording{});

    EXPECT_EQ(sm_->state().kind, Kind::Recording);

    const auto audio = audioCommands();
    ASSERT_EQ(audio.size(), 1u);
    EXPECT_TRUE(holds_alternative<audio_cmd::Start>(audio[0]));

    const auto transcription = transcriptionCommands();
    ASSERT_EQ(transcription.size(), 1u);
    ASSERT_TRUE(holds_alternative<transcription_cmd::Prepare>(transcription[0]));
    EXPECT_EQ(get<transcription_cmd::Prepare>(transcription[0]).model_path, model_path);
}

TEST_F(StateMachineTest, EnglishUsesTheEnglishModelUnlessTranslating) {
    create({.language = "en_US"});
    loadInitialModel();
    EXPECT_EQ(sm_->language(), "en");
    EXPECT_EQ(sm_->activeModelPath(), english_model_path);

    send(event::ToggleTranslate{});
    EXPECT_TRUE(sm_->translate());
    EXPECT_EQ(sm_->activeModelPath(), model_path);
}

TEST_F(StateMachineTest, DictationRoundTrip) {
    loadInitialModel();

    send(event::StartRecording{});
    send(event::StopRecording{});
    EXPECT_EQ(sm_->state().kind, Kind::Transcribing);

    auto audio = audioCommands();
    ASSERT_EQ(audio.size(), 2u);
    EXPECT_TRUE(holds_alternative<audio_cmd::Start>(audio[0]));
    EXPECT_TRUE(holds_alternative<audio_cmd::Stop>(audio[1]));

    send(event::AudioCaptured{oneSecond()});

    auto cmds = transcriptionCommands();
    ASSERT_EQ(cmds.size(), 2u);
    ASSERT_TRUE(holds_alternative<transcription_cmd::Process>(cmds[1]));
    const auto& process = get<transcription_cmd::Process>(cmds[1]);
    EXPECT_EQ(process.buffer.samples.size(), 16000u);
    EXPECT_EQ(process.model, "small");
    EXPECT_EQ(process.model_path, model_path);
    EXPECT_FALSE(process.translate);

    uiUpdates();
    send(event::TranscriptionFinished{process.job, "hello world"});

    EXPECT_EQ(sm_->state().kind, Kind::Ready);
    const auto updates = uiUpdates();
    const auto results = only<ui::TranscriptionResult>(updates);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].text, "hello world");
    const auto states = only<ui::StateChanged>(updates);
    ASSERT_EQ(states.size(), 1u);
    EXPECT_EQ(states[0].state.kind, Kind::Ready);
}

TEST_F(StateMachineTest, StrayStopInReadyIsIgnored) {
    loadInitialModel();
    send(event::StopRecording{});

    EXPECT_EQ(sm_->state().kind, Kind::Ready);
    EXPECT_TRUE(audioCommands().empty());
    EXPECT_TRUE(uiUpdates().empty());
}

TEST_F(StateMachineTest, DuplicateStartIsIgnored) {
    loadInitialModel();
    send(event::StartRecording{});
    send(event::StartRecording{});

    EXPECT_EQ(sm_->state().kind, Kind::Recording);
    EXPECT_EQ(audioCommands().size(), 1u);
}

TEST_F(StateMachineTest, StartWhileTranscribingIsReplayedWhenReady) {
    loadInitialModel();
    const auto job = recordAndStop();

    send(event::StartRecording{});
    EXPECT_EQ(sm_->state().kind, Kind::Transcribing);
    EXPECT_TRUE(sm_->hasDeferredStart());
    EXPECT_TRUE(audioCommands().empty());

    send(event::TranscriptionFinished{job, "first"});

    // The replayed start is processed after the result
    EXPECT_EQ(sm_->state().kind, Kind::Recording);
    EXPECT_FALSE(sm_->hasDeferredStart());
    const auto audio = audioCommands();
    ASSERT_EQ(audio.size(), 1u);
    EXPECT_TRUE(holds_alternative<audio_cmd::Start>(audio[0]));
}

TEST_F(StateMachineTest, StopCancelsTheDeferredStart) {
    loadInitialModel();
    const auto job = recordAndStop();

    send(event::StartRecording{});
    send(event::StopRecording{});
    EXPECT_FALSE(sm_->hasDeferredStart());

    send(event::TranscriptionFinished{job, "text"});
    EXPECT_EQ(sm_->state().kind, Kind::Ready);
    EXPECT_TRUE(audioCommands().empty());
}

TEST_F(StateMachineTest, TranscriptionFailureIsRecoverable) {
    loadInitialModel();
    const auto job = recordAndStop();
    send(event::StartRecording{});

    send(event::TranscriptionFailed{job, "engine failure"});

    EXPECT_EQ(sm_->state().kind, Kind::Error);
    EXPECT_TRUE(sm_->state().recoverable);
    EXPECT_FALSE(sm_->hasDeferredStart());
    const auto errors = only<ui::ErrorMessage>(uiUpdates());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].text, "engine failure");
}

TEST_F(StateMachineTest, LateResultsAreIgnored) {
    loadInitialModel();
    const auto job = recordAndStop();

    send(event::TranscriptionFinished{job + 100, "stale"});
    send(event::TranscriptionFailed{job + 100, "stale"});

    EXPECT_EQ(sm_->state().kind, Kind::Transcribing);
    EXPECT_TRUE(only<ui::TranscriptionResult>(uiUpdates()).empty());

    send(event::TranscriptionFinished{job, "fresh"});
    EXPECT_EQ(sm_->state().kind, Kind::Ready);

    // A duplicate of the answer is late too
    send(event::TranscriptionFinished{job, "fresh"});
    EXPECT_EQ(sm_->state().kind, Kind::Ready);
    EXPECT_EQ(only<ui::TranscriptionResult>(uiUpdates()).size(), 1u);
}

TEST_F(StateMachineTest, TranscriptionTimesOut) {
    loadInitialModel();
    const auto job = recordAndStop();

    advance(29s);
    EXPECT_EQ(sm_->state().kind, Kind::Transcribing);

    advance(2s);
    EXPECT_EQ(sm_->state().kind, Kind::Error);
    EXPECT_TRUE(sm_->state().recoverable);
    EXPECT_EQ(sm_->state().message, "timeout");

    job_id_t abandoned{};
    ASSERT_TRUE(ports_.transcription.abandoned->tryPop(abandoned));
    EXPECT_EQ(abandoned, job);

    // The real answer arrives too late
    send(event::TranscriptionFinished{job, "too late"});
    EXPECT_EQ(sm_->state().kind, Kind::Error);
}

TEST_F(StateMachineTest, CaptureHandoverTimesOut) {
    loadInitialModel();
    send(event::StartRecording{});
    send(event::StopRecording{});

    advance(6s);

    EXPECT_EQ(sm_->state().kind, Kind::Error);
    EXPECT_EQ(sm_->state().message, "audio capture did not finish");
}

TEST_F(StateMachineTest, ModelLoadTimesOut) {
    const auto job = get<model_cmd::Load>(modelCommands().at(0)).job;

    advance(31min);

    EXPECT_EQ(sm_->state().kind, Kind::Error);
    EXPECT_TRUE(sm_->state().recoverable);

    job_id_t abandoned{};
    ASSERT_TRUE(ports_.model.abandoned->tryPop(abandoned));
    EXPECT_EQ(abandoned, job);
}

TEST_F(StateMachineTest, LostDeviceWhileRecordingReturnsToReady) {
    loadInitialModel();
    send(event::StartRecording{});
    send(event::RecordingStoppedByDevice{"unplugged"});

    EXPECT_EQ(sm_->state().kind, Kind::Ready);
    EXPECT_EQ(only<ui::ErrorMessage>(uiUpdates()).size(), 1u);
}

TEST_F(StateMachineTest, RecordingThatNeverStartedReturnsToReady) {
    loadInitialModel();
    send(event::StartRecording{});
    send(event::RecordingNeverStarted{"no microphone"});

    EXPECT_EQ(sm_->state().kind, Kind::Ready);
    const auto errors = only<ui::ErrorMessage>(uiUpdates());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].text.find("no microphone"), string::npos);
}

TEST_F(StateMachineTest, EmptyCaptureReturnsToReady) {
    loadInitialModel();
    send(event::StartRecording{});
    send(event::StopRecording{});
    send(event::AudioCaptured{});

    EXPECT_EQ(sm_->state().kind, Kind::Ready);
    const auto errors = only<ui::ErrorMessage>(uiUpdates());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].text, "No audio was captured");

    for (const auto& cmd : transcriptionCommands()) {
        EXPECT_FALSE(holds_alternative<transcription_cmd::Process>(cmd));
    }
}

TEST_F(StateMachineTest, MaximumLengthCaptureStartsTranscription) {
    loadInitialModel();
    send(event::StartRecording{});
    send(event::AudioCaptured{oneSecond()});

    EXPECT_EQ(sm_->state().kind, Kind::Transcribing);
    const auto cmds = transcriptionCommands();
    ASSERT_FALSE(cmds.empty());
    EXPECT_TRUE(holds_alternative<transcription_cmd::Process>(cmds.back()));

    // The user lets go of the keys afterwards
    send(event::StopRecording{});
    EXPECT_EQ(sm_->state().kind, Kind::Transcribing);
    for (const auto& cmd : audioCommands()) {
        EXPECT_FALSE(holds_alternative<audio_cmd::Stop>(cmd));
    }
}

TEST_F(StateMachineTest, ChangeModelOnlyInReady) {
    loadInitialModel();
    send(event::StartRecording{});
    send(event::ChangeModel{"medium"});
    EXPECT_TRUE(modelCommands().empty());

    send(event::RecordingStoppedByDevice{"gone"});
    send(event::ChangeModel{"medium"});

    EXPECT_EQ(sm_->state().kind, Kind::LoadingInitialModel);
    const auto cmds = modelCommands();
    ASSERT_EQ(cmds.size(), 1u);
    EXPECT_EQ(get<model_cmd::Load>(cmds[0]).name, "medium");
}

TEST_F(StateMachineTest, StartInErrorReportsNotReady) {
    const auto job = get<model_cmd::Load>(modelCommands().at(0)).job;
    send(event::ModelLoadingFailed{"small", job, "offline", true});
    uiUpdates();

    send(event::StartRecording{});

    EXPECT_EQ(sm_->state().kind, Kind::Error);
    EXPECT_TRUE(audioCommands().empty());
    const auto errors = only<ui::ErrorMessage>(uiUpdates());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].text, "not ready");
}

TEST_F(StateMachineTest, WorkerFailureIsFatal) {
    loadInitialModel();
    send(event::WorkerFailed{"AudioWorker", "boom"});

    EXPECT_TRUE(sm_->state().isFatal());

    send(event::StartRecording{});
    send(event::LoadModel{});
    EXPECT_TRUE(sm_->state().isFatal());
    EXPECT_TRUE(audioCommands().empty());
    EXPECT_TRUE(modelCommands().empty());

    send(event::Shutdown{});
    EXPECT_EQ(sm_->state().kind, Kind::Shutdown);
}

TEST_F(StateMachineTest, TranslateModeChanges) {
    loadInitialModel();

    send(event::ToggleTranslate{});
    send(event::SetTranslate{true});
    send(event::SetTranslate{false});

    const auto changes = only<ui::TranslateModeChanged>(uiUpdates());
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_TRUE(changes[0].enabled);
    EXPECT_FALSE(changes[1].enabled);
    EXPECT_EQ(sm_->state().kind, Kind::Ready);
}

TEST_F(StateMachineTest, LanguageIsStoredWithoutChangingState) {
    loadInitialModel();
    send(event::LanguageDetected{"nb_NO"});
    EXPECT_EQ(sm_->language(), "nb");

    send(event::LanguageDetected{"?"});
    EXPECT_EQ(sm_->language(), "nb");
    EXPECT_EQ(sm_->state().kind, Kind::Ready);

    send(event::StartRecording{});
    send(event::StopRecording{});
    send(event::AudioCaptured{oneSecond()});
    const auto cmds = transcriptionCommands();
    ASSERT_FALSE(cmds.empty());
    EXPECT_EQ(get<transcription_cmd::Process>(cmds.back()).language, "nb");
}

TEST_F(StateMachineTest, ShutdownStopsEveryWorkerOnce) {
    loadInitialModel();
    send(event::StartRecording{});
    audioCommands();
    transcriptionCommands();

    send(event::Shutdown{});
    EXPECT_EQ(sm_->state().kind, Kind::Shutdown);
    EXPECT_FALSE(sm_->processNext());

    // A second Shutdown is not even accepted
    sm_->submit(event::Shutdown{});
    EXPECT_FALSE(sm_->processNext());

    const auto audio = audioCommands();
    ASSERT_EQ(audio.size(), 1u);
    EXPECT_TRUE(holds_alternative<audio_cmd::Shutdown>(audio[0]));

    const auto model = modelCommands();
    ASSERT_EQ(model.size(), 1u);
    EXPECT_TRUE(holds_alternative<model_cmd::Shutdown>(model[0]));

    const auto transcription = transcriptionCommands();
    ASSERT_EQ(transcription.size(), 1u);
    EXPECT_TRUE(holds_alternative<transcription_cmd::Shutdown>(transcription[0]));

    const auto states = only<ui::StateChanged>(uiUpdates());
    ASSERT_FALSE(states.empty());
    EXPECT_EQ(states.back().state.kind, Kind::Shutdown);
    EXPECT_TRUE(ports_.ui->closed());
}

TEST_F(StateMachineTest, ShutdownGoesAheadOfQueuedEvents) {
    loadInitialModel();

    sm_->submit(event::StartRecording{});
    sm_->submit(event::StopRecording{});
    sm_->submit(event::Shutdown{});

    EXPECT_FALSE(sm_->processNext());
    EXPECT_EQ(sm_->state().kind, Kind::Shutdown);

    const auto audio = audioCommands();
    ASSERT_EQ(audio.size(), 1u);
    EXPECT_TRUE(holds_alternative<audio_cmd::Shutdown>(audio[0]));
}

TEST_F(StateMachineTest, RunsOnItsOwnThread) {
    StateMachine::Config config;
    config.tick = 5ms;
    create(config);
    modelCommands();

    sm_->start();
    sm_->submit(event::ModelLoaded{"small", 0, model_path, {}});
    sm_->submit(event::Shutdown{});
    sm_->join();

    const auto states = only<ui::StateChanged>(uiUpdates());
    ASSERT_FALSE(states.empty());
    EXPECT_EQ(states.back().state.kind, Kind::Shutdown);
}
