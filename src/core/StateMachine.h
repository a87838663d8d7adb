#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "vin/Events.h"
#include "Channel.h"
#include "Worker.h"

namespace vin {

/*! The orchestrator of the dictation pipeline.
 *
 *  Owns the application state. Events are submitted from any thread and processed
 *  one at a time, in arrival order, on the state machine's own thread. `Shutdown`
 *  is processed ahead of queued events.
 *
 *  The StateMachine talks to the workers only by sending commands, and to the
 *  presentation layer only through the UI update channel.
 */
class StateMachine
{
public:
    using Clock = std::chrono::steady_clock;
    using now_fn_t = std::function<Clock::time_point()>;

    struct Config {
        std::string initial_model{"small"};
        bool redownload{false};
        std::string language;       // empty means unknown
        bool translate{false};
        std::chrono::milliseconds model_load_timeout{std::chrono::minutes{30}};
        std::chrono::milliseconds capture_handover_timeout{std::chrono::seconds{5}};
        std::chrono::milliseconds transcription_timeout{std::chrono::seconds{30}};

        // How often deadlines are checked when no events arrive
        std::chrono::milliseconds tick{std::chrono::milliseconds{100}};
    };

    struct Ports {
        WorkerPort<AudioCommand> audio;
        WorkerPort<ModelCommand> model;
        WorkerPort<TranscriptionCommand> transcription;
        std::shared_ptr<Channel<UIUpdate>> ui;
    };

    StateMachine(Config config, Ports ports, now_fn_t now = {});
    ~StateMachine();

    StateMachine(const StateMachine&) = delete;
    StateMachine& operator=(const StateMachine&) = delete;

    // Thread safe
    void submit(AppEvent&& event);

    // Sends the initial model load. Called once, before the first event is processed.
    void begin();

    // Calls begin() and processes events on a new thread until Shutdown
    void start();

    void join();

    /*! Processes at most one event, waiting up to `wait` for it, then checks deadlines.
     *
     *  @return False once the machine has shut down.
     */
    bool processNext(std::chrono::milliseconds wait = std::chrono::milliseconds{0});

    // Synthesizes failures for commands whose deadline has passed
    void checkDeadlines();

    // The accessors below are for the owning thread, and for tests that drive the
    // machine with processNext().
    const AppState& state() const noexcept {
        return state_;
    }

    const std::string& modelName() const noexcept {
        return model_name_;
    }

    const std::string& language() const noexcept {
        return language_;
    }

    bool translate() const noexcept {
        return translate_;
    }

    bool hasDeferredStart() const noexcept {
        return deferred_start_;
    }

    // Model file to use for the current language and translate mode
    const std::string& activeModelPath() const noexcept;

private:
    struct Deadline {
        job_id_t job{};
        Clock::time_point at;
    };

    void run();
    void dispatch(AppEvent&& event);

    void on(event::ModelLoaded& e);
    void on(event::ModelLoadingFailed& e);
    void on(event::ModelDownloadProgress& e);
    void on(event::StartRecording& e);
    void on(event::StopRecording& e);
    void on(event::AudioCaptured& e);
    void on(event::RecordingStoppedByDevice& e);
    void on(event::RecordingNeverStarted& e);
    void on(event::TranscriptionFinished& e);
    void on(event::TranscriptionFailed& e);
    void on(event::ChangeModel& e);
    void on(event::LoadModel& e);
    void on(event::LanguageDetected& e);
    void on(event::ToggleTranslate& e);
    void on(event::SetTranslate& e);
    void on(event::WorkerFailed& e);
    void on(event::Shutdown& e);

    void setState(AppState state);
    void returnToReady();
    void requestModel(const std::string& name, bool forceDownload);
    void startTranscription(AudioBuffer&& buffer);
    void transcriptionFailed(const std::string& reason);
    void recordingAborted(const std::string& reason);
    void clearPendingWork();
    void setTranslate(bool enabled);
    void shutdown();

    void emitUi(UIUpdate&& update);
    void sendAudio(AudioCommand&& cmd, Priority priority = Priority::Normal);
    void sendModel(ModelCommand&& cmd, Priority priority = Priority::Normal);
    void sendTranscription(TranscriptionCommand&& cmd, Priority priority = Priority::Normal);

    Clock::time_point now() const;
    job_id_t nextJob() noexcept {
        return ++last_job_;
    }

    const Config config_;
    Ports ports_;
    now_fn_t now_;
    Channel<AppEvent> events_{"events"};
    std::optional<std::jthread> thread_;

    AppState state_{AppState::loadingInitialModel()};
    bool begun_{false};
    bool shut_down_{false};

    std::string model_name_;
    std::string model_path_;
    std::string english_model_path_;
    std::string requested_model_;
    std::string language_;
    bool translate_{false};

    job_id_t last_job_{};
    std::optional<Deadline> load_deadline_;
    std::optional<Deadline> capture_deadline_;
    std::optional<Deadline> process_deadline_;
    bool deferred_start_{false};
};

} // ns
