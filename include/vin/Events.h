#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <variant>

#include "vin/AudioBuffer.h"

/*! The in-process protocol of the dictation core.
 *
 *  Everything that crosses a thread boundary is one of the value types declared here:
 *  events flowing into the StateMachine, commands flowing to the workers and
 *  updates flowing to the presentation layer.
 */

namespace vin {

// Correlation id for long-running commands. 0 means "not correlated".
using job_id_t = uint64_t;

struct AppState {
    enum class Kind {
        LoadingInitialModel,
        Ready,
        Recording,
        Transcribing,
        Error,
        Shutdown
    };

    Kind kind{Kind::LoadingInitialModel};
    bool recoverable{};
    std::string message;

    static AppState loadingInitialModel() { return {Kind::LoadingInitialModel}; }
    static AppState ready() { return {Kind::Ready}; }
    static AppState recording() { return {Kind::Recording}; }
    static AppState transcribing() { return {Kind::Transcribing}; }
    static AppState shutdown() { return {Kind::Shutdown}; }
    static AppState error(bool recoverable, std::string message) {
        return {Kind::Error, recoverable, std::move(message)};
    }

    bool is(Kind k) const noexcept {
        return kind == k;
    }

    bool isFatal() const noexcept {
        return kind == Kind::Error && !recoverable;
    }

    bool operator==(const AppState&) const = default;
};

namespace event {

struct ModelLoaded {
    std::string name;
    job_id_t job{};
    std::string path;           // multilingual weights
    std::string english_path;   // empty if the model has no English-only variant
};

struct ModelLoadingFailed {
    std::string name;
    job_id_t job{};
    std::string reason;
    bool retryable{};
};

struct ModelDownloadProgress {
    std::string name;
    int percent{};
};

struct StartRecording {};
struct StopRecording {};

struct AudioCaptured {
    AudioBuffer buffer;
};

struct RecordingStoppedByDevice {
    std::string reason;
};

struct RecordingNeverStarted {
    std::string reason;
};

struct TranscriptionFinished {
    job_id_t job{};
    std::string text;
};

struct TranscriptionFailed {
    job_id_t job{};
    std::string reason;
};

struct ChangeModel {
    std::string name;
};

struct LoadModel {
    std::string name;
    bool force_download{};
};

struct LanguageDetected {
    std::string code;
};

struct ToggleTranslate {};

struct SetTranslate {
    bool enabled{};
};

struct WorkerFailed {
    std::string worker;
    std::string reason;
};

struct Shutdown {};

} // event ns

using AppEvent = std::variant<
    event::ModelLoaded,
    event::ModelLoadingFailed,
    event::ModelDownloadProgress,
    event::StartRecording,
    event::StopRecording,
    event::AudioCaptured,
    event::RecordingStoppedByDevice,
    event::RecordingNeverStarted,
    event::TranscriptionFinished,
    event::TranscriptionFailed,
    event::ChangeModel,
    event::LoadModel,
    event::LanguageDetected,
    event::ToggleTranslate,
    event::SetTranslate,
    event::WorkerFailed,
    event::Shutdown>;

namespace audio_cmd {
struct Start {};
struct Stop {};
struct Shutdown {};
} // audio_cmd ns

using AudioCommand = std::variant<audio_cmd::Start, audio_cmd::Stop, audio_cmd::Shutdown>;

namespace model_cmd {

// Make sure the model is available locally. Downloads missing artifacts.
struct Load {
    std::string name;
    job_id_t job{};
};

// Fetch the model's artifacts again, even if they exist.
struct Download {
    std::string name;
    job_id_t job{};
};

struct Shutdown {};
} // model_cmd ns

using ModelCommand = std::variant<model_cmd::Load, model_cmd::Download, model_cmd::Shutdown>;

namespace transcription_cmd {

// Hint that a Process for this model will follow soon.
struct Prepare {
    std::string model_path;
};

struct Process {
    job_id_t job{};
    AudioBuffer buffer;
    std::string language;
    std::string model;
    std::string model_path;
    bool translate{};
};

struct Shutdown {};
} // transcription_cmd ns

using TranscriptionCommand = std::variant<transcription_cmd::Prepare,
                                          transcription_cmd::Process,
                                          transcription_cmd::Shutdown>;

namespace ui {

struct StateChanged {
    AppState state;
};

struct TranscriptionResult {
    std::string text;
};

struct ErrorMessage {
    std::string text;
};

struct ProgressUpdate {
    std::string model;
    int percent{};
};

struct TranslateModeChanged {
    bool enabled{};
};

} // ui ns

using UIUpdate = std::variant<ui::StateChanged,
                              ui::TranscriptionResult,
                              ui::ErrorMessage,
                              ui::ProgressUpdate,
                              ui::TranslateModeChanged>;

std::ostream& operator << (std::ostream& os, AppState::Kind kind);
std::ostream& operator << (std::ostream& os, const AppState& state);
std::ostream& operator << (std::ostream& os, const AppEvent& event);
std::ostream& operator << (std::ostream& os, const AudioCommand& cmd);
std::ostream& operator << (std::ostream& os, const ModelCommand& cmd);
std::ostream& operator << (std::ostream& os, const TranscriptionCommand& cmd);
std::ostream& operator << (std::ostream& os, const UIUpdate& update);

} // ns
