
#include <array>
#include <string_view>

#include "vin/Events.h"
#include "vin/InputSource.h"
#include "Overloaded.h"

using namespace std;

namespace vin {

std::ostream& operator << (std::ostream& os, AppState::Kind kind) {
    constexpr auto kinds = to_array<string_view>({
        "LoadingInitialModel",
        "Ready",
        "Recording",
        "Transcribing",
        "Error",
        "Shutdown"
    });

    return os << kinds.at(static_cast<size_t>(kind));
}

std::ostream& operator << (std::ostream& os, const AppState& state) {
    os << state.kind;
    if (state.is(AppState::Kind::Error)) {
        os << "{recoverable=" << (state.recoverable ? "true" : "false")
           << ", message=\"" << state.message << "\"}";
    }
    return os;
}

std::ostream& operator << (std::ostream& os, const AppEvent& event) {
    visit(overloaded{
        [&](const event::ModelLoaded& e) {
            os << "ModelLoaded{" << e.name << ", job=" << e.job << ", path=" << e.path << '}';
        },
        [&](const event::ModelLoadingFailed& e) {
            os << "ModelLoadingFailed{" << e.name << ", job=" << e.job << ", retryable="
               << e.retryable << ", reason=\"" << e.reason << "\"}";
        },
        [&](const event::ModelDownloadProgress& e) {
            os << "ModelDownloadProgress{" << e.name << ", " << e.percent << "%}";
        },
        [&](const event::StartRecording&) { os << "StartRecording"; },
        [&](const event::StopRecording&) { os << "StopRecording"; },
        [&](const event::AudioCaptured& e) {
            os << "AudioCaptured{samples=" << e.buffer.samples.size()
               << ", rate=" << e.buffer.sample_rate
               << ", channels=" << e.buffer.channels << '}';
        },
        [&](const event::RecordingStoppedByDevice& e) {
            os << "RecordingStoppedByDevice{\"" << e.reason << "\"}";
        },
        [&](const event::RecordingNeverStarted& e) {
            os << "RecordingNeverStarted{\"" << e.reason << "\"}";
        },
        [&](const event::TranscriptionFinished& e) {
            os << "TranscriptionFinished{job=" << e.job << ", chars=" << e.text.size() << '}';
        },
        [&](const event::TranscriptionFailed& e) {
            os << "TranscriptionFailed{job=" << e.job << ", reason=\"" << e.reason << "\"}";
        },
        [&](const event::ChangeModel& e) { os << "ChangeModel{" << e.name << '}'; },
        [&](const event::LoadModel& e) {
            os << "LoadModel{" << e.name << (e.force_download ? ", force" : "") << '}';
        },
        [&](const event::LanguageDetected& e) { os << "LanguageDetected{" << e.code << '}'; },
        [&](const event::ToggleTranslate&) { os << "ToggleTranslate"; },
        [&](const event::SetTranslate& e) { os << "SetTranslate{" << e.enabled << '}'; },
        [&](const event::WorkerFailed& e) {
            os << "WorkerFailed{" << e.worker << ", \"" << e.reason << "\"}";
        },
        [&](const event::Shutdown&) { os << "Shutdown"; }
    }, event);
    return os;
}

std::ostream& operator << (std::ostream& os, const AudioCommand& cmd) {
    constexpr auto names = to_array<string_view>({
        "Start",
        "Stop",
        "Shutdown"
    });

    return os << "AudioCommand::" << names.at(cmd.index());
}

std::ostream& operator << (std::ostream& os, const ModelCommand& cmd) {
    visit(overloaded{
        [&](const model_cmd::Load& c) { os << "ModelCommand::Load{" << c.name << ", job=" << c.job << '}'; },
        [&](const model_cmd::Download& c) { os << "ModelCommand::Download{" << c.name << ", job=" << c.job << '}'; },
        [&](const model_cmd::Shutdown&) { os << "ModelCommand::Shutdown"; }
    }, cmd);
    return os;
}

std::ostream& operator << (std::ostream& os, const TranscriptionCommand& cmd) {
    visit(overloaded{
        [&](const transcription_cmd::Prepare& c) {
            os << "TranscriptionCommand::Prepare{" << c.model_path << '}';
        },
        [&](const transcription_cmd::Process& c) {
            os << "TranscriptionCommand::Process{job=" << c.job
               << ", model=" << c.model
               << ", language=" << (c.language.empty() ? "auto" : c.language)
               << ", translate=" << c.translate
               << ", seconds=" << c.buffer.duration() << '}';
        },
        [&](const transcription_cmd::Shutdown&) { os << "TranscriptionCommand::Shutdown"; }
    }, cmd);
    return os;
}

std::ostream& operator << (std::ostream& os, const UIUpdate& update) {
    visit(overloaded{
        [&](const ui::StateChanged& u) { os << "StateChanged{" << u.state << '}'; },
        [&](const ui::TranscriptionResult& u) { os << "TranscriptionResult{chars=" << u.text.size() << '}'; },
        [&](const ui::ErrorMessage& u) { os << "ErrorMessage{\"" << u.text << "\"}"; },
        [&](const ui::ProgressUpdate& u) { os << "ProgressUpdate{" << u.model << ", " << u.percent << "%}"; },
        [&](const ui::TranslateModeChanged& u) { os << "TranslateModeChanged{" << u.enabled << '}'; }
    }, update);
    return os;
}

std::ostream& operator << (std::ostream& os, Key key) {
    constexpr auto keys = to_array<string_view>({
        "Modifier",
        "AltModifier",
        "Trigger"
    });

    return os << keys.at(static_cast<size_t>(key));
}

std::ostream& operator << (std::ostream& os, const KeyEdge& edge) {
    return os << edge.key << (edge.pressed ? " pressed" : " released") << (edge.repeat ? " (repeat)" : "");
}

} // ns
