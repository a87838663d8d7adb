
#include <cassert>
#include <cctype>
#include <format>
#include <sstream>

#include "StateMachine.h"
#include "logging.h"

using namespace std;

namespace logfault {
std::pair<bool /* json */, std::string /* content or json */> toLog(const vin::StateMachine& sm, bool json) {
    ostringstream state;
    state << sm.state().kind;

    if (json) {
        return make_pair(true, format(R"("component":"StateMachine", "state":"{}")", state.str()));
    }

    return make_pair(false, format("StateMachine{{state={}}}", state.str()));
}
} // logfault ns

namespace vin {

using Kind = AppState::Kind;

namespace {

// "en_US", "EN", "en-GB" -> "en"
string normalizeLanguage(string_view code) {
    string lang;
    for (const auto ch : code) {
        if (!isalpha(static_cast<unsigned char>(ch)) || lang.size() == 2) {
            break;
        }
        lang.push_back(static_cast<char>(tolower(static_cast<unsigned char>(ch))));
    }

    return lang.size() == 2 ? lang : string{};
}

} // anon ns

StateMachine::StateMachine(Config config, Ports ports, now_fn_t now)
    : config_{std::move(config)}, ports_{std::move(ports)}, now_{std::move(now)}
{
    assert(ports_.audio.commands && ports_.model.commands && ports_.transcription.commands);
    assert(ports_.ui);

    language_ = normalizeLanguage(config_.language);
    translate_ = config_.translate;
}

StateMachine::~StateMachine()
{
    if (thread_ && thread_->joinable()) {
        submit(event::Shutdown{});
        thread_->join();
    }
}

void StateMachine::submit(AppEvent &&event)
{
    const auto priority = holds_alternative<event::Shutdown>(event) ? Priority::High : Priority::Normal;
    if (!events_.push(std::move(event), priority)) {
        LOG_DEBUG_N << "Event discarded. The state machine has shut down.";
    }
}

void StateMachine::begin()
{
    if (begun_) {
        return;
    }

    begun_ = true;
    LOG_INFO_EX(*this) << "Starting with model '" << config_.initial_model << "'"
                       << ", language=" << (language_.empty() ? "auto" : language_)
                       << ", translate=" << translate_;

    emitUi(ui::StateChanged{state_});
    emitUi(ui::TranslateModeChanged{translate_});
    requestModel(config_.initial_model, config_.redownload);
}

void StateMachine::start()
{
    assert(!thread_);
    thread_.emplace([this] { run(); });
}

void StateMachine::join()
{
    if (thread_ && thread_->joinable()) {
        thread_->join();
    }
}

void StateMachine::run()
{
    LOG_DEBUG_EX(*this) << "State machine thread started.";
    begin();
    while (processNext(config_.tick))
        ;
    LOG_DEBUG_EX(*this) << "State machine thread done.";
}

bool StateMachine::processNext(std::chrono::milliseconds wait)
{
    if (shut_down_) {
        return false;
    }

    AppEvent event;
    const bool have_event = wait.count() > 0 ? events_.popFor(event, wait) : events_.tryPop(event);
    if (have_event) {
        try {
            dispatch(std::move(event));
        } catch (const exception& ex) {
            LOG_ERROR_EX(*this) << "Caught exception while processing an event: " << ex.what();
            clearPendingWork();
            setState(AppState::error(false, ex.what()));
            emitUi(ui::ErrorMessage{format("Internal error: {}", ex.what())});
        }
    } else if (events_.closed()) {
        LOG_WARN_EX(*this) << "The event channel was closed without a Shutdown event.";
        shutdown();
    }

    if (!shut_down_) {
        checkDeadlines();
    }

    return !shut_down_;
}

void StateMachine::checkDeadlines()
{
    if (shut_down_) {
        return;
    }

    const auto t = now();

    if (load_deadline_ && t >= load_deadline_->at) {
        const auto job = load_deadline_->job;
        LOG_WARN_EX(*this) << "Model load job #" << job << " timed out.";
        ports_.model.abandoned->push(job_id_t{job});
        event::ModelLoadingFailed failed{requested_model_, job, "timeout", true};
        on(failed);
    }

    if (capture_deadline_ && t >= capture_deadline_->at) {
        LOG_WARN_EX(*this) << "The audio capture was not handed over in time.";
        transcriptionFailed("audio capture did not finish");
    }

    if (process_deadline_ && t >= process_deadline_->at) {
        const auto job = process_deadline_->job;
        LOG_WARN_EX(*this) << "Transcription job #" << job << " timed out.";
        ports_.transcription.abandoned->push(job_id_t{job});
        event::TranscriptionFailed failed{job, "timeout"};
        on(failed);
    }
}

const string &StateMachine::activeModelPath() const noexcept
{
    if (!translate_ && language_ == "en" && !english_model_path_.empty()) {
        return english_model_path_;
    }
    return model_path_;
}

void StateMachine::dispatch(AppEvent &&event)
{
    LOG_TRACE_EX(*this) << "Processing " << event;

    if (state_.isFatal() && !holds_alternative<event::Shutdown>(event)) {
        LOG_DEBUG_EX(*this) << "Ignoring " << event << " after a fatal error.";
        return;
    }

    visit([this](auto& e) { on(e); }, event);
}

void StateMachine::on(event::ModelLoaded &e)
{
    if (!state_.is(Kind::LoadingInitialModel) || !load_deadline_
        || (e.job && e.job != load_deadline_->job)) {
        LOG_DEBUG_EX(*this) << "Ignoring late ModelLoaded for '" << e.name << "', job #" << e.job;
        return;
    }

    load_deadline_.reset();
    model_name_ = e.name;
    model_path_ = e.path;
    english_model_path_ = e.english_path;

    LOG_INFO_EX(*this) << "Model '" << model_name_ << "' is ready: " << model_path_;
    setState(AppState::ready());
}

void StateMachine::on(event::ModelLoadingFailed &e)
{
    if (!state_.is(Kind::LoadingInitialModel) || !load_deadline_
        || (e.job && e.job != load_deadline_->job)) {
        LOG_DEBUG_EX(*this) << "Ignoring late ModelLoadingFailed for '" << e.name << "', job #" << e.job;
        return;
    }

    load_deadline_.reset();
    const auto message = format("Failed to load model {}: {}", e.name, e.reason);
    LOG_WARN_EX(*this) << message << (e.retryable ? "" : " (giving up)");
    setState(AppState::error(true, message));
    emitUi(ui::ErrorMessage{message});
}

void StateMachine::on(event::ModelDownloadProgress &e)
{
    if (state_.is(Kind::LoadingInitialModel)) {
        emitUi(ui::ProgressUpdate{e.name, e.percent});
    }
}

void StateMachine::on(event::StartRecording &)
{
    switch(state_.kind) {
    case Kind::Ready:
        setState(AppState::recording());
        sendAudio(audio_cmd::Start{});
        sendTranscription(transcription_cmd::Prepare{activeModelPath()});
        break;
    case Kind::Recording:
        LOG_DEBUG_EX(*this) << "Duplicate start, ignored.";
        break;
    case Kind::Transcribing:
        if (deferred_start_) {
            LOG_DEBUG_EX(*this) << "A start is already deferred.";
        } else {
            LOG_DEBUG_EX(*this) << "Deferring start until the transcription is done.";
            deferred_start_ = true;
        }
        break;
    case Kind::Error:
        emitUi(ui::ErrorMessage{"not ready"});
        break;
    default:
        LOG_DEBUG_EX(*this) << "Ignoring StartRecording.";
    }
}

void StateMachine::on(event::StopRecording &)
{
    switch(state_.kind) {
    case Kind::Ready:
        LOG_DEBUG_EX(*this) << "Stray stop, ignored.";
        break;
    case Kind::Recording:
        setState(AppState::transcribing());
        sendAudio(audio_cmd::Stop{});
        capture_deadline_ = Deadline{0, now() + config_.capture_handover_timeout};
        break;
    case Kind::Transcribing:
        if (deferred_start_) {
            LOG_DEBUG_EX(*this) << "Stop cancels the deferred start.";
            deferred_start_ = false;
        } else {
            LOG_DEBUG_EX(*this) << "Ignoring StopRecording while transcribing.";
        }
        break;
    default:
        LOG_DEBUG_EX(*this) << "Ignoring StopRecording.";
    }
}

void StateMachine::on(event::AudioCaptured &e)
{
    if (state_.is(Kind::Recording)) {
        // The worker stopped by itself at the maximum duration
        LOG_INFO_EX(*this) << "The recording reached its maximum length.";
        setState(AppState::transcribing());
        startTranscription(std::move(e.buffer));
        return;
    }

    if (state_.is(Kind::Transcribing) && capture_deadline_) {
        capture_deadline_.reset();
        startTranscription(std::move(e.buffer));
        return;
    }

    LOG_DEBUG_EX(*this) << "Discarding a late audio buffer with " << e.buffer.samples.size() << " samples.";
}

void StateMachine::on(event::RecordingStoppedByDevice &e)
{
    if (state_.is(Kind::Recording) || (state_.is(Kind::Transcribing) && capture_deadline_)) {
        recordingAborted(format("Recording stopped: {}", e.reason));
        return;
    }

    LOG_DEBUG_EX(*this) << "Ignoring RecordingStoppedByDevice: " << e.reason;
}

void StateMachine::on(event::RecordingNeverStarted &e)
{
    if (state_.is(Kind::Recording) || (state_.is(Kind::Transcribing) && capture_deadline_)) {
        recordingAborted(format("Could not start recording: {}", e.reason));
        return;
    }

    LOG_DEBUG_EX(*this) << "Ignoring RecordingNeverStarted: " << e.reason;
}

void StateMachine::on(event::TranscriptionFinished &e)
{
    if (!state_.is(Kind::Transcribing) || !process_deadline_
        || (e.job && e.job != process_deadline_->job)) {
        LOG_DEBUG_EX(*this) << "Ignoring late transcription result for job #" << e.job;
        return;
    }

    LOG_DEBUG_EX(*this) << "Transcription job #" << process_deadline_->job << " finished.";
    process_deadline_.reset();
    emitUi(ui::TranscriptionResult{std::move(e.text)});
    returnToReady();
}

void StateMachine::on(event::TranscriptionFailed &e)
{
    const bool current = e.job
        ? process_deadline_ && process_deadline_->job == e.job
        : process_deadline_ || capture_deadline_;

    if (!state_.is(Kind::Transcribing) || !current) {
        LOG_DEBUG_EX(*this) << "Ignoring late transcription failure for job #" << e.job
                            << ": " << e.reason;
        return;
    }

    transcriptionFailed(e.reason);
}

void StateMachine::on(event::ChangeModel &e)
{
    if (!state_.is(Kind::Ready)) {
        LOG_DEBUG_EX(*this) << "Ignoring ChangeModel to '" << e.name << "'.";
        return;
    }

    requestModel(e.name, false);
}

void StateMachine::on(event::LoadModel &e)
{
    if (!state_.is(Kind::Error) || !state_.recoverable) {
        LOG_DEBUG_EX(*this) << "Ignoring LoadModel for '" << e.name << "'.";
        return;
    }

    requestModel(e.name.empty() ? requested_model_ : e.name, e.force_download);
}

void StateMachine::on(event::LanguageDetected &e)
{
    auto lang = normalizeLanguage(e.code);
    if (lang.empty()) {
        LOG_DEBUG_EX(*this) << "Ignoring unusable language code '" << e.code << "'.";
        return;
    }

    if (lang != language_) {
        LOG_DEBUG_EX(*this) << "Language is now '" << lang << "'.";
        language_ = std::move(lang);
    }
}

void StateMachine::on(event::ToggleTranslate &)
{
    setTranslate(!translate_);
}

void StateMachine::on(event::SetTranslate &e)
{
    setTranslate(e.enabled);
}

void StateMachine::on(event::WorkerFailed &e)
{
    const auto message = format("{} failed: {}", e.worker, e.reason);
    LOG_ERROR_EX(*this) << message;
    clearPendingWork();
    setState(AppState::error(false, message));
    emitUi(ui::ErrorMessage{message});
}

void StateMachine::on(event::Shutdown &)
{
    shutdown();
}

void StateMachine::setState(AppState state)
{
    if (state == state_) {
        return;
    }

    LOG_DEBUG_EX(*this) << "State changed from " << state_ << " to " << state;
    state_ = std::move(state);
    emitUi(ui::StateChanged{state_});
}

void StateMachine::returnToReady()
{
    setState(AppState::ready());

    if (deferred_start_) {
        LOG_DEBUG_EX(*this) << "Replaying the deferred start.";
        deferred_start_ = false;
        events_.push(event::StartRecording{});
    }
}

void StateMachine::requestModel(const std::string &name, bool forceDownload)
{
    const auto job = nextJob();
    requested_model_ = name;
    setState(AppState::loadingInitialModel());
    load_deadline_ = Deadline{job, now() + config_.model_load_timeout};

    if (forceDownload) {
        sendModel(model_cmd::Download{name, job});
    } else {
        sendModel(model_cmd::Load{name, job});
    }
}

void StateMachine::startTranscription(AudioBuffer &&buffer)
{
    if (buffer.empty()) {
        LOG_INFO_EX(*this) << "No audio was captured.";
        returnToReady();
        emitUi(ui::ErrorMessage{"No audio was captured"});
        return;
    }

    const auto job = nextJob();
    process_deadline_ = Deadline{job, now() + config_.transcription_timeout};
    sendTranscription(transcription_cmd::Process{
        .job = job,
        .buffer = std::move(buffer),
        .language = language_,
        .model = model_name_,
        .model_path = activeModelPath(),
        .translate = translate_
    });
}

void StateMachine::transcriptionFailed(const std::string &reason)
{
    if (deferred_start_) {
        LOG_DEBUG_EX(*this) << "Dropping the deferred start.";
    }
    clearPendingWork();
    setState(AppState::error(true, reason));
    emitUi(ui::ErrorMessage{reason});
}

void StateMachine::recordingAborted(const std::string &reason)
{
    LOG_WARN_EX(*this) << reason;
    capture_deadline_.reset();
    returnToReady();
    emitUi(ui::ErrorMessage{reason});
}

void StateMachine::clearPendingWork()
{
    load_deadline_.reset();
    capture_deadline_.reset();
    process_deadline_.reset();
    deferred_start_ = false;
}

void StateMachine::setTranslate(bool enabled)
{
    if (translate_ == enabled) {
        return;
    }

    translate_ = enabled;
    LOG_INFO_EX(*this) << "Translate to English is " << (translate_ ? "on" : "off");
    emitUi(ui::TranslateModeChanged{translate_});
}

void StateMachine::shutdown()
{
    if (shut_down_) {
        LOG_DEBUG_EX(*this) << "Already shut down.";
        return;
    }

    LOG_INFO_EX(*this) << "Shutting down.";
    clearPendingWork();

    sendAudio(audio_cmd::Shutdown{}, Priority::High);
    sendModel(model_cmd::Shutdown{}, Priority::High);
    sendTranscription(transcription_cmd::Shutdown{}, Priority::High);

    for (const auto& ch : {ports_.audio.abandoned, ports_.model.abandoned, ports_.transcription.abandoned}) {
        ch->close();
    }
    ports_.audio.commands->close();
    ports_.model.commands->close();
    ports_.transcription.commands->close();

    setState(AppState::shutdown());
    shut_down_ = true;

    // Whatever is still queued is obsolete
    events_.close();
    AppEvent event;
    size_t discarded = 0;
    while (events_.tryPop(event)) {
        ++discarded;
    }
    if (discarded) {
        LOG_DEBUG_EX(*this) << "Discarded " << discarded << " queued events.";
    }

    ports_.ui->close();
}

void StateMachine::emitUi(UIUpdate &&update)
{
    LOG_TRACE_EX(*this) << "UI update: " << update;
    if (!ports_.ui->push(std::move(update))) {
        LOG_TRACE_EX(*this) << "The UI channel is closed.";
    }
}

void StateMachine::sendAudio(AudioCommand &&cmd, Priority priority)
{
    LOG_DEBUG_EX(*this) << "Sending " << cmd;
    if (!ports_.audio.commands->push(std::move(cmd), priority)) {
        LOG_WARN_EX(*this) << "The audio worker's channel is closed.";
    }
}

void StateMachine::sendModel(ModelCommand &&cmd, Priority priority)
{
    LOG_DEBUG_EX(*this) << "Sending " << cmd;
    if (!ports_.model.commands->push(std::move(cmd), priority)) {
        LOG_WARN_EX(*this) << "The model worker's channel is closed.";
    }
}

void StateMachine::sendTranscription(TranscriptionCommand &&cmd, Priority priority)
{
    LOG_DEBUG_EX(*this) << "Sending " << cmd;
    if (!ports_.transcription.commands->push(std::move(cmd), priority)) {
        LOG_WARN_EX(*this) << "The transcription worker's channel is closed.";
    }
}

StateMachine::Clock::time_point StateMachine::now() const
{
    return now_ ? now_() : Clock::now();
}

} // ns
