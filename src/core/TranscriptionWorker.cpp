
#include <algorithm>
#include <cassert>
#include <format>

#include "TranscriptionWorker.h"
#include "AudioConvert.h"
#include "Overloaded.h"
#include "ScopedTimer.h"
#include "logging.h"

using namespace std;

namespace vin {

namespace {

string trim(string_view text) {
    constexpr string_view ws = " \t\r\n";
    const auto start = text.find_first_not_of(ws);
    if (start == string_view::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(ws);
    return string{text.substr(start, end - start + 1)};
}

} // anon ns

TranscriptionWorker::TranscriptionWorker(Config config, port_t port, event_sink_t emit,
                                         std::shared_ptr<InferenceEngine> engine)
    : Worker("TranscriptionWorker", std::move(port), std::move(emit))
    , config_{config}
    , engine_{std::move(engine)}
{
    assert(engine_);
}

TranscriptionWorker::~TranscriptionWorker()
{
    stop();
}

void TranscriptionWorker::handle(TranscriptionCommand &&cmd)
{
    visit(overloaded{
        [this](transcription_cmd::Prepare& c) { prepare(c.model_path); },
        [this](transcription_cmd::Process& c) {
            const auto job = c.job;
            process(std::move(c));
            done(job);
        },
        [this](transcription_cmd::Shutdown&) {
            LOG_DEBUG_EX(*this) << "Shutting down.";
            finish();
        }
    }, cmd);
}

void TranscriptionWorker::onExit()
{
    if (!models_.empty()) {
        LOG_DEBUG_EX(*this) << "Releasing " << models_.size() << " model(s).";
        models_.clear();
    }
}

void TranscriptionWorker::prepare(const std::string &modelPath)
{
    if (modelPath.empty()) {
        return;
    }

    string error;
    if (!model(modelPath, error)) {
        LOG_WARN_EX(*this) << "Could not preload the model: " << error;
    }
}

void TranscriptionWorker::process(transcription_cmd::Process &&cmd)
{
    // The buffer is ours now, and goes away when we return
    const AudioBuffer buffer{std::move(cmd.buffer)};
    const auto job = cmd.job;

    if (isAbandoned(job)) {
        LOG_DEBUG_EX(*this) << "Skipping abandoned job #" << job;
        forget(job);
        return;
    }

    if (!isUsable(buffer)) {
        LOG_WARN_EX(*this) << "Job #" << job << " has a corrupt audio buffer with "
                           << buffer.samples.size() << " samples, rate=" << buffer.sample_rate
                           << ", channels=" << buffer.channels;
        emit(event::TranscriptionFailed{job, "corrupt audio buffer"});
        return;
    }

    if (cmd.model_path.empty()) {
        emit(event::TranscriptionFailed{job, "no model is selected"});
        return;
    }

    string error;
    auto handle = model(cmd.model_path, error);
    if (!handle) {
        emit(event::TranscriptionFailed{job, error});
        return;
    }

    const ScopedTimer timer;
    const auto samples = toMono(buffer, inference_sample_rate);
    const auto deadline = chrono::steady_clock::now() + config_.timeout;

    auto abort = Abort::None;
    RunParams params{
        .language = cmd.language,
        .translate = cmd.translate,
        .threads = config_.threads,
        .should_abort = [&] {
            if (abort == Abort::None) {
                abort = checkAbort(job, deadline);
            }
            return abort != Abort::None;
        }
    };

    LOG_DEBUG_EX(*this) << "Transcribing " << buffer.duration() << " seconds of audio with "
                        << cmd.model << ", language=" << (cmd.language.empty() ? "auto" : cmd.language)
                        << ", translate=" << cmd.translate;

    string text;
    const bool ok = engine_->run(*handle, samples, params, text);

    switch(abort) {
    case Abort::Abandoned:
        LOG_INFO_EX(*this) << "Job #" << job << " was abandoned after " << timer.elapsed() << " seconds.";
        forget(job);
        return;
    case Abort::Timeout:
        LOG_WARN_EX(*this) << "Job #" << job << " timed out after " << timer.elapsed() << " seconds.";
        emit(event::TranscriptionFailed{job, "timeout"});
        return;
    case Abort::Shutdown:
        LOG_DEBUG_EX(*this) << "Job #" << job << " cancelled by shutdown.";
        return;
    case Abort::None:
        break;
    }

    if (!ok) {
        auto reason = engine_->lastError();
        LOG_WARN_EX(*this) << "Job #" << job << " failed: " << reason;
        emit(event::TranscriptionFailed{job, reason.empty() ? string{"transcription failed"} : reason});
        return;
    }

    LOG_INFO_EX(*this) << "Transcribed " << buffer.duration() << " seconds of audio in "
                       << timer.elapsed() << " seconds (" << timer.speed(buffer.duration()) << "x realtime).";
    emit(event::TranscriptionFinished{job, trim(text)});
}

std::shared_ptr<ModelHandle> TranscriptionWorker::model(const std::string &modelPath, std::string &error)
{
    if (auto it = ranges::find(models_, modelPath, &decltype(models_)::value_type::first); it != models_.end()) {
        models_.splice(models_.begin(), models_, it);
        return models_.front().second;
    }

    const ScopedTimer timer;
    auto handle = engine_->load(modelPath);
    if (!handle) {
        error = engine_->lastError();
        if (error.empty()) {
            error = format("Failed to load model {}", modelPath);
        }
        return {};
    }

    LOG_INFO_EX(*this) << "Loaded " << modelPath << " in " << timer.elapsed() << " seconds.";
    models_.emplace_front(modelPath, handle);

    while (models_.size() > max<size_t>(1, config_.max_cached_models)) {
        LOG_DEBUG_EX(*this) << "Unloading " << models_.back().first;
        models_.pop_back();
    }

    return handle;
}

TranscriptionWorker::Abort TranscriptionWorker::checkAbort(job_id_t job, std::chrono::steady_clock::time_point deadline)
{
    if (shutdown_requested_) {
        return Abort::Shutdown;
    }

    if (isAbandoned(job)) {
        return Abort::Abandoned;
    }

    if (chrono::steady_clock::now() >= deadline) {
        return Abort::Timeout;
    }

    TranscriptionCommand cmd;
    while (pollCommand(cmd)) {
        if (holds_alternative<transcription_cmd::Shutdown>(cmd)) {
            shutdown_requested_ = true;
            finish();
            return Abort::Shutdown;
        }
        defer(std::move(cmd));
    }

    return Abort::None;
}

} // ns
