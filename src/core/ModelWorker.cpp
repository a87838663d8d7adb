
#include <algorithm>
#include <array>
#include <cassert>
#include <format>
#include <thread>

#include "ModelWorker.h"
#include "Overloaded.h"
#include "logging.h"

using namespace std;

namespace vin {

std::ostream& operator << (std::ostream& os, ModelDescriptor::State state) {
    constexpr auto states = to_array<string_view>({
        "Unknown",
        "Missing",
        "Downloading",
        "Present",
        "Failed"
    });

    return os << states.at(static_cast<size_t>(state));
}

ModelWorker::ModelWorker(Config config, port_t port, event_sink_t emit, std::shared_ptr<ArtifactStore> store)
    : Worker("ModelWorker", std::move(port), std::move(emit))
    , config_{config}
    , store_{std::move(store)}
{
    assert(store_);
}

ModelWorker::~ModelWorker()
{
    stop();
}

void ModelWorker::handle(ModelCommand &&cmd)
{
    visit(overloaded{
        [this](model_cmd::Load& c) {
            ensure(c.name, c.job, false);
            done(c.job);
        },
        [this](model_cmd::Download& c) {
            ensure(c.name, c.job, true);
            done(c.job);
        },
        [this](model_cmd::Shutdown&) {
            LOG_DEBUG_EX(*this) << "Shutting down.";
            finish();
        }
    }, cmd);
}

void ModelWorker::ensure(const std::string &requested, job_id_t job, bool force)
{
    if (isAbandoned(job)) {
        LOG_DEBUG_EX(*this) << "Skipping abandoned job #" << job;
        forget(job);
        return;
    }

    const auto name = ModelCatalog::normalize(requested);
    const auto *info = ModelCatalog::find(name);
    if (!info) {
        LOG_WARN_EX(*this) << "Unknown model '" << requested << "'";
        emit(event::ModelLoadingFailed{requested, job, format("Unknown model '{}'", requested), false});
        return;
    }

    if (name != requested) {
        LOG_INFO_EX(*this) << "Using model '" << name << "' for '" << requested << "'";
    }

    auto& desc = descriptor(*info);
    LOG_DEBUG_EX(*this) << "Model '" << name << "' is " << desc.state;

    current_ = name;
    waiting_ = {job};
    last_percent_ = -1;

    string error;
    for (size_t i = 0; i < desc.artifacts.size(); ++i) {
        const auto& artifact = desc.artifacts[i];
        if (!force && store_->exists(artifact)) {
            continue;
        }

        LOG_INFO_EX(*this) << "Downloading " << artifact << " for model '" << name << "'";
        desc.state = ModelDescriptor::State::Downloading;

        const auto outcome = fetchWithRetries(desc, artifact, i, error);
        if (outcome == FetchOutcome::Ok) {
            continue;
        }

        if (outcome == FetchOutcome::Interrupted) {
            LOG_INFO_EX(*this) << "The download of model '" << name << "' was interrupted.";
            desc.state = ModelDescriptor::State::Missing;
        } else {
            LOG_WARN_EX(*this) << "Failed to fetch model '" << name << "': " << error;
            desc.state = ModelDescriptor::State::Failed;
            for (const auto j : waiting_) {
                emit(event::ModelLoadingFailed{name, j, error, false});
            }
        }

        current_.clear();
        waiting_.clear();
        return;
    }

    desc.state = ModelDescriptor::State::Present;
    LOG_INFO_EX(*this) << "Model '" << name << "' is available at " << desc.path;

    for (const auto j : waiting_) {
        emit(event::ModelLoaded{name, j, desc.path.string(), desc.english_path.string()});
    }

    current_.clear();
    waiting_.clear();
}

ModelDescriptor &ModelWorker::descriptor(const ModelInfo &info)
{
    auto [it, inserted] = models_.try_emplace(string{info.name});
    auto& desc = it->second;

    if (inserted) {
        desc.name = info.name;
        desc.artifacts.emplace_back(info.filename);
        desc.path = store_->localPath(string{info.filename});
        if (!info.english_filename.empty()) {
            desc.artifacts.emplace_back(info.english_filename);
            desc.english_path = store_->localPath(string{info.english_filename});
        }
        desc.byte_size = info.approx_size * desc.artifacts.size();
    }

    // The files may have been removed since we last looked
    const bool present = ranges::all_of(desc.artifacts, [this](const string& a) {
        return store_->exists(a);
    });
    desc.state = present ? ModelDescriptor::State::Present : ModelDescriptor::State::Missing;

    return desc;
}

ModelWorker::FetchOutcome ModelWorker::fetchWithRetries(ModelDescriptor &desc,
                                                        const std::string &artifact,
                                                        size_t index,
                                                        std::string &error)
{
    const auto attempts = max(1u, config_.max_retries);

    for (unsigned attempt = 1;; ++attempt) {
        const auto result = store_->fetch(artifact,
            [&](uint64_t received, uint64_t total) {
                reportProgress(desc, index, received, total);
            },
            [this] {
                return interrupted();
            });

        if (result.ok) {
            LOG_DEBUG_EX(*this) << "Fetched " << artifact << " to " << result.path;
            return FetchOutcome::Ok;
        }

        if (interrupted()) {
            return FetchOutcome::Interrupted;
        }

        error = result.error;
        if (!result.retryable) {
            return FetchOutcome::Failed;
        }

        if (attempt >= attempts) {
            error = format("{} (gave up after {} attempts)", result.error, attempt);
            return FetchOutcome::Failed;
        }

        // Doubles per attempt, up to max_backoff
        const auto doublings = min(attempt - 1, 16u);
        const auto delay = min<chrono::milliseconds>(config_.backoff_base * (1u << doublings),
                                                     config_.max_backoff);
        LOG_WARN_EX(*this) << "Attempt " << attempt << " to fetch " << artifact << " failed: "
                           << result.error << ". Retrying in " << delay.count() << " ms.";

        if (!backoff(delay)) {
            return FetchOutcome::Interrupted;
        }
    }
}

bool ModelWorker::backoff(std::chrono::milliseconds delay)
{
    const auto until = chrono::steady_clock::now() + delay;
    while (chrono::steady_clock::now() < until) {
        if (interrupted()) {
            return false;
        }
        const auto left = chrono::duration_cast<chrono::milliseconds>(until - chrono::steady_clock::now());
        this_thread::sleep_for(clamp(left, chrono::milliseconds{1}, chrono::milliseconds{50}));
    }

    return !interrupted();
}

bool ModelWorker::interrupted()
{
    erase_if(waiting_, [this](job_id_t j) {
        if (isAbandoned(j)) {
            forget(j);
            return true;
        }
        return false;
    });

    ModelCommand cmd;
    while (!shutdown_requested_ && pollCommand(cmd)) {
        if (holds_alternative<model_cmd::Shutdown>(cmd)) {
            LOG_DEBUG_EX(*this) << "Shutdown requested during a download.";
            shutdown_requested_ = true;
            finish();
            break;
        }

        string name;
        job_id_t job{};
        if (const auto *load = get_if<model_cmd::Load>(&cmd)) {
            name = load->name;
            job = load->job;
        } else if (const auto *download = get_if<model_cmd::Download>(&cmd)) {
            name = download->name;
            job = download->job;
        }

        if (ModelCatalog::normalize(name) == current_) {
            LOG_DEBUG_EX(*this) << "Job #" << job << " joins the download of '" << current_ << "'";
            waiting_.push_back(job);
            continue;
        }

        LOG_DEBUG_EX(*this) << "Queued " << cmd;
        defer(std::move(cmd));
    }

    return shutdown_requested_ || waiting_.empty();
}

void ModelWorker::reportProgress(const ModelDescriptor &desc, size_t index, uint64_t received, uint64_t total)
{
    const auto part = total ? static_cast<double>(min(received, total)) / static_cast<double>(total) : 0.0;
    const auto percent = static_cast<int>((static_cast<double>(index) + part) * 100.0
                                          / static_cast<double>(desc.artifacts.size()));

    if (percent != last_percent_) {
        last_percent_ = percent;
        emit(event::ModelDownloadProgress{desc.name, percent});
    }
}

} // ns
