
#include <algorithm>
#include <atomic>
#include <cassert>
#include <format>
#include <memory>
#include <mutex>
#include <thread>

#include "vin/WhisperEngine.h"

#include <whisper.h>

using namespace std;

namespace vin {

namespace {

void whisperLogger(ggml_log_level level, const char *msg, void *) {
    string_view message(msg);
    message = message.substr(0, message.empty() ? 0 : message.size() -1);

    switch(level) {
    case GGML_LOG_LEVEL_ERROR:
        LOG_ERROR << "[whisper] " << message;
        break;
    case GGML_LOG_LEVEL_WARN:
        LOG_WARN << "[whisper] " << message;
        break;
    case GGML_LOG_LEVEL_INFO:
        LOG_DEBUG << "[whisper] " << message;
        break;
    case GGML_LOG_LEVEL_DEBUG:
    case GGML_LOG_LEVEL_CONT:
        LOG_TRACE << "[whisper] " << message;
        break;
    case GGML_LOG_LEVEL_NONE:
        break;
    }
}

int defaultThreads() {
    const auto thds = std::thread::hardware_concurrency();
    if (thds > 32) {
        return static_cast<int>(thds - 4);
    }
    if (thds > 8) {
        return 8;
    }
    return std::max(4, static_cast<int>(thds));
}

class WhisperImpl;

class WhisperModel final : public ModelHandle {
public:
    WhisperModel(WhisperImpl& engine, filesystem::path path, whisper_context *ctx)
        : engine_{engine}, path_{std::move(path)}, ctx_{ctx}
    {
        assert(ctx_ != nullptr);
    }

    ~WhisperModel() override;

    const filesystem::path& path() const noexcept override {
        return path_;
    }

    whisper_context *ctx() noexcept {
        return ctx_;
    }

private:
    WhisperImpl& engine_;
    const filesystem::path path_;
    whisper_context *ctx_{nullptr};
};

class WhisperImpl final : public WhisperEngine {
public:
    WhisperImpl(const CreateParams& params)
        : params_{params}
    {
        LOG_DEBUG << "Creating Whisper engine";
        whisper_log_set(whisperLogger, nullptr);
    }

    ~WhisperImpl() override {
        LOG_DEBUG << "Destroying Whisper engine with " << num_loaded_models_ << " loaded models";
    }

    string version() const override {
        string_view v;
        if (const auto p = whisper_version()) {
            v = p;
        }

        return format("whisper.cpp {}", v);
    }

    void setLogger(vin_log::callback_t cb, vin_log::Level level) override {
        vin_log::setCallback(std::move(cb), "whisper", level);
    }

    string lastError() const override {
        lock_guard lock{mutex_};
        return error_;
    }

    shared_ptr<ModelHandle> load(const filesystem::path& modelPath) override {
        whisper_context_params cparams = whisper_context_default_params();

        LOG_DEBUG << "Loading Whisper model from " << modelPath;

        cparams.use_gpu = params_.use_gpu;
        cparams.flash_attn = params_.use_gpu && params_.flash_attn;
        cparams.gpu_device = params_.gpu_device;

        // DTW token timestamps are not used for dictation
        cparams.dtw_token_timestamps = false;
        cparams.dtw_aheads_preset = WHISPER_AHEADS_NONE;
        cparams.dtw_n_top = 0;

        if (auto *ctx = whisper_init_from_file_with_params_no_state(modelPath.c_str(), cparams)) {
            ++num_loaded_models_;
            clearError();
            return make_shared<WhisperModel>(*this, modelPath, ctx);
        }

        LOG_ERROR << "Failed to load Whisper model from " << modelPath;
        setError(format("Failed to load Whisper model from {}", modelPath.string()));
        return {};
    }

    bool run(ModelHandle& model, span<const float> samples, const RunParams& params, string& text) override {
        auto *wmodel = dynamic_cast<WhisperModel *>(&model);
        if (!wmodel) {
            return setError("The model was not loaded by the Whisper engine");
        }

        if (samples.empty()) {
            return setError("No audio to transcribe");
        }

        // A fresh state per run. The model itself is shared.
        auto *state = whisper_init_state(wmodel->ctx());
        if (!state) {
            return setError("Failed to create Whisper state");
        }
        const auto state_guard = unique_ptr<whisper_state, decltype(&whisper_free_state)>{state, whisper_free_state};

        auto p = whisper_full_default_params(params_.beam_size > 1
                                                 ? WHISPER_SAMPLING_BEAM_SEARCH
                                                 : WHISPER_SAMPLING_GREEDY);
        p.beam_search.beam_size = params_.beam_size;
        p.temperature = params_.temperature;
        p.n_threads = params.threads > 0 ? params.threads : defaultThreads();
        p.translate = params.translate;
        p.language = params.language.empty() ? "auto" : params.language.c_str();
        p.print_progress = false;
        p.print_realtime = false;
        p.print_timestamps = false;
        p.print_special = false;

        // ggml may poll the abort callback from its compute threads
        struct AbortState {
            const std::function<bool()> *fn{};
            std::mutex mutex;
            std::atomic_bool aborted{false};
        } abort_state{&params.should_abort};

        if (params.should_abort) {
            p.abort_callback = [](void *user_data) -> bool {
                auto *as = static_cast<AbortState *>(user_data);
                if (as->aborted) {
                    return true;
                }
                unique_lock lock{as->mutex, try_to_lock};
                if (lock.owns_lock() && (*as->fn)()) {
                    as->aborted = true;
                }
                return as->aborted;
            };
            p.abort_callback_user_data = &abort_state;
        }

        LOG_TRACE << "Whisper full params: "
                  << "language='" << p.language << "', "
                  << "translate=" << p.translate << ", "
                  << "n_threads=" << p.n_threads << ", "
                  << "beam_size=" << p.beam_search.beam_size << ", "
                  << "samples=" << samples.size();

        const auto rc = whisper_full_with_state(wmodel->ctx(), state, p, samples.data(), static_cast<int>(samples.size()));
        if (abort_state.aborted) {
            return setError("aborted");
        }

        if (rc != 0) {
            return setError(format("Whisper inference failed with code {}", rc));
        }

        text.clear();
        const int n = whisper_full_n_segments_from_state(state);
        for (int i = 0; i < n; ++i) {
            if (const char *txt = whisper_full_get_segment_text_from_state(state, i)) {
                text += txt;
            }
        }

        clearError();
        return true;
    }

    void onModelUnloaded() {
        --num_loaded_models_;
    }

private:
    // Always returns false
    bool setError(string msg) {
        lock_guard lock{mutex_};
        LOG_DEBUG << "Whisper error: " << msg;
        error_ = std::move(msg);
        return false;
    }

    void clearError() {
        lock_guard lock{mutex_};
        error_.clear();
    }

    const CreateParams params_;
    mutable mutex mutex_;
    string error_;
    atomic_int num_loaded_models_{0};
};

WhisperModel::~WhisperModel() {
    if (ctx_) {
        LOG_DEBUG << "Unloading Whisper model " << path_;
        whisper_free(ctx_);
        ctx_ = nullptr;
        engine_.onModelUnloaded();
    }
}

} // anon ns

std::shared_ptr<WhisperEngine> WhisperEngine::create(const CreateParams &params)
{
    LOG_DEBUG << "Creating Whisper engine instance";
    return make_shared<WhisperImpl>(params);
}

WhisperEngine::WhisperEngine() {}

WhisperEngine::~WhisperEngine() {}

} // ns
