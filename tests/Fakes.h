#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "vin/ArtifactStore.h"
#include "vin/CaptureDevice.h"
#include "vin/InferenceEngine.h"
#include "vin/InputSource.h"
#include "vin/PresentationSink.h"
#include "Channel.h"
#include "Worker.h"

namespace vin::test {

using namespace std::chrono_literals;

constexpr auto wait_timeout = 5s;

// Collects the events a component emits
class EventCollector {
public:
    event_sink_t sink() {
        return [ch = channel_](AppEvent&& ev) {
            ch->push(std::move(ev));
        };
    }

    std::optional<AppEvent> next(std::chrono::milliseconds timeout = wait_timeout) {
        AppEvent ev;
        if (channel_->popFor(ev, timeout)) {
            return ev;
        }
        return std::nullopt;
    }

    // Skips events of other types
    template <typename T>
    std::optional<T> nextOf(std::chrono::milliseconds timeout = wait_timeout) {
        const auto until = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < until) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - std::chrono::steady_clock::now());
            auto ev = next(std::max(left, std::chrono::milliseconds{1}));
            if (ev && std::holds_alternative<T>(*ev)) {
                return std::move(std::get<T>(*ev));
            }
        }
        return std::nullopt;
    }

    bool empty() const {
        return channel_->empty();
    }

private:
    std::shared_ptr<Channel<AppEvent>> channel_ = std::make_shared<Channel<AppEvent>>("test.events");
};

class ManualClock {
public:
    std::chrono::steady_clock::time_point now() const {
        return now_;
    }

    void advance(std::chrono::milliseconds d) {
        now_ += d;
    }

    std::function<std::chrono::steady_clock::time_point()> fn() {
        return [this] { return now_; };
    }

private:
    std::chrono::steady_clock::time_point now_{std::chrono::steady_clock::now()};
};

// Shared between a test and the devices its factory creates
struct CaptureScript {
    std::mutex mutex;
    unsigned rate{16000};
    unsigned channels{1};
    bool open_ok{true};
    bool start_ok{true};
    bool lost{false};
    std::string error{"device error"};
    std::vector<float> available;   // delivered on the next read()

    std::atomic_int created{0};
    std::atomic_int opened{0};
    std::atomic_int started{0};
    std::atomic_int paused{0};
    std::atomic_int closed{0};

    void feed(const std::vector<float>& samples) {
        std::lock_guard lock{mutex};
        available.insert(available.end(), samples.begin(), samples.end());
    }

    void loseDevice() {
        std::lock_guard lock{mutex};
        lost = true;
    }
};

class FakeCaptureDevice : public CaptureDevice {
public:
    explicit FakeCaptureDevice(std::shared_ptr<CaptureScript> script)
        : script_{std::move(script)} {}

    bool open() override {
        ++script_->opened;
        std::lock_guard lock{script_->mutex};
        return script_->open_ok;
    }

    bool start() override {
        ++script_->started;
        std::lock_guard lock{script_->mutex};
        return script_->start_ok;
    }

    void pause() override {
        ++script_->paused;
    }

    void close() override {
        ++script_->closed;
    }

    size_t read(std::vector<float>& out) override {
        std::lock_guard lock{script_->mutex};
        const auto n = script_->available.size();
        out.insert(out.end(), script_->available.begin(), script_->available.end());
        script_->available.clear();
        return n;
    }

    bool isLost() const override {
        std::lock_guard lock{script_->mutex};
        return script_->lost;
    }

    unsigned sampleRate() const noexcept override {
        return script_->rate;
    }

    unsigned channels() const noexcept override {
        return script_->channels;
    }

    std::string lastError() const override {
        std::lock_guard lock{script_->mutex};
        return script_->error;
    }

private:
    std::shared_ptr<CaptureScript> script_;
};

inline capture_factory_t fakeCaptureFactory(std::shared_ptr<CaptureScript> script) {
    return [script] {
        ++script->created;
        return std::make_unique<FakeCaptureDevice>(script);
    };
}

class FakeModel : public ModelHandle {
public:
    explicit FakeModel(std::filesystem::path path)
        : path_{std::move(path)} {}

    const std::filesystem::path& path() const noexcept override {
        return path_;
    }

private:
    const std::filesystem::path path_;
};

class FakeEngine : public InferenceEngine {
public:
    struct Run {
        std::string model;
        size_t samples{};
        std::string language;
        bool translate{};
    };

    std::string version() const override {
        return "fake 1.0";
    }

    void setLogger(vin_log::callback_t, vin_log::Level) override {}

    std::shared_ptr<ModelHandle> load(const std::filesystem::path& modelPath) override {
        std::lock_guard lock{mutex_};
        ++loads_;
        if (fail_load_) {
            error_ = "cannot load " + modelPath.string();
            return {};
        }
        return std::make_shared<FakeModel>(modelPath);
    }

    bool run(ModelHandle& model, std::span<const float> samples, const RunParams& params, std::string& text) override {
        {
            std::lock_guard lock{mutex_};
            runs_.push_back({model.path().string(), samples.size(), params.language, params.translate});
        }
        cv_.notify_all();

        // A blocking run only ends when it is aborted or released
        while (true) {
            {
                std::unique_lock lock{mutex_};
                if (!block_ || released_) {
                    break;
                }
            }
            if (params.should_abort && params.should_abort()) {
                std::lock_guard lock{mutex_};
                ++aborted_;
                error_ = "aborted";
                return false;
            }
            std::this_thread::sleep_for(1ms);
        }

        std::lock_guard lock{mutex_};
        if (fail_run_) {
            error_ = "engine failure";
            return false;
        }
        text = text_;
        return true;
    }

    std::string lastError() const override {
        std::lock_guard lock{mutex_};
        return error_;
    }

    void setText(std::string text) {
        std::lock_guard lock{mutex_};
        text_ = std::move(text);
    }

    void setBlocking(bool block) {
        std::lock_guard lock{mutex_};
        block_ = block;
        released_ = false;
    }

    void release() {
        std::lock_guard lock{mutex_};
        released_ = true;
    }

    void failLoad(bool fail) {
        std::lock_guard lock{mutex_};
        fail_load_ = fail;
    }

    void failRun(bool fail) {
        std::lock_guard lock{mutex_};
        fail_run_ = fail;
    }

    bool waitForRuns(size_t count, std::chrono::milliseconds timeout = wait_timeout) {
        std::unique_lock lock{mutex_};
        return cv_.wait_for(lock, timeout, [&] { return runs_.size() >= count; });
    }

    std::vector<Run> runs() const {
        std::lock_guard lock{mutex_};
        return runs_;
    }

    int loads() const {
        std::lock_guard lock{mutex_};
        return loads_;
    }

    int aborted() const {
        std::lock_guard lock{mutex_};
        return aborted_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Run> runs_;
    std::string text_{" hello world "};
    std::string error_;
    int loads_{};
    int aborted_{};
    bool block_{false};
    bool released_{false};
    bool fail_load_{false};
    bool fail_run_{false};
};

class FakeStore : public ArtifactStore {
public:
    bool exists(const std::string& name) const override {
        std::lock_guard lock{mutex_};
        return present_.contains(name);
    }

    std::filesystem::path localPath(const std::string& name) const override {
        return std::filesystem::path{"/models"} / name;
    }

    FetchResult fetch(const std::string& name, const progress_cb_t& progress, const abort_cb_t& shouldAbort) override {
        {
            std::lock_guard lock{mutex_};
            fetched_.push_back(name);
        }
        cv_.notify_all();

        if (progress) {
            progress(50, 100);
            progress(100, 100);
        }

        while (true) {
            {
                std::lock_guard lock{mutex_};
                if (!block_ || released_) {
                    break;
                }
            }
            if (shouldAbort && shouldAbort()) {
                return {.ok = false, .path = {}, .error = "aborted", .retryable = false};
            }
            std::this_thread::sleep_for(1ms);
        }

        std::lock_guard lock{mutex_};
        if (!failures_.empty()) {
            auto result = failures_.front();
            failures_.pop_front();
            return result;
        }
        present_.insert(name);
        return {.ok = true, .path = localPath(name), .error = {}, .retryable = false};
    }

    void addPresent(const std::string& name) {
        std::lock_guard lock{mutex_};
        present_.insert(name);
    }

    // Queues a failure for the next fetch
    void failNext(std::string error, bool retryable) {
        std::lock_guard lock{mutex_};
        failures_.push_back({.ok = false, .path = {}, .error = std::move(error), .retryable = retryable});
    }

    void setBlocking(bool block) {
        std::lock_guard lock{mutex_};
        block_ = block;
        released_ = false;
    }

    void release() {
        std::lock_guard lock{mutex_};
        released_ = true;
    }

    bool waitForFetches(size_t count, std::chrono::milliseconds timeout = wait_timeout) {
        std::unique_lock lock{mutex_};
        return cv_.wait_for(lock, timeout, [&] { return fetched_.size() >= count; });
    }

    std::vector<std::string> fetched() const {
        std::lock_guard lock{mutex_};
        return fetched_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::set<std::string> present_;
    std::vector<std::string> fetched_;
    std::deque<FetchResult> failures_;
    bool block_{false};
    bool released_{false};
};

class FakeInput : public InputSource {
public:
    std::optional<KeyEdge> next(std::chrono::milliseconds timeout) override {
        std::unique_lock lock{mutex_};
        if (!cv_.wait_for(lock, timeout, [this] { return !edges_.empty() || fail_; })) {
            return std::nullopt;
        }
        if (fail_) {
            fail_ = false;
            throw std::runtime_error{"keyboard unplugged"};
        }
        const auto edge = edges_.front();
        edges_.pop_front();
        return edge;
    }

    void press(Key key) {
        push({key, true, false});
    }

    void release(Key key) {
        push({key, false, false});
    }

    void fail() {
        {
            std::lock_guard lock{mutex_};
            fail_ = true;
        }
        cv_.notify_all();
    }

private:
    void push(KeyEdge edge) {
        {
            std::lock_guard lock{mutex_};
            edges_.push_back(edge);
        }
        cv_.notify_all();
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<KeyEdge> edges_;
    bool fail_{false};
};

class RecordingSink : public PresentationSink {
public:
    void render(const UIUpdate& update) override {
        {
            std::lock_guard lock{mutex_};
            updates_.push_back(update);
        }
        cv_.notify_all();
        if (throw_on_render_) {
            throw std::runtime_error{"render failed"};
        }
    }

    void insertText(const std::string& text) override {
        {
            std::lock_guard lock{mutex_};
            inserted_.push_back(text);
        }
        cv_.notify_all();
    }

    // Waits until an update matches
    bool waitFor(const std::function<bool(const UIUpdate&)>& pred, std::chrono::milliseconds timeout = wait_timeout) {
        std::unique_lock lock{mutex_};
        return cv_.wait_for(lock, timeout, [&] {
            return std::ranges::any_of(updates_, pred);
        });
    }

    // Waits until an update has matched `times` times
    bool waitFor(const std::function<bool(const UIUpdate&)>& pred, size_t times,
                 std::chrono::milliseconds timeout = wait_timeout) {
        std::unique_lock lock{mutex_};
        return cv_.wait_for(lock, timeout, [&] {
            return static_cast<size_t>(std::ranges::count_if(updates_, pred)) >= times;
        });
    }

    bool waitForState(AppState::Kind kind, std::chrono::milliseconds timeout = wait_timeout) {
        return waitForState(kind, 1, timeout);
    }

    bool waitForState(AppState::Kind kind, size_t times, std::chrono::milliseconds timeout = wait_timeout) {
        return waitFor([kind](const UIUpdate& u) {
            const auto *sc = std::get_if<ui::StateChanged>(&u);
            return sc && sc->state.is(kind);
        }, times, timeout);
    }

    std::vector<UIUpdate> updates() const {
        std::lock_guard lock{mutex_};
        return updates_;
    }

    std::vector<std::string> inserted() const {
        std::lock_guard lock{mutex_};
        return inserted_;
    }

    void throwOnRender(bool enable) {
        throw_on_render_ = enable;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<UIUpdate> updates_;
    std::vector<std::string> inserted_;
    std::atomic_bool throw_on_render_{false};
};

} // ns
