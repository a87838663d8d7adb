#pragma once

#include <chrono>
#include <list>
#include <memory>
#include <string>
#include <utility>

#include "vin/InferenceEngine.h"
#include "Worker.h"

namespace vin {

/*! Runs speech-to-text on captured audio.
 *
 *  Each Process command carries its own buffer, which is dropped when the command
 *  is done. Loaded models are kept between runs.
 */
class TranscriptionWorker : public Worker<TranscriptionCommand>
{
public:
    struct Config {
        std::chrono::milliseconds timeout{std::chrono::seconds{30}};
        int threads{-1};
        size_t max_cached_models{2};
    };

    TranscriptionWorker(Config config, port_t port, event_sink_t emit, std::shared_ptr<InferenceEngine> engine);
    ~TranscriptionWorker() override;

protected:
    void handle(TranscriptionCommand&& cmd) override;
    void onExit() override;

private:
    enum class Abort {
        None,
        Abandoned,
        Timeout,
        Shutdown
    };

    void prepare(const std::string& modelPath);
    void process(transcription_cmd::Process&& cmd);
    std::shared_ptr<ModelHandle> model(const std::string& modelPath, std::string& error);
    Abort checkAbort(job_id_t job, std::chrono::steady_clock::time_point deadline);

    const Config config_;
    // Declared before the cache, so the models are released first
    std::shared_ptr<InferenceEngine> engine_;
    std::list<std::pair<std::string, std::shared_ptr<ModelHandle>>> models_;
    bool shutdown_requested_{false};
};

} // ns
