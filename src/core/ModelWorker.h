#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "vin/ArtifactStore.h"
#include "ModelCatalog.h"
#include "Worker.h"

namespace vin {

struct ModelDescriptor {
    enum class State {
        Unknown,
        Missing,
        Downloading,
        Present,
        Failed
    };

    std::string name;
    std::vector<std::string> artifacts;
    std::filesystem::path path;
    std::filesystem::path english_path;
    uint64_t byte_size{};
    State state{State::Unknown};
};

/*! Makes sure a model's files exist in the local model cache.
 *
 *  Only this worker writes to the model cache. Loads for the model that is being
 *  downloaded are answered by the same download; loads for other models wait
 *  until the current one is done.
 */
class ModelWorker : public Worker<ModelCommand>
{
public:
    struct Config {
        unsigned max_retries{3};
        std::chrono::milliseconds backoff_base{std::chrono::seconds{2}};
        std::chrono::milliseconds max_backoff{std::chrono::minutes{1}};
    };

    ModelWorker(Config config, port_t port, event_sink_t emit, std::shared_ptr<ArtifactStore> store);
    ~ModelWorker() override;

protected:
    void handle(ModelCommand&& cmd) override;

private:
    enum class FetchOutcome {
        Ok,
        Failed,
        Interrupted
    };

    void ensure(const std::string& requested, job_id_t job, bool force);
    ModelDescriptor& descriptor(const ModelInfo& info);
    FetchOutcome fetchWithRetries(ModelDescriptor& desc, const std::string& artifact,
                                  size_t index, std::string& error);
    bool backoff(std::chrono::milliseconds delay);
    bool interrupted();
    void reportProgress(const ModelDescriptor& desc, size_t index, uint64_t received, uint64_t total);

    const Config config_;
    std::shared_ptr<ArtifactStore> store_;
    std::map<std::string, ModelDescriptor> models_;

    // While a model is being fetched
    std::string current_;
    std::vector<job_id_t> waiting_;
    int last_percent_{-1};
    bool shutdown_requested_{false};
};

std::ostream& operator << (std::ostream& os, ModelDescriptor::State state);

} // ns
