#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace vin {

struct FetchResult {
    bool ok{};
    std::filesystem::path path;
    std::string error;
    bool retryable{};
};

/*! Local storage of downloadable artifacts (model weights).
 *
 *  Artifacts are identified by their file name. An instance is used by one thread
 *  at a time.
 */
class ArtifactStore {
public:
    // bytesTotal is 0 when the size is not known
    using progress_cb_t = std::function<void(uint64_t bytesReceived, uint64_t bytesTotal)>;

    // Polled during a fetch. Returning true aborts it.
    using abort_cb_t = std::function<bool()>;

    ArtifactStore() = default;
    virtual ~ArtifactStore() = default;

    virtual bool exists(const std::string& name) const = 0;

    virtual std::filesystem::path localPath(const std::string& name) const = 0;

    /*! Downloads the artifact, replacing any local copy.
     *
     *  A partially downloaded artifact is never visible under its final path.
     */
    virtual FetchResult fetch(const std::string& name,
                              const progress_cb_t& progress,
                              const abort_cb_t& shouldAbort) = 0;
};

} // ns
