#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <span>
#include <string>

#include "vin/log_wrapper.h"

/*! Only pure interfaces here. The implementations are in separate libraries.
 */

namespace vin {

// Sample rate the engines expect, mono float samples
constexpr unsigned inference_sample_rate = 16000;

/*! A loaded model.
 *
 *  When the last reference goes away, the model is unloaded.
 */
class ModelHandle {
public:
    ModelHandle() = default;
    virtual ~ModelHandle() = default;

    ModelHandle(const ModelHandle&) = delete;
    ModelHandle& operator=(const ModelHandle&) = delete;

    virtual const std::filesystem::path& path() const noexcept = 0;
};

struct RunParams {
    std::string language;   // empty for auto-detect
    bool translate{};       // translate to English
    int threads{-1};        // -1 for the engine's default

    // Polled by the engine while it works. Returning true cancels the run.
    // May be called from the engine's own threads, but never concurrently.
    std::function<bool()> should_abort;
};

class InferenceEngine {
public:
    InferenceEngine() = default;
    virtual ~InferenceEngine() = default;

    /*! Returns the version string of the underlying library.
     *
     * Example: "whisper.cpp 1.7.6"
     */
    virtual std::string version() const = 0;

    /*! Routes the engine's log output to the application's logger. */
    virtual void setLogger(vin_log::callback_t cb, vin_log::Level level) = 0;

    /*! Loads the model at modelPath.
     *
     * @return The loaded model, or nullptr on failure. See lastError().
     */
    virtual std::shared_ptr<ModelHandle> load(const std::filesystem::path& modelPath) = 0;

    /*! Transcribes mono samples at inference_sample_rate.
     *
     * @param model Model returned by load() on this engine.
     * @param samples Audio to transcribe.
     * @param params Language, translation and cancellation.
     * @param text Receives the transcript.
     * @return True on success. On failure or cancellation, see lastError().
     */
    virtual bool run(ModelHandle& model,
                     std::span<const float> samples,
                     const RunParams& params,
                     std::string& text) = 0;

    /*! Returns the last error message, if any. */
    virtual std::string lastError() const = 0;
};

} // ns
