#pragma once

#include "vin/InferenceEngine.h"

#if defined(_WIN32)
#if defined(VIN_WHISPER_WRAP_BUILD)
#define VIN_WHISPER_WRAP_API __declspec(dllexport)
#else
#define VIN_WHISPER_WRAP_API __declspec(dllimport)
#endif
#else
#define VIN_WHISPER_WRAP_API __attribute__((visibility("default")))
#endif

namespace vin {

/*! Inference engine backed by whisper.cpp
 *
 *  One run at a time per engine. Each run gets its own whisper state, so a model
 *  can be kept loaded between runs.
 */
class VIN_WHISPER_WRAP_API WhisperEngine : public InferenceEngine {
public:
    struct CreateParams {
        bool use_gpu{};
        bool flash_attn{};
        int gpu_device{};
        int beam_size{5};
        float temperature{0.0f};
    };

    WhisperEngine();
    ~WhisperEngine() override;

    /*! Creates a new Whisper engine instance.
     *
     * @param params Parameters for creating the engine.
     * @return Shared pointer to the new Whisper engine instance.
     */
    static std::shared_ptr<WhisperEngine> create(const CreateParams& params);
};

} // ns
