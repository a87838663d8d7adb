#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <QUrl>

#include "EvdevInputSource.h"
#include "Pipeline.h"
#include "logging.h"

/*! The application's persistent configuration, kept in QSettings. */
class AppSettings
{
public:
    // Adds the log handlers. `consoleLevel` overrides the configured console level.
    static void initLogging(std::optional<logfault::LogLevel> consoleLevel = {});

    static vin::Pipeline::Config pipelineConfig();

    // `model/selected`, normalized. Re-reads the settings file, which another process may have changed.
    static std::string selectedModel();
    static EvdevInputSource::Config hotkeys();

    static std::filesystem::path modelsPath();
    static QUrl modelsUrl();

    // The configured language, or the system locale's
    static std::optional<std::string> language();
};
