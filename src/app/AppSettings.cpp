#include <iostream>

#include <QLocale>
#include <QSettings>
#include <QStandardPaths>
#include <QStringList>

#include "AppSettings.h"
#include "ModelCatalog.h"

using namespace std;

namespace {

constexpr auto default_models_url = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/";

vector<int> toCodes(const QString& value, vector<int> fallback) {
    vector<int> codes;
    for (const auto& part : value.split(',', Qt::SkipEmptyParts)) {
        bool ok = false;
        const int code = part.trimmed().toInt(&ok);
        if (ok && code > 0) {
            codes.push_back(code);
        } else {
            LOG_WARN_N << "Ignoring invalid key code '" << part.toStdString() << "'";
        }
    }
    return codes.empty() ? std::move(fallback) : codes;
}

} // anon ns

void AppSettings::initLogging(std::optional<logfault::LogLevel> consoleLevel)
{
    QSettings settings{};

    if (!settings.contains("logging/applevel")) {
        settings.setValue("logging/applevel", 4); // INFO
    }

    const auto applevel = consoleLevel ? static_cast<int>(*consoleLevel)
                                       : settings.value("logging/applevel", 4).toInt();
    if (applevel > 0) {
        logfault::LogManager::Instance().AddHandler(
            make_unique<logfault::StreamHandler>(clog, static_cast<logfault::LogLevel>(applevel)));
        LOG_INFO << "Logging to console";
    }

    auto level = settings.value("logging/level", 0).toInt();
    if (level > 0) {
        if (auto path = settings.value("logging/path", "").toString().toStdString(); !path.empty()) {
            const bool prune = settings.value("logging/prune", "").toString() == "true";
            logfault::LogManager::Instance().AddHandler(
                make_unique<logfault::StreamHandler>(path, static_cast<logfault::LogLevel>(level), prune));

            LOG_INFO << "Logging to: " << path;
        }
    }
}

std::string AppSettings::selectedModel()
{
    QSettings settings{};
    settings.sync();

    const auto selected = settings.value("model/selected", "small").toString().toStdString();
    auto name = vin::ModelCatalog::normalize(selected);
    if (name != selected) {
        settings.setValue("model/selected", QString::fromStdString(name));
    }
    return name;
}

vin::Pipeline::Config AppSettings::pipelineConfig()
{
    QSettings settings{};
    vin::Pipeline::Config config;

    auto& sm = config.state_machine;
    sm.initial_model = selectedModel();
    sm.translate = settings.value("transcribe/translate", false).toBool();
    sm.language = language().value_or(string{});
    sm.model_load_timeout = chrono::seconds{settings.value("timeouts/model_load_s", 30 * 60).toInt()};
    sm.transcription_timeout = chrono::seconds{settings.value("timeouts/transcription_s", 30).toInt()};

    // The worker gives up at the same time as the state machine
    config.transcription.timeout = sm.transcription_timeout;

    config.audio.max_recording = chrono::seconds{settings.value("audio/max_recording_s", 300).toInt()};

    config.model.max_retries = settings.value("download/max_retries", 3).toUInt();
    config.model.backoff_base = chrono::milliseconds{settings.value("download/backoff_ms", 2000).toInt()};
    config.model.max_backoff = chrono::milliseconds{settings.value("download/max_backoff_ms", 60'000).toInt()};

    return config;
}

EvdevInputSource::Config AppSettings::hotkeys()
{
    QSettings settings{};
    EvdevInputSource::Config config;

    config.modifiers = toCodes(settings.value("hotkeys/modifier").toString(), config.modifiers);
    if (const auto trigger = settings.value("hotkeys/trigger", config.trigger).toInt(); trigger > 0) {
        config.trigger = trigger;
    }
    config.device = settings.value("hotkeys/device", "").toString().toStdString();
    return config;
}

std::filesystem::path AppSettings::modelsPath()
{
    QSettings settings{};
    auto base = settings.value("models/path", "").toString().trimmed();
    if (base.isEmpty()) {
        base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation) + "/models";
        settings.setValue("models/path", base);
    }
    return base.toStdString();
}

QUrl AppSettings::modelsUrl()
{
    auto url = QSettings{}.value("models/url", default_models_url).toString();
    if (!url.endsWith('/')) {
        url += '/';
    }
    return QUrl{url};
}

std::optional<std::string> AppSettings::language()
{
    if (auto lang = QSettings{}.value("transcribe/language", "").toString().trimmed(); !lang.isEmpty()) {
        return lang.toStdString();
    }

    if (const auto name = QLocale::system().name(); name.size() >= 2 && name != "C") {
        return name.left(2).toStdString();
    }

    return nullopt;
}
