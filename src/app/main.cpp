#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>

#include <sys/socket.h>
#include <unistd.h>

#include <QCommandLineParser>
#include <QDir>
#include <QGuiApplication>
#include <QLockFile>
#include <QSettings>
#include <QSocketNotifier>
#include <QStandardPaths>

// logging.h first, so log_wrapper.h provides forward_to_logfault
#include "logging.h"
#include "vin/WhisperEngine.h"
#include "AppSettings.h"
#include "DesktopSink.h"
#include "EvdevInputSource.h"
#include "HttpArtifactStore.h"
#include "ModelCatalog.h"
#include "Pipeline.h"
#include "QtCaptureDevice.h"

using namespace std;

namespace {

int signal_fds[2] = {-1, -1};

void onSignal(int sig) {
    const auto ch = static_cast<char>(sig);
    [[maybe_unused]] const auto rc = ::write(signal_fds[0], &ch, sizeof(ch));
}

optional<logfault::LogLevel> toLogLevel(string_view name) {
    if (name.empty() || name == "off" || name == "false") {
        return logfault::LogLevel::DISABLED;
    }

    if (name == "error") {
        return logfault::LogLevel::ERROR;
    }

    if (name == "warn") {
        return logfault::LogLevel::WARN;
    }

    if (name == "debug") {
        return logfault::LogLevel::DEBUGGING;
    }

    if (name == "trace") {
        return logfault::LogLevel::TRACE;
    }

    return logfault::LogLevel::INFO;
}

void listModels() {
    for (const auto& m : vin::ModelCatalog::models()) {
        cout << m.name << '\t' << m.filename;
        if (!m.english_filename.empty()) {
            cout << ", " << m.english_filename;
        }
        cout << '\t' << (m.approx_size / (1024 * 1024)) << " MB" << endl;
    }
}

// `voiceinput --model x` or `--reload` while an instance runs. The settings are already saved.
int notifyRunningInstance(QLockFile& lock, int sig) {
    qint64 pid{};
    QString host, app_name;
    if (!lock.getLockInfo(&pid, &host, &app_name) || pid <= 0) {
        LOG_WARN << "Another instance is running, but its pid is unknown.";
        return 1;
    }

    if (::kill(static_cast<pid_t>(pid), sig) != 0) {
        LOG_WARN << "Failed to signal the running instance (pid " << pid << "): " << strerror(errno);
        return 1;
    }

    LOG_INFO << "Asked the running instance (pid " << pid << ") to "
             << (sig == SIGUSR1 ? "switch model." : "reload the model.");
    return 0;
}

} // anon ns

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);

    QCoreApplication::setOrganizationName("VoiceInput");
    QCoreApplication::setApplicationName("voiceinput");
    QCoreApplication::setApplicationVersion(VIN_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Hold Ctrl and CapsLock to dictate.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        {"model", "Speech model to use (small, medium, large).", "name"},
        {"language", "Spoken language, like 'en' or 'de'. Empty to follow the system.", "code"},
        {"translate", "Translate the speech to English (on or off).", "on|off"},
        {"device", "Run the model on the cpu or the gpu.", "cpu|gpu"},
        {"redownload", "Download the model again, even if it exists."},
        {"reload", "Ask the running instance to load its model again, after a failure."},
        {"log-level", "Console log level (off, error, warn, info, debug, trace).", "level"},
        {"list-models", "List the available models and exit."},
    });
    parser.process(app);

    if (parser.isSet("list-models")) {
        listModels();
        return 0;
    }

    QSettings settings;

    // Options that are also preferences are remembered
    if (parser.isSet("model")) {
        settings.setValue("model/selected", parser.value("model"));
    }
    if (parser.isSet("language")) {
        settings.setValue("transcribe/language", parser.value("language"));
    }
    if (parser.isSet("translate")) {
        settings.setValue("transcribe/translate", parser.value("translate") == "on");
    }
    if (parser.isSet("device")) {
        settings.setValue("transcribe/device", parser.value("device"));
    }

    optional<logfault::LogLevel> console_level;
    if (parser.isSet("log-level")) {
        console_level = toLogLevel(parser.value("log-level").toStdString());
    }
    AppSettings::initLogging(console_level);

    LOG_INFO << "Starting VoiceInput " << VIN_VERSION;
    LOG_INFO << "Configuration from '" << settings.fileName().toStdString() << "'";

    const auto cache_dir = QStandardPaths::writableLocation(QStandardPaths::CacheLocation);
    QDir{}.mkpath(cache_dir);
    QLockFile lock{cache_dir + "/voiceinput.lock"};
    if (!lock.tryLock(100)) {
        if (parser.isSet("model") || parser.isSet("reload")) {
            return notifyRunningInstance(lock, parser.isSet("model") ? SIGUSR1 : SIGHUP);
        }
        LOG_INFO << "Another instance is already running.";
        return 0;
    }

    auto config = AppSettings::pipelineConfig();
    config.state_machine.redownload = parser.isSet("redownload");

    const bool use_gpu = settings.value("transcribe/device", "cpu").toString() == "gpu";
    auto engine = vin::WhisperEngine::create({.use_gpu = use_gpu, .flash_attn = use_gpu});
    if (!engine) {
        LOG_ERROR << "Failed to create the speech engine.";
        return 1;
    }
    engine->setLogger(vin_log::forward_to_logfault,
                      static_cast<vin_log::Level>(settings.value("logging/applevel", 4).toInt()));
    LOG_INFO << "Using " << engine->version();

    auto input = make_shared<EvdevInputSource>(AppSettings::hotkeys());
    if (!input->open()) {
        LOG_ERROR << "Cannot read the keyboard: " << input->lastError();
        return 1;
    }

    vin::Pipeline pipeline{config, {
        .capture = QtCaptureDevice::factory(),
        .engine = engine,
        .store = make_shared<HttpArtifactStore>(AppSettings::modelsPath(), AppSettings::modelsUrl()),
        .input = input,
        .presentation = make_shared<DesktopSink>(),
        .language_probe = [] { return AppSettings::language(); }
    }};

    // Ctrl+C and friends shut the pipeline down, and the sink then quits the event loop
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, signal_fds) != 0) {
        LOG_ERROR << "socketpair() failed.";
        return 1;
    }
    QSocketNotifier signal_notifier{signal_fds[1], QSocketNotifier::Read};
    QObject::connect(&signal_notifier, &QSocketNotifier::activated, &app, [&] {
        char ch{};
        if (::read(signal_fds[1], &ch, sizeof(ch)) != sizeof(ch)) {
            return;
        }

        switch(ch) {
        case SIGHUP:
            LOG_INFO << "SIGHUP received. Reloading the model.";
            pipeline.reloadModel();
            break;
        case SIGUSR1: {
            const auto model = AppSettings::selectedModel();
            LOG_INFO << "SIGUSR1 received. Selecting model '" << model << "'";
            pipeline.selectModel(model);
        } break;
        default:
            LOG_INFO << "Signal received. Shutting down.";
            pipeline.shutdown();
        }
    });
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    std::signal(SIGHUP, onSignal);
    std::signal(SIGUSR1, onSignal);

    pipeline.start();
    const auto result = app.exec();

    pipeline.shutdown();
    pipeline.wait();

    LOG_INFO << "Bye.";
    return result;
}
