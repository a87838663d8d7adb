#include <iostream>

#include <QClipboard>
#include <QGuiApplication>
#include <QMetaObject>
#include <QSettings>

#include "DesktopSink.h"
#include "Overloaded.h"
#include "logging.h"

using namespace std;

void DesktopSink::render(const vin::UIUpdate &update)
{
    visit(vin::overloaded{
        [](const vin::ui::StateChanged& u) {
            LOG_INFO << "State: " << u.state;
            if (u.state.is(vin::AppState::Kind::Error) && u.state.recoverable) {
                LOG_INFO << "Run 'voiceinput --reload' to try again, or 'voiceinput --model <name>' for another model.";
            }
            if (u.state.is(vin::AppState::Kind::Shutdown)) {
                QMetaObject::invokeMethod(qApp, [] {
                    QCoreApplication::quit();
                }, Qt::QueuedConnection);
            }
        },
        [](const vin::ui::TranscriptionResult& u) {
            LOG_DEBUG << "Transcription: " << u.text;
        },
        [](const vin::ui::ErrorMessage& u) {
            LOG_WARN << u.text;
        },
        [](const vin::ui::ProgressUpdate& u) {
            LOG_INFO << "Downloading model '" << u.model << "': " << u.percent << "%";
        },
        [](const vin::ui::TranslateModeChanged& u) {
            LOG_INFO << "Translate to English: " << (u.enabled ? "on" : "off");
            QSettings{}.setValue("transcribe/translate", u.enabled);
        }
    }, update);
}

void DesktopSink::insertText(const std::string &text)
{
    cout << text << endl;

    QMetaObject::invokeMethod(qApp, [text = QString::fromStdString(text)] {
        if (auto *clipboard = QGuiApplication::clipboard()) {
            clipboard->setText(text);
        }
    }, Qt::QueuedConnection);
}
