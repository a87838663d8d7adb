#pragma once

#include <filesystem>

#include <QNetworkReply>
#include <QObject>
#include <QUrl>

#include <qcorotask.h>

#include "vin/ArtifactStore.h"

/*! Emits one signal for any of the reply's signals we wait for. */
class ReplyEventProxy : public QObject {
    Q_OBJECT
public:
    enum class Event {
        ReadyRead,
        Finished,
        Error
    };
    Q_ENUM(Event)

    explicit ReplyEventProxy(QNetworkReply *reply, QObject *parent = nullptr);

signals:
    void event(ReplyEventProxy::Event ev);
};

/*! Model files in a local directory, downloaded over HTTP(S) when missing.
 *
 *  fetch() runs a coroutine to completion on the calling thread.
 */
class HttpArtifactStore : public vin::ArtifactStore
{
public:
    HttpArtifactStore(std::filesystem::path dir, QUrl baseUrl);

    bool exists(const std::string& name) const override;
    std::filesystem::path localPath(const std::string& name) const override;
    vin::FetchResult fetch(const std::string& name,
                           const progress_cb_t& progress,
                           const abort_cb_t& shouldAbort) override;

private:
    QCoro::Task<vin::FetchResult> download(QUrl url, QString fullPath,
                                           const progress_cb_t& progress,
                                           const abort_cb_t& shouldAbort);

    const std::filesystem::path dir_;
    const QUrl base_url_;
};
