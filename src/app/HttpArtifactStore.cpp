#include <format>

#include <QFile>
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QScopeGuard>

#include <qcorosignal.h>
#include <qcorotask.h>

#include "HttpArtifactStore.h"
#include "logging.h"

using namespace std;

namespace {

constexpr auto wake_interval = 100ms;
constexpr auto transfer_timeout = 300s;

bool isRetryable(QNetworkReply::NetworkError error, int httpStatus) {
    if (httpStatus >= 400 && httpStatus < 500) {
        return false;
    }

    switch(error) {
    case QNetworkReply::ContentNotFoundError:
    case QNetworkReply::ContentAccessDenied:
    case QNetworkReply::ContentGoneError:
    case QNetworkReply::AuthenticationRequiredError:
    case QNetworkReply::ProtocolUnknownError:
    case QNetworkReply::ProtocolInvalidOperationError:
        return false;
    default:
        return true;
    }
}

vin::FetchResult failed(string error, bool retryable) {
    return {.ok = false, .path = {}, .error = std::move(error), .retryable = retryable};
}

} // anon ns

ReplyEventProxy::ReplyEventProxy(QNetworkReply *reply, QObject *parent)
    : QObject(parent)
{
    connect(reply, &QNetworkReply::readyRead,
            this, [this] {
                emit event(Event::ReadyRead);
            });

    connect(reply, &QNetworkReply::finished,
            this, [this] {
                LOG_TRACE_N << "ReplyEventProxy: finished signaled.";
                emit event(Event::Finished);
            });

    connect(reply, &QNetworkReply::errorOccurred,
            this, [this](QNetworkReply::NetworkError) {
                LOG_TRACE_N << "ReplyEventProxy: errorOccurred signaled.";
                emit event(Event::Error);
            });
}

HttpArtifactStore::HttpArtifactStore(std::filesystem::path dir, QUrl baseUrl)
    : dir_{std::move(dir)}, base_url_{std::move(baseUrl)}
{
    if (!filesystem::is_directory(dir_)) {
        LOG_INFO_N << "Creating model directory: " << dir_;
        error_code ec;
        filesystem::create_directories(dir_, ec);
        if (ec) {
            LOG_ERROR_N << "Failed to create " << dir_ << ": " << ec.message();
        }
    }
}

bool HttpArtifactStore::exists(const std::string &name) const
{
    error_code ec;
    const auto path = localPath(name);
    return filesystem::is_regular_file(path, ec) && filesystem::file_size(path, ec) > 0 && !ec;
}

std::filesystem::path HttpArtifactStore::localPath(const std::string &name) const
{
    return dir_ / name;
}

vin::FetchResult HttpArtifactStore::fetch(const std::string &name,
                                          const progress_cb_t &progress,
                                          const abort_cb_t &shouldAbort)
{
    const auto url = base_url_.resolved(QUrl{QString::fromStdString(name)});
    const auto full_path = QString::fromStdString(localPath(name).string());

    return QCoro::waitFor(download(url, full_path, progress, shouldAbort));
}

QCoro::Task<vin::FetchResult> HttpArtifactStore::download(QUrl url, QString fullPath,
                                                          const progress_cb_t &progress,
                                                          const abort_cb_t &shouldAbort)
{
    LOG_DEBUG_N << "Downloading " << url.toString().toStdString() << " to " << fullPath.toStdString();

    const QString tmp_path = fullPath + ".part";

    QNetworkAccessManager nam;
    QNetworkRequest request{url};
    request.setTransferTimeout(chrono::duration_cast<chrono::milliseconds>(transfer_timeout));
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    QNetworkReply *reply = nam.get(request);

    // Delete the reply and remove the temporary file on every exit path
    const auto guard = qScopeGuard([reply, tmp_path] {
        reply->deleteLater();
        if (QFile::exists(tmp_path)) {
            LOG_DEBUG_N << "Removing temporary file: " << tmp_path.toStdString();
            QFile::remove(tmp_path);
        }
    });

    QFile out(tmp_path);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        reply->abort();
        co_return failed(format("Cannot write {}: {}", tmp_path.toStdString(), out.errorString().toStdString()), false);
    }

    if (progress) {
        QObject::connect(reply, &QNetworkReply::downloadProgress,
                         [&progress](qint64 bytesReceived, qint64 bytesTotal) {
            progress(static_cast<uint64_t>(max<qint64>(0, bytesReceived)),
                     static_cast<uint64_t>(max<qint64>(0, bytesTotal)));
        });
    }

    ReplyEventProxy proxy{reply};

    bool write_error = false;
    auto drain_to_file = [&] {
        while (reply->bytesAvailable() > 0) {
            const QByteArray chunk = reply->read(64 * 1024);
            if (chunk.isEmpty()) {
                break;
            }

            if (out.write(chunk) != chunk.size()) {
                write_error = true;
                reply->abort();
                break;
            }
        }
    };

    while (true) {
        drain_to_file();
        if (write_error) {
            co_return failed(format("Disk write error while downloading {}", url.toString().toStdString()), false);
        }

        if (shouldAbort && shouldAbort()) {
            LOG_DEBUG_N << "Download of " << url.toString().toStdString() << " aborted.";
            reply->abort();
            co_return failed("aborted", false);
        }

        if (reply->isFinished() && reply->bytesAvailable() == 0) {
            break;
        }

        if (reply->error() != QNetworkReply::NoError) {
            break;
        }

        // Wake up regularly, so an abort is noticed while the network is quiet
        co_await qCoro(&proxy, &ReplyEventProxy::event, wake_interval);
    }

    out.flush();
    out.close();

    const int http_status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (reply->error() != QNetworkReply::NoError) {
        const auto msg = format("Failed to download {}: {}", url.toString().toStdString(),
                                reply->errorString().toStdString());
        LOG_WARN_N << msg;
        co_return failed(msg, isRetryable(reply->error(), http_status));
    }

    if (http_status < 200 || http_status >= 300) {
        const auto msg = format("Failed to download {}: HTTP status {}", url.toString().toStdString(), http_status);
        LOG_WARN_N << msg;
        co_return failed(msg, isRetryable(QNetworkReply::NoError, http_status));
    }

    QFile::remove(fullPath);
    if (!QFile::rename(tmp_path, fullPath)) {
        co_return failed(format("Failed to rename {} to {}", tmp_path.toStdString(), fullPath.toStdString()), false);
    }

    LOG_INFO_N << "Downloaded " << fullPath.toStdString();
    co_return vin::FetchResult{.ok = true, .path = fullPath.toStdString(), .error = {}, .retryable = false};
}
