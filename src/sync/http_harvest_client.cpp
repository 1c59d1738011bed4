#include "sync/http_harvest_client.hpp"
#include "sync/harvest_codec.hpp"

#include <QEventLoop>
#include <QLoggingCategory>
#include <QNetworkReply>
#include <QNetworkRequest>

#include <memory>

namespace atrium::sync {

Q_LOGGING_CATEGORY(atriumHttpLog, "atrium.harvest")

namespace {

struct ReplyDeleter {
    void operator()(QNetworkReply* reply) const {
        if (reply) reply->deleteLater();
    }
};

bool is_transient(QNetworkReply::NetworkError error) {
    switch (error) {
        case QNetworkReply::ConnectionRefusedError:
        case QNetworkReply::RemoteHostClosedError:
        case QNetworkReply::HostNotFoundError:
        case QNetworkReply::TimeoutError:
        case QNetworkReply::OperationCanceledError:
        case QNetworkReply::TemporaryNetworkFailureError:
        case QNetworkReply::NetworkSessionFailedError:
        case QNetworkReply::UnknownNetworkError:
        case QNetworkReply::ProxyConnectionRefusedError:
        case QNetworkReply::ProxyConnectionClosedError:
        case QNetworkReply::ProxyNotFoundError:
        case QNetworkReply::ProxyTimeoutError:
        case QNetworkReply::SslHandshakeFailedError:
            return true;
        default:
            return false;
    }
}

} // namespace

HttpHarvestClient::HttpHarvestClient(HarvestClientConfig config)
    : config_(std::move(config)) {}

Result<HarvestBatch> HttpHarvestClient::fetch(const HarvestCursor& cursor) {
    auto url = harvest_url(config_.base_url, cursor, config_.preferred_amount);
    if (url.is_err()) {
        return Result<HarvestBatch>::err(url.unwrap_err());
    }

    QNetworkRequest request(url.unwrap());
    request.setTransferTimeout(static_cast<int>(config_.timeout.count()));
    request.setRawHeader("Accept", "application/json");
    if (!config_.user.isEmpty()) {
        const QByteArray credentials = (config_.user + QLatin1Char(':') + config_.password).toUtf8();
        request.setRawHeader("Authorization", "Basic " + credentials.toBase64());
    }

    qCDebug(atriumHttpLog) << "GET" << url.unwrap().toString();

    std::unique_ptr<QNetworkReply, ReplyDeleter> reply(network_.get(request));
    QEventLoop loop;
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished()) {
        loop.exec();
    }

    const QVariant status_attr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    const int status = status_attr.isValid() ? status_attr.toInt() : 0;

    if (status == 0) {
        const auto error = reply->error();
        const std::string detail = reply->errorString().toStdString();
        if (error == QNetworkReply::NoError || is_transient(error)) {
            return Result<HarvestBatch>::err(Error::transient("Harvest request failed: " + detail));
        }
        return Result<HarvestBatch>::err(
            Error::protocol("Harvest request was rejected: " + detail));
    }

    auto status_check = check_http_status(status);
    if (status_check.is_err()) {
        return Result<HarvestBatch>::err(status_check.unwrap_err());
    }
    if (reply->error() != QNetworkReply::NoError) {
        // Body cut off mid-transfer, e.g. by the transfer timeout.
        return Result<HarvestBatch>::err(Error::transient(
            "Harvest response incomplete: " + reply->errorString().toStdString()));
    }

    return decode_harvest_response(reply->readAll());
}

} // namespace atrium::sync
