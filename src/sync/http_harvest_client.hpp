#pragma once

#include "sync/harvest.hpp"

#include <QNetworkAccessManager>
#include <QString>
#include <QUrl>

#include <chrono>

namespace atrium::sync {

struct HarvestClientConfig {
    QUrl base_url;
    QString user;
    QString password;
    int preferred_amount = 500;
    std::chrono::milliseconds timeout{30000};
};

/**
 * HttpHarvestClient - HarvestSource over HTTP with Basic auth.
 *
 * fetch() blocks in a local event loop until the reply finished or the
 * transfer timeout fired. Needs a QCoreApplication.
 */
class HttpHarvestClient : public HarvestSource {
public:
    explicit HttpHarvestClient(HarvestClientConfig config);

    [[nodiscard]] Result<HarvestBatch> fetch(const HarvestCursor& cursor) override;

private:
    HarvestClientConfig config_;
    QNetworkAccessManager network_;
};

} // namespace atrium::sync
