#include "cutline/http_feed_source.hpp"

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QDebug>

namespace cutline {

HttpFeedSource::HttpFeedSource(const QUrl &url, QObject *parent)
    : FeedSource(parent)
    , url_(url)
    , nam_(new QNetworkAccessManager(this))
{
}

HttpFeedSource::~HttpFeedSource() = default;

void HttpFeedSource::fetch(quint64 requestId)
{
    QNetworkRequest request(url_);
    request.setAttribute(QNetworkRequest::CacheLoadControlAttribute,
                         QNetworkRequest::AlwaysNetwork);
    request.setRawHeader("Cache-Control", "no-store");
    request.setTransferTimeout(transferTimeoutMs_);

    QNetworkReply *reply = nam_->get(request);
    connect(reply, &QNetworkReply::finished, this, [this, reply, requestId]() {
        handleFinished(reply, requestId);
    });
}

void HttpFeedSource::handleFinished(QNetworkReply *reply, quint64 requestId)
{
    reply->deleteLater();

    if (reply->error() != QNetworkReply::NoError) {
        const QString reason = QStringLiteral("GET %1 failed: %2")
                                   .arg(url_.toString(), reply->errorString());
        qWarning() << "HttpFeedSource:" << reason;
        emit replyFailed(requestId, reason);
        return;
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status < 200 || status >= 300) {
        const QString reason = QStringLiteral("GET %1 returned HTTP %2")
                                   .arg(url_.toString())
                                   .arg(status);
        qWarning() << "HttpFeedSource:" << reason;
        emit replyFailed(requestId, reason);
        return;
    }

    emit replyReady(requestId, reply->readAll());
}

} // namespace cutline
