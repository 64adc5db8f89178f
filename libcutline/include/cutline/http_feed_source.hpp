#pragma once

#include <QUrl>

#include "cutline/feed_source.hpp"

class QNetworkAccessManager;
class QNetworkReply;

namespace cutline {

// Fetches the feed with a plain GET. Non-2xx statuses and transport errors
// are reported through replyFailed().
class HttpFeedSource : public FeedSource
{
    Q_OBJECT
public:
    explicit HttpFeedSource(const QUrl &url, QObject *parent = nullptr);
    ~HttpFeedSource() override;

    void fetch(quint64 requestId) override;
    QString description() const override { return url_.toString(); }

    // Requests still in flight are aborted after this many milliseconds.
    void setTransferTimeout(int ms) { transferTimeoutMs_ = ms; }

private:
    void handleFinished(QNetworkReply *reply, quint64 requestId);

    QUrl url_;
    QNetworkAccessManager *nam_ = nullptr;
    int transferTimeoutMs_ = 15000;
};

} // namespace cutline
