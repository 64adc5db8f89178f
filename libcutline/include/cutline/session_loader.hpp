#pragma once

#include <QObject>
#include <QPointer>
#include <QString>

#include <optional>

#include "cutline/analytics.hpp"
#include "cutline/session.hpp"

namespace cutline {

class FeedSource;

// Owns the current Session and replaces it on every acquisition. Each
// reload() gets a new request id; replies carrying any other id are stale
// and dropped, so the most recent request wins even if an older one
// finishes later. A failed or unusable feed falls back to synthetic events.
class SessionLoader : public QObject
{
    Q_OBJECT
public:
    // `source` is not owned and may be null until setSource() is called. If it
    // is destroyed, the loader behaves as if no source were set.
    explicit SessionLoader(FeedSource *source = nullptr, QObject *parent = nullptr);

    void setSource(FeedSource *source);
    FeedSource *source() const { return source_.data(); }

    // Name the synthetic fallback is seeded from.
    void setSessionName(const QString &name) { sessionName_ = name; }
    QString sessionName() const { return sessionName_; }

    // Start a new acquisition; the current session is discarded until it
    // resolves. Returns the request id. Without a source the fallback is
    // applied on the spot.
    quint64 reload();

    bool isLoading() const { return loading_; }
    quint64 latestRequestId() const { return latestRequestId_; }

    const std::optional<Session> &session() const { return session_; }

    // nullopt while there is no session.
    std::optional<AnalyticsReport> report(const QueryParameters &params) const;

signals:
    void sessionReady(const cutline::Session &session);
    void loadingChanged(bool loading);

private slots:
    void handleReplyReady(quint64 requestId, const QByteArray &payload);
    void handleReplyFailed(quint64 requestId, const QString &reason);

private:
    bool isCurrent(quint64 requestId) const;
    void finish(quint64 requestId, const AcquisitionResult &result);
    void setLoading(bool loading);

    QPointer<FeedSource> source_;
    QString sessionName_;
    quint64 latestRequestId_ = 0;
    bool loading_ = false;
    std::optional<Session> session_;
};

} // namespace cutline
