#include "cutline/session_loader.hpp"

#include "cutline/feed_source.hpp"

#include <QDebug>

namespace cutline {

SessionLoader::SessionLoader(FeedSource *source, QObject *parent)
    : QObject(parent)
{
    setSource(source);
}

void SessionLoader::setSource(FeedSource *source)
{
    if (source_ == source)
        return;

    if (source_) {
        disconnect(source_.data(), nullptr, this, nullptr);
    }

    source_ = source;

    if (source) {
        connect(source, &FeedSource::replyReady,
                this, &SessionLoader::handleReplyReady);
        connect(source, &FeedSource::replyFailed,
                this, &SessionLoader::handleReplyFailed);
        // A source destroyed mid-request will never answer.
        connect(source, &QObject::destroyed, this, [this]() {
            if (loading_) {
                finish(latestRequestId_,
                       AcquisitionResult::unavailable(QStringLiteral("feed source destroyed")));
            }
        });
    }
}

quint64 SessionLoader::reload()
{
    const quint64 requestId = ++latestRequestId_;

    // No session while an acquisition is outstanding.
    session_.reset();

    if (!source_) {
        finish(requestId, AcquisitionResult::unavailable(QStringLiteral("no feed source configured")));
        return requestId;
    }

    setLoading(true);
    qDebug() << "SessionLoader: request" << requestId << "->" << source_->description();
    source_->fetch(requestId);
    return requestId;
}

std::optional<AnalyticsReport> SessionLoader::report(const QueryParameters &params) const
{
    if (!session_.has_value()) {
        return std::nullopt;
    }
    return buildReport(*session_, params);
}

bool SessionLoader::isCurrent(quint64 requestId) const
{
    if (requestId != latestRequestId_) {
        qDebug() << "SessionLoader: dropping stale reply" << requestId
                 << "(latest is" << latestRequestId_ << ")";
        return false;
    }
    if (!loading_) {
        qDebug() << "SessionLoader: request" << requestId << "already resolved";
        return false;
    }
    return true;
}

void SessionLoader::handleReplyReady(quint64 requestId, const QByteArray &payload)
{
    if (!isCurrent(requestId))
        return;

    finish(requestId, parseFeedPayload(payload, requestId));
}

void SessionLoader::handleReplyFailed(quint64 requestId, const QString &reason)
{
    if (!isCurrent(requestId))
        return;

    finish(requestId, AcquisitionResult::unavailable(reason));
}

void SessionLoader::finish(quint64 requestId, const AcquisitionResult &result)
{
    session_ = sessionOrFallback(result, sessionName_, requestId);
    setLoading(false);

    qInfo() << "SessionLoader: session" << requestId << "ready with"
            << session_->events().size() << "events from"
            << originToString(session_->origin());

    // Copy: a slot may call reload() and reset session_.
    const Session ready = *session_;
    emit sessionReady(ready);
}

void SessionLoader::setLoading(bool loading)
{
    if (loading_ == loading)
        return;
    loading_ = loading;
    emit loadingChanged(loading_);
}

} // namespace cutline
