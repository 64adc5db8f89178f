#include "cutline/feed_source.hpp"

#include "cutline/http_feed_source.hpp"

#include <QFile>
#include <QTimer>
#include <QUrl>
#include <QDebug>

namespace cutline {

FeedSource::FeedSource(QObject *parent)
    : QObject(parent)
{
}

FeedSource::~FeedSource() = default;

FileFeedSource::FileFeedSource(const QString &filePath, QObject *parent)
    : FeedSource(parent)
    , filePath_(filePath)
{
}

void FileFeedSource::fetch(quint64 requestId)
{
    // Deliver on the next event loop turn, like a network reply would.
    QTimer::singleShot(0, this, [this, requestId]() { readNow(requestId); });
}

void FileFeedSource::readNow(quint64 requestId)
{
    QFile file(filePath_);
    if (!file.open(QIODevice::ReadOnly)) {
        const QString reason = QStringLiteral("cannot open %1: %2")
                                   .arg(filePath_, file.errorString());
        qWarning() << "FileFeedSource:" << reason;
        emit replyFailed(requestId, reason);
        return;
    }

    emit replyReady(requestId, file.readAll());
}

QString feedFileName(std::optional<qint64> branchLocationId)
{
    if (!branchLocationId.has_value()) {
        return QStringLiteral("pizza-events.json");
    }
    return QStringLiteral("pizza-events-%1.json").arg(*branchLocationId);
}

FeedSource *createFeedSource(const QString &location, QObject *parent)
{
    const QUrl url(location);
    const QString scheme = url.scheme().toLower();
    if (scheme == QLatin1String("http") || scheme == QLatin1String("https")) {
        return new HttpFeedSource(url, parent);
    }
    if (scheme == QLatin1String("file")) {
        return new FileFeedSource(url.toLocalFile(), parent);
    }
    return new FileFeedSource(location, parent);
}

} // namespace cutline
