#pragma once

#include <QByteArray>
#include <QObject>
#include <QString>

#include <optional>

namespace cutline {

// Something that can deliver the raw feed document. Every fetch is tagged
// with the caller's request id and completes with exactly one of the two
// signals carrying that id, never synchronously from inside fetch().
class FeedSource : public QObject
{
    Q_OBJECT
public:
    explicit FeedSource(QObject *parent = nullptr);
    ~FeedSource() override;

    virtual void fetch(quint64 requestId) = 0;

    // Human readable location, for logs.
    virtual QString description() const = 0;

signals:
    void replyReady(quint64 requestId, const QByteArray &payload);
    void replyFailed(quint64 requestId, const QString &reason);
};

// Reads the feed from a local file.
class FileFeedSource : public FeedSource
{
    Q_OBJECT
public:
    explicit FileFeedSource(const QString &filePath, QObject *parent = nullptr);

    void fetch(quint64 requestId) override;
    QString description() const override { return filePath_; }

private:
    void readNow(quint64 requestId);

    QString filePath_;
};

// "pizza-events.json", or "pizza-events-<id>.json" for a branch.
QString feedFileName(std::optional<qint64> branchLocationId);

// http(s) URLs get an HttpFeedSource, anything else is a file path.
FeedSource *createFeedSource(const QString &location, QObject *parent = nullptr);

} // namespace cutline
