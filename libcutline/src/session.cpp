#include "cutline/session.hpp"

#include "cutline/event_validator.hpp"
#include "cutline/synthetic_events.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QDebug>

namespace cutline {

QString originToString(SessionOrigin o)
{
    switch (o) {
    case SessionOrigin::Feed:
        return QStringLiteral("feed");
    case SessionOrigin::Synthetic:
        return QStringLiteral("synthetic");
    }

    return QStringLiteral("synthetic");
}

Session::Session(std::vector<DetectionEvent> events,
                 SessionOrigin origin,
                 quint64 requestId,
                 QString seed)
    : events_(std::move(events))
    , origin_(origin)
    , requestId_(requestId)
    , seed_(std::move(seed))
{
}

AcquisitionResult AcquisitionResult::acquired(Session s)
{
    AcquisitionResult r;
    r.session = std::move(s);
    return r;
}

AcquisitionResult AcquisitionResult::unavailable(const QString &reason)
{
    AcquisitionResult r;
    r.reason = reason;
    return r;
}

AcquisitionResult parseFeedPayload(const QByteArray &payload, quint64 requestId)
{
    QJsonParseError err{};
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &err);
    if (err.error != QJsonParseError::NoError) {
        return AcquisitionResult::unavailable(
            QStringLiteral("feed is not valid JSON: %1").arg(err.errorString()));
    }
    if (!doc.isObject()) {
        return AcquisitionResult::unavailable(QStringLiteral("feed is not a JSON object"));
    }

    const QJsonValue eventsVal = doc.object().value(QStringLiteral("events"));
    if (!eventsVal.isArray()) {
        return AcquisitionResult::unavailable(QStringLiteral("feed has no \"events\" array"));
    }

    std::vector<DetectionEvent> events = validateEvents(eventsVal.toArray());
    if (events.empty()) {
        return AcquisitionResult::unavailable(QStringLiteral("feed contains no valid events"));
    }

    return AcquisitionResult::acquired(
        Session(std::move(events), SessionOrigin::Feed, requestId));
}

Session sessionOrFallback(const AcquisitionResult &result,
                          const QString &sessionName,
                          quint64 requestId)
{
    if (result.isAcquired()) {
        return *result.session;
    }

    const QString seed = syntheticSeedFor(sessionName);
    qInfo() << "Session: feed unavailable:" << result.reason
            << "- using synthetic events seeded with" << seed;

    return Session(generateSyntheticEvents(seed), SessionOrigin::Synthetic, requestId, seed);
}

} // namespace cutline
