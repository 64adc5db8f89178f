#pragma once

#include <QByteArray>
#include <QMetaType>
#include <QString>

#include <optional>
#include <vector>

#include "cutline/common.hpp"
#include "cutline/event.hpp"

namespace cutline {

enum class SessionOrigin {
    Feed,
    Synthetic
};

QString originToString(SessionOrigin o);

// One immutable snapshot of detection events covering kSessionDurationSecs.
// A new acquisition replaces the whole Session; nothing edits one in place.
class Session
{
public:
    Session() = default;
    Session(std::vector<DetectionEvent> events,
            SessionOrigin origin,
            quint64 requestId = 0,
            QString seed = QString());

    const std::vector<DetectionEvent> &events() const { return events_; }
    SessionOrigin origin() const { return origin_; }

    // Acquisition that produced this session; 0 when built directly.
    quint64 requestId() const { return requestId_; }

    // Seed string, only for synthetic sessions.
    QString seed() const { return seed_; }

    static constexpr qint64 durationSecs() { return kSessionDurationSecs; }

private:
    std::vector<DetectionEvent> events_;
    SessionOrigin origin_ = SessionOrigin::Synthetic;
    quint64 requestId_ = 0;
    QString seed_;
};

// Outcome of one feed acquisition: either a session or the reason there is none.
struct AcquisitionResult
{
    std::optional<Session> session;
    QString reason;

    bool isAcquired() const { return session.has_value(); }

    static AcquisitionResult acquired(Session s);
    static AcquisitionResult unavailable(const QString &reason);
};

// Decode a feed document ({"events": [...]}) into a Feed session. A payload
// that is not such a document, or has no valid events, is Unavailable.
AcquisitionResult parseFeedPayload(const QByteArray &payload, quint64 requestId = 0);

// The acquired session, or the synthetic one for `sessionName`.
Session sessionOrFallback(const AcquisitionResult &result,
                          const QString &sessionName,
                          quint64 requestId = 0);

} // namespace cutline

Q_DECLARE_METATYPE(cutline::Session)
