#pragma once

#include <QElapsedTimer>
#include <QList>
#include <QObject>
#include <QTimer>
#include <chrono>

namespace btt {

/// One cancellable countdown with warning checkpoints before the deadline.
///
/// Each start() opens a new session with a fresh id. Checkpoints are emitted
/// together with the id of the session that scheduled them, so a receiver that
/// queues them can drop the ones whose session is no longer current. Once a
/// session is cancelled nothing more is emitted for it.
///
/// After deadlineReached the session stays live (expired) until cancel().
class TimeoutController : public QObject {
    Q_OBJECT
public:
    using Duration = std::chrono::milliseconds;

    explicit TimeoutController(QObject* parent = nullptr);

    /// Arm a countdown of total with warnings at the given offsets before the
    /// deadline. Offsets not strictly inside (0, total) are skipped, duplicates
    /// collapse. Returns false and does nothing if a session is live.
    bool start(Duration total, const QList<Duration>& warnings);

    /// cancel() followed by start().
    bool reset(Duration total, const QList<Duration>& warnings);

    /// Drop the live session, if any. Safe to call repeatedly.
    void cancel();

    bool isActive() const { return active_; }
    bool isExpired() const { return active_ && expired_; }
    quint64 sessionId() const { return session_; }
    bool isCurrent(quint64 session) const { return active_ && session == session_; }
    /// True while a checkpoint of the live session is scheduled.
    bool isArmed() const { return timer_.isActive(); }

    /// Time left until the deadline of the live session, zero when idle or expired.
    Duration remaining() const;

    /// Offsets already dispatched in the live session, in dispatch order.
    QList<Duration> firedWarnings() const { return fired_; }
    /// Offsets still to be dispatched in the live session, longest first.
    QList<Duration> pendingWarnings() const { return pending_; }

signals:
    void warningDue(quint64 session, qint64 offsetMs);
    void deadlineReached(quint64 session);

private:
    void scheduleNext();
    void onTimeout();

    QTimer timer_;
    QElapsedTimer clock_;
    Duration total_{0};
    QList<Duration> pending_;
    QList<Duration> fired_;
    quint64 session_ = 0;
    bool active_ = false;
    bool expired_ = false;
};

} // namespace btt
