#pragma once

#include "core/bluetooth/AdapterEvent.hpp"
#include <QList>
#include <QObject>
#include <QQueue>
#include <QSet>
#include <QString>
#include <chrono>

namespace btt {

class IAdapterService;
class INotificationService;
class TimeoutController;

enum class AdapterState {
    PoweredOff,
    PoweredOnIdle,
    PoweredOnActive
};

const char* toString(AdapterState state);

struct TimeoutPolicy {
    std::chrono::milliseconds timeout{301000};
    QList<std::chrono::milliseconds> warnings;
    bool notificationsEnabled = true;
};

/// Owns the adapter's power state and the set of connected devices, and
/// drives the TimeoutController from them.
///
/// Observer events, timer checkpoints and power-off results all go through
/// one bounded FIFO that is drained on the event loop one input at a time.
/// A checkpoint is only acted on if its session is still current when it is
/// dequeued, so an event queued ahead of it wins.
class AdapterStateMachine : public QObject {
    Q_OBJECT
public:
    static constexpr int MAX_QUEUED_INPUTS = 64;

    AdapterStateMachine(IAdapterService* adapter, INotificationService* notifier,
                        TimeoutController* timeout, const TimeoutPolicy& policy,
                        QObject* parent = nullptr);

    /// Query the adapter and enter the matching state, arming the countdown
    /// if it is powered with no devices. Returns false if the query failed.
    bool initialize();

    AdapterState state() const { return state_; }
    bool isPowered() const { return state_ != AdapterState::PoweredOff; }
    QSet<QString> connectedDevices() const { return devices_; }
    int pendingInputs() const { return queue_.size(); }

public slots:
    void post(const btt::AdapterEvent& event);

signals:
    void stateChanged(btt::AdapterState state);

private slots:
    void onWarningDue(quint64 session, qint64 offsetMs);
    void onDeadlineReached(quint64 session);

private:
    struct Input {
        enum class Kind { Event, Warning, Deadline, PowerOffResult };
        Kind kind = Kind::Event;
        AdapterEvent event;
        quint64 session = 0;
        qint64 offsetMs = 0;
        bool ok = false;
    };

    void enqueue(const Input& input);
    void drain();
    void process(const Input& input);

    void handleEvent(const AdapterEvent& event);
    void handleWarning(quint64 session, qint64 offsetMs);
    void handleDeadline(quint64 session);
    void handlePowerOffResult(bool ok);

    bool resynchronize();
    void applySnapshot(bool powered, const QStringList& devices);
    void armTimeout();
    void setState(AdapterState next);
    void notify(const QString& summary, const QString& body, const QString& icon);

    IAdapterService* adapter_;
    INotificationService* notifier_;
    TimeoutController* timeout_;
    TimeoutPolicy policy_;

    AdapterState state_ = AdapterState::PoweredOff;
    QSet<QString> devices_;
    QQueue<Input> queue_;
    bool drainScheduled_ = false;
    bool resyncPending_ = false;
};

} // namespace btt

Q_DECLARE_METATYPE(btt::AdapterState)
