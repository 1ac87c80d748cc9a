#include "AdapterStateMachine.hpp"
#include "core/Duration.hpp"
#include "core/services/IAdapterService.hpp"
#include "core/services/INotificationService.hpp"
#include "core/timeout/TimeoutController.hpp"
#include <QMetaObject>
#include <QPointer>
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace btt {

const char* toString(AdapterState state)
{
    switch (state) {
    case AdapterState::PoweredOff: return "PoweredOff";
    case AdapterState::PoweredOnIdle: return "PoweredOnIdle";
    case AdapterState::PoweredOnActive: return "PoweredOnActive";
    }
    return "Unknown";
}

AdapterStateMachine::AdapterStateMachine(IAdapterService* adapter, INotificationService* notifier,
                                         TimeoutController* timeout, const TimeoutPolicy& policy,
                                         QObject* parent)
    : QObject(parent)
    , adapter_(adapter)
    , notifier_(notifier)
    , timeout_(timeout)
    , policy_(policy)
{
    connect(timeout_, &TimeoutController::warningDue, this, &AdapterStateMachine::onWarningDue);
    connect(timeout_, &TimeoutController::deadlineReached,
            this, &AdapterStateMachine::onDeadlineReached);
}

bool AdapterStateMachine::initialize()
{
    BOOST_LOG_TRIVIAL(info) << "[StateMachine] Querying initial adapter state";
    if (!resynchronize()) {
        BOOST_LOG_TRIVIAL(error) << "[StateMachine] Initial adapter query failed";
        return false;
    }
    BOOST_LOG_TRIVIAL(info) << "[StateMachine] Initial state " << toString(state_)
                            << " with " << devices_.size() << " connected device(s)";
    return true;
}

void AdapterStateMachine::post(const AdapterEvent& event)
{
    Input input;
    input.kind = Input::Kind::Event;
    input.event = event;
    enqueue(input);
}

void AdapterStateMachine::onWarningDue(quint64 session, qint64 offsetMs)
{
    Input input;
    input.kind = Input::Kind::Warning;
    input.session = session;
    input.offsetMs = offsetMs;
    enqueue(input);
}

void AdapterStateMachine::onDeadlineReached(quint64 session)
{
    Input input;
    input.kind = Input::Kind::Deadline;
    input.session = session;
    enqueue(input);
}

void AdapterStateMachine::enqueue(const Input& input)
{
    if (queue_.size() >= MAX_QUEUED_INPUTS) {
        // Observer events are replaced by a fresh query; timer and power-off
        // inputs carry their own session and are kept.
        const auto before = queue_.size();
        queue_.erase(std::remove_if(queue_.begin(), queue_.end(), [](const Input& queued) {
            return queued.kind == Input::Kind::Event;
        }), queue_.end());
        BOOST_LOG_TRIVIAL(warning) << "[StateMachine] Input queue full, discarded "
                                   << (before - queue_.size()) << " event(s), will resynchronize";
        resyncPending_ = true;
    }

    if (input.kind == Input::Kind::Event && resyncPending_) {
        BOOST_LOG_TRIVIAL(debug) << "[StateMachine] Resync pending, dropping queued event";
    } else {
        queue_.enqueue(input);
    }

    if (!drainScheduled_) {
        drainScheduled_ = true;
        QMetaObject::invokeMethod(this, [this]() { drain(); }, Qt::QueuedConnection);
    }
}

void AdapterStateMachine::drain()
{
    drainScheduled_ = false;

    if (resyncPending_) {
        resyncPending_ = false;
        if (!resynchronize())
            BOOST_LOG_TRIVIAL(warning) << "[StateMachine] Resync after overflow failed, keeping "
                                       << toString(state_);
    }

    while (!queue_.isEmpty())
        process(queue_.dequeue());
}

void AdapterStateMachine::process(const Input& input)
{
    switch (input.kind) {
    case Input::Kind::Event:
        handleEvent(input.event);
        break;
    case Input::Kind::Warning:
        handleWarning(input.session, input.offsetMs);
        break;
    case Input::Kind::Deadline:
        handleDeadline(input.session);
        break;
    case Input::Kind::PowerOffResult:
        handlePowerOffResult(input.ok);
        break;
    }
}

void AdapterStateMachine::handleEvent(const AdapterEvent& event)
{
    const std::string name = event.isDeviceEvent()
        ? std::string(btt::toString(event.type)) + "(" + event.device.toStdString() + ")"
        : std::string(btt::toString(event.type));

    switch (event.type) {
    case AdapterEventType::AdapterPoweredOn:
        if (state_ != AdapterState::PoweredOff) {
            BOOST_LOG_TRIVIAL(debug) << "[StateMachine] " << name << " ignored in " << toString(state_);
            return;
        }
        devices_.clear();
        setState(AdapterState::PoweredOnIdle);
        armTimeout();
        break;

    case AdapterEventType::AdapterPoweredOff:
        if (state_ == AdapterState::PoweredOff) {
            BOOST_LOG_TRIVIAL(debug) << "[StateMachine] " << name << " ignored in " << toString(state_);
            return;
        }
        timeout_->cancel();
        devices_.clear();
        setState(AdapterState::PoweredOff);
        break;

    case AdapterEventType::DeviceConnected:
        if (state_ == AdapterState::PoweredOff) {
            BOOST_LOG_TRIVIAL(warning) << "[StateMachine] " << name << " while adapter is off, ignored";
            return;
        }
        if (state_ == AdapterState::PoweredOnIdle)
            timeout_->cancel();
        devices_.insert(event.device);
        setState(AdapterState::PoweredOnActive);
        break;

    case AdapterEventType::DeviceDisconnected:
    case AdapterEventType::DeviceRemoved:
        if (!devices_.remove(event.device)) {
            BOOST_LOG_TRIVIAL(debug) << "[StateMachine] " << name << " for unknown device ignored in "
                                     << toString(state_);
            return;
        }
        if (devices_.isEmpty()) {
            setState(AdapterState::PoweredOnIdle);
            armTimeout();
        }
        break;
    }

    BOOST_LOG_TRIVIAL(info) << "[StateMachine] " << name << " -> " << toString(state_)
                            << " (" << devices_.size() << " connected)";
}

void AdapterStateMachine::handleWarning(quint64 session, qint64 offsetMs)
{
    if (!timeout_->isCurrent(session) || state_ != AdapterState::PoweredOnIdle) {
        BOOST_LOG_TRIVIAL(debug) << "[StateMachine] Stale warning from session " << session << " dropped";
        return;
    }

    const QString left = formatDuration(std::chrono::milliseconds(offsetMs));
    BOOST_LOG_TRIVIAL(info) << "[StateMachine] Adapter turns off in " << left.toStdString();
    notify(QStringLiteral("Bluetooth Timeout Warning"),
           QStringLiteral("Bluetooth adapter will turn off in %1 due to inactivity.").arg(left),
           QStringLiteral("bluetooth-symbolic"));
}

void AdapterStateMachine::handleDeadline(quint64 session)
{
    if (!timeout_->isCurrent(session) || state_ != AdapterState::PoweredOnIdle) {
        BOOST_LOG_TRIVIAL(debug) << "[StateMachine] Stale deadline from session " << session << " dropped";
        return;
    }

    BOOST_LOG_TRIVIAL(info) << "[StateMachine] Inactivity timeout reached, powering off adapter";
    timeout_->cancel();

    QPointer<AdapterStateMachine> self(this);
    adapter_->powerOff([self](bool ok) {
        if (!self)
            return;
        Input input;
        input.kind = Input::Kind::PowerOffResult;
        input.ok = ok;
        self->enqueue(input);
    });
}

void AdapterStateMachine::handlePowerOffResult(bool ok)
{
    if (ok) {
        BOOST_LOG_TRIVIAL(info) << "[StateMachine] Adapter power-off requested";
        notify(QStringLiteral("Bluetooth Adapter Turned Off"),
               QStringLiteral("Bluetooth adapter has been turned off due to inactivity."),
               QStringLiteral("bluetooth-disabled-symbolic"));
        return;
    }

    BOOST_LOG_TRIVIAL(warning) << "[StateMachine] Adapter power-off failed";
    if (state_ == AdapterState::PoweredOnIdle && !timeout_->isActive())
        armTimeout();
}

bool AdapterStateMachine::resynchronize()
{
    const std::optional<bool> powered = adapter_->isPowered();
    if (!powered)
        return false;

    QStringList devices;
    if (*powered) {
        const std::optional<QStringList> connected = adapter_->connectedDevices();
        if (!connected)
            return false;
        devices = *connected;
    }

    applySnapshot(*powered, devices);
    return true;
}

void AdapterStateMachine::applySnapshot(bool powered, const QStringList& devices)
{
    if (!powered) {
        timeout_->cancel();
        devices_.clear();
        setState(AdapterState::PoweredOff);
        return;
    }

    devices_ = QSet<QString>(devices.begin(), devices.end());
    if (devices_.isEmpty()) {
        setState(AdapterState::PoweredOnIdle);
        if (!timeout_->isActive())
            armTimeout();
    } else {
        timeout_->cancel();
        setState(AdapterState::PoweredOnActive);
    }
}

void AdapterStateMachine::armTimeout()
{
    timeout_->reset(policy_.timeout,
                    policy_.notificationsEnabled ? policy_.warnings
                                                 : QList<std::chrono::milliseconds>());
}

void AdapterStateMachine::setState(AdapterState next)
{
    if (state_ == next)
        return;
    BOOST_LOG_TRIVIAL(debug) << "[StateMachine] " << toString(state_) << " -> " << toString(next);
    state_ = next;
    emit stateChanged(state_);
}

void AdapterStateMachine::notify(const QString& summary, const QString& body, const QString& icon)
{
    if (!policy_.notificationsEnabled || !notifier_)
        return;
    notifier_->notify(summary, body, icon);
}

} // namespace btt
