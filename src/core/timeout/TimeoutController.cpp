#include "TimeoutController.hpp"
#include "core/Duration.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <functional>
#include <limits>

namespace btt {

namespace {

// QTimer intervals are int milliseconds; longer waits are covered in hops.
constexpr TimeoutController::Duration kMaxTimerHop{std::numeric_limits<int>::max()};

} // namespace

TimeoutController::TimeoutController(QObject* parent)
    : QObject(parent)
{
    timer_.setSingleShot(true);
    timer_.setTimerType(Qt::PreciseTimer);
    connect(&timer_, &QTimer::timeout, this, &TimeoutController::onTimeout);
}

bool TimeoutController::start(Duration total, const QList<Duration>& warnings)
{
    if (active_) {
        BOOST_LOG_TRIVIAL(warning) << "[TimeoutController] Session " << session_
                                   << " still live, start ignored";
        return false;
    }
    if (total <= Duration::zero()) {
        BOOST_LOG_TRIVIAL(error) << "[TimeoutController] Refusing non-positive timeout";
        return false;
    }

    pending_.clear();
    fired_.clear();
    for (const Duration& offset : warnings) {
        if (offset <= Duration::zero() || offset >= total) {
            BOOST_LOG_TRIVIAL(debug) << "[TimeoutController] Skipping warning at "
                                     << formatDuration(offset).toStdString()
                                     << ", not inside " << formatDuration(total).toStdString();
            continue;
        }
        if (!pending_.contains(offset))
            pending_.append(offset);
    }
    std::sort(pending_.begin(), pending_.end(), std::greater<Duration>());

    total_ = total;
    ++session_;
    active_ = true;
    expired_ = false;
    clock_.start();

    BOOST_LOG_TRIVIAL(info) << "[TimeoutController] Session " << session_ << " started, deadline in "
                            << formatDuration(total_).toStdString() << " with "
                            << pending_.size() << " warning(s)";
    scheduleNext();
    return true;
}

bool TimeoutController::reset(Duration total, const QList<Duration>& warnings)
{
    cancel();
    return start(total, warnings);
}

void TimeoutController::cancel()
{
    if (!active_)
        return;

    timer_.stop();
    active_ = false;
    expired_ = false;
    pending_.clear();
    fired_.clear();
    BOOST_LOG_TRIVIAL(info) << "[TimeoutController] Session " << session_ << " cancelled";
}

TimeoutController::Duration TimeoutController::remaining() const
{
    if (!active_ || expired_)
        return Duration::zero();
    const Duration left = total_ - Duration(clock_.elapsed());
    return std::max(left, Duration::zero());
}

void TimeoutController::scheduleNext()
{
    if (!active_ || expired_)
        return;

    const Duration nextAt = pending_.isEmpty() ? total_ : total_ - pending_.first();
    const Duration wait = std::max(nextAt - Duration(clock_.elapsed()), Duration::zero());
    timer_.start(std::min(wait, kMaxTimerHop));
}

void TimeoutController::onTimeout()
{
    if (!active_ || expired_)
        return;

    const quint64 session = session_;
    const Duration elapsed(clock_.elapsed());

    if (elapsed >= total_) {
        if (!pending_.isEmpty()) {
            BOOST_LOG_TRIVIAL(warning) << "[TimeoutController] Deadline overdue, skipping "
                                       << pending_.size() << " warning(s)";
            pending_.clear();
        }
        expired_ = true;
        BOOST_LOG_TRIVIAL(info) << "[TimeoutController] Session " << session << " reached its deadline";
        emit deadlineReached(session);
        return;
    }

    // Several checkpoints can be overdue after a stall; only the closest to
    // the deadline is dispatched.
    int due = 0;
    Duration offset{0};
    while (!pending_.isEmpty() && total_ - pending_.first() <= elapsed) {
        offset = pending_.takeFirst();
        fired_.append(offset);
        ++due;
    }
    if (due == 0) {
        // Intermediate hop of a long wait
        scheduleNext();
        return;
    }
    if (due > 1) {
        BOOST_LOG_TRIVIAL(warning) << "[TimeoutController] " << (due - 1)
                                   << " overdue warning(s) collapsed";
    }

    BOOST_LOG_TRIVIAL(debug) << "[TimeoutController] Session " << session << " warning at "
                             << formatDuration(offset).toStdString();
    emit warningDue(session, offset.count());
    if (!isCurrent(session))
        return;  // receiver cancelled or restarted

    scheduleNext();
}

} // namespace btt
