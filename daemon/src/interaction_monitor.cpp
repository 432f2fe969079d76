#include "interaction_monitor.hpp"

#include "idleguard/common.hpp"

#include <QDBusConnection>
#include <QDBusMessage>
#include <QDBusPendingCallWatcher>
#include <QDBusPendingReply>
#include <QDebug>

namespace idleguard {

namespace {
// Idle-time readings are only accurate to the polling cadence, so small
// forward jitter is not treated as new input.
constexpr qint64 kJitterMs = 500;
} // namespace

InteractionMonitor::InteractionMonitor(QObject *parent)
    : QObject(parent)
{
    timer_.setParent(this);
    connect(&timer_, &QTimer::timeout, this, &InteractionMonitor::poll);
}

void InteractionMonitor::start(int intervalMs)
{
    timer_.start(intervalMs);
}

void InteractionMonitor::stop()
{
    timer_.stop();
}

void InteractionMonitor::poll()
{
    if (pending_) {
        return;
    }

    const QDBusMessage message = QDBusMessage::createMethodCall(
        QStringLiteral("org.freedesktop.ScreenSaver"),
        QStringLiteral("/org/freedesktop/ScreenSaver"),
        QStringLiteral("org.freedesktop.ScreenSaver"),
        QStringLiteral("GetSessionIdleTime"));

    pending_ = true;
    auto *watcher = new QDBusPendingCallWatcher(
        QDBusConnection::sessionBus().asyncCall(message), this);
    connect(watcher, &QDBusPendingCallWatcher::finished,
            this, &InteractionMonitor::handleReply);
}

void InteractionMonitor::handleReply(QDBusPendingCallWatcher *call)
{
    pending_ = false;
    call->deleteLater();

    const QDBusPendingReply<uint> reply = *call;
    if (reply.isError()) {
        if (!warned_) {
            qWarning() << "InteractionMonitor: GetSessionIdleTime failed:"
                       << reply.error().message();
            warned_ = true;
        }
        return;
    }
    warned_ = false;

    const QDateTime lastInput = nowUtc().addMSecs(-static_cast<qint64>(reply.value()));

    if (lastReported_.isValid()
        && lastReported_.msecsTo(lastInput) <= kJitterMs) {
        return;
    }

    lastReported_ = lastInput;
    emit interactionDetected(lastInput);
}

} // namespace idleguard
