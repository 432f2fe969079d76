#include "desktop_notifier.hpp"

#include <QDBusConnection>
#include <QDBusMessage>
#include <QDBusPendingCallWatcher>
#include <QDBusPendingReply>
#include <QDebug>
#include <QStringList>
#include <QVariantMap>

namespace idleguard {

namespace {
const QString kService = QStringLiteral("org.freedesktop.Notifications");
const QString kPath = QStringLiteral("/org/freedesktop/Notifications");

// Freedesktop urgency hint: 0 low, 1 normal, 2 critical.
uchar urgencyFor(ThreatLevel level)
{
    switch (level) {
    case ThreatLevel::Critical:
        return 2;
    case ThreatLevel::Alert:
    case ThreatLevel::Warning:
        return 1;
    case ThreatLevel::Normal:
        break;
    }
    return 0;
}
} // namespace

DesktopNotifier::DesktopNotifier(const QString &appName, QObject *parent)
    : QObject(parent)
    , appName_(appName)
{
}

bool DesktopNotifier::deliver(const Notification &notification)
{
    QDBusConnection bus = QDBusConnection::sessionBus();
    if (!bus.isConnected()) {
        qWarning() << "DesktopNotifier: session bus unavailable, dropping"
                   << notification.title;
        return false;
    }

    QDBusMessage message = QDBusMessage::createMethodCall(kService, kPath, kService,
                                                          QStringLiteral("Notify"));

    QVariantMap hints;
    hints.insert(QStringLiteral("urgency"), QVariant::fromValue(urgencyFor(notification.severity)));

    message << appName_
            << uint(0)
            << QStringLiteral("security-medium")
            << notification.title
            << notification.body
            << QStringList()
            << hints
            << int(-1);

    auto *watcher = new QDBusPendingCallWatcher(bus.asyncCall(message), this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this,
            [title = notification.title](QDBusPendingCallWatcher *call) {
                const QDBusPendingReply<uint> reply = *call;
                if (reply.isError()) {
                    qWarning() << "DesktopNotifier: Notify failed for" << title
                               << "-" << reply.error().message();
                }
                call->deleteLater();
            });

    return true;
}

} // namespace idleguard
