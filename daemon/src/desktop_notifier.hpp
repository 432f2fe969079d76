#pragma once

#include <QObject>
#include <QString>

#include "idleguard/alert_gate.hpp"

namespace idleguard {

// Delivers alerts through org.freedesktop.Notifications.
class DesktopNotifier : public QObject, public NotificationSink
{
    Q_OBJECT
public:
    explicit DesktopNotifier(const QString &appName, QObject *parent = nullptr);

    // Returns false when the notification service is unreachable. The call
    // itself is asynchronous; a failed reply is only logged.
    bool deliver(const Notification &notification) override;

private:
    QString appName_;
};

} // namespace idleguard
