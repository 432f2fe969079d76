#pragma once

#include <QDateTime>
#include <QObject>
#include <QTimer>

class QDBusPendingCallWatcher;

namespace idleguard {

// Polls the session's screensaver idle time and reports the moment of the
// most recent user input whenever it moves forward.
class InteractionMonitor : public QObject
{
    Q_OBJECT
public:
    explicit InteractionMonitor(QObject *parent = nullptr);

    void start(int intervalMs = 2000);
    void stop();

signals:
    void interactionDetected(const QDateTime &at);

private slots:
    void poll();
    void handleReply(QDBusPendingCallWatcher *call);

private:
    QTimer timer_;
    QDateTime lastReported_;
    bool pending_ = false;
    bool warned_ = false;
};

} // namespace idleguard
