#pragma once

#include <QObject>
#include <QString>

#include "idleguard/config.hpp"
#include "idleguard/engine.hpp"
#include "idleguard/incident_store.hpp"
#include "idleguard/threshold.hpp"

#include "desktop_notifier.hpp"
#include "interaction_monitor.hpp"
#include "metrics_collector.hpp"

namespace idleguard {

class IdleGuardDaemon : public QObject
{
    Q_OBJECT
public:
    IdleGuardDaemon(const EngineConfig &config,
                    const QString &dbPath,
                    const QString &thresholdsPath,
                    QObject *parent = nullptr);
    ~IdleGuardDaemon() override;

    // Opens the incident store, loads thresholds and starts sampling.
    bool init();

    // DBus-exposed methods used by the generated DaemonAdaptor. Every
    // payload is a compact JSON string.
    QString GetStatus();
    QString GetRecentActivity();
    QString GetIncidents(qlonglong fromMs, qlonglong toMs);
    QString GetThresholds();
    bool SetThreshold(const QString &metric, double value, bool enabled);
    void ResetThresholds();
    void ReportUserInteraction();
    bool AcknowledgeIncident(const QString &id);
    bool ResolveIncident(const QString &id);
    QString GetLastSessionReport();
    void StartMonitoring();
    void StopMonitoring();

signals:
    // Relayed over DBus by the adaptor.
    void StatusChanged(const QString &statusJson);
    void IncidentRecorded(const QString &incidentJson);

private slots:
    void handleSnapshot(const idleguard::EngineSnapshot &snapshot);
    void handleIncident(const idleguard::Incident &incident);
    void handleSessionFinished(const idleguard::SessionReport &report);

private:
    void saveThresholds();

    QString          dbPath_;
    QString          thresholdsPath_;
    ThresholdStore   thresholds_;
    IncidentStore    store_;
    MetricsCollector metrics_;
    InteractionMonitor interaction_;
    DesktopNotifier  notifier_;
    ThreatEngine     engine_;
};

} // namespace idleguard
