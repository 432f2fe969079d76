#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QMutex>
#include <QObject>
#include <QTimer>

#include <optional>
#include <vector>

#include "idleguard/activity_log.hpp"
#include "idleguard/alert_gate.hpp"
#include "idleguard/baseline_tracker.hpp"
#include "idleguard/config.hpp"
#include "idleguard/idle_detector.hpp"
#include "idleguard/incident.hpp"
#include "idleguard/metrics.hpp"
#include "idleguard/rolling_window.hpp"
#include "idleguard/session_report.hpp"
#include "idleguard/threat_level.hpp"
#include "idleguard/threat_scorer.hpp"
#include "idleguard/threshold.hpp"

namespace idleguard {

// Everything a presentation layer needs after one tick.
struct EngineSnapshot
{
    MetricSnapshot metrics;
    int score = 0;
    ThreatLevel level = ThreatLevel::Normal;
    bool levelHeld = false;
    bool isIdle = false;
    double idleDurationSeconds = 0.0;
    std::vector<ThreatFactor> factors;
    RollingTotals totals;
    Baseline baseline;
    bool monitoring = false;
    int openIncidents = 0;
};

QJsonObject engineSnapshotToJson(const EngineSnapshot &snapshot);

// Timer-driven evaluate -> score -> transition -> gate pipeline.
//
// All state is guarded by one mutex and only tick() mutates the learned
// state, so a tick is atomic with respect to readers on other threads.
// The incident sink and the notifier are called after the lock is released,
// and so are the signals.
class ThreatEngine : public QObject
{
    Q_OBJECT
public:
    ThreatEngine(const EngineConfig &config,
                 ThresholdStore &thresholds,
                 MetricSource &source,
                 NotificationSink *notifier = nullptr,
                 IncidentSink *incidents = nullptr,
                 QObject *parent = nullptr);
    ~ThreatEngine() override;

    // Starts the recurring tick. Calling start() twice is a no-op.
    void start();

    // Cancels the tick and closes the session, resolving any incident still
    // open. Idempotent.
    void stop();

    bool isMonitoring() const;

    // Session bookkeeping without the timer, for hosts that drive tick()
    // themselves.
    void beginSession(const QDateTime &now);
    std::optional<SessionReport> endSession(const QDateTime &now);

    EngineSnapshot tick(const QDateTime &now);

    // Any user interaction: the device is active immediately.
    void registerUserInteraction(const QDateTime &at);

    EngineSnapshot lastSnapshot() const;
    std::vector<ActivityEntry> recentActivity() const;
    std::vector<Incident> recentIncidents() const;
    std::optional<SessionReport> lastSessionReport() const;

    // Incidents no longer held in memory are looked up in the incident sink.
    bool acknowledgeIncident(const QString &id);
    bool resolveIncident(const QString &id);

    const EngineConfig &config() const { return config_; }

signals:
    void snapshotPublished(const idleguard::EngineSnapshot &snapshot);
    void levelChanged(idleguard::ThreatLevel from, idleguard::ThreatLevel to, int score);
    void incidentRecorded(const idleguard::Incident &incident);
    void sessionFinished(const idleguard::SessionReport &report);

private slots:
    void onTimer();

private:
    MetricSample readSample(const QDateTime &now);
    void commit(const GateDecision &decision);
    bool persistUpdate(const Incident &incident);
    std::optional<Incident> storedOpenIncident(const QString &id);
    void addActivity(const QDateTime &at, ActivityType type,
                     const QString &title, const QString &description, ThreatLevel level);

    const EngineConfig config_;
    ThresholdStore &thresholds_;
    MetricSource &source_;
    NotificationSink *notifier_;
    IncidentSink *incidents_;

    mutable QMutex mutex_;

    QTimer timer_;
    bool monitoring_ = false;

    IdleDetector idle_;
    BaselineTracker baseline_;
    RollingWindowTotal rolling_;
    LevelStateMachine levels_;
    AlertGate gate_;
    ActivityLog activity_;
    SessionRecorder session_;

    MetricSample lastGood_;
    bool degraded_ = false;

    EngineSnapshot last_;
    std::optional<SessionReport> lastReport_;
};

} // namespace idleguard
