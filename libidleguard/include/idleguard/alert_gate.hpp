#pragma once

#include <QDateTime>
#include <QString>

#include <deque>
#include <map>
#include <optional>
#include <vector>

#include "idleguard/incident.hpp"
#include "idleguard/metrics.hpp"
#include "idleguard/rolling_window.hpp"
#include "idleguard/threat_level.hpp"
#include "idleguard/threat_scorer.hpp"

namespace idleguard {

struct Notification
{
    QString title;
    QString body;
    ThreatLevel severity = ThreatLevel::Alert;
};

// Delivery collaborator. deliver() must not block; returning false reports a
// failed hand-off and is only logged.
class NotificationSink
{
public:
    virtual ~NotificationSink() = default;
    virtual bool deliver(const Notification &notification) = 0;
};

// Durable storage collaborator for incidents.
class IncidentSink
{
public:
    virtual ~IncidentSink() = default;
    virtual bool insertIncident(const Incident &incident) = 0;
    virtual bool updateIncident(const Incident &incident) = 0;
    virtual std::optional<Incident> findIncident(const QString &id) = 0;
};

struct AlertGateConfig
{
    int incidentDedupSeconds = 60;
    int alertCooldownSeconds = 300;
    int incidentHistory = 100;
};

// Work produced by one gate decision. The caller persists and delivers it
// outside its own lock.
struct GateDecision
{
    std::vector<Incident> recorded;
    std::vector<Incident> resolved;
    std::optional<Notification> notification;
    QString notificationIdentity;
};

// Incident types implied by a set of factors. Adds MultiFactorAlert when
// three or more distinct types are present.
std::vector<IncidentType> incidentTypesForFactors(const std::vector<ThreatFactor> &factors);

// Turns accepted level changes into incidents and notifications, with
// per-type duplicate suppression and per-identity notification cooldown.
// Holds state only; storage and delivery belong to the caller.
class AlertGate
{
public:
    explicit AlertGate(const AlertGateConfig &config);

    GateDecision handleTransition(const LevelTransition &transition,
                                  const std::vector<ThreatFactor> &factors,
                                  const MetricSnapshot &snapshot,
                                  const RollingTotals &totals);

    // Records a new incident unless one of the same type is open or was
    // recorded within the dedup window.
    std::optional<Incident> recordIncident(IncidentType type,
                                           const MetricSnapshot &snapshot,
                                           const RollingTotals &totals,
                                           const QDateTime &now,
                                           const QString &details = QString());

    // True unless `identity` was claimed within the cooldown. A successful
    // claim starts a new cooldown whatever the delivery outcome.
    bool claimNotification(const QString &identity, const QDateTime &now);

    // Both return the changed incident, or nullopt when `id` is unknown here
    // or already resolved.
    std::optional<Incident> acknowledgeIncident(const QString &id);
    std::optional<Incident> resolveIncident(const QString &id, const QDateTime &now);

    // Resolves every open incident ("condition cleared").
    std::vector<Incident> resolveAll(const QDateTime &now);

    std::vector<Incident> openIncidents() const;
    std::vector<Incident> recentIncidents() const;

    bool isSuspicious() const;

private:
    Incident *findIncident(const QString &id);
    void trimHistory();

    AlertGateConfig config_;

    std::deque<Incident> history_;   // newest first
    std::map<IncidentType, QDateTime> lastRecorded_;
    std::map<QString, QDateTime> lastNotified_;
};

} // namespace idleguard
