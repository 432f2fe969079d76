#include "idleguard/alert_gate.hpp"

#include <QDebug>
#include <QUuid>

#include <algorithm>
#include <cmath>
#include <iterator>

namespace idleguard {

namespace {

std::optional<IncidentType> incidentTypeForFactor(const QString &name)
{
    if (name == QLatin1String(factor::TotalUpload) ||
        name == QLatin1String(factor::SustainedUpload))
        return IncidentType::DataExfiltration;
    if (name == QLatin1String(factor::TotalDownload))
        return IncidentType::NetworkAnomaly;
    if (name == QLatin1String(factor::IdleCpu))
        return IncidentType::CpuAnomaly;
    if (name == QLatin1String(factor::BatteryDrain))
        return IncidentType::BatteryAnomaly;
    if (name == QLatin1String(factor::Thermal))
        return IncidentType::ThermalAnomaly;
    if (name == QLatin1String(factor::SurveillancePattern))
        return IncidentType::ScreenSurveillance;

    // Near-limit warnings never open an incident.
    return std::nullopt;
}

const ThreatFactor *primaryFactor(const std::vector<ThreatFactor> &factors)
{
    const auto it = std::max_element(factors.begin(), factors.end(),
                                     [](const ThreatFactor &a, const ThreatFactor &b) {
                                         return a.score < b.score;
                                     });
    return it == factors.end() ? nullptr : &*it;
}

qint64 totalBytes(double bytes)
{
    return (std::isfinite(bytes) && bytes > 0.0) ? static_cast<qint64>(bytes) : 0;
}

} // namespace

std::vector<IncidentType> incidentTypesForFactors(const std::vector<ThreatFactor> &factors)
{
    std::vector<IncidentType> types;
    for (const ThreatFactor &f : factors) {
        const auto type = incidentTypeForFactor(f.name);
        if (type && std::find(types.begin(), types.end(), *type) == types.end()) {
            types.push_back(*type);
        }
    }

    if (types.size() >= 3) {
        types.push_back(IncidentType::MultiFactorAlert);
    }
    return types;
}

AlertGate::AlertGate(const AlertGateConfig &config)
    : config_(config)
{
}

GateDecision AlertGate::handleTransition(const LevelTransition &transition,
                                         const std::vector<ThreatFactor> &factors,
                                         const MetricSnapshot &snapshot,
                                         const RollingTotals &totals)
{
    GateDecision decision;

    if (transition.to == ThreatLevel::Normal) {
        decision.resolved = resolveAll(transition.at);
        return decision;
    }

    const QString details = describeFactors(factors);
    for (IncidentType type : incidentTypesForFactors(factors)) {
        auto incident = recordIncident(type, snapshot, totals, transition.at, details);
        if (incident) {
            decision.recorded.push_back(*incident);
        }
    }

    // Warning only goes to the activity log.
    if (transition.to != ThreatLevel::Alert && transition.to != ThreatLevel::Critical) {
        return decision;
    }

    const ThreatFactor *primary = primaryFactor(factors);
    const QString identity = threatLevelToString(transition.to) + QLatin1Char(':') +
        (primary ? primary->name : QStringLiteral("score"));

    if (!claimNotification(identity, transition.at)) {
        return decision;
    }

    Notification notification;
    notification.title = threatLevelMessage(transition.to);
    notification.body = describeFactors(
        factors, QStringLiteral("Threat score %1 while the device was idle").arg(transition.score));
    notification.severity = transition.to;

    decision.notification = notification;
    decision.notificationIdentity = identity;
    return decision;
}

std::optional<Incident> AlertGate::recordIncident(IncidentType type,
                                                  const MetricSnapshot &snapshot,
                                                  const RollingTotals &totals,
                                                  const QDateTime &now,
                                                  const QString &details)
{
    const bool alreadyOpen = std::any_of(history_.begin(), history_.end(),
                                         [type](const Incident &i) {
                                             return i.type == type && i.isOpen();
                                         });
    if (alreadyOpen) {
        qDebug() << "AlertGate:" << incidentTypeToString(type) << "already open";
        return std::nullopt;
    }

    const auto last = lastRecorded_.find(type);
    if (last != lastRecorded_.end() &&
        last->second.msecsTo(now) < static_cast<qint64>(config_.incidentDedupSeconds) * 1000) {
        qDebug() << "AlertGate: duplicate" << incidentTypeToString(type) << "suppressed";
        return std::nullopt;
    }

    Incident incident;
    incident.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    incident.type = type;
    incident.severity = defaultSeverity(type);
    incident.openedAt = now;
    incident.uploadBytesPerSecond = snapshot.uploadBytesPerSecond;
    incident.downloadBytesPerSecond = snapshot.downloadBytesPerSecond;
    incident.cpuUsagePercent = snapshot.cpuUsagePercent;
    incident.batteryDrainPerHourPercent = snapshot.batteryDrainPerHourPercent;
    incident.thermalLevel = thermalLevelOrdinal(snapshot.thermalLevel);
    incident.threatScore = snapshot.threatScore;
    incident.totalBytesUploaded = totalBytes(totals.uploadBytes);
    incident.totalBytesDownloaded = totalBytes(totals.downloadBytes);
    incident.summary = incidentTypeTitle(type);
    incident.details = details;

    history_.push_front(incident);
    lastRecorded_[type] = now;
    trimHistory();

    qInfo() << "AlertGate: incident" << incidentTypeToString(type)
            << "(" << incidentSeverityToString(incident.severity) << ")" << incident.id;

    return incident;
}

bool AlertGate::claimNotification(const QString &identity, const QDateTime &now)
{
    const auto last = lastNotified_.find(identity);
    if (last != lastNotified_.end() &&
        last->second.msecsTo(now) < static_cast<qint64>(config_.alertCooldownSeconds) * 1000) {
        qDebug() << "AlertGate: notification" << identity << "in cooldown";
        return false;
    }

    lastNotified_[identity] = now;
    return true;
}

Incident *AlertGate::findIncident(const QString &id)
{
    const auto it = std::find_if(history_.begin(), history_.end(),
                                 [&id](const Incident &i) { return i.id == id; });
    return it == history_.end() ? nullptr : &*it;
}

std::optional<Incident> AlertGate::acknowledgeIncident(const QString &id)
{
    Incident *incident = findIncident(id);
    if (!incident || incident->resolved) {
        return std::nullopt;
    }

    incident->acknowledged = true;
    return *incident;
}

std::optional<Incident> AlertGate::resolveIncident(const QString &id, const QDateTime &now)
{
    Incident *incident = findIncident(id);
    if (!incident || incident->resolved) {
        return std::nullopt;
    }

    incident->resolved = true;
    incident->endedAt = now;

    qInfo() << "AlertGate: incident" << id << "resolved";
    return *incident;
}

std::vector<Incident> AlertGate::resolveAll(const QDateTime &now)
{
    std::vector<Incident> resolved;
    for (Incident &incident : history_) {
        if (incident.resolved) {
            continue;
        }
        incident.resolved = true;
        incident.endedAt = now;
        resolved.push_back(incident);
    }

    if (!resolved.empty()) {
        qInfo() << "AlertGate: condition cleared," << resolved.size() << "incident(s) resolved";
    }
    return resolved;
}

std::vector<Incident> AlertGate::openIncidents() const
{
    std::vector<Incident> open;
    std::copy_if(history_.begin(), history_.end(), std::back_inserter(open),
                 [](const Incident &i) { return i.isOpen(); });
    return open;
}

std::vector<Incident> AlertGate::recentIncidents() const
{
    return std::vector<Incident>(history_.begin(), history_.end());
}

bool AlertGate::isSuspicious() const
{
    return std::any_of(history_.begin(), history_.end(),
                       [](const Incident &i) { return i.isOpen(); });
}

void AlertGate::trimHistory()
{
    const std::size_t limit = static_cast<std::size_t>(std::max(1, config_.incidentHistory));

    // Drop the oldest resolved entries first; open ones back the dedup check.
    for (auto it = history_.end(); history_.size() > limit && it != history_.begin();) {
        --it;
        if (it->resolved) {
            it = history_.erase(it);
        }
    }
}

} // namespace idleguard
