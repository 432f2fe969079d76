#include "idleguard/incident.hpp"

#include <QJsonDocument>
#include <QJsonValue>
#include <QTimeZone>

namespace idleguard {

namespace {

QDateTime timestampFromJson(const QJsonObject &obj, const QString &msKey, const QString &isoKey)
{
    if (obj.contains(msKey)) {
        return QDateTime::fromMSecsSinceEpoch(obj.value(msKey).toInteger(), QTimeZone::utc());
    }
    if (obj.contains(isoKey)) {
        QDateTime dt = QDateTime::fromString(obj.value(isoKey).toString(), Qt::ISODateWithMs);
        if (dt.isValid()) {
            dt.setTimeZone(QTimeZone::utc());
        }
        return dt;
    }
    return QDateTime();
}

void insertTimestamp(QJsonObject &obj, const QString &msKey, const QString &isoKey,
                     const QDateTime &ts)
{
    if (!ts.isValid()) {
        return;
    }
    obj.insert(isoKey, ts.toUTC().toString(Qt::ISODate));
    obj.insert(msKey, static_cast<qint64>(ts.toMSecsSinceEpoch()));
}

} // namespace

QString incidentTypeToString(IncidentType t)
{
    switch (t) {
    case IncidentType::ScreenSurveillance:
        return QStringLiteral("screen_surveillance");
    case IncidentType::DataExfiltration:
        return QStringLiteral("data_exfiltration");
    case IncidentType::NetworkAnomaly:
        return QStringLiteral("network_anomaly");
    case IncidentType::CpuAnomaly:
        return QStringLiteral("cpu_anomaly");
    case IncidentType::BatteryAnomaly:
        return QStringLiteral("battery_anomaly");
    case IncidentType::ThermalAnomaly:
        return QStringLiteral("thermal_anomaly");
    case IncidentType::MultiFactorAlert:
        return QStringLiteral("multi_factor_alert");
    }

    return QStringLiteral("cpu_anomaly");
}

IncidentType incidentTypeFromString(const QString &s)
{
    const QString lower = s.trimmed().toLower();

    if (lower == QLatin1String("screen_surveillance"))
        return IncidentType::ScreenSurveillance;
    if (lower == QLatin1String("data_exfiltration"))
        return IncidentType::DataExfiltration;
    if (lower == QLatin1String("network_anomaly"))
        return IncidentType::NetworkAnomaly;
    if (lower == QLatin1String("battery_anomaly"))
        return IncidentType::BatteryAnomaly;
    if (lower == QLatin1String("thermal_anomaly"))
        return IncidentType::ThermalAnomaly;
    if (lower == QLatin1String("multi_factor_alert"))
        return IncidentType::MultiFactorAlert;

    return IncidentType::CpuAnomaly;
}

QString incidentTypeTitle(IncidentType t)
{
    switch (t) {
    case IncidentType::ScreenSurveillance:
        return QStringLiteral("Possible Screen Surveillance");
    case IncidentType::DataExfiltration:
        return QStringLiteral("Suspicious Data Upload");
    case IncidentType::NetworkAnomaly:
        return QStringLiteral("Unusual Download Volume");
    case IncidentType::CpuAnomaly:
        return QStringLiteral("Abnormal CPU Activity");
    case IncidentType::BatteryAnomaly:
        return QStringLiteral("Unusual Battery Drain");
    case IncidentType::ThermalAnomaly:
        return QStringLiteral("Thermal Anomaly");
    case IncidentType::MultiFactorAlert:
        return QStringLiteral("Multi-Factor Security Alert");
    }

    return QString();
}

QString incidentSeverityToString(IncidentSeverity s)
{
    switch (s) {
    case IncidentSeverity::Low:
        return QStringLiteral("low");
    case IncidentSeverity::Medium:
        return QStringLiteral("medium");
    case IncidentSeverity::High:
        return QStringLiteral("high");
    case IncidentSeverity::Critical:
        return QStringLiteral("critical");
    }

    return QStringLiteral("low");
}

IncidentSeverity incidentSeverityFromString(const QString &s)
{
    const QString lower = s.trimmed().toLower();

    if (lower == QLatin1String("medium"))
        return IncidentSeverity::Medium;
    if (lower == QLatin1String("high"))
        return IncidentSeverity::High;
    if (lower == QLatin1String("critical"))
        return IncidentSeverity::Critical;

    return IncidentSeverity::Low;
}

IncidentSeverity defaultSeverity(IncidentType t)
{
    switch (t) {
    case IncidentType::ScreenSurveillance:
    case IncidentType::MultiFactorAlert:
        return IncidentSeverity::Critical;
    case IncidentType::DataExfiltration:
        return IncidentSeverity::High;
    case IncidentType::NetworkAnomaly:
    case IncidentType::CpuAnomaly:
    case IncidentType::BatteryAnomaly:
    case IncidentType::ThermalAnomaly:
        return IncidentSeverity::Medium;
    }

    return IncidentSeverity::Low;
}

qint64 Incident::durationSeconds() const
{
    if (!endedAt.isValid() || !openedAt.isValid()) {
        return -1;
    }
    return openedAt.secsTo(endedAt);
}

QJsonObject incidentToJson(const Incident &incident)
{
    QJsonObject obj;

    obj.insert(QStringLiteral("id"), incident.id);
    obj.insert(QStringLiteral("type"), incidentTypeToString(incident.type));
    obj.insert(QStringLiteral("title"), incidentTypeTitle(incident.type));
    obj.insert(QStringLiteral("severity"), incidentSeverityToString(incident.severity));

    insertTimestamp(obj, QStringLiteral("opened_ms"), QStringLiteral("opened"), incident.openedAt);
    insertTimestamp(obj, QStringLiteral("ended_ms"), QStringLiteral("ended"), incident.endedAt);

    obj.insert(QStringLiteral("acknowledged"), incident.acknowledged);
    obj.insert(QStringLiteral("resolved"), incident.resolved);

    QJsonObject metrics;
    metrics.insert(QStringLiteral("upload_bps"), incident.uploadBytesPerSecond);
    metrics.insert(QStringLiteral("download_bps"), incident.downloadBytesPerSecond);
    metrics.insert(QStringLiteral("cpu_percent"), incident.cpuUsagePercent);
    metrics.insert(QStringLiteral("battery_drain_per_hour"), incident.batteryDrainPerHourPercent);
    metrics.insert(QStringLiteral("thermal"), incident.thermalLevel);
    metrics.insert(QStringLiteral("threat_score"), incident.threatScore);
    metrics.insert(QStringLiteral("total_uploaded"), incident.totalBytesUploaded);
    metrics.insert(QStringLiteral("total_downloaded"), incident.totalBytesDownloaded);
    obj.insert(QStringLiteral("metrics"), metrics);

    obj.insert(QStringLiteral("summary"), incident.summary);
    if (!incident.details.isEmpty()) {
        obj.insert(QStringLiteral("details"), incident.details);
    }

    return obj;
}

Incident incidentFromJson(const QJsonObject &obj)
{
    Incident incident;

    incident.id = obj.value(QStringLiteral("id")).toString();
    incident.type = incidentTypeFromString(obj.value(QStringLiteral("type")).toString());

    if (obj.contains(QStringLiteral("severity"))) {
        incident.severity =
            incidentSeverityFromString(obj.value(QStringLiteral("severity")).toString());
    } else {
        incident.severity = defaultSeverity(incident.type);
    }

    incident.openedAt = timestampFromJson(obj, QStringLiteral("opened_ms"), QStringLiteral("opened"));
    incident.endedAt = timestampFromJson(obj, QStringLiteral("ended_ms"), QStringLiteral("ended"));

    incident.acknowledged = obj.value(QStringLiteral("acknowledged")).toBool();
    incident.resolved = obj.value(QStringLiteral("resolved")).toBool();

    const QJsonObject metrics = obj.value(QStringLiteral("metrics")).toObject();
    incident.uploadBytesPerSecond = metrics.value(QStringLiteral("upload_bps")).toDouble();
    incident.downloadBytesPerSecond = metrics.value(QStringLiteral("download_bps")).toDouble();
    incident.cpuUsagePercent = metrics.value(QStringLiteral("cpu_percent")).toDouble();
    incident.batteryDrainPerHourPercent =
        metrics.value(QStringLiteral("battery_drain_per_hour")).toDouble();
    incident.thermalLevel = metrics.value(QStringLiteral("thermal")).toInt();
    incident.threatScore = metrics.value(QStringLiteral("threat_score")).toInt();
    incident.totalBytesUploaded = metrics.value(QStringLiteral("total_uploaded")).toInteger();
    incident.totalBytesDownloaded = metrics.value(QStringLiteral("total_downloaded")).toInteger();

    incident.summary = obj.value(QStringLiteral("summary")).toString();
    if (incident.summary.isEmpty()) {
        incident.summary = incidentTypeTitle(incident.type);
    }
    incident.details = obj.value(QStringLiteral("details")).toString();

    return incident;
}

QString incidentToJsonString(const Incident &incident)
{
    const QJsonDocument doc(incidentToJson(incident));
    return QString::fromUtf8(doc.toJson(QJsonDocument::Compact));
}

} // namespace idleguard
