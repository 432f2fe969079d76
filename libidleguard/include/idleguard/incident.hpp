#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>

namespace idleguard {

enum class IncidentType {
    ScreenSurveillance,
    DataExfiltration,
    NetworkAnomaly,
    CpuAnomaly,
    BatteryAnomaly,
    ThermalAnomaly,
    MultiFactorAlert
};

enum class IncidentSeverity {
    Low = 1,
    Medium = 2,
    High = 3,
    Critical = 4
};

QString incidentTypeToString(IncidentType t);
IncidentType incidentTypeFromString(const QString &s);
QString incidentTypeTitle(IncidentType t);

QString incidentSeverityToString(IncidentSeverity s);
IncidentSeverity incidentSeverityFromString(const QString &s);

IncidentSeverity defaultSeverity(IncidentType t);

// One detected anomaly episode. Open -> (acknowledged) -> resolved; a
// resolved incident is never reopened.
struct Incident
{
    QString id;
    IncidentType type = IncidentType::CpuAnomaly;
    IncidentSeverity severity = IncidentSeverity::Low;

    QDateTime openedAt;
    QDateTime endedAt;      // invalid while open
    bool acknowledged = false;
    bool resolved = false;

    // Metrics at detection time
    double uploadBytesPerSecond = 0.0;
    double downloadBytesPerSecond = 0.0;
    double cpuUsagePercent = 0.0;
    double batteryDrainPerHourPercent = 0.0;
    int thermalLevel = 0;
    int threatScore = 0;

    // Trailing-hour totals at detection time
    qint64 totalBytesUploaded = 0;
    qint64 totalBytesDownloaded = 0;

    QString summary;
    QString details;

    bool isOpen() const { return !resolved; }

    // Seconds between open and end; -1 while ongoing.
    qint64 durationSeconds() const;
};

QJsonObject incidentToJson(const Incident &incident);
Incident incidentFromJson(const QJsonObject &obj);

QString incidentToJsonString(const Incident &incident);

} // namespace idleguard
