#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QtGlobal>

#include <optional>

#include "idleguard/threat_level.hpp"

namespace idleguard {

enum class ThermalLevel {
    Nominal,
    Fair,
    Serious,
    Critical
};

QString thermalLevelToString(ThermalLevel t);

// Clamps to [0,3].
ThermalLevel thermalLevelFromOrdinal(int ordinal);
int thermalLevelOrdinal(ThermalLevel t);

// Raw reading as delivered by a metric source. A floating point field is NaN
// when the underlying reading was unavailable.
struct MetricSample
{
    QDateTime timestamp;

    double  uploadBytesPerSecond   = 0.0;
    double  downloadBytesPerSecond = 0.0;
    quint64 cumulativeUploadBytes   = 0;
    quint64 cumulativeDownloadBytes = 0;

    double cpuUsagePercent            = 0.0;
    double batteryLevelPercent        = 0.0;
    double batteryDrainPerHourPercent = 0.0;
    int    thermalLevel               = 0;
};

// Latest-value provider polled by the engine once per tick. Sources sample
// on their own cadence; the engine never waits for a fresh value.
class MetricSource
{
public:
    virtual ~MetricSource() = default;

    // std::nullopt while no reading is available.
    virtual std::optional<MetricSample> latestSample() const = 0;
};

// Per-tick view of the metrics, clamped to their declared ranges.
struct MetricSnapshot
{
    QDateTime timestamp;

    double uploadBytesPerSecond       = 0.0;
    double downloadBytesPerSecond     = 0.0;
    double cpuUsagePercent            = 0.0;
    double batteryLevelPercent        = 0.0;
    double batteryDrainPerHourPercent = 0.0;
    ThermalLevel thermalLevel = ThermalLevel::Nominal;

    // Written by the engine after scoring.
    int threatScore = 0;
    ThreatLevel threatLevel = ThreatLevel::Normal;
};

// Replaces every non-finite field of `incoming` with the value from
// `lastGood`. Sets *degraded when at least one field was substituted.
MetricSample mergeWithLastGood(const MetricSample &incoming,
                               const MetricSample &lastGood,
                               bool *degraded = nullptr);

// Builds the clamped snapshot: negative rates become 0, CPU and battery level
// are clamped to [0,100], non-finite values become 0.
MetricSnapshot snapshotFromSample(const MetricSample &sample, const QDateTime &at);

QJsonObject snapshotToJson(const MetricSnapshot &snapshot);

// Human-readable rate, e.g. "12.5 KB/s".
QString formatRate(double bytesPerSecond);

} // namespace idleguard
