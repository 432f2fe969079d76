#include "idleguard/metrics.hpp"

#include <algorithm>
#include <cmath>

namespace idleguard {

namespace {

double finiteOr(double value, double fallback)
{
    return std::isfinite(value) ? value : fallback;
}

double nonNegative(double value)
{
    if (!std::isfinite(value) || value < 0.0) {
        return 0.0;
    }
    return value;
}

double percent(double value)
{
    if (!std::isfinite(value)) {
        return 0.0;
    }
    return std::clamp(value, 0.0, 100.0);
}

} // namespace

QString thermalLevelToString(ThermalLevel t)
{
    switch (t) {
    case ThermalLevel::Nominal:
        return QStringLiteral("nominal");
    case ThermalLevel::Fair:
        return QStringLiteral("fair");
    case ThermalLevel::Serious:
        return QStringLiteral("serious");
    case ThermalLevel::Critical:
        return QStringLiteral("critical");
    }

    return QStringLiteral("nominal");
}

ThermalLevel thermalLevelFromOrdinal(int ordinal)
{
    return static_cast<ThermalLevel>(std::clamp(ordinal, 0, 3));
}

int thermalLevelOrdinal(ThermalLevel t)
{
    return static_cast<int>(t);
}

MetricSample mergeWithLastGood(const MetricSample &incoming,
                               const MetricSample &lastGood,
                               bool *degraded)
{
    MetricSample merged = incoming;

    merged.uploadBytesPerSecond =
        finiteOr(incoming.uploadBytesPerSecond, lastGood.uploadBytesPerSecond);
    merged.downloadBytesPerSecond =
        finiteOr(incoming.downloadBytesPerSecond, lastGood.downloadBytesPerSecond);
    merged.cpuUsagePercent =
        finiteOr(incoming.cpuUsagePercent, lastGood.cpuUsagePercent);
    merged.batteryLevelPercent =
        finiteOr(incoming.batteryLevelPercent, lastGood.batteryLevelPercent);
    merged.batteryDrainPerHourPercent =
        finiteOr(incoming.batteryDrainPerHourPercent, lastGood.batteryDrainPerHourPercent);

    // Counters are monotonic; a zero reading after a non-zero one means the
    // source lost its counters rather than that they wrapped.
    if (incoming.cumulativeUploadBytes == 0 && lastGood.cumulativeUploadBytes != 0) {
        merged.cumulativeUploadBytes = lastGood.cumulativeUploadBytes;
    }
    if (incoming.cumulativeDownloadBytes == 0 && lastGood.cumulativeDownloadBytes != 0) {
        merged.cumulativeDownloadBytes = lastGood.cumulativeDownloadBytes;
    }

    if (degraded) {
        *degraded = !std::isfinite(incoming.uploadBytesPerSecond) ||
                    !std::isfinite(incoming.downloadBytesPerSecond) ||
                    !std::isfinite(incoming.cpuUsagePercent) ||
                    !std::isfinite(incoming.batteryLevelPercent) ||
                    !std::isfinite(incoming.batteryDrainPerHourPercent);
    }

    return merged;
}

MetricSnapshot snapshotFromSample(const MetricSample &sample, const QDateTime &at)
{
    MetricSnapshot snapshot;
    snapshot.timestamp = at;
    snapshot.uploadBytesPerSecond = nonNegative(sample.uploadBytesPerSecond);
    snapshot.downloadBytesPerSecond = nonNegative(sample.downloadBytesPerSecond);
    snapshot.cpuUsagePercent = percent(sample.cpuUsagePercent);
    snapshot.batteryLevelPercent = percent(sample.batteryLevelPercent);
    // Drain may legitimately be negative while charging.
    snapshot.batteryDrainPerHourPercent = finiteOr(sample.batteryDrainPerHourPercent, 0.0);
    snapshot.thermalLevel = thermalLevelFromOrdinal(sample.thermalLevel);
    return snapshot;
}

QJsonObject snapshotToJson(const MetricSnapshot &snapshot)
{
    QJsonObject obj;

    if (snapshot.timestamp.isValid()) {
        obj.insert(QStringLiteral("timestamp"),
                   snapshot.timestamp.toUTC().toString(Qt::ISODate));
        obj.insert(QStringLiteral("timestamp_ms"),
                   static_cast<qint64>(snapshot.timestamp.toMSecsSinceEpoch()));
    }

    obj.insert(QStringLiteral("upload_bps"), snapshot.uploadBytesPerSecond);
    obj.insert(QStringLiteral("download_bps"), snapshot.downloadBytesPerSecond);
    obj.insert(QStringLiteral("cpu_percent"), snapshot.cpuUsagePercent);
    obj.insert(QStringLiteral("battery_percent"), snapshot.batteryLevelPercent);
    obj.insert(QStringLiteral("battery_drain_per_hour"), snapshot.batteryDrainPerHourPercent);
    obj.insert(QStringLiteral("thermal"), thermalLevelToString(snapshot.thermalLevel));
    obj.insert(QStringLiteral("threat_score"), snapshot.threatScore);
    obj.insert(QStringLiteral("threat_level"), threatLevelToString(snapshot.threatLevel));

    return obj;
}

QString formatRate(double bytesPerSecond)
{
    const double bps = nonNegative(bytesPerSecond);
    if (bps < 1024.0) {
        return QStringLiteral("%1 B/s").arg(bps, 0, 'f', 0);
    }
    if (bps < 1024.0 * 1024.0) {
        return QStringLiteral("%1 KB/s").arg(bps / 1024.0, 0, 'f', 1);
    }
    return QStringLiteral("%1 MB/s").arg(bps / (1024.0 * 1024.0), 0, 'f', 1);
}

} // namespace idleguard
