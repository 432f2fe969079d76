#include "idleguard/config.hpp"

#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonValue>

#include <cmath>

namespace idleguard {

namespace {

void readInt(const QJsonObject &obj, const char *key, int minimum, int &out)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (v.isUndefined()) {
        return;
    }
    if (!v.isDouble() || v.toDouble() < minimum) {
        qWarning() << "EngineConfig: ignoring invalid" << key << v;
        return;
    }
    out = v.toInt();
}

void readDouble(const QJsonObject &obj, const char *key, double minimum, double maximum, double &out)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (v.isUndefined()) {
        return;
    }
    const double d = v.toDouble(std::nan(""));
    if (!v.isDouble() || !std::isfinite(d) || d < minimum || d > maximum) {
        qWarning() << "EngineConfig: ignoring invalid" << key << v;
        return;
    }
    out = d;
}

} // namespace

QJsonObject engineConfigToJson(const EngineConfig &config)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("tick_interval_ms"), config.tickIntervalMs);
    obj.insert(QStringLiteral("idle_threshold_s"), config.idle.idleThresholdSeconds);
    obj.insert(QStringLiteral("idle_cpu_percent"), config.idle.idleCpuThreshold);
    obj.insert(QStringLiteral("idle_network_bps"), config.idle.idleNetworkThreshold);
    obj.insert(QStringLiteral("baseline_cold_start_samples"), config.baselineColdStartSamples);
    obj.insert(QStringLiteral("baseline_smoothing"), config.baselineSmoothing);
    obj.insert(QStringLiteral("baseline_multiplier"), config.scoring.baselineMultiplier);
    obj.insert(QStringLiteral("near_limit_ratio"), config.scoring.nearLimitRatio);
    obj.insert(QStringLiteral("surveillance_upload_mb"), config.scoring.surveillanceUploadMegabytes);
    obj.insert(QStringLiteral("surveillance_cpu_percent"), config.scoring.surveillanceCpuPercent);
    obj.insert(QStringLiteral("surveillance_drain_per_hour"), config.scoring.surveillanceDrainPerHour);
    obj.insert(QStringLiteral("level_change_cooldown_s"), config.levelChangeCooldownSeconds);
    obj.insert(QStringLiteral("incident_dedup_s"), config.gate.incidentDedupSeconds);
    obj.insert(QStringLiteral("alert_cooldown_s"), config.gate.alertCooldownSeconds);
    obj.insert(QStringLiteral("incident_history"), config.gate.incidentHistory);
    obj.insert(QStringLiteral("rolling_window_s"), config.rollingWindowSeconds);
    obj.insert(QStringLiteral("activity_log_capacity"), config.activityLogCapacity);
    return obj;
}

EngineConfig engineConfigFromJson(const QJsonObject &obj)
{
    EngineConfig c;

    readInt(obj, "tick_interval_ms", 100, c.tickIntervalMs);
    readInt(obj, "idle_threshold_s", 0, c.idle.idleThresholdSeconds);
    readDouble(obj, "idle_cpu_percent", 0.0, 100.0, c.idle.idleCpuThreshold);
    readDouble(obj, "idle_network_bps", 0.0, 1e12, c.idle.idleNetworkThreshold);
    readInt(obj, "baseline_cold_start_samples", 1, c.baselineColdStartSamples);
    readDouble(obj, "baseline_smoothing", 0.0, 1.0, c.baselineSmoothing);
    readDouble(obj, "baseline_multiplier", 0.0, 1000.0, c.scoring.baselineMultiplier);
    readDouble(obj, "near_limit_ratio", 0.0, 1.0, c.scoring.nearLimitRatio);
    readDouble(obj, "surveillance_upload_mb", 0.0, 1e6, c.scoring.surveillanceUploadMegabytes);
    readDouble(obj, "surveillance_cpu_percent", 0.0, 100.0, c.scoring.surveillanceCpuPercent);
    readDouble(obj, "surveillance_drain_per_hour", -100.0, 100.0, c.scoring.surveillanceDrainPerHour);
    readInt(obj, "level_change_cooldown_s", 0, c.levelChangeCooldownSeconds);
    readInt(obj, "incident_dedup_s", 0, c.gate.incidentDedupSeconds);
    readInt(obj, "alert_cooldown_s", 0, c.gate.alertCooldownSeconds);
    readInt(obj, "incident_history", 1, c.gate.incidentHistory);
    readInt(obj, "rolling_window_s", 1, c.rollingWindowSeconds);
    readInt(obj, "activity_log_capacity", 1, c.activityLogCapacity);

    return c;
}

EngineConfig loadEngineConfig(const QString &path)
{
    QFile file(path);
    if (!file.exists()) {
        qInfo() << "EngineConfig: no config at" << path << "- using defaults";
        return EngineConfig();
    }

    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "EngineConfig: cannot open" << path << "-" << file.errorString();
        return EngineConfig();
    }

    QJsonParseError err{};
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "EngineConfig: invalid config" << path << "-" << err.errorString();
        return EngineConfig();
    }

    return engineConfigFromJson(doc.object());
}

} // namespace idleguard
