#include "idleguard/threat_scorer.hpp"

#include <QStringList>

#include <algorithm>
#include <cmath>

namespace idleguard {

namespace {

// A threshold participates only when enabled with a finite, positive value.
bool usable(const AlertThreshold &t)
{
    return t.enabled && std::isfinite(t.value) && t.value > 0.0;
}

double nonNegative(double value)
{
    return (std::isfinite(value) && value > 0.0) ? value : 0.0;
}

QString mb(double value)
{
    return QString::number(value, 'f', 1);
}

} // namespace

bool ThreatAssessment::hasFactor(const QString &name) const
{
    return std::any_of(factors.begin(), factors.end(),
                       [&name](const ThreatFactor &f) { return f.name == name; });
}

double megabytesPerHour(double bytesPerSecond)
{
    return nonNegative(bytesPerSecond) * 3600.0 / kBytesPerMegabyte;
}

ThreatAssessment scoreThreat(const MetricSnapshot &snapshot,
                             bool isIdle,
                             const Baseline &baseline,
                             const ThresholdSet &thresholds,
                             const RollingTotals &totals,
                             const ScoringParameters &params)
{
    ThreatAssessment result;

    // Nothing is scored while the device is in use.
    if (!isIdle) {
        return result;
    }

    auto add = [&result](const char *name, int score, const QString &reason) {
        result.factors.push_back({QString::fromLatin1(name), score, reason});
    };

    const double totalUpMB = nonNegative(totals.uploadMegabytes());
    const double totalDownMB = nonNegative(totals.downloadMegabytes());
    const double cpu = std::isfinite(snapshot.cpuUsagePercent)
        ? std::clamp(snapshot.cpuUsagePercent, 0.0, 100.0) : 0.0;
    const double drain = std::isfinite(snapshot.batteryDrainPerHourPercent)
        ? snapshot.batteryDrainPerHourPercent : 0.0;

    // 1. Trailing-hour upload total, with an early warning near the limit.
    const AlertThreshold &totalUp = thresholds.get(ThresholdMetric::TotalUpload);
    if (usable(totalUp)) {
        const double ratio = totalUpMB / totalUp.value;
        if (ratio > 1.0) {
            add(factor::TotalUpload, kTotalUploadScore,
                QStringLiteral("Uploaded %1 MB in the last hour (limit %2 MB)")
                    .arg(mb(totalUpMB), mb(totalUp.value)));
        } else if (ratio > params.nearLimitRatio) {
            add(factor::TotalUploadNearLimit, kTotalUploadNearLimitScore,
                QStringLiteral("Upload approaching limit (%1/%2 MB, %3%)")
                    .arg(mb(totalUpMB), mb(totalUp.value))
                    .arg(static_cast<int>(ratio * 100.0)));
        }
    }

    // 2. Trailing-hour download total.
    const AlertThreshold &totalDown = thresholds.get(ThresholdMetric::TotalDownload);
    if (usable(totalDown) && totalDownMB > totalDown.value) {
        add(factor::TotalDownload, kTotalDownloadScore,
            QStringLiteral("Downloaded %1 MB in the last hour (limit %2 MB)")
                .arg(mb(totalDownMB), mb(totalDown.value)));
    }

    // 3. Sustained upload rate: above the user threshold and well above what
    // this device normally does while idle. The baseline comparison only
    // applies once the baseline has left cold start.
    const AlertThreshold &uploadRate = thresholds.get(ThresholdMetric::UploadRate);
    if (usable(uploadRate)) {
        const double rate = nonNegative(snapshot.uploadBytesPerSecond);
        const double rateMBH = megabytesPerHour(rate);
        const double baselineLimit =
            params.baselineMultiplier * nonNegative(baseline.uploadBytesPerSecond);
        const bool aboveThreshold = rateMBH > uploadRate.value;
        const bool aboveBaseline = !baseline.warm || rate > baselineLimit;
        if (aboveThreshold && aboveBaseline) {
            add(factor::SustainedUpload, kSustainedUploadScore,
                baseline.warm
                    ? QStringLiteral("Upload rate %1 MB/h, %2x the idle baseline")
                          .arg(mb(rateMBH))
                          .arg(baseline.uploadBytesPerSecond > 0.0
                                   ? rate / baseline.uploadBytesPerSecond : 0.0,
                               0, 'f', 1)
                    : QStringLiteral("Upload rate %1 MB/h (limit %2 MB/h)")
                          .arg(mb(rateMBH), mb(uploadRate.value)));
        }
    }

    // 4. CPU while idle.
    const AlertThreshold &cpuLimit = thresholds.get(ThresholdMetric::CpuUsage);
    if (usable(cpuLimit) && cpu > cpuLimit.value) {
        add(factor::IdleCpu, kIdleCpuScore,
            QStringLiteral("CPU at %1% while idle").arg(static_cast<int>(cpu)));
    }

    // 5. Battery drain.
    const AlertThreshold &drainLimit = thresholds.get(ThresholdMetric::BatteryDrain);
    if (usable(drainLimit) && drain > drainLimit.value) {
        add(factor::BatteryDrain, kBatteryDrainScore,
            QStringLiteral("Battery draining %1%/h").arg(drain, 0, 'f', 1));
    }

    // 6. Thermal state.
    if (snapshot.thermalLevel == ThermalLevel::Serious ||
        snapshot.thermalLevel == ThermalLevel::Critical) {
        add(factor::Thermal, kThermalScore,
            QStringLiteral("Thermal state %1").arg(thermalLevelToString(snapshot.thermalLevel)));
    }

    // 7. Moderate upload + CPU + drain together, independent of thresholds.
    // TODO: derive these limits from the user thresholds once the UI exposes them.
    if (totalUpMB > params.surveillanceUploadMegabytes &&
        cpu > params.surveillanceCpuPercent &&
        drain > params.surveillanceDrainPerHour) {
        add(factor::SurveillancePattern, kSurveillancePatternScore,
            QStringLiteral("Upload, CPU and battery drain elevated together "
                           "(possible screen mirroring)"));
    }

    int sum = 0;
    for (const ThreatFactor &f : result.factors) {
        sum += f.score;
    }
    result.score = std::clamp(sum, 0, 100);

    return result;
}

QJsonObject factorToJson(const ThreatFactor &f)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("name"), f.name);
    obj.insert(QStringLiteral("score"), f.score);
    obj.insert(QStringLiteral("reason"), f.reason);
    return obj;
}

QJsonArray factorsToJson(const std::vector<ThreatFactor> &factors)
{
    QJsonArray arr;
    for (const ThreatFactor &f : factors) {
        arr.push_back(factorToJson(f));
    }
    return arr;
}

QString describeFactors(const std::vector<ThreatFactor> &factors, const QString &fallback)
{
    if (factors.empty()) {
        return fallback;
    }

    QStringList reasons;
    for (const ThreatFactor &f : factors) {
        reasons << f.reason;
    }
    return reasons.join(QStringLiteral("; "));
}

} // namespace idleguard
