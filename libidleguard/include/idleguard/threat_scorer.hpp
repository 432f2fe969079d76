#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QString>

#include <vector>

#include "idleguard/baseline_tracker.hpp"
#include "idleguard/metrics.hpp"
#include "idleguard/rolling_window.hpp"
#include "idleguard/threshold.hpp"

namespace idleguard {

// Factor identifiers, stable across releases (used as alert identities and
// in the DBus JSON).
namespace factor {
constexpr const char *TotalUpload          = "total_upload";
constexpr const char *TotalUploadNearLimit = "total_upload_near_limit";
constexpr const char *TotalDownload        = "total_download";
constexpr const char *SustainedUpload      = "sustained_upload";
constexpr const char *IdleCpu              = "idle_cpu";
constexpr const char *BatteryDrain         = "battery_drain";
constexpr const char *Thermal              = "thermal";
constexpr const char *SurveillancePattern  = "surveillance_pattern";
} // namespace factor

struct ThreatFactor
{
    QString name;
    int score = 0;
    QString reason;
};

struct ThreatAssessment
{
    int score = 0;
    std::vector<ThreatFactor> factors;

    bool hasFactor(const QString &name) const;
};

struct ScoringParameters
{
    double baselineMultiplier = 5.0;
    double nearLimitRatio = 0.8;

    // Fixed co-occurrence heuristic for screen mirroring / surveillance.
    // Not tied to the user thresholds.
    double surveillanceUploadMegabytes = 30.0;
    double surveillanceCpuPercent = 20.0;
    double surveillanceDrainPerHour = 3.0;
};

// Factor weights.
constexpr int kTotalUploadScore          = 50;
constexpr int kTotalUploadNearLimitScore = 20;
constexpr int kTotalDownloadScore        = 30;
constexpr int kSustainedUploadScore      = 25;
constexpr int kIdleCpuScore              = 25;
constexpr int kBatteryDrainScore         = 20;
constexpr int kThermalScore              = 20;
constexpr int kSurveillancePatternScore  = 20;

// Instantaneous rate expressed as megabytes per hour.
double megabytesPerHour(double bytesPerSecond);

// Pure and total over any input. Returns (0, []) while the device is not
// idle; otherwise sums the triggered factors and clamps to [0,100].
ThreatAssessment scoreThreat(const MetricSnapshot &snapshot,
                             bool isIdle,
                             const Baseline &baseline,
                             const ThresholdSet &thresholds,
                             const RollingTotals &totals,
                             const ScoringParameters &params = {});

QJsonObject factorToJson(const ThreatFactor &factor);
QJsonArray factorsToJson(const std::vector<ThreatFactor> &factors);

// "a; b; c" list of factor reasons, or `fallback` when empty.
QString describeFactors(const std::vector<ThreatFactor> &factors,
                        const QString &fallback = QString());

} // namespace idleguard
