#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QMutex>
#include <QString>

#include <array>
#include <cstddef>
#include <optional>

namespace idleguard {

enum class ThresholdMetric {
    UploadRate,     // MB/h equivalent of the instantaneous rate
    DownloadRate,   // MB/h equivalent of the instantaneous rate
    CpuUsage,       // percent while idle
    BatteryDrain,   // percent per hour
    TotalUpload,    // MB over the trailing hour
    TotalDownload   // MB over the trailing hour
};

constexpr std::size_t kThresholdMetricCount = 6;

const std::array<ThresholdMetric, kThresholdMetricCount> &allThresholdMetrics();

QString thresholdMetricToString(ThresholdMetric metric);
std::optional<ThresholdMetric> thresholdMetricFromString(const QString &s);

QString thresholdMetricTitle(ThresholdMetric metric);
QString thresholdMetricUnit(ThresholdMetric metric);

// Editing constraints of a metric, enforced by ThresholdStore.
struct ThresholdBounds
{
    double minimum = 0.0;
    double maximum = 0.0;
    double step = 1.0;
    double defaultValue = 0.0;
};

ThresholdBounds thresholdBounds(ThresholdMetric metric);

struct AlertThreshold
{
    ThresholdMetric metric = ThresholdMetric::UploadRate;
    double value = 0.0;
    bool enabled = true;
};

AlertThreshold defaultThreshold(ThresholdMetric metric);

// Clamps the value into the metric bounds and snaps it to the step grid.
// A non-finite value falls back to the default.
AlertThreshold clampToBounds(const AlertThreshold &threshold);

QJsonObject thresholdToJson(const AlertThreshold &threshold);
std::optional<AlertThreshold> thresholdFromJson(const QJsonObject &obj);

// One threshold per metric. Value type; the scorer works on a copy.
class ThresholdSet
{
public:
    ThresholdSet();

    const AlertThreshold &get(ThresholdMetric metric) const;
    void set(const AlertThreshold &threshold);

    QJsonArray toJson() const;

private:
    std::array<AlertThreshold, kThresholdMetricCount> thresholds_;
};

// User-adjustable thresholds shared between the engine (reader, once per
// tick) and the configuration surface (writer).
class ThresholdStore
{
public:
    ThresholdStore();

    ThresholdSet thresholds() const;
    AlertThreshold threshold(ThresholdMetric metric) const;

    // Stores the clamped value and returns what was stored.
    AlertThreshold update(const AlertThreshold &threshold);

    void reset();

    // Entries for unknown metrics are skipped. Returns false when the file
    // cannot be read or parsed; current values are kept in that case.
    bool load(const QString &path);
    bool save(const QString &path) const;

    QJsonArray toJson() const;
    bool fromJson(const QJsonArray &array);

private:
    mutable QMutex mutex_;
    ThresholdSet thresholds_;
};

} // namespace idleguard
