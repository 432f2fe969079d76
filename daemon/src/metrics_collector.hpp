#pragma once

#include <QDateTime>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QTimer>

#include <deque>
#include <optional>

#include "idleguard/metrics.hpp"

namespace idleguard {

// Samples /proc and /sys on its own timer and keeps the latest reading for
// the engine.
class MetricsCollector : public QObject, public MetricSource
{
    Q_OBJECT
public:
    explicit MetricsCollector(QObject *parent = nullptr);

    void start(int intervalMs = 1000);
    void stop();

    std::optional<MetricSample> latestSample() const override;

private slots:
    void sample();

private:
    struct CpuTimes
    {
        quint64 busy = 0;
        quint64 total = 0;
    };

    struct NetCounters
    {
        quint64 received = 0;
        quint64 transmitted = 0;
    };

    struct BatteryReading
    {
        QDateTime at;
        double level = 0.0;
    };

    std::optional<CpuTimes> readCpuTimes() const;
    std::optional<NetCounters> readNetCounters() const;
    std::optional<double> readBatteryLevel() const;
    std::optional<double> readHottestZoneCelsius() const;

    double cpuUsage(const std::optional<CpuTimes> &current);
    double batteryDrain(const QDateTime &now, const std::optional<double> &level);

    QTimer timer_;

    mutable QMutex mutex_;
    std::optional<MetricSample> latest_;

    std::optional<CpuTimes> lastCpu_;
    std::optional<NetCounters> lastNet_;
    QDateTime lastNetAt_;
    std::deque<BatteryReading> battery_;
};

} // namespace idleguard
