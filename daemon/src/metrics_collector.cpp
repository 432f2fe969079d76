#include "metrics_collector.hpp"

#include "idleguard/common.hpp"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QMutexLocker>
#include <QtGlobal>

#include <cmath>
#include <limits>

namespace idleguard {

namespace {
constexpr int kBatteryWindowSeconds = 600;
constexpr int kBatteryMinSpanSeconds = 60;

constexpr double kFairCelsius = 60.0;
constexpr double kSeriousCelsius = 75.0;
constexpr double kCriticalCelsius = 90.0;

const double kUnavailable = std::numeric_limits<double>::quiet_NaN();

QByteArray readSysFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return {};
    }
    return file.readAll().trimmed();
}

int thermalOrdinalForCelsius(double celsius)
{
    if (celsius < kFairCelsius) {
        return thermalLevelOrdinal(ThermalLevel::Nominal);
    }
    if (celsius < kSeriousCelsius) {
        return thermalLevelOrdinal(ThermalLevel::Fair);
    }
    if (celsius < kCriticalCelsius) {
        return thermalLevelOrdinal(ThermalLevel::Serious);
    }
    return thermalLevelOrdinal(ThermalLevel::Critical);
}

} // namespace

MetricsCollector::MetricsCollector(QObject *parent)
    : QObject(parent)
{
    timer_.setParent(this);
    connect(&timer_, &QTimer::timeout, this, &MetricsCollector::sample);
}

void MetricsCollector::start(int intervalMs)
{
    sample();
    timer_.start(intervalMs);
}

void MetricsCollector::stop()
{
    timer_.stop();
}

std::optional<MetricSample> MetricsCollector::latestSample() const
{
    QMutexLocker locker(&mutex_);
    return latest_;
}

std::optional<MetricsCollector::CpuTimes> MetricsCollector::readCpuTimes() const
{
    QFile file(QStringLiteral("/proc/stat"));
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return std::nullopt;
    }

    // cpu user nice system idle iowait irq softirq steal ...
    const QByteArray line = file.readLine().simplified();
    const QList<QByteArray> parts = line.split(' ');
    if (parts.size() < 5 || parts.at(0) != "cpu") {
        return std::nullopt;
    }

    CpuTimes times;
    quint64 idle = 0;
    for (int i = 1; i < parts.size(); ++i) {
        bool ok = false;
        const quint64 value = parts.at(i).toULongLong(&ok);
        if (!ok) {
            return std::nullopt;
        }
        times.total += value;
        if (i == 4 || i == 5) {
            idle += value;
        }
    }
    times.busy = times.total - idle;
    return times;
}

std::optional<MetricsCollector::NetCounters> MetricsCollector::readNetCounters() const
{
    QFile file(QStringLiteral("/proc/net/dev"));
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return std::nullopt;
    }

    NetCounters counters;
    bool any = false;

    while (!file.atEnd()) {
        const QByteArray line = file.readLine();
        const int colon = line.indexOf(':');
        if (colon < 0) {
            continue; // header lines
        }

        const QByteArray iface = line.left(colon).trimmed();
        if (iface == "lo") {
            continue;
        }

        const QList<QByteArray> fields = line.mid(colon + 1).simplified().split(' ');
        if (fields.size() < 9) {
            continue;
        }

        bool rxOk = false;
        bool txOk = false;
        const quint64 rx = fields.at(0).toULongLong(&rxOk);
        const quint64 tx = fields.at(8).toULongLong(&txOk);
        if (!rxOk || !txOk) {
            continue;
        }

        counters.received += rx;
        counters.transmitted += tx;
        any = true;
    }

    if (!any) {
        return std::nullopt;
    }
    return counters;
}

std::optional<double> MetricsCollector::readBatteryLevel() const
{
    const QDir dir(QStringLiteral("/sys/class/power_supply"));
    const QStringList batteries = dir.entryList({QStringLiteral("BAT*")},
                                                QDir::Dirs | QDir::NoDotAndDotDot);
    for (const QString &name : batteries) {
        const QByteArray raw = readSysFile(dir.filePath(name) + QStringLiteral("/capacity"));
        bool ok = false;
        const double level = raw.toDouble(&ok);
        if (ok) {
            return level;
        }
    }
    return std::nullopt;
}

std::optional<double> MetricsCollector::readHottestZoneCelsius() const
{
    const QDir dir(QStringLiteral("/sys/class/thermal"));
    const QStringList zones = dir.entryList({QStringLiteral("thermal_zone*")},
                                            QDir::Dirs | QDir::NoDotAndDotDot);

    std::optional<double> hottest;
    for (const QString &zone : zones) {
        const QByteArray raw = readSysFile(dir.filePath(zone) + QStringLiteral("/temp"));
        bool ok = false;
        const double milli = raw.toDouble(&ok);
        if (!ok) {
            continue;
        }
        const double celsius = milli / 1000.0;
        if (!hottest || celsius > *hottest) {
            hottest = celsius;
        }
    }
    return hottest;
}

double MetricsCollector::cpuUsage(const std::optional<CpuTimes> &current)
{
    if (!current) {
        return kUnavailable;
    }

    double usage = kUnavailable;
    if (lastCpu_ && current->total > lastCpu_->total && current->busy >= lastCpu_->busy) {
        const double busy = static_cast<double>(current->busy - lastCpu_->busy);
        const double total = static_cast<double>(current->total - lastCpu_->total);
        usage = 100.0 * busy / total;
    }
    lastCpu_ = current;
    return usage;
}

double MetricsCollector::batteryDrain(const QDateTime &now, const std::optional<double> &level)
{
    if (!level) {
        battery_.clear();
        return kUnavailable;
    }

    battery_.push_back(BatteryReading{now, *level});
    while (!battery_.empty()
           && secondsBetween(battery_.front().at, now) > kBatteryWindowSeconds) {
        battery_.pop_front();
    }

    const BatteryReading &oldest = battery_.front();
    const double span = secondsBetween(oldest.at, now);
    if (span < kBatteryMinSpanSeconds) {
        return 0.0;
    }

    // Charging shows up as a negative drop and is reported as no drain.
    const double dropped = oldest.level - *level;
    return qMax(0.0, dropped * 3600.0 / span);
}

void MetricsCollector::sample()
{
    const QDateTime now = nowUtc();

    MetricSample sample;
    sample.timestamp = now;
    sample.cpuUsagePercent = cpuUsage(readCpuTimes());

    const std::optional<NetCounters> net = readNetCounters();
    if (net) {
        sample.cumulativeDownloadBytes = net->received;
        sample.cumulativeUploadBytes = net->transmitted;

        if (lastNet_ && lastNetAt_.isValid()) {
            const double elapsed = secondsBetween(lastNetAt_, now);
            if (elapsed > 0.0 && net->received >= lastNet_->received
                && net->transmitted >= lastNet_->transmitted) {
                sample.downloadBytesPerSecond =
                    static_cast<double>(net->received - lastNet_->received) / elapsed;
                sample.uploadBytesPerSecond =
                    static_cast<double>(net->transmitted - lastNet_->transmitted) / elapsed;
            }
        }
        lastNet_ = net;
        lastNetAt_ = now;
    } else {
        sample.uploadBytesPerSecond = kUnavailable;
        sample.downloadBytesPerSecond = kUnavailable;
    }

    const std::optional<double> battery = readBatteryLevel();
    sample.batteryLevelPercent = battery ? *battery : kUnavailable;
    sample.batteryDrainPerHourPercent = batteryDrain(now, battery);

    const std::optional<double> celsius = readHottestZoneCelsius();
    sample.thermalLevel = celsius ? thermalOrdinalForCelsius(*celsius)
                                  : thermalLevelOrdinal(ThermalLevel::Nominal);

    QMutexLocker locker(&mutex_);
    latest_ = sample;
}

} // namespace idleguard
