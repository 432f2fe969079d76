#include "idleguard/threshold.hpp"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonValue>
#include <QMutexLocker>
#include <QSaveFile>

#include <algorithm>
#include <cmath>

namespace idleguard {

const std::array<ThresholdMetric, kThresholdMetricCount> &allThresholdMetrics()
{
    static const std::array<ThresholdMetric, kThresholdMetricCount> metrics = {
        ThresholdMetric::UploadRate,
        ThresholdMetric::DownloadRate,
        ThresholdMetric::CpuUsage,
        ThresholdMetric::BatteryDrain,
        ThresholdMetric::TotalUpload,
        ThresholdMetric::TotalDownload,
    };
    return metrics;
}

QString thresholdMetricToString(ThresholdMetric metric)
{
    switch (metric) {
    case ThresholdMetric::UploadRate:
        return QStringLiteral("upload_rate");
    case ThresholdMetric::DownloadRate:
        return QStringLiteral("download_rate");
    case ThresholdMetric::CpuUsage:
        return QStringLiteral("cpu_usage");
    case ThresholdMetric::BatteryDrain:
        return QStringLiteral("battery_drain");
    case ThresholdMetric::TotalUpload:
        return QStringLiteral("total_upload");
    case ThresholdMetric::TotalDownload:
        return QStringLiteral("total_download");
    }

    return QStringLiteral("upload_rate");
}

std::optional<ThresholdMetric> thresholdMetricFromString(const QString &s)
{
    const QString lower = s.trimmed().toLower();

    for (ThresholdMetric metric : allThresholdMetrics()) {
        if (lower == thresholdMetricToString(metric)) {
            return metric;
        }
    }
    return std::nullopt;
}

QString thresholdMetricTitle(ThresholdMetric metric)
{
    switch (metric) {
    case ThresholdMetric::UploadRate:
        return QStringLiteral("Sustained Upload Rate");
    case ThresholdMetric::DownloadRate:
        return QStringLiteral("Sustained Download Rate");
    case ThresholdMetric::CpuUsage:
        return QStringLiteral("CPU While Idle");
    case ThresholdMetric::BatteryDrain:
        return QStringLiteral("Battery Drain While Idle");
    case ThresholdMetric::TotalUpload:
        return QStringLiteral("Total Upload (1 hour)");
    case ThresholdMetric::TotalDownload:
        return QStringLiteral("Total Download (1 hour)");
    }

    return QString();
}

QString thresholdMetricUnit(ThresholdMetric metric)
{
    switch (metric) {
    case ThresholdMetric::UploadRate:
    case ThresholdMetric::DownloadRate:
        return QStringLiteral("MB/h");
    case ThresholdMetric::CpuUsage:
        return QStringLiteral("%");
    case ThresholdMetric::BatteryDrain:
        return QStringLiteral("%/h");
    case ThresholdMetric::TotalUpload:
    case ThresholdMetric::TotalDownload:
        return QStringLiteral("MB");
    }

    return QString();
}

ThresholdBounds thresholdBounds(ThresholdMetric metric)
{
    switch (metric) {
    case ThresholdMetric::UploadRate:
        return {50.0, 2000.0, 50.0, 200.0};
    case ThresholdMetric::DownloadRate:
        return {50.0, 2000.0, 50.0, 500.0};
    case ThresholdMetric::CpuUsage:
        return {20.0, 90.0, 5.0, 50.0};
    case ThresholdMetric::BatteryDrain:
        return {5.0, 30.0, 1.0, 10.0};
    case ThresholdMetric::TotalUpload:
        return {50.0, 1000.0, 50.0, 100.0};
    case ThresholdMetric::TotalDownload:
        return {100.0, 2000.0, 50.0, 300.0};
    }

    return {};
}

AlertThreshold defaultThreshold(ThresholdMetric metric)
{
    AlertThreshold t;
    t.metric = metric;
    t.value = thresholdBounds(metric).defaultValue;
    t.enabled = true;
    return t;
}

AlertThreshold clampToBounds(const AlertThreshold &threshold)
{
    const ThresholdBounds bounds = thresholdBounds(threshold.metric);

    AlertThreshold t = threshold;
    if (!std::isfinite(t.value)) {
        t.value = bounds.defaultValue;
        return t;
    }

    double v = std::clamp(t.value, bounds.minimum, bounds.maximum);
    if (bounds.step > 0.0) {
        v = bounds.minimum + std::round((v - bounds.minimum) / bounds.step) * bounds.step;
        v = std::clamp(v, bounds.minimum, bounds.maximum);
    }
    t.value = v;
    return t;
}

QJsonObject thresholdToJson(const AlertThreshold &threshold)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("metric"), thresholdMetricToString(threshold.metric));
    obj.insert(QStringLiteral("value"), threshold.value);
    obj.insert(QStringLiteral("enabled"), threshold.enabled);
    return obj;
}

std::optional<AlertThreshold> thresholdFromJson(const QJsonObject &obj)
{
    const auto metric = thresholdMetricFromString(obj.value(QStringLiteral("metric")).toString());
    if (!metric) {
        return std::nullopt;
    }

    AlertThreshold t = defaultThreshold(*metric);

    const QJsonValue value = obj.value(QStringLiteral("value"));
    if (value.isDouble()) {
        t.value = value.toDouble();
    }

    const QJsonValue enabled = obj.value(QStringLiteral("enabled"));
    if (enabled.isBool()) {
        t.enabled = enabled.toBool();
    }

    return t;
}

ThresholdSet::ThresholdSet()
{
    for (ThresholdMetric metric : allThresholdMetrics()) {
        thresholds_[static_cast<std::size_t>(metric)] = defaultThreshold(metric);
    }
}

const AlertThreshold &ThresholdSet::get(ThresholdMetric metric) const
{
    return thresholds_[static_cast<std::size_t>(metric)];
}

void ThresholdSet::set(const AlertThreshold &threshold)
{
    thresholds_[static_cast<std::size_t>(threshold.metric)] = threshold;
}

QJsonArray ThresholdSet::toJson() const
{
    QJsonArray arr;
    for (const AlertThreshold &t : thresholds_) {
        arr.push_back(thresholdToJson(t));
    }
    return arr;
}

ThresholdStore::ThresholdStore() = default;

ThresholdSet ThresholdStore::thresholds() const
{
    QMutexLocker locker(&mutex_);
    return thresholds_;
}

AlertThreshold ThresholdStore::threshold(ThresholdMetric metric) const
{
    QMutexLocker locker(&mutex_);
    return thresholds_.get(metric);
}

AlertThreshold ThresholdStore::update(const AlertThreshold &threshold)
{
    const AlertThreshold clamped = clampToBounds(threshold);
    if (clamped.value != threshold.value) {
        qInfo() << "ThresholdStore:" << thresholdMetricToString(threshold.metric)
                << "value" << threshold.value << "adjusted to" << clamped.value;
    }

    QMutexLocker locker(&mutex_);
    thresholds_.set(clamped);
    return clamped;
}

void ThresholdStore::reset()
{
    QMutexLocker locker(&mutex_);
    thresholds_ = ThresholdSet();
}

QJsonArray ThresholdStore::toJson() const
{
    QMutexLocker locker(&mutex_);
    return thresholds_.toJson();
}

bool ThresholdStore::fromJson(const QJsonArray &array)
{
    ThresholdSet loaded;
    int accepted = 0;

    for (const QJsonValue &v : array) {
        if (!v.isObject()) {
            continue;
        }
        const auto t = thresholdFromJson(v.toObject());
        if (!t) {
            qWarning() << "ThresholdStore: skipping entry with unknown metric";
            continue;
        }
        loaded.set(clampToBounds(*t));
        ++accepted;
    }

    QMutexLocker locker(&mutex_);
    thresholds_ = loaded;
    return accepted > 0 || array.isEmpty();
}

bool ThresholdStore::load(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "ThresholdStore: cannot open" << path << "-" << file.errorString();
        return false;
    }

    QJsonParseError err{};
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isArray()) {
        qWarning() << "ThresholdStore: invalid thresholds file" << path << "-" << err.errorString();
        return false;
    }

    return fromJson(doc.array());
}

bool ThresholdStore::save(const QString &path) const
{
    const QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        qWarning() << "ThresholdStore: cannot create" << info.absolutePath();
        return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "ThresholdStore: cannot write" << path << "-" << file.errorString();
        return false;
    }

    const QJsonDocument doc(toJson());
    file.write(doc.toJson(QJsonDocument::Indented));

    if (!file.commit()) {
        qWarning() << "ThresholdStore: failed to commit" << path << "-" << file.errorString();
        return false;
    }
    return true;
}

} // namespace idleguard
