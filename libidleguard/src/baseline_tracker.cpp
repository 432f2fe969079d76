#include "idleguard/baseline_tracker.hpp"

#include <QDebug>

#include <algorithm>
#include <cmath>
#include <limits>

namespace idleguard {

QJsonObject baselineToJson(const Baseline &baseline)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("upload_bps"), baseline.uploadBytesPerSecond);
    obj.insert(QStringLiteral("download_bps"), baseline.downloadBytesPerSecond);
    obj.insert(QStringLiteral("cpu_percent"), baseline.cpuPercent);
    obj.insert(QStringLiteral("samples"), baseline.sampleCount);
    obj.insert(QStringLiteral("warm"), baseline.warm);
    return obj;
}

BaselineTracker::BaselineTracker(int coldStartSamples, double smoothing)
    : coldStartSamples_(std::max(1, coldStartSamples))
    , smoothing_(std::clamp(smoothing, 0.0, 1.0))
{
}

double BaselineTracker::blend(double current, double value) const
{
    if (count_ < coldStartSamples_) {
        return (current * count_ + value) / (count_ + 1);
    }
    return smoothing_ * value + (1.0 - smoothing_) * current;
}

void BaselineTracker::observe(double uploadRate, double downloadRate, double cpuPercent)
{
    if (!std::isfinite(uploadRate) || !std::isfinite(downloadRate) ||
        !std::isfinite(cpuPercent)) {
        return;
    }

    upload_ = blend(upload_, std::max(0.0, uploadRate));
    download_ = blend(download_, std::max(0.0, downloadRate));
    cpu_ = blend(cpu_, std::clamp(cpuPercent, 0.0, 100.0));

    if (count_ < std::numeric_limits<int>::max()) {
        ++count_;
    }

    if (count_ == coldStartSamples_) {
        qInfo() << "BaselineTracker: baseline warm after" << count_ << "samples"
                << "(up" << upload_ << "B/s, down" << download_ << "B/s, cpu" << cpu_ << "%)";
    }
}

Baseline BaselineTracker::baseline() const
{
    Baseline b;
    b.uploadBytesPerSecond = upload_;
    b.downloadBytesPerSecond = download_;
    b.cpuPercent = cpu_;
    b.sampleCount = count_;
    b.warm = isWarm();
    return b;
}

} // namespace idleguard
