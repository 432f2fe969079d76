#pragma once

#include <QJsonObject>

namespace idleguard {

struct Baseline
{
    double uploadBytesPerSecond   = 0.0;
    double downloadBytesPerSecond = 0.0;
    double cpuPercent             = 0.0;
    int    sampleCount = 0;
    bool   warm = false;
};

QJsonObject baselineToJson(const Baseline &baseline);

// Learns "quiet idle" upload, download and CPU levels. The first
// `coldStartSamples` observations are averaged; after that the values follow
// an exponential moving average with factor `smoothing`.
class BaselineTracker
{
public:
    explicit BaselineTracker(int coldStartSamples = 30, double smoothing = 0.1);

    void observe(double uploadRate, double downloadRate, double cpuPercent);

    Baseline baseline() const;
    bool isWarm() const { return count_ >= coldStartSamples_; }
    int sampleCount() const { return count_; }

private:
    double blend(double current, double value) const;

    int coldStartSamples_;
    double smoothing_;

    int count_ = 0;
    double upload_ = 0.0;
    double download_ = 0.0;
    double cpu_ = 0.0;
};

} // namespace idleguard
