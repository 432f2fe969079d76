#include "idleguard/idle_detector.hpp"

#include "idleguard/common.hpp"

#include <QDebug>

#include <algorithm>

namespace idleguard {

bool isIdleAt(const QDateTime &now,
              const QDateTime &lastInteraction,
              double cpuPercent,
              double uploadRate,
              double downloadRate,
              const IdleParameters &params)
{
    if (!now.isValid() || !lastInteraction.isValid()) {
        return false;
    }

    const qint64 elapsedMs = lastInteraction.msecsTo(now);
    if (elapsedMs < static_cast<qint64>(params.idleThresholdSeconds) * 1000) {
        return false;
    }

    const bool lowCpu = cpuPercent < params.idleCpuThreshold;
    const bool lowNetwork = std::max(uploadRate, downloadRate) < params.idleNetworkThreshold;

    return lowCpu || lowNetwork;
}

bool isQuiet(double cpuPercent,
             double uploadRate,
             double downloadRate,
             const IdleParameters &params)
{
    return cpuPercent < params.idleCpuThreshold &&
           std::max(uploadRate, downloadRate) < params.idleNetworkThreshold;
}

IdleDetector::IdleDetector(const IdleParameters &params)
    : params_(params)
{
}

void IdleDetector::reset(const QDateTime &now)
{
    lastInteraction_ = now;
    idle_ = false;
}

void IdleDetector::registerInteraction(const QDateTime &at)
{
    if (!lastInteraction_.isValid() || at > lastInteraction_) {
        lastInteraction_ = at;
    }

    if (idle_) {
        qInfo() << "IdleDetector: user interaction, leaving idle";
    }
    idle_ = false;
}

bool IdleDetector::evaluate(const QDateTime &now,
                            double cpuPercent,
                            double uploadRate,
                            double downloadRate)
{
    if (!lastInteraction_.isValid()) {
        lastInteraction_ = now;
    }

    const bool idle = isIdleAt(now, lastInteraction_, cpuPercent,
                               uploadRate, downloadRate, params_);

    if (idle && !idle_) {
        qInfo() << "IdleDetector: device idle for"
                << static_cast<int>(secondsBetween(lastInteraction_, now)) << "s"
                << "(cpu" << cpuPercent << "%, up" << uploadRate
                << "B/s, down" << downloadRate << "B/s)";
    } else if (!idle && idle_) {
        qInfo() << "IdleDetector: activity resumed";
    }

    idle_ = idle;
    return idle_;
}

double IdleDetector::idleDurationSeconds(const QDateTime &now) const
{
    if (!idle_) {
        return 0.0;
    }
    return std::max(0.0, secondsBetween(lastInteraction_, now));
}

} // namespace idleguard
