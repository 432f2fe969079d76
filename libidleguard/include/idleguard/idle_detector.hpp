#pragma once

#include <QDateTime>

namespace idleguard {

struct IdleParameters
{
    int    idleThresholdSeconds = 60;
    double idleCpuThreshold     = 15.0;            // percent
    double idleNetworkThreshold = 50.0 * 1024.0;   // bytes per second
};

// Stateless idle rule: enough time since the last interaction AND either CPU
// or network below its low-activity threshold.
bool isIdleAt(const QDateTime &now,
              const QDateTime &lastInteraction,
              double cpuPercent,
              double uploadRate,
              double downloadRate,
              const IdleParameters &params = {});

// Both CPU and network below their idle thresholds. Baseline learning only
// happens in this state.
bool isQuiet(double cpuPercent,
             double uploadRate,
             double downloadRate,
             const IdleParameters &params = {});

class IdleDetector
{
public:
    explicit IdleDetector(const IdleParameters &params = {});

    // Starts a session as if the user interacted at `now`.
    void reset(const QDateTime &now);

    // Forces the active state immediately, whatever the metrics say.
    void registerInteraction(const QDateTime &at);

    bool evaluate(const QDateTime &now,
                  double cpuPercent,
                  double uploadRate,
                  double downloadRate);

    bool isIdle() const { return idle_; }
    QDateTime lastInteraction() const { return lastInteraction_; }

    // Seconds since the last interaction while idle, 0 while active.
    double idleDurationSeconds(const QDateTime &now) const;

    const IdleParameters &parameters() const { return params_; }

private:
    IdleParameters params_;
    QDateTime lastInteraction_;
    bool idle_ = false;
};

} // namespace idleguard
