#pragma once

#include <QJsonObject>
#include <QString>

#include "idleguard/alert_gate.hpp"
#include "idleguard/idle_detector.hpp"
#include "idleguard/threat_scorer.hpp"

namespace idleguard {

struct EngineConfig
{
    int tickIntervalMs = 3000;

    IdleParameters idle;

    int    baselineColdStartSamples = 30;
    double baselineSmoothing = 0.1;

    ScoringParameters scoring;

    int levelChangeCooldownSeconds = 60;

    AlertGateConfig gate;

    int rollingWindowSeconds = 3600;
    int activityLogCapacity = 50;
};

QJsonObject engineConfigToJson(const EngineConfig &config);

// Missing keys keep their defaults. Keys with a wrong type or an out-of-range
// value are ignored with a warning.
EngineConfig engineConfigFromJson(const QJsonObject &obj);

// A missing file yields the defaults; an unreadable or malformed file yields
// the defaults and a warning.
EngineConfig loadEngineConfig(const QString &path);

} // namespace idleguard
