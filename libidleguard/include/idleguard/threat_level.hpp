#pragma once

#include <QDateTime>
#include <QString>

#include <optional>

namespace idleguard {

enum class ThreatLevel {
    Normal,
    Warning,
    Alert,
    Critical
};

QString threatLevelToString(ThreatLevel level);
ThreatLevel threatLevelFromString(const QString &s);

// Short user-facing sentence for a level ("Suspicious activity detected").
QString threatLevelMessage(ThreatLevel level);

// Pure score -> level mapping:
//   Normal [0,20), Warning [20,45), Alert [45,70), Critical [70,100].
// Scores outside [0,100] are clamped first.
ThreatLevel levelForScore(int score);

struct LevelTransition
{
    ThreatLevel from = ThreatLevel::Normal;
    ThreatLevel to = ThreatLevel::Normal;
    int score = 0;
    QDateTime at;
};

// Debounces the discrete level label. The score is always taken as-is; a
// level change is only accepted once `cooldownSeconds` have passed since the
// previous accepted change (or since reset()).
class LevelStateMachine
{
public:
    explicit LevelStateMachine(int cooldownSeconds = 60);

    void reset(const QDateTime &sessionStart);

    std::optional<LevelTransition> update(int score, const QDateTime &now);

    ThreatLevel level() const { return level_; }
    int score() const { return score_; }
    QDateTime lastChange() const { return lastChange_; }

    // True when the latest score maps to a different level than the one
    // currently exposed.
    bool isHeld() const { return held_; }

private:
    int cooldownSeconds_;
    ThreatLevel level_ = ThreatLevel::Normal;
    int score_ = 0;
    bool held_ = false;
    QDateTime lastChange_;
};

} // namespace idleguard
