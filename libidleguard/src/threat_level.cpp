#include "idleguard/threat_level.hpp"

#include <QDebug>

#include <algorithm>

namespace idleguard {

QString threatLevelToString(ThreatLevel level)
{
    switch (level) {
    case ThreatLevel::Normal:
        return QStringLiteral("normal");
    case ThreatLevel::Warning:
        return QStringLiteral("warning");
    case ThreatLevel::Alert:
        return QStringLiteral("alert");
    case ThreatLevel::Critical:
        return QStringLiteral("critical");
    }

    return QStringLiteral("normal");
}

ThreatLevel threatLevelFromString(const QString &s)
{
    const QString lower = s.trimmed().toLower();

    if (lower == QLatin1String("warning"))
        return ThreatLevel::Warning;
    if (lower == QLatin1String("alert"))
        return ThreatLevel::Alert;
    if (lower == QLatin1String("critical"))
        return ThreatLevel::Critical;

    return ThreatLevel::Normal;
}

QString threatLevelMessage(ThreatLevel level)
{
    switch (level) {
    case ThreatLevel::Normal:
        return QStringLiteral("Your device is secure");
    case ThreatLevel::Warning:
        return QStringLiteral("Elevated activity detected");
    case ThreatLevel::Alert:
        return QStringLiteral("Suspicious activity detected");
    case ThreatLevel::Critical:
        return QStringLiteral("Critical threat detected");
    }

    return QString();
}

ThreatLevel levelForScore(int score)
{
    const int s = std::clamp(score, 0, 100);

    if (s < 20)
        return ThreatLevel::Normal;
    if (s < 45)
        return ThreatLevel::Warning;
    if (s < 70)
        return ThreatLevel::Alert;
    return ThreatLevel::Critical;
}

LevelStateMachine::LevelStateMachine(int cooldownSeconds)
    : cooldownSeconds_(std::max(0, cooldownSeconds))
{
}

void LevelStateMachine::reset(const QDateTime &sessionStart)
{
    level_ = ThreatLevel::Normal;
    score_ = 0;
    held_ = false;
    lastChange_ = sessionStart;
}

std::optional<LevelTransition> LevelStateMachine::update(int score, const QDateTime &now)
{
    score_ = std::clamp(score, 0, 100);

    const ThreatLevel candidate = levelForScore(score_);
    if (candidate == level_) {
        held_ = false;
        return std::nullopt;
    }

    // An invalid lastChange_ means reset() was never called: accept.
    if (lastChange_.isValid() &&
        lastChange_.msecsTo(now) < static_cast<qint64>(cooldownSeconds_) * 1000) {
        if (!held_) {
            qDebug() << "LevelStateMachine: holding" << threatLevelToString(level_)
                     << "- score" << score_ << "maps to" << threatLevelToString(candidate);
        }
        held_ = true;
        return std::nullopt;
    }

    LevelTransition transition;
    transition.from = level_;
    transition.to = candidate;
    transition.score = score_;
    transition.at = now;

    level_ = candidate;
    lastChange_ = now;
    held_ = false;

    return transition;
}

} // namespace idleguard
