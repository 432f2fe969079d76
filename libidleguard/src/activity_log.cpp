#include "idleguard/activity_log.hpp"

#include <QJsonObject>

#include <algorithm>

namespace idleguard {

QString activityTypeToString(ActivityType t)
{
    switch (t) {
    case ActivityType::MonitoringStarted:
        return QStringLiteral("monitoring_started");
    case ActivityType::MonitoringStopped:
        return QStringLiteral("monitoring_stopped");
    case ActivityType::Normal:
        return QStringLiteral("normal");
    case ActivityType::Warning:
        return QStringLiteral("warning");
    case ActivityType::Alert:
        return QStringLiteral("alert");
    case ActivityType::Critical:
        return QStringLiteral("critical");
    }

    return QStringLiteral("normal");
}

ActivityType activityTypeForLevel(ThreatLevel level)
{
    switch (level) {
    case ThreatLevel::Normal:
        return ActivityType::Normal;
    case ThreatLevel::Warning:
        return ActivityType::Warning;
    case ThreatLevel::Alert:
        return ActivityType::Alert;
    case ThreatLevel::Critical:
        return ActivityType::Critical;
    }

    return ActivityType::Normal;
}

ActivityLog::ActivityLog(int capacity)
    : capacity_(std::max(1, capacity))
{
}

void ActivityLog::add(const ActivityEntry &entry)
{
    entries_.push_front(entry);
    while (entries_.size() > static_cast<std::size_t>(capacity_)) {
        entries_.pop_back();
    }
}

std::vector<ActivityEntry> ActivityLog::entries() const
{
    return std::vector<ActivityEntry>(entries_.begin(), entries_.end());
}

QJsonArray ActivityLog::toJson() const
{
    return activityToJson(entries());
}

QJsonArray activityToJson(const std::vector<ActivityEntry> &entries)
{
    QJsonArray arr;
    for (const ActivityEntry &e : entries) {
        QJsonObject obj;
        if (e.timestamp.isValid()) {
            obj.insert(QStringLiteral("timestamp"), e.timestamp.toUTC().toString(Qt::ISODate));
            obj.insert(QStringLiteral("timestamp_ms"),
                       static_cast<qint64>(e.timestamp.toMSecsSinceEpoch()));
        }
        obj.insert(QStringLiteral("type"), activityTypeToString(e.type));
        obj.insert(QStringLiteral("title"), e.title);
        obj.insert(QStringLiteral("description"), e.description);
        obj.insert(QStringLiteral("level"), threatLevelToString(e.level));
        arr.push_back(obj);
    }
    return arr;
}

} // namespace idleguard
