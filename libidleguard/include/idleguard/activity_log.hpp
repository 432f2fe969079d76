#pragma once

#include <QDateTime>
#include <QJsonArray>
#include <QString>

#include <deque>
#include <vector>

#include "idleguard/threat_level.hpp"

namespace idleguard {

enum class ActivityType {
    MonitoringStarted,
    MonitoringStopped,
    Normal,
    Warning,
    Alert,
    Critical
};

QString activityTypeToString(ActivityType t);
ActivityType activityTypeForLevel(ThreatLevel level);

struct ActivityEntry
{
    QDateTime timestamp;
    ActivityType type = ActivityType::Normal;
    QString title;
    QString description;
    ThreatLevel level = ThreatLevel::Normal;
};

// Newest-first log shown to the user. Oldest entries are evicted once
// `capacity` is reached.
class ActivityLog
{
public:
    explicit ActivityLog(int capacity = 50);

    void add(const ActivityEntry &entry);

    std::vector<ActivityEntry> entries() const;
    std::size_t size() const { return entries_.size(); }
    int capacity() const { return capacity_; }

    void clear() { entries_.clear(); }

    QJsonArray toJson() const;

private:
    int capacity_;
    std::deque<ActivityEntry> entries_;
};

QJsonArray activityToJson(const std::vector<ActivityEntry> &entries);

} // namespace idleguard
