#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QtGlobal>

#include "idleguard/incident.hpp"
#include "idleguard/metrics.hpp"

namespace idleguard {

// Summary of one monitoring session ("what happened while you were away").
struct SessionReport
{
    QDateTime startedAt;
    QDateTime endedAt;

    double batteryStart = 0.0;
    double batteryEnd = 0.0;

    double peakCpu = 0.0;
    double averageCpu = 0.0;
    int    peakScore = 0;
    double averageScore = 0.0;

    qint64 totalUploadBytes = 0;
    qint64 totalDownloadBytes = 0;

    int  sampleCount = 0;
    int  incidentCount = 0;
    bool hasAnomalies = false;

    qint64 durationSeconds() const;
    double batteryUsed() const { return batteryStart - batteryEnd; }
};

QJsonObject sessionReportToJson(const SessionReport &report);

class SessionRecorder
{
public:
    void begin(const QDateTime &at);

    void recordSnapshot(const MetricSnapshot &snapshot,
                        quint64 cumulativeUpload,
                        quint64 cumulativeDownload);
    void recordIncident(const Incident &incident);

    SessionReport finish(const QDateTime &at);

    bool isActive() const { return active_; }

private:
    bool active_ = false;
    SessionReport report_;

    double cpuSum_ = 0.0;
    double scoreSum_ = 0.0;
    bool haveCounters_ = false;
    quint64 lastUpload_ = 0;
    quint64 lastDownload_ = 0;
};

} // namespace idleguard
