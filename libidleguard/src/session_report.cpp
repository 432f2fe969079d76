#include "idleguard/session_report.hpp"

#include <QDebug>

#include <algorithm>

namespace idleguard {

qint64 SessionReport::durationSeconds() const
{
    if (!startedAt.isValid() || !endedAt.isValid()) {
        return 0;
    }
    return std::max<qint64>(0, startedAt.secsTo(endedAt));
}

QJsonObject sessionReportToJson(const SessionReport &report)
{
    QJsonObject obj;

    if (report.startedAt.isValid()) {
        obj.insert(QStringLiteral("started"), report.startedAt.toUTC().toString(Qt::ISODate));
    }
    if (report.endedAt.isValid()) {
        obj.insert(QStringLiteral("ended"), report.endedAt.toUTC().toString(Qt::ISODate));
    }
    obj.insert(QStringLiteral("duration_s"), report.durationSeconds());
    obj.insert(QStringLiteral("battery_start"), report.batteryStart);
    obj.insert(QStringLiteral("battery_end"), report.batteryEnd);
    obj.insert(QStringLiteral("peak_cpu"), report.peakCpu);
    obj.insert(QStringLiteral("average_cpu"), report.averageCpu);
    obj.insert(QStringLiteral("peak_score"), report.peakScore);
    obj.insert(QStringLiteral("average_score"), report.averageScore);
    obj.insert(QStringLiteral("total_uploaded"), report.totalUploadBytes);
    obj.insert(QStringLiteral("total_downloaded"), report.totalDownloadBytes);
    obj.insert(QStringLiteral("samples"), report.sampleCount);
    obj.insert(QStringLiteral("incidents"), report.incidentCount);
    obj.insert(QStringLiteral("has_anomalies"), report.hasAnomalies);

    return obj;
}

void SessionRecorder::begin(const QDateTime &at)
{
    report_ = SessionReport();
    report_.startedAt = at;
    cpuSum_ = 0.0;
    scoreSum_ = 0.0;
    haveCounters_ = false;
    lastUpload_ = 0;
    lastDownload_ = 0;
    active_ = true;
}

void SessionRecorder::recordSnapshot(const MetricSnapshot &snapshot,
                                     quint64 cumulativeUpload,
                                     quint64 cumulativeDownload)
{
    if (!active_) {
        return;
    }

    if (report_.sampleCount == 0) {
        report_.batteryStart = snapshot.batteryLevelPercent;
    }
    report_.batteryEnd = snapshot.batteryLevelPercent;

    ++report_.sampleCount;
    cpuSum_ += snapshot.cpuUsagePercent;
    scoreSum_ += snapshot.threatScore;
    report_.peakCpu = std::max(report_.peakCpu, snapshot.cpuUsagePercent);
    report_.peakScore = std::max(report_.peakScore, snapshot.threatScore);

    if (haveCounters_) {
        if (cumulativeUpload > lastUpload_) {
            report_.totalUploadBytes += static_cast<qint64>(cumulativeUpload - lastUpload_);
        }
        if (cumulativeDownload > lastDownload_) {
            report_.totalDownloadBytes += static_cast<qint64>(cumulativeDownload - lastDownload_);
        }
    }
    haveCounters_ = true;
    lastUpload_ = cumulativeUpload;
    lastDownload_ = cumulativeDownload;
}

void SessionRecorder::recordIncident(const Incident &incident)
{
    if (!active_) {
        return;
    }

    ++report_.incidentCount;
    if (incident.severity >= IncidentSeverity::High) {
        report_.hasAnomalies = true;
    }
}

SessionReport SessionRecorder::finish(const QDateTime &at)
{
    report_.endedAt = at;
    if (report_.sampleCount > 0) {
        report_.averageCpu = cpuSum_ / report_.sampleCount;
        report_.averageScore = scoreSum_ / report_.sampleCount;
    }
    active_ = false;

    qInfo() << "SessionRecorder: session of" << report_.durationSeconds() << "s,"
            << report_.incidentCount << "incident(s), peak score" << report_.peakScore;

    return report_;
}

} // namespace idleguard
