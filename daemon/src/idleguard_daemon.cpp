#include "idleguard_daemon.hpp"

#include "idleguard/common.hpp"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTimeZone>

#include "idleguard_daemon_adaptor.h"

namespace idleguard {

namespace {
QString compact(const QJsonObject &obj)
{
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

QString compact(const QJsonArray &arr)
{
    return QString::fromUtf8(QJsonDocument(arr).toJson(QJsonDocument::Compact));
}
} // namespace

IdleGuardDaemon::IdleGuardDaemon(const EngineConfig &config,
                                 const QString &dbPath,
                                 const QString &thresholdsPath,
                                 QObject *parent)
    : QObject(parent)
    , dbPath_(dbPath)
    , thresholdsPath_(thresholdsPath)
    , store_(dbPath)
    , metrics_(this)
    , interaction_(this)
    , notifier_(QStringLiteral("IdleGuard"), this)
    , engine_(config, thresholds_, metrics_, &notifier_, &store_, this)
{
    connect(&engine_, &ThreatEngine::snapshotPublished,
            this, &IdleGuardDaemon::handleSnapshot);
    connect(&engine_, &ThreatEngine::incidentRecorded,
            this, &IdleGuardDaemon::handleIncident);
    connect(&engine_, &ThreatEngine::sessionFinished,
            this, &IdleGuardDaemon::handleSessionFinished);
    connect(&interaction_, &InteractionMonitor::interactionDetected,
            &engine_, &ThreatEngine::registerUserInteraction);

    // Owned by this object; relays StatusChanged / IncidentRecorded.
    auto *adaptor = new DaemonAdaptor(this);
    Q_UNUSED(adaptor);
}

IdleGuardDaemon::~IdleGuardDaemon()
{
    engine_.stop();
}

bool IdleGuardDaemon::init()
{
    if (!store_.open()) {
        qWarning() << "IdleGuardDaemon: failed to open incident store at" << dbPath_;
        return false;
    }
    if (!store_.initSchema()) {
        qWarning() << "IdleGuardDaemon: failed to initialise schema";
        return false;
    }
    if (!store_.resolveOpenIncidents(nowUtc())) {
        qWarning() << "IdleGuardDaemon: incidents from the previous run stay open";
    }

    if (QFileInfo::exists(thresholdsPath_)) {
        if (!thresholds_.load(thresholdsPath_)) {
            qWarning() << "IdleGuardDaemon: keeping default thresholds";
        }
    } else {
        qInfo() << "IdleGuardDaemon: no thresholds file, using defaults";
    }

    metrics_.start();
    interaction_.start();
    engine_.start();
    return true;
}

QString IdleGuardDaemon::GetStatus()
{
    return compact(engineSnapshotToJson(engine_.lastSnapshot()));
}

QString IdleGuardDaemon::GetRecentActivity()
{
    return compact(activityToJson(engine_.recentActivity()));
}

QString IdleGuardDaemon::GetIncidents(qlonglong fromMs, qlonglong toMs)
{
    const QDateTime from = QDateTime::fromMSecsSinceEpoch(fromMs, QTimeZone::utc());
    const QDateTime to   = QDateTime::fromMSecsSinceEpoch(toMs,   QTimeZone::utc());

    QJsonArray arr;
    for (const auto &incident : store_.queryIncidents(from, to)) {
        arr.push_back(incidentToJson(incident));
    }
    return compact(arr);
}

QString IdleGuardDaemon::GetThresholds()
{
    return compact(thresholds_.toJson());
}

bool IdleGuardDaemon::SetThreshold(const QString &metric, double value, bool enabled)
{
    const auto parsed = thresholdMetricFromString(metric);
    if (!parsed) {
        qWarning() << "IdleGuardDaemon: SetThreshold for unknown metric" << metric;
        return false;
    }

    AlertThreshold threshold;
    threshold.metric = *parsed;
    threshold.value = value;
    threshold.enabled = enabled;

    const AlertThreshold stored = thresholds_.update(threshold);
    qInfo() << "IdleGuardDaemon: threshold" << metric << "set to" << stored.value
            << (stored.enabled ? "(enabled)" : "(disabled)");
    saveThresholds();
    return true;
}

void IdleGuardDaemon::ResetThresholds()
{
    thresholds_.reset();
    qInfo() << "IdleGuardDaemon: thresholds reset to defaults";
    saveThresholds();
}

void IdleGuardDaemon::ReportUserInteraction()
{
    engine_.registerUserInteraction(nowUtc());
}

bool IdleGuardDaemon::AcknowledgeIncident(const QString &id)
{
    return engine_.acknowledgeIncident(id);
}

bool IdleGuardDaemon::ResolveIncident(const QString &id)
{
    return engine_.resolveIncident(id);
}

QString IdleGuardDaemon::GetLastSessionReport()
{
    const auto report = engine_.lastSessionReport();
    if (!report) {
        return QStringLiteral("{}");
    }
    return compact(sessionReportToJson(*report));
}

void IdleGuardDaemon::StartMonitoring()
{
    engine_.start();
}

void IdleGuardDaemon::StopMonitoring()
{
    engine_.stop();
}

void IdleGuardDaemon::handleSnapshot(const idleguard::EngineSnapshot &snapshot)
{
    emit StatusChanged(compact(engineSnapshotToJson(snapshot)));
}

void IdleGuardDaemon::handleIncident(const idleguard::Incident &incident)
{
    emit IncidentRecorded(incidentToJsonString(incident));
}

void IdleGuardDaemon::handleSessionFinished(const idleguard::SessionReport &report)
{
    qInfo() << "IdleGuardDaemon: session finished after" << report.durationSeconds()
            << "s," << report.incidentCount << "incident(s)"
            << (report.hasAnomalies ? "with anomalies" : "");
}

void IdleGuardDaemon::saveThresholds()
{
    QDir().mkpath(QFileInfo(thresholdsPath_).absolutePath());
    if (!thresholds_.save(thresholdsPath_)) {
        qWarning() << "IdleGuardDaemon: failed to save thresholds to" << thresholdsPath_;
    }
}

} // namespace idleguard
