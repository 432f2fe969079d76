#include "idleguard/engine.hpp"

#include "idleguard/common.hpp"

#include <QDebug>
#include <QJsonArray>
#include <QMutexLocker>

namespace idleguard {

QJsonObject engineSnapshotToJson(const EngineSnapshot &snapshot)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("score"), snapshot.score);
    obj.insert(QStringLiteral("level"), threatLevelToString(snapshot.level));
    obj.insert(QStringLiteral("level_held"), snapshot.levelHeld);
    obj.insert(QStringLiteral("idle"), snapshot.isIdle);
    obj.insert(QStringLiteral("idle_duration_s"), snapshot.idleDurationSeconds);
    obj.insert(QStringLiteral("monitoring"), snapshot.monitoring);
    obj.insert(QStringLiteral("open_incidents"), snapshot.openIncidents);
    obj.insert(QStringLiteral("metrics"), snapshotToJson(snapshot.metrics));
    obj.insert(QStringLiteral("factors"), factorsToJson(snapshot.factors));
    obj.insert(QStringLiteral("totals"), rollingTotalsToJson(snapshot.totals));
    obj.insert(QStringLiteral("baseline"), baselineToJson(snapshot.baseline));
    return obj;
}

ThreatEngine::ThreatEngine(const EngineConfig &config,
                           ThresholdStore &thresholds,
                           MetricSource &source,
                           NotificationSink *notifier,
                           IncidentSink *incidents,
                           QObject *parent)
    : QObject(parent)
    , config_(config)
    , thresholds_(thresholds)
    , source_(source)
    , notifier_(notifier)
    , incidents_(incidents)
    , idle_(config.idle)
    , baseline_(config.baselineColdStartSamples, config.baselineSmoothing)
    , rolling_(config.rollingWindowSeconds)
    , levels_(config.levelChangeCooldownSeconds)
    , gate_(config.gate)
    , activity_(config.activityLogCapacity)
{
    timer_.setParent(this);
    timer_.setSingleShot(false);
    connect(&timer_, &QTimer::timeout, this, &ThreatEngine::onTimer);
}

ThreatEngine::~ThreatEngine()
{
    timer_.stop();
}

void ThreatEngine::start()
{
    if (isMonitoring()) {
        return;
    }

    beginSession(nowUtc());
    timer_.start(config_.tickIntervalMs);

    // First evaluation right away rather than one interval later.
    tick(nowUtc());
}

void ThreatEngine::stop()
{
    timer_.stop();
    endSession(nowUtc());
}

bool ThreatEngine::isMonitoring() const
{
    QMutexLocker locker(&mutex_);
    return monitoring_;
}

void ThreatEngine::beginSession(const QDateTime &now)
{
    QMutexLocker locker(&mutex_);
    if (monitoring_) {
        return;
    }

    monitoring_ = true;
    degraded_ = false;
    idle_.reset(now);
    levels_.reset(now);
    rolling_.clear();
    session_.begin(now);

    last_ = EngineSnapshot();
    last_.monitoring = true;
    last_.baseline = baseline_.baseline();
    last_.openIncidents = static_cast<int>(gate_.openIncidents().size());

    addActivity(now, ActivityType::MonitoringStarted,
                QStringLiteral("Monitoring Started"),
                QStringLiteral("Background activity is now being watched while the device is idle"),
                ThreatLevel::Normal);

    qInfo() << "ThreatEngine: monitoring started, tick every" << config_.tickIntervalMs << "ms";
}

std::optional<SessionReport> ThreatEngine::endSession(const QDateTime &now)
{
    SessionReport report;
    GateDecision closed;
    {
        QMutexLocker locker(&mutex_);
        if (!monitoring_) {
            return std::nullopt;
        }

        monitoring_ = false;
        last_.monitoring = false;

        // A later session never reuses an incident from this one.
        closed.resolved = gate_.resolveAll(now);
        last_.openIncidents = 0;

        addActivity(now, ActivityType::MonitoringStopped,
                    QStringLiteral("Monitoring Stopped"),
                    QStringLiteral("Idle activity monitoring has been paused"),
                    ThreatLevel::Normal);

        report = session_.finish(now);
        lastReport_ = report;

        qInfo() << "ThreatEngine: monitoring stopped";
    }

    commit(closed);
    emit sessionFinished(report);
    return report;
}

void ThreatEngine::onTimer()
{
    tick(nowUtc());
}

MetricSample ThreatEngine::readSample(const QDateTime &now)
{
    const std::optional<MetricSample> incoming = source_.latestSample();

    if (!incoming) {
        if (!degraded_) {
            qWarning() << "ThreatEngine: no metric sample available, reusing last known values";
            degraded_ = true;
        }
        MetricSample sample = lastGood_;
        sample.timestamp = now;
        return sample;
    }

    bool partial = false;
    const MetricSample merged = mergeWithLastGood(*incoming, lastGood_, &partial);

    if (partial && !degraded_) {
        qWarning() << "ThreatEngine: incomplete metric sample, reusing last known values";
        degraded_ = true;
    } else if (!partial && degraded_) {
        qInfo() << "ThreatEngine: metric input recovered";
        degraded_ = false;
    }

    lastGood_ = merged;
    return merged;
}

void ThreatEngine::commit(const GateDecision &decision)
{
    for (const Incident &incident : decision.recorded) {
        if (incidents_ && !incidents_->insertIncident(incident)) {
            qWarning() << "ThreatEngine: failed to persist incident" << incident.id;
        }
    }

    for (const Incident &incident : decision.resolved) {
        persistUpdate(incident);
    }

    if (!decision.notification) {
        return;
    }

    if (!notifier_) {
        qDebug() << "ThreatEngine: no notifier, dropping" << decision.notificationIdentity;
    } else if (!notifier_->deliver(*decision.notification)) {
        qWarning() << "ThreatEngine: notification delivery failed for"
                   << decision.notificationIdentity;
    } else {
        qInfo() << "ThreatEngine: notified" << decision.notificationIdentity
                << "-" << decision.notification->title;
    }
}

bool ThreatEngine::persistUpdate(const Incident &incident)
{
    if (!incidents_) {
        return true;
    }

    if (!incidents_->updateIncident(incident)) {
        qWarning() << "ThreatEngine: failed to update incident" << incident.id;
        return false;
    }
    return true;
}

std::optional<Incident> ThreatEngine::storedOpenIncident(const QString &id)
{
    if (!incidents_) {
        return std::nullopt;
    }

    std::optional<Incident> stored = incidents_->findIncident(id);
    if (!stored || stored->resolved) {
        return std::nullopt;
    }
    return stored;
}

void ThreatEngine::addActivity(const QDateTime &at, ActivityType type,
                               const QString &title, const QString &description,
                               ThreatLevel level)
{
    ActivityEntry entry;
    entry.timestamp = at;
    entry.type = type;
    entry.title = title;
    entry.description = description;
    entry.level = level;
    activity_.add(entry);
}

EngineSnapshot ThreatEngine::tick(const QDateTime &now)
{
    EngineSnapshot published;
    std::optional<LevelTransition> transition;
    GateDecision decision;

    {
        QMutexLocker locker(&mutex_);

        const MetricSample sample = readSample(now);
        MetricSnapshot metrics = snapshotFromSample(sample, now);

        rolling_.addCounters(now, sample.cumulativeUploadBytes, sample.cumulativeDownloadBytes);
        const RollingTotals totals = rolling_.totals();

        const bool idle = idle_.evaluate(now, metrics.cpuUsagePercent,
                                         metrics.uploadBytesPerSecond,
                                         metrics.downloadBytesPerSecond);

        // Learn only from quiet idle, never from idle-but-spiking.
        if (idle && isQuiet(metrics.cpuUsagePercent, metrics.uploadBytesPerSecond,
                            metrics.downloadBytesPerSecond, idle_.parameters())) {
            baseline_.observe(metrics.uploadBytesPerSecond,
                              metrics.downloadBytesPerSecond,
                              metrics.cpuUsagePercent);
        }
        const Baseline baseline = baseline_.baseline();

        const ThresholdSet thresholds = thresholds_.thresholds();
        ThreatAssessment assessment =
            scoreThreat(metrics, idle, baseline, thresholds, totals, config_.scoring);

        transition = levels_.update(assessment.score, now);
        metrics.threatScore = levels_.score();
        metrics.threatLevel = levels_.level();

        if (transition) {
            const QString factors = describeFactors(assessment.factors);
            if (transition->to == ThreatLevel::Normal) {
                qInfo() << "ThreatEngine: level" << threatLevelToString(transition->from)
                        << "->" << threatLevelToString(transition->to)
                        << "score" << transition->score;
            } else {
                qWarning() << "ThreatEngine: level" << threatLevelToString(transition->from)
                           << "->" << threatLevelToString(transition->to)
                           << "score" << transition->score << "factors:" << factors;
            }

            addActivity(now, activityTypeForLevel(transition->to),
                        threatLevelMessage(transition->to),
                        transition->to == ThreatLevel::Normal
                            ? QStringLiteral("Activity returned to normal levels")
                            : describeFactors(assessment.factors, QStringLiteral("Various indicators")),
                        transition->to);

            decision = gate_.handleTransition(*transition, assessment.factors, metrics, totals);
            for (const Incident &incident : decision.recorded) {
                session_.recordIncident(incident);
            }
        }

        session_.recordSnapshot(metrics, sample.cumulativeUploadBytes,
                                sample.cumulativeDownloadBytes);

        published.metrics = metrics;
        published.score = levels_.score();
        published.level = levels_.level();
        published.levelHeld = levels_.isHeld();
        published.isIdle = idle;
        published.idleDurationSeconds = idle_.idleDurationSeconds(now);
        published.factors = std::move(assessment.factors);
        published.totals = totals;
        published.baseline = baseline;
        published.monitoring = monitoring_;
        published.openIncidents = static_cast<int>(gate_.openIncidents().size());

        last_ = published;
    }

    commit(decision);

    if (transition) {
        emit levelChanged(transition->from, transition->to, transition->score);
    }
    for (const Incident &incident : decision.recorded) {
        emit incidentRecorded(incident);
    }
    emit snapshotPublished(published);

    return published;
}

void ThreatEngine::registerUserInteraction(const QDateTime &at)
{
    QMutexLocker locker(&mutex_);
    idle_.registerInteraction(at);
    last_.isIdle = false;
    last_.idleDurationSeconds = 0.0;
}

EngineSnapshot ThreatEngine::lastSnapshot() const
{
    QMutexLocker locker(&mutex_);
    return last_;
}

std::vector<ActivityEntry> ThreatEngine::recentActivity() const
{
    QMutexLocker locker(&mutex_);
    return activity_.entries();
}

std::vector<Incident> ThreatEngine::recentIncidents() const
{
    QMutexLocker locker(&mutex_);
    return gate_.recentIncidents();
}

std::optional<SessionReport> ThreatEngine::lastSessionReport() const
{
    QMutexLocker locker(&mutex_);
    return lastReport_;
}

bool ThreatEngine::acknowledgeIncident(const QString &id)
{
    std::optional<Incident> changed;
    {
        QMutexLocker locker(&mutex_);
        changed = gate_.acknowledgeIncident(id);
    }

    if (changed) {
        persistUpdate(*changed);
        return true;
    }

    changed = storedOpenIncident(id);
    if (!changed) {
        return false;
    }
    changed->acknowledged = true;
    return persistUpdate(*changed);
}

bool ThreatEngine::resolveIncident(const QString &id)
{
    const QDateTime now = nowUtc();
    std::optional<Incident> changed;
    {
        QMutexLocker locker(&mutex_);
        changed = gate_.resolveIncident(id, now);
        if (changed) {
            last_.openIncidents = static_cast<int>(gate_.openIncidents().size());
        }
    }

    if (changed) {
        persistUpdate(*changed);
        return true;
    }

    changed = storedOpenIncident(id);
    if (!changed) {
        return false;
    }
    changed->resolved = true;
    changed->endedAt = now;
    if (!persistUpdate(*changed)) {
        return false;
    }

    qInfo() << "ThreatEngine: stored incident" << id << "resolved";
    return true;
}

} // namespace idleguard
