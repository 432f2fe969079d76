#include <gtest/gtest.h>

#include "idleguard/engine.hpp"

#include <QTimeZone>

#include <limits>
#include <memory>
#include <vector>

using namespace idleguard;

namespace {

const QDateTime kStart = QDateTime::fromMSecsSinceEpoch(1700000000000LL, QTimeZone::utc());

class FakeSource : public MetricSource {
public:
    std::optional<MetricSample> latestSample() const override { return sample; }

    void set(double cpu, quint64 uploaded, double battery = 80.0)
    {
        MetricSample s;
        s.cpuUsagePercent = cpu;
        s.cumulativeUploadBytes = uploaded;
        s.cumulativeDownloadBytes = 1000;
        s.batteryLevelPercent = battery;
        sample = s;
    }

    std::optional<MetricSample> sample;
};

class FakeNotifier : public NotificationSink {
public:
    bool deliver(const Notification &notification) override
    {
        delivered.push_back(notification);
        return true;
    }

    std::vector<Notification> delivered;
};

class FakeIncidentSink : public IncidentSink {
public:
    bool insertIncident(const Incident &incident) override
    {
        inserted.push_back(incident);
        return true;
    }

    bool updateIncident(const Incident &incident) override
    {
        updated.push_back(incident);
        return true;
    }

    std::optional<Incident> findIncident(const QString &id) override
    {
        for (const Incident &incident : stored) {
            if (incident.id == id) {
                return incident;
            }
        }
        return std::nullopt;
    }

    std::vector<Incident> inserted;
    std::vector<Incident> updated;
    std::vector<Incident> stored;
};

// Reads engine state from inside the collaborator calls.
class ReentrantIncidentSink : public FakeIncidentSink {
public:
    bool insertIncident(const Incident &incident) override
    {
        if (engine) {
            seenLevels.push_back(engine->lastSnapshot().level);
        }
        return FakeIncidentSink::insertIncident(incident);
    }

    ThreatEngine *engine = nullptr;
    std::vector<ThreatLevel> seenLevels;
};

class ThreatEngineTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        engine_ = std::make_unique<ThreatEngine>(EngineConfig(), thresholds_, source_,
                                                 &notifier_, &incidents_);
    }

    ThresholdStore thresholds_;
    FakeSource source_;
    FakeNotifier notifier_;
    FakeIncidentSink incidents_;
    std::unique_ptr<ThreatEngine> engine_;
};

constexpr quint64 kHundredTwentyMB = 120000000ULL;

} // namespace

TEST_F(ThreatEngineTest, IdleUploadRaisesAlertAndClearsOnActivity) {
    std::vector<ThreatLevel> levels;
    int incidentSignals = 0;
    QObject::connect(engine_.get(), &ThreatEngine::levelChanged,
                     [&levels](ThreatLevel, ThreatLevel to, int) { levels.push_back(to); });
    QObject::connect(engine_.get(), &ThreatEngine::incidentRecorded,
                     [&incidentSignals](const Incident &) { ++incidentSignals; });

    engine_->beginSession(kStart);

    source_.set(5.0, 0);
    EngineSnapshot s = engine_->tick(kStart.addSecs(3));
    EXPECT_FALSE(s.isIdle);
    EXPECT_EQ(s.score, 0);

    source_.set(5.0, kHundredTwentyMB);
    s = engine_->tick(kStart.addSecs(61));
    EXPECT_TRUE(s.isIdle);
    EXPECT_EQ(s.score, 50);
    EXPECT_EQ(s.level, ThreatLevel::Alert);
    EXPECT_NEAR(s.totals.uploadMegabytes(), 120.0, 1e-9);
    EXPECT_EQ(s.openIncidents, 1);
    EXPECT_EQ(s.baseline.sampleCount, 1);
    ASSERT_EQ(s.factors.size(), 1u);
    EXPECT_EQ(s.factors[0].name, QString::fromLatin1(factor::TotalUpload));

    ASSERT_EQ(incidents_.inserted.size(), 1u);
    EXPECT_EQ(incidents_.inserted[0].type, IncidentType::DataExfiltration);
    EXPECT_EQ(incidents_.inserted[0].threatScore, 50);
    ASSERT_EQ(notifier_.delivered.size(), 1u);
    EXPECT_EQ(incidentSignals, 1);

    // The user comes back: scoring stops at once, the label is held.
    engine_->registerUserInteraction(kStart.addSecs(62));
    EXPECT_FALSE(engine_->lastSnapshot().isIdle);

    s = engine_->tick(kStart.addSecs(70));
    EXPECT_FALSE(s.isIdle);
    EXPECT_EQ(s.score, 0);
    EXPECT_EQ(s.level, ThreatLevel::Alert);
    EXPECT_TRUE(s.levelHeld);

    s = engine_->tick(kStart.addSecs(121));
    EXPECT_EQ(s.level, ThreatLevel::Normal);
    EXPECT_EQ(s.openIncidents, 0);
    EXPECT_EQ(incidents_.updated.size(), 1u);
    EXPECT_EQ(notifier_.delivered.size(), 1u);

    ASSERT_EQ(levels.size(), 2u);
    EXPECT_EQ(levels[0], ThreatLevel::Alert);
    EXPECT_EQ(levels[1], ThreatLevel::Normal);

    const auto activity = engine_->recentActivity();
    ASSERT_EQ(activity.size(), 3u);
    EXPECT_EQ(activity[0].type, ActivityType::Normal);
    EXPECT_EQ(activity[1].type, ActivityType::Alert);
    EXPECT_EQ(activity[2].type, ActivityType::MonitoringStarted);

    const auto report = engine_->endSession(kStart.addSecs(200));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->sampleCount, 4);
    EXPECT_EQ(report->incidentCount, 1);
    EXPECT_TRUE(report->hasAnomalies);
    EXPECT_EQ(report->peakScore, 50);
    EXPECT_EQ(report->totalUploadBytes, static_cast<qint64>(kHundredTwentyMB));

    EXPECT_FALSE(engine_->isMonitoring());
    EXPECT_EQ(engine_->recentActivity().front().type, ActivityType::MonitoringStopped);
    ASSERT_TRUE(engine_->lastSessionReport().has_value());
}

TEST_F(ThreatEngineTest, ThresholdChangesApplyOnNextTick) {
    AlertThreshold totalUpload = defaultThreshold(ThresholdMetric::TotalUpload);
    totalUpload.enabled = false;
    thresholds_.update(totalUpload);

    engine_->beginSession(kStart);
    source_.set(5.0, 0);
    engine_->tick(kStart.addSecs(3));
    source_.set(5.0, kHundredTwentyMB);

    EXPECT_EQ(engine_->tick(kStart.addSecs(61)).score, 0);

    thresholds_.reset();
    EXPECT_EQ(engine_->tick(kStart.addSecs(64)).score, 50);
}

TEST_F(ThreatEngineTest, ScoreChangeWithinCooldownOfSessionStartIsHeld) {
    IdleParameters fastIdle;
    fastIdle.idleThresholdSeconds = 0;
    EngineConfig config;
    config.idle = fastIdle;
    ThreatEngine engine(config, thresholds_, source_, &notifier_, &incidents_);

    engine.beginSession(kStart);
    source_.set(5.0, 0);
    engine.tick(kStart.addSecs(1));
    source_.set(5.0, kHundredTwentyMB);

    const EngineSnapshot s = engine.tick(kStart.addSecs(10));
    EXPECT_EQ(s.score, 50);
    EXPECT_EQ(s.level, ThreatLevel::Normal);
    EXPECT_TRUE(s.levelHeld);
    EXPECT_TRUE(notifier_.delivered.empty());
    EXPECT_TRUE(incidents_.inserted.empty());
}

TEST_F(ThreatEngineTest, MissingInputUsesLastKnownValues) {
    engine_->beginSession(kStart);

    // Nothing sampled yet.
    EngineSnapshot s = engine_->tick(kStart.addSecs(3));
    EXPECT_DOUBLE_EQ(s.metrics.cpuUsagePercent, 0.0);
    EXPECT_EQ(s.score, 0);

    source_.set(8.0, 500);
    engine_->tick(kStart.addSecs(6));

    source_.sample->cpuUsagePercent = std::numeric_limits<double>::quiet_NaN();
    source_.sample->cumulativeUploadBytes = 0;
    s = engine_->tick(kStart.addSecs(9));
    EXPECT_DOUBLE_EQ(s.metrics.cpuUsagePercent, 8.0);
    // A zeroed counter is a lost reading, not a wrap.
    EXPECT_DOUBLE_EQ(s.totals.uploadBytes, 500.0);

    source_.sample.reset();
    s = engine_->tick(kStart.addSecs(12));
    EXPECT_DOUBLE_EQ(s.metrics.cpuUsagePercent, 8.0);
    EXPECT_DOUBLE_EQ(s.metrics.batteryLevelPercent, 80.0);
}

TEST_F(ThreatEngineTest, BaselineOnlyLearnsFromQuietIdle) {
    engine_->beginSession(kStart);

    source_.set(5.0, 0);
    engine_->tick(kStart.addSecs(30));
    EXPECT_EQ(engine_->lastSnapshot().baseline.sampleCount, 0);

    // Idle (quiet network) but CPU above the idle limit.
    source_.set(40.0, 0);
    EXPECT_TRUE(engine_->tick(kStart.addSecs(61)).isIdle);
    EXPECT_EQ(engine_->lastSnapshot().baseline.sampleCount, 0);

    source_.set(5.0, 0);
    engine_->tick(kStart.addSecs(64));
    EXPECT_EQ(engine_->lastSnapshot().baseline.sampleCount, 1);

    // A new session keeps what was learned.
    engine_->endSession(kStart.addSecs(70));
    engine_->beginSession(kStart.addSecs(80));
    EXPECT_EQ(engine_->lastSnapshot().baseline.sampleCount, 1);
}

TEST_F(ThreatEngineTest, StartAndStopAreIdempotent) {
    int finished = 0;
    QObject::connect(engine_.get(), &ThreatEngine::sessionFinished,
                     [&finished](const SessionReport &) { ++finished; });

    source_.set(1.0, 0);
    engine_->start();
    engine_->start();
    EXPECT_TRUE(engine_->isMonitoring());
    EXPECT_TRUE(engine_->lastSnapshot().monitoring);

    engine_->stop();
    engine_->stop();
    EXPECT_FALSE(engine_->isMonitoring());
    EXPECT_EQ(finished, 1);

    const auto activity = engine_->recentActivity();
    ASSERT_EQ(activity.size(), 2u);
    EXPECT_EQ(activity[0].type, ActivityType::MonitoringStopped);
    EXPECT_EQ(activity[1].type, ActivityType::MonitoringStarted);
}

TEST_F(ThreatEngineTest, SnapshotJson) {
    engine_->beginSession(kStart);
    source_.set(5.0, 0);
    const QJsonObject obj = engineSnapshotToJson(engine_->tick(kStart.addSecs(3)));

    EXPECT_EQ(obj.value(QStringLiteral("level")).toString(), threatLevelToString(ThreatLevel::Normal));
    EXPECT_TRUE(obj.value(QStringLiteral("monitoring")).toBool());
    EXPECT_TRUE(obj.value(QStringLiteral("factors")).isArray());
    EXPECT_TRUE(obj.value(QStringLiteral("metrics")).isObject());
}

TEST_F(ThreatEngineTest, NewSessionRecordsFreshIncident) {
    engine_->beginSession(kStart);
    source_.set(5.0, 0);
    engine_->tick(kStart.addSecs(3));
    source_.set(5.0, kHundredTwentyMB);
    ASSERT_EQ(engine_->tick(kStart.addSecs(61)).level, ThreatLevel::Alert);
    ASSERT_EQ(incidents_.inserted.size(), 1u);
    const QString firstId = incidents_.inserted[0].id;

    // Stopping while still at Alert closes the open incident.
    engine_->endSession(kStart.addSecs(100));
    ASSERT_EQ(incidents_.updated.size(), 1u);
    EXPECT_EQ(incidents_.updated[0].id, firstId);
    EXPECT_TRUE(incidents_.updated[0].resolved);
    EXPECT_EQ(engine_->lastSnapshot().openIncidents, 0);

    engine_->beginSession(kStart.addSecs(110));
    source_.set(5.0, kHundredTwentyMB);
    engine_->tick(kStart.addSecs(113));
    source_.set(5.0, 2 * kHundredTwentyMB);
    const EngineSnapshot s = engine_->tick(kStart.addSecs(171));

    EXPECT_EQ(s.level, ThreatLevel::Alert);
    EXPECT_EQ(s.openIncidents, 1);
    ASSERT_EQ(incidents_.inserted.size(), 2u);
    EXPECT_EQ(incidents_.inserted[1].type, IncidentType::DataExfiltration);
    EXPECT_NE(incidents_.inserted[1].id, firstId);
}

TEST_F(ThreatEngineTest, CollaboratorsRunOutsideTheLock) {
    ReentrantIncidentSink sink;
    ThreatEngine engine(EngineConfig(), thresholds_, source_, &notifier_, &sink);
    sink.engine = &engine;

    engine.beginSession(kStart);
    source_.set(5.0, 0);
    engine.tick(kStart.addSecs(3));
    source_.set(5.0, kHundredTwentyMB);
    engine.tick(kStart.addSecs(61));

    // The published state is already visible when the incident is stored.
    ASSERT_EQ(sink.seenLevels.size(), 1u);
    EXPECT_EQ(sink.seenLevels[0], ThreatLevel::Alert);
    EXPECT_EQ(notifier_.delivered.size(), 1u);
}

TEST_F(ThreatEngineTest, StoredIncidentCanBeAcknowledgedAndResolved) {
    Incident stored;
    stored.id = QStringLiteral("stored-1");
    stored.type = IncidentType::CpuAnomaly;
    stored.openedAt = kStart;
    incidents_.stored.push_back(stored);

    Incident closed = stored;
    closed.id = QStringLiteral("stored-2");
    closed.resolved = true;
    incidents_.stored.push_back(closed);

    EXPECT_TRUE(engine_->acknowledgeIncident(QStringLiteral("stored-1")));
    ASSERT_EQ(incidents_.updated.size(), 1u);
    EXPECT_TRUE(incidents_.updated[0].acknowledged);
    EXPECT_FALSE(incidents_.updated[0].resolved);

    EXPECT_TRUE(engine_->resolveIncident(QStringLiteral("stored-1")));
    ASSERT_EQ(incidents_.updated.size(), 2u);
    EXPECT_TRUE(incidents_.updated[1].resolved);
    EXPECT_TRUE(incidents_.updated[1].endedAt.isValid());

    EXPECT_FALSE(engine_->resolveIncident(QStringLiteral("stored-2")));
    EXPECT_FALSE(engine_->acknowledgeIncident(QStringLiteral("missing")));
    EXPECT_EQ(incidents_.updated.size(), 2u);
}
