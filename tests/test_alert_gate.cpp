#include <gtest/gtest.h>

#include "idleguard/alert_gate.hpp"

#include <QTimeZone>

#include <vector>

using namespace idleguard;

namespace {

const QDateTime kStart = QDateTime::fromMSecsSinceEpoch(1700000000000LL, QTimeZone::utc());

ThreatFactor makeFactor(const char *name, int score)
{
    return ThreatFactor{QString::fromLatin1(name), score, QStringLiteral("reason")};
}

LevelTransition makeTransition(ThreatLevel from, ThreatLevel to, int score, const QDateTime &at)
{
    LevelTransition t;
    t.from = from;
    t.to = to;
    t.score = score;
    t.at = at;
    return t;
}

class AlertGateTest : public ::testing::Test {
protected:
    AlertGateTest()
        : gate_(AlertGateConfig())
    {
    }

    AlertGate gate_;
    MetricSnapshot snapshot_;
    RollingTotals totals_;
};

} // namespace

TEST(IncidentTypeMappingTest, FactorsMapToIncidentTypes) {
    const auto upload = incidentTypesForFactors({makeFactor(factor::TotalUpload, 50),
                                                 makeFactor(factor::SustainedUpload, 25)});
    ASSERT_EQ(upload.size(), 1u);
    EXPECT_EQ(upload[0], IncidentType::DataExfiltration);

    EXPECT_TRUE(incidentTypesForFactors({makeFactor(factor::TotalUploadNearLimit, 20)}).empty());

    const auto multi = incidentTypesForFactors({makeFactor(factor::IdleCpu, 25),
                                                makeFactor(factor::BatteryDrain, 20),
                                                makeFactor(factor::Thermal, 20)});
    ASSERT_EQ(multi.size(), 4u);
    EXPECT_EQ(multi.back(), IncidentType::MultiFactorAlert);
}

TEST_F(AlertGateTest, AlertRecordsIncidentAndNotifies) {
    const GateDecision d = gate_.handleTransition(
        makeTransition(ThreatLevel::Normal, ThreatLevel::Alert, 50, kStart),
        {makeFactor(factor::TotalUpload, 50)}, snapshot_, totals_);

    ASSERT_EQ(d.recorded.size(), 1u);
    EXPECT_EQ(d.recorded[0].type, IncidentType::DataExfiltration);
    EXPECT_EQ(d.recorded[0].severity, IncidentSeverity::High);
    EXPECT_FALSE(d.recorded[0].id.isEmpty());

    ASSERT_TRUE(d.notification.has_value());
    EXPECT_EQ(d.notification->severity, ThreatLevel::Alert);
    EXPECT_EQ(d.notificationIdentity, QStringLiteral("Alert:total_upload"));
    EXPECT_TRUE(gate_.isSuspicious());
}

TEST_F(AlertGateTest, WarningIsNotNotified) {
    const GateDecision d = gate_.handleTransition(
        makeTransition(ThreatLevel::Normal, ThreatLevel::Warning, 20, kStart),
        {makeFactor(factor::SurveillancePattern, 20)}, snapshot_, totals_);

    EXPECT_EQ(d.recorded.size(), 1u);
    EXPECT_FALSE(d.notification.has_value());
}

TEST_F(AlertGateTest, DuplicateWithinWindowIsSuppressed) {
    ASSERT_TRUE(gate_.recordIncident(IncidentType::CpuAnomaly, snapshot_, totals_, kStart));
    ASSERT_TRUE(gate_.resolveIncident(gate_.recentIncidents().front().id, kStart.addSecs(10)));

    EXPECT_FALSE(gate_.recordIncident(IncidentType::CpuAnomaly, snapshot_, totals_,
                                      kStart.addSecs(30)));
    EXPECT_TRUE(gate_.recordIncident(IncidentType::CpuAnomaly, snapshot_, totals_,
                                     kStart.addSecs(60)));
    EXPECT_EQ(gate_.recentIncidents().size(), 2u);
}

TEST_F(AlertGateTest, OpenIncidentOfSameTypeIsNotDuplicated) {
    ASSERT_TRUE(gate_.recordIncident(IncidentType::BatteryAnomaly, snapshot_, totals_, kStart));
    EXPECT_FALSE(gate_.recordIncident(IncidentType::BatteryAnomaly, snapshot_, totals_,
                                      kStart.addSecs(600)));
    EXPECT_TRUE(gate_.recordIncident(IncidentType::ThermalAnomaly, snapshot_, totals_,
                                     kStart.addSecs(1)));
    EXPECT_EQ(gate_.openIncidents().size(), 2u);
}

TEST_F(AlertGateTest, NotificationCooldownPerIdentity) {
    EXPECT_TRUE(gate_.claimNotification(QStringLiteral("Alert:total_upload"), kStart));
    EXPECT_FALSE(gate_.claimNotification(QStringLiteral("Alert:total_upload"), kStart.addSecs(299)));
    EXPECT_TRUE(gate_.claimNotification(QStringLiteral("Alert:idle_cpu"), kStart.addSecs(10)));
    EXPECT_TRUE(gate_.claimNotification(QStringLiteral("Alert:total_upload"), kStart.addSecs(300)));
}

TEST_F(AlertGateTest, RepeatedTransitionsNotifyOnce) {
    const std::vector<ThreatFactor> factors = {makeFactor(factor::TotalUpload, 50)};

    const GateDecision first = gate_.handleTransition(
        makeTransition(ThreatLevel::Normal, ThreatLevel::Alert, 50, kStart),
        factors, snapshot_, totals_);
    gate_.handleTransition(makeTransition(ThreatLevel::Alert, ThreatLevel::Normal, 0,
                                          kStart.addSecs(60)),
                           {}, snapshot_, totals_);
    const GateDecision again = gate_.handleTransition(
        makeTransition(ThreatLevel::Normal, ThreatLevel::Alert, 50, kStart.addSecs(120)),
        factors, snapshot_, totals_);

    EXPECT_TRUE(first.notification.has_value());
    EXPECT_FALSE(again.notification.has_value());
    // The incident itself is new; only the notification is in cooldown.
    EXPECT_EQ(again.recorded.size(), 1u);
}

TEST_F(AlertGateTest, ReturnToNormalResolvesWithoutNotifying) {
    gate_.handleTransition(makeTransition(ThreatLevel::Normal, ThreatLevel::Critical, 75, kStart),
                           {makeFactor(factor::IdleCpu, 25), makeFactor(factor::BatteryDrain, 20),
                            makeFactor(factor::Thermal, 20), makeFactor(factor::TotalDownload, 30)},
                           snapshot_, totals_);
    ASSERT_EQ(gate_.openIncidents().size(), 5u);

    const GateDecision d = gate_.handleTransition(
        makeTransition(ThreatLevel::Critical, ThreatLevel::Normal, 0, kStart.addSecs(60)),
        {}, snapshot_, totals_);

    EXPECT_EQ(d.resolved.size(), 5u);
    EXPECT_FALSE(d.notification.has_value());
    EXPECT_TRUE(d.recorded.empty());
    EXPECT_TRUE(gate_.openIncidents().empty());
    EXPECT_FALSE(gate_.isSuspicious());

    for (const Incident &incident : gate_.recentIncidents()) {
        EXPECT_TRUE(incident.resolved);
        EXPECT_EQ(incident.endedAt, kStart.addSecs(60));
    }
}

TEST_F(AlertGateTest, AcknowledgeKeepsIncidentOpen) {
    const auto incident = gate_.recordIncident(IncidentType::NetworkAnomaly, snapshot_, totals_, kStart);
    ASSERT_TRUE(incident);

    EXPECT_TRUE(gate_.acknowledgeIncident(incident->id));
    EXPECT_TRUE(gate_.openIncidents().front().acknowledged);

    EXPECT_TRUE(gate_.resolveIncident(incident->id, kStart.addSecs(5)));
    EXPECT_FALSE(gate_.resolveIncident(incident->id, kStart.addSecs(6)));
    EXPECT_FALSE(gate_.acknowledgeIncident(incident->id));
    EXPECT_FALSE(gate_.acknowledgeIncident(QStringLiteral("missing")));
}
