#include <gtest/gtest.h>

#include "idleguard/incident_store.hpp"

#include <QTimeZone>
#include <QUuid>

#include <memory>

using namespace idleguard;

namespace {

const QDateTime kStart = QDateTime::fromMSecsSinceEpoch(1700000000000LL, QTimeZone::utc());

Incident makeIncident(IncidentType type, const QDateTime &openedAt)
{
    Incident incident;
    incident.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    incident.type = type;
    incident.severity = defaultSeverity(type);
    incident.openedAt = openedAt;
    incident.uploadBytesPerSecond = 42000.0;
    incident.cpuUsagePercent = 61.5;
    incident.thermalLevel = 2;
    incident.threatScore = 70;
    incident.totalBytesUploaded = 150000000;
    incident.totalBytesDownloaded = 3000;
    incident.summary = incidentTypeTitle(type);
    return incident;
}

class IncidentStoreTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        store_ = std::make_unique<IncidentStore>(
            QStringLiteral(":memory:"),
            QStringLiteral("incident_store_test_%1").arg(counter_++));
        ASSERT_TRUE(store_->open());
        ASSERT_TRUE(store_->initSchema());
    }

    void TearDown() override
    {
        store_.reset();
    }

    std::unique_ptr<IncidentStore> store_;
    static int counter_;
};

int IncidentStoreTest::counter_ = 0;

} // namespace

TEST_F(IncidentStoreTest, InsertAndQueryByRange) {
    const Incident first = makeIncident(IncidentType::CpuAnomaly, kStart);
    const Incident second = makeIncident(IncidentType::DataExfiltration, kStart.addSecs(600));
    ASSERT_TRUE(store_->insertIncident(first));
    ASSERT_TRUE(store_->insertIncident(second));

    const auto all = store_->queryIncidents(kStart, kStart.addSecs(3600));
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].id, first.id);
    EXPECT_EQ(all[1].id, second.id);

    const Incident &read = all[1];
    EXPECT_EQ(read.type, IncidentType::DataExfiltration);
    EXPECT_EQ(read.severity, IncidentSeverity::High);
    EXPECT_EQ(read.openedAt, second.openedAt);
    EXPECT_FALSE(read.endedAt.isValid());
    EXPECT_DOUBLE_EQ(read.cpuUsagePercent, 61.5);
    EXPECT_EQ(read.thermalLevel, 2);
    EXPECT_EQ(read.totalBytesUploaded, 150000000);
    EXPECT_TRUE(read.details.isEmpty());

    const auto early = store_->queryIncidents(kStart, kStart.addSecs(60));
    ASSERT_EQ(early.size(), 1u);
    EXPECT_EQ(early[0].id, first.id);
}

TEST_F(IncidentStoreTest, UpdateMarksResolved) {
    Incident incident = makeIncident(IncidentType::BatteryAnomaly, kStart);
    ASSERT_TRUE(store_->insertIncident(incident));
    ASSERT_EQ(store_->openIncidents().size(), 1u);

    incident.acknowledged = true;
    incident.resolved = true;
    incident.endedAt = kStart.addSecs(120);
    ASSERT_TRUE(store_->updateIncident(incident));

    EXPECT_TRUE(store_->openIncidents().empty());
    const auto all = store_->queryIncidents(kStart, kStart.addSecs(1));
    ASSERT_EQ(all.size(), 1u);
    EXPECT_TRUE(all[0].acknowledged);
    EXPECT_TRUE(all[0].resolved);
    EXPECT_EQ(all[0].endedAt, kStart.addSecs(120));
}

TEST_F(IncidentStoreTest, UpdateUnknownIncidentFails) {
    EXPECT_FALSE(store_->updateIncident(makeIncident(IncidentType::CpuAnomaly, kStart)));
}

TEST_F(IncidentStoreTest, DuplicateIdIsRejected) {
    const Incident incident = makeIncident(IncidentType::ThermalAnomaly, kStart);
    ASSERT_TRUE(store_->insertIncident(incident));
    EXPECT_FALSE(store_->insertIncident(incident));
}

TEST_F(IncidentStoreTest, InitSchemaIsIdempotent) {
    EXPECT_TRUE(store_->initSchema());
}

TEST_F(IncidentStoreTest, FindIncidentById) {
    const Incident incident = makeIncident(IncidentType::ThermalAnomaly, kStart);
    ASSERT_TRUE(store_->insertIncident(incident));

    const auto found = store_->findIncident(incident.id);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->type, IncidentType::ThermalAnomaly);
    EXPECT_EQ(found->threatScore, 70);

    EXPECT_FALSE(store_->findIncident(QStringLiteral("missing")).has_value());
}

TEST_F(IncidentStoreTest, ResolveOpenIncidentsClosesLeftovers) {
    const Incident open = makeIncident(IncidentType::CpuAnomaly, kStart);
    Incident closed = makeIncident(IncidentType::BatteryAnomaly, kStart);
    closed.resolved = true;
    closed.endedAt = kStart.addSecs(30);
    ASSERT_TRUE(store_->insertIncident(open));
    ASSERT_TRUE(store_->insertIncident(closed));

    ASSERT_TRUE(store_->resolveOpenIncidents(kStart.addSecs(3600)));

    EXPECT_TRUE(store_->openIncidents().empty());
    const auto stored = store_->findIncident(open.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(stored->resolved);
    EXPECT_EQ(stored->endedAt, kStart.addSecs(3600));

    // Already-resolved rows keep their end time.
    EXPECT_EQ(store_->findIncident(closed.id)->endedAt, kStart.addSecs(30));
}
