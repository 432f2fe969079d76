#pragma once

#include "idleguard/alert_gate.hpp"
#include "idleguard/incident.hpp"

#include <QDateTime>
#include <QSqlDatabase>
#include <QString>

#include <optional>
#include <vector>

namespace idleguard {

// SQLite-backed incident history.
class IncidentStore : public IncidentSink {
public:
    explicit IncidentStore(const QString &dbPath,
                           const QString &connectionName = QStringLiteral("idleguard_incident_store"));
    ~IncidentStore() override;

    bool open();
    bool initSchema();

    bool insertIncident(const Incident &incident) override;
    bool updateIncident(const Incident &incident) override;
    std::optional<Incident> findIncident(const QString &id) override;

    std::vector<Incident> queryIncidents(const QDateTime &from,
                                         const QDateTime &to);

    std::vector<Incident> openIncidents();

    // Closes incidents left open by an earlier process.
    bool resolveOpenIncidents(const QDateTime &at);

private:
    QString dbPath_;
    QString connectionName_;
    QSqlDatabase db_;

    bool ensureConnection();
    std::vector<Incident> readIncidents(const QString &where,
                                        const QVariantList &bindings);
};

} // namespace idleguard
