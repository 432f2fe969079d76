#include "idleguard/incident_store.hpp"

#include <QDebug>
#include <QSqlError>
#include <QSqlQuery>
#include <QTimeZone>
#include <QVariant>

namespace idleguard {

namespace {
constexpr int kSchemaVersion = 1;

QString lastErrorString(const QSqlDatabase &db)
{
    return db.lastError().text();
}

QString lastErrorString(const QSqlQuery &query)
{
    return query.lastError().text();
}

QVariant msecsOrNull(const QDateTime &ts)
{
    return ts.isValid() ? QVariant(ts.toMSecsSinceEpoch()) : QVariant();
}

} // namespace

IncidentStore::IncidentStore(const QString &dbPath, const QString &connectionName)
    : dbPath_(dbPath)
    , connectionName_(connectionName)
{
}

IncidentStore::~IncidentStore()
{
    if (db_.isValid()) {
        db_.close();
        db_ = QSqlDatabase();
        QSqlDatabase::removeDatabase(connectionName_);
    }
}

bool IncidentStore::ensureConnection()
{
    if (db_.isValid() && db_.isOpen()) {
        return true;
    }

    if (QSqlDatabase::contains(connectionName_)) {
        db_ = QSqlDatabase::database(connectionName_);
    } else {
        db_ = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), connectionName_);
    }

    db_.setDatabaseName(dbPath_);

    if (!db_.open()) {
        qWarning() << "IncidentStore: failed to open database:"
                   << dbPath_ << "-" << lastErrorString(db_);
        return false;
    }

    return true;
}

bool IncidentStore::open()
{
    return ensureConnection();
}

bool IncidentStore::initSchema()
{
    if (!ensureConnection()) {
        return false;
    }

    QSqlQuery query(db_);

    const char *createSql = R"(
        CREATE TABLE IF NOT EXISTS incidents (
            id            TEXT    PRIMARY KEY,
            type          TEXT    NOT NULL,
            severity      INTEGER NOT NULL,
            opened_ms     INTEGER NOT NULL,
            ended_ms      INTEGER,
            acknowledged  INTEGER NOT NULL DEFAULT 0,
            resolved      INTEGER NOT NULL DEFAULT 0,
            upload_bps    REAL,
            download_bps  REAL,
            cpu_percent   REAL,
            battery_drain REAL,
            thermal       INTEGER,
            threat_score  INTEGER,
            total_up      INTEGER,
            total_down    INTEGER,
            summary       TEXT    NOT NULL,
            details       TEXT
        )
    )";

    if (!query.exec(QString::fromUtf8(createSql))) {
        qWarning() << "IncidentStore: failed to create incidents table:"
                   << lastErrorString(query);
        return false;
    }

    if (!query.exec(QStringLiteral(
            "CREATE INDEX IF NOT EXISTS incidents_opened ON incidents (opened_ms)"))) {
        qWarning() << "IncidentStore: failed to create index:" << lastErrorString(query);
        return false;
    }

    const char *metaSql = R"(
        CREATE TABLE IF NOT EXISTS meta (
            key   TEXT PRIMARY KEY,
            value TEXT NOT NULL
        )
    )";

    if (!query.exec(QString::fromUtf8(metaSql))) {
        qWarning() << "IncidentStore: failed to create meta table:"
                   << lastErrorString(query);
        return false;
    }

    query.prepare(QStringLiteral(
        "INSERT OR REPLACE INTO meta (key, value) VALUES ('schema_version', ?)"
    ));
    query.addBindValue(QString::number(kSchemaVersion));
    if (!query.exec()) {
        qWarning() << "IncidentStore: failed to write schema version:"
                   << lastErrorString(query);
        // Not fatal.
    }

    return true;
}

bool IncidentStore::insertIncident(const Incident &incident)
{
    if (!ensureConnection()) {
        return false;
    }

    QSqlQuery query(db_);

    query.prepare(QStringLiteral(R"(
        INSERT INTO incidents (
            id, type, severity, opened_ms, ended_ms, acknowledged, resolved,
            upload_bps, download_bps, cpu_percent, battery_drain, thermal,
            threat_score, total_up, total_down, summary, details
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )"));

    query.addBindValue(incident.id);
    query.addBindValue(incidentTypeToString(incident.type));
    query.addBindValue(static_cast<int>(incident.severity));
    query.addBindValue(incident.openedAt.toMSecsSinceEpoch());
    query.addBindValue(msecsOrNull(incident.endedAt));
    query.addBindValue(incident.acknowledged ? 1 : 0);
    query.addBindValue(incident.resolved ? 1 : 0);
    query.addBindValue(incident.uploadBytesPerSecond);
    query.addBindValue(incident.downloadBytesPerSecond);
    query.addBindValue(incident.cpuUsagePercent);
    query.addBindValue(incident.batteryDrainPerHourPercent);
    query.addBindValue(incident.thermalLevel);
    query.addBindValue(incident.threatScore);
    query.addBindValue(incident.totalBytesUploaded);
    query.addBindValue(incident.totalBytesDownloaded);
    query.addBindValue(incident.summary);
    query.addBindValue(incident.details.isEmpty() ? QVariant() : QVariant(incident.details));

    if (!query.exec()) {
        qWarning() << "IncidentStore: insertIncident failed:" << lastErrorString(query);
        return false;
    }

    return true;
}

bool IncidentStore::updateIncident(const Incident &incident)
{
    if (!ensureConnection()) {
        return false;
    }

    QSqlQuery query(db_);
    query.prepare(QStringLiteral(
        "UPDATE incidents SET ended_ms = ?, acknowledged = ?, resolved = ? WHERE id = ?"
    ));
    query.addBindValue(msecsOrNull(incident.endedAt));
    query.addBindValue(incident.acknowledged ? 1 : 0);
    query.addBindValue(incident.resolved ? 1 : 0);
    query.addBindValue(incident.id);

    if (!query.exec()) {
        qWarning() << "IncidentStore: updateIncident failed:" << lastErrorString(query);
        return false;
    }

    if (query.numRowsAffected() == 0) {
        qWarning() << "IncidentStore: updateIncident found no incident" << incident.id;
        return false;
    }

    return true;
}

std::vector<Incident> IncidentStore::queryIncidents(const QDateTime &from,
                                                    const QDateTime &to)
{
    return readIncidents(QStringLiteral("opened_ms BETWEEN ? AND ?"),
                         {from.toMSecsSinceEpoch(), to.toMSecsSinceEpoch()});
}

std::vector<Incident> IncidentStore::openIncidents()
{
    return readIncidents(QStringLiteral("resolved = 0"), {});
}

std::optional<Incident> IncidentStore::findIncident(const QString &id)
{
    std::vector<Incident> found = readIncidents(QStringLiteral("id = ?"), {id});
    if (found.empty()) {
        return std::nullopt;
    }
    return found.front();
}

bool IncidentStore::resolveOpenIncidents(const QDateTime &at)
{
    if (!ensureConnection()) {
        return false;
    }

    QSqlQuery query(db_);
    query.prepare(QStringLiteral(
        "UPDATE incidents SET resolved = 1, ended_ms = ? WHERE resolved = 0"
    ));
    query.addBindValue(at.toMSecsSinceEpoch());

    if (!query.exec()) {
        qWarning() << "IncidentStore: resolveOpenIncidents failed:" << lastErrorString(query);
        return false;
    }

    const int closed = query.numRowsAffected();
    if (closed > 0) {
        qInfo() << "IncidentStore: resolved" << closed << "incident(s) left open";
    }
    return true;
}

std::vector<Incident> IncidentStore::readIncidents(const QString &where,
                                                   const QVariantList &bindings)
{
    std::vector<Incident> results;

    if (!ensureConnection()) {
        return results;
    }

    QSqlQuery query(db_);

    const QString sql = QStringLiteral(
        "SELECT id, type, severity, opened_ms, ended_ms, acknowledged, resolved, "
        "upload_bps, download_bps, cpu_percent, battery_drain, thermal, "
        "threat_score, total_up, total_down, summary, details "
        "FROM incidents WHERE %1 ORDER BY opened_ms ASC"
    ).arg(where);

    if (!query.prepare(sql)) {
        qWarning() << "IncidentStore: query prepare failed:" << lastErrorString(query);
        return results;
    }

    for (const QVariant &value : bindings) {
        query.addBindValue(value);
    }

    if (!query.exec()) {
        qWarning() << "IncidentStore: query exec failed:" << lastErrorString(query);
        return results;
    }

    while (query.next()) {
        Incident incident;
        incident.id = query.value(0).toString();
        incident.type = incidentTypeFromString(query.value(1).toString());
        incident.severity = static_cast<IncidentSeverity>(query.value(2).toInt());
        incident.openedAt = QDateTime::fromMSecsSinceEpoch(query.value(3).toLongLong(),
                                                           QTimeZone::utc());
        if (!query.value(4).isNull()) {
            incident.endedAt = QDateTime::fromMSecsSinceEpoch(query.value(4).toLongLong(),
                                                              QTimeZone::utc());
        }
        incident.acknowledged = query.value(5).toInt() != 0;
        incident.resolved = query.value(6).toInt() != 0;
        incident.uploadBytesPerSecond = query.value(7).toDouble();
        incident.downloadBytesPerSecond = query.value(8).toDouble();
        incident.cpuUsagePercent = query.value(9).toDouble();
        incident.batteryDrainPerHourPercent = query.value(10).toDouble();
        incident.thermalLevel = query.value(11).toInt();
        incident.threatScore = query.value(12).toInt();
        incident.totalBytesUploaded = query.value(13).toLongLong();
        incident.totalBytesDownloaded = query.value(14).toLongLong();
        incident.summary = query.value(15).toString();
        incident.details = query.value(16).toString();

        results.push_back(std::move(incident));
    }

    return results;
}

} // namespace idleguard
