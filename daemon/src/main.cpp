#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDBusConnection>
#include <QDebug>
#include <QDir>
#include <QStandardPaths>

#include "idleguard/config.hpp"

#include "idleguard_daemon.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("idleguard"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Detects anomalous background activity while the machine is idle."));
    parser.addHelpOption();

    const QCommandLineOption configOption(
        QStringLiteral("config"),
        QStringLiteral("Engine configuration file (JSON)."),
        QStringLiteral("path"));
    const QCommandLineOption dbOption(
        QStringLiteral("db"),
        QStringLiteral("Incident database file."),
        QStringLiteral("path"));
    const QCommandLineOption intervalOption(
        QStringLiteral("interval"),
        QStringLiteral("Evaluation interval in milliseconds."),
        QStringLiteral("ms"));
    parser.addOption(configOption);
    parser.addOption(dbOption);
    parser.addOption(intervalOption);
    parser.process(app);

    const QString configDir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    const QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir().mkpath(configDir);
    QDir().mkpath(dataDir);

    const QString configPath = parser.isSet(configOption)
        ? parser.value(configOption)
        : configDir + QStringLiteral("/engine.json");
    const QString dbPath = parser.isSet(dbOption)
        ? parser.value(dbOption)
        : dataDir + QStringLiteral("/incidents.db");
    const QString thresholdsPath = configDir + QStringLiteral("/thresholds.json");

    idleguard::EngineConfig config = idleguard::loadEngineConfig(configPath);
    if (parser.isSet(intervalOption)) {
        bool ok = false;
        const int interval = parser.value(intervalOption).toInt(&ok);
        if (ok && interval > 0) {
            config.tickIntervalMs = interval;
        } else {
            qWarning() << "Ignoring invalid --interval" << parser.value(intervalOption);
        }
    }

    qInfo() << "IdleGuard daemon starting, DB path:" << dbPath;

    idleguard::IdleGuardDaemon daemon(config, dbPath, thresholdsPath);

    QDBusConnection bus = QDBusConnection::sessionBus();
    if (!bus.registerService(QStringLiteral("org.idleguard.Daemon"))) {
        qCritical() << "Failed to register D-Bus service org.idleguard.Daemon";
        return 1;
    }

    if (!bus.registerObject(QStringLiteral("/org/idleguard/Daemon"), &daemon,
                            QDBusConnection::ExportAdaptors)) {
        qCritical() << "Failed to register D-Bus object /org/idleguard/Daemon";
        return 1;
    }

    if (!daemon.init()) {
        qCritical() << "Failed to initialize IdleGuardDaemon";
        return 1;
    }

    qInfo() << "IdleGuard daemon initialized and D-Bus service registered";
    return app.exec();
}
