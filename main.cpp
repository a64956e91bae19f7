#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>

#include "catalog/config/CatalogConfig.h"
#include "catalog/index/CatalogIndex.h"
#include "catalog/sync/GitRunner.h"
#include "catalog/sync/SyncEngine.h"
#include "catalog/util/LogSink.h"

using namespace catalog;

// presetcatalog [config.ini]
// Brings the catalog checkout up to date, scans it and logs a summary.
int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("presetcatalog");

    const QStringList args = QCoreApplication::arguments();
    const QString iniPath = args.size() > 1 ? args.at(1) : QString();
    const config::CatalogConfig cfg = config::loadCatalogConfigFile(iniPath);

    util::LogSinkOptions logOpts;
    logOpts.filePath = cfg.logFile;
    logOpts.maxBytes = cfg.logMaxBytes;
    logOpts.backups = cfg.logBackups;
    logOpts.verbose = cfg.verbose;
    if (!util::LogSink::install(logOpts)) {
        qWarning().noquote() << QString("Could not open log file %1, logging to stderr only").arg(cfg.logFile);
    }

    const QString root = QDir::cleanPath(QFileInfo(cfg.catalogRoot).absoluteFilePath());
    qInfo().noquote() << QString("presetcatalog: root=%1 role=%2 sync=%3")
                             .arg(root, cfg.role, cfg.syncEnabled ? "on" : "off");

    sync::ProcessGitRunner git(cfg.gitTimeoutMs);
    sync::SyncSettings syncSettings;
    syncSettings.catalogRoot = root;
    syncSettings.parentRepoRoot = cfg.parentRepoRoot;
    syncSettings.submodulePath = cfg.submodulePath;
    syncSettings.remoteUrl = cfg.remoteUrl;
    syncSettings.enabled = cfg.syncEnabled;

    sync::SyncEngine engine(git, syncSettings);
    const sync::SyncResult synced = engine.sync(sync::syncModeFromRole(cfg.role));
    if (synced.ok) {
        qInfo().noquote() << QString("Sync: %1").arg(synced.message);
    } else {
        // Scanning still runs against whatever is on disk.
        qWarning().noquote() << QString("Sync: %1 (code %2)").arg(synced.message).arg(synced.code);
    }

    index::CatalogIndex::Options opts;
    opts.scanTtlSec = cfg.scanCacheTtlSec;
    opts.communityTtlSec = cfg.communityCacheTtlSec;
    index::CatalogIndex catalogIndex(root, opts);
    if (!catalogIndex.init()) {
        qCritical().noquote() << QString("Catalog root %1 does not exist").arg(root);
        util::LogSink::uninstall();
        return 1;
    }

    const scan::ScanStats stats = catalogIndex.lastScanStats();
    qInfo().noquote() << QString("Catalog: %1 manufacturers, %2 devices (%3 documents parsed, %4 skipped) in %5 ms")
                             .arg(catalogIndex.manufacturers().size())
                             .arg(catalogIndex.deviceCount())
                             .arg(stats.documentsParsed)
                             .arg(stats.documentsSkipped)
                             .arg(stats.elapsedMs);
    for (const QString& m : catalogIndex.manufacturers()) {
        qInfo().noquote() << QString("  %1: %2").arg(m, catalogIndex.devicesByManufacturer(m).join(", "));
    }

    catalogIndex.teardown();
    util::LogSink::uninstall();
    return 0;
}
