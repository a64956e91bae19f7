#include "catalog/config/CatalogConfig.h"

#include <QFileInfo>
#include <QSettings>
#include <QDebug>
#include <QtGlobal>

#include <algorithm>

namespace catalog::config {
namespace {

static int clampInt(int v, int lo, int hi) { return std::max(lo, std::min(hi, v)); }

static int readInt(QSettings& s, const QString& k, int def) { return s.value(k, def).toInt(); }
static qint64 readI64(QSettings& s, const QString& k, qint64 def) { return s.value(k, def).toLongLong(); }
static bool readB(QSettings& s, const QString& k, bool def) { return s.value(k, def).toBool(); }
static QString readS(QSettings& s, const QString& k, const QString& def) { return s.value(k, def).toString(); }

static QString normalizeRole(const QString& role) {
    const QString r = role.trimmed().toLower();
    return (r == "dev" || r == "submodule") ? QString("submodule") : QString("clone");
}

} // namespace

CatalogConfig defaultCatalogConfig() {
    return CatalogConfig{};
}

CatalogConfig loadCatalogConfig(QSettings& settings) {
    CatalogConfig c = defaultCatalogConfig();

    c.catalogRoot = readS(settings, "catalog/root", c.catalogRoot);
    c.scanCacheTtlSec = clampInt(readInt(settings, "catalog/scanCacheTtlSec", c.scanCacheTtlSec), 0, 86400);
    c.communityCacheTtlSec = clampInt(readInt(settings, "catalog/communityCacheTtlSec", c.communityCacheTtlSec), 0, 86400);

    c.parentRepoRoot = readS(settings, "sync/parentRepoRoot", c.parentRepoRoot);
    c.submodulePath = readS(settings, "sync/submodulePath", c.submodulePath);
    c.remoteUrl = readS(settings, "sync/remoteUrl", c.remoteUrl);
    c.role = normalizeRole(readS(settings, "sync/role", c.role));
    c.syncEnabled = readB(settings, "sync/enabled", c.syncEnabled);
    c.gitTimeoutMs = clampInt(readInt(settings, "sync/gitTimeoutMs", c.gitTimeoutMs), 1000, 3600 * 1000);

    c.logFile = readS(settings, "log/file", c.logFile);
    c.logMaxBytes = std::max<qint64>(1024, readI64(settings, "log/maxBytes", c.logMaxBytes));
    c.logBackups = clampInt(readInt(settings, "log/backups", c.logBackups), 0, 100);
    c.verbose = readB(settings, "log/verbose", c.verbose);
    return c;
}

void saveCatalogConfig(QSettings& settings, const CatalogConfig& c) {
    settings.setValue("catalog/root", c.catalogRoot);
    settings.setValue("catalog/scanCacheTtlSec", c.scanCacheTtlSec);
    settings.setValue("catalog/communityCacheTtlSec", c.communityCacheTtlSec);

    settings.setValue("sync/parentRepoRoot", c.parentRepoRoot);
    settings.setValue("sync/submodulePath", c.submodulePath);
    settings.setValue("sync/remoteUrl", c.remoteUrl);
    settings.setValue("sync/role", c.role);
    settings.setValue("sync/enabled", c.syncEnabled);
    settings.setValue("sync/gitTimeoutMs", c.gitTimeoutMs);

    settings.setValue("log/file", c.logFile);
    settings.setValue("log/maxBytes", c.logMaxBytes);
    settings.setValue("log/backups", c.logBackups);
    settings.setValue("log/verbose", c.verbose);
}

void applyEnvironmentOverrides(CatalogConfig* c) {
    const QString root = qEnvironmentVariable("PRESETCATALOG_ROOT");
    if (!root.isEmpty()) c->catalogRoot = root;

    if (qEnvironmentVariableIsSet("PRESETCATALOG_ROLE")) {
        // Only "dev" selects the submodule layout here.
        c->role = qEnvironmentVariable("PRESETCATALOG_ROLE").trimmed().toLower() == "dev"
            ? QString("submodule") : QString("clone");
    }

    if (qEnvironmentVariableIsSet("PRESETCATALOG_SYNC")) {
        const QString v = qEnvironmentVariable("PRESETCATALOG_SYNC").trimmed().toLower();
        c->syncEnabled = !(v == "0" || v == "false");
    }
}

CatalogConfig loadCatalogConfigFile(const QString& iniPath) {
    CatalogConfig c = defaultCatalogConfig();
    if (!iniPath.isEmpty() && QFileInfo::exists(iniPath)) {
        QSettings settings(iniPath, QSettings::IniFormat);
        c = loadCatalogConfig(settings);
        qInfo().noquote() << QString("CatalogConfig: loaded %1").arg(iniPath);
    } else if (!iniPath.isEmpty()) {
        qWarning().noquote() << QString("CatalogConfig: %1 not found, using defaults").arg(iniPath);
    }
    applyEnvironmentOverrides(&c);
    return c;
}

} // namespace catalog::config
