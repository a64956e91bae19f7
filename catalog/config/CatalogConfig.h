#pragma once

#include <QString>

class QSettings;

namespace catalog::config {

// Process configuration for one catalog. Stored under catalog/*, sync/* and
// log/* keys; PRESETCATALOG_ROOT, PRESETCATALOG_ROLE and PRESETCATALOG_SYNC
// override the stored values.
struct CatalogConfig {
    QString catalogRoot = "midi-presets";
    QString parentRepoRoot;       // submodule role only
    QString submodulePath;        // relative to parentRepoRoot
    QString remoteUrl = "https://github.com/tirans/midi-presets.git";
    QString role = "clone";       // "clone" | "submodule"
    bool syncEnabled = true;

    int scanCacheTtlSec = 3600;
    int communityCacheTtlSec = 300;
    int gitTimeoutMs = 120000;

    QString logFile;              // empty => stderr only
    qint64 logMaxBytes = 10 * 1024 * 1024;
    int logBackups = 10;
    bool verbose = false;
};

CatalogConfig defaultCatalogConfig();

CatalogConfig loadCatalogConfig(QSettings& settings);
void saveCatalogConfig(QSettings& settings, const CatalogConfig& c);

// Reads an INI file (missing file => defaults), then applies the environment.
CatalogConfig loadCatalogConfigFile(const QString& iniPath);

void applyEnvironmentOverrides(CatalogConfig* c);

} // namespace catalog::config
