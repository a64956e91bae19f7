#pragma once

#include <QMutex>
#include <QReadWriteLock>
#include <QString>
#include <QStringList>
#include <QVector>

#include "catalog/cache/DocumentCache.h"
#include "catalog/model/DeviceDocument.h"
#include "catalog/scan/CatalogScanner.h"

namespace catalog::index {

// Empty fields mean "any". A communityFolder selects the overlay document of
// the device's manufacturer instead of its primary collections.
struct PresetQuery {
    QString device;
    QString manufacturer;
    QString communityFolder;
};

/**
 * CatalogIndex: the in-memory catalog for one root directory.
 *
 * Lifecycle: init() runs the first scan, rescan() replaces the whole state,
 * teardown() drops it and the document cache. Accessors return copies, so a
 * caller's data stays valid across rescans; it just goes stale.
 */
class CatalogIndex {
public:
    struct Options {
        int scanTtlSec = cache::DocumentCache::kDefaultScanTtlSec;
        int communityTtlSec = cache::DocumentCache::kDefaultCommunityTtlSec;
        int outerWidth = 0;
        int innerWidth = 0;
    };

    explicit CatalogIndex(const QString& root);
    CatalogIndex(const QString& root, const Options& opts, cache::DocumentCache::Clock clock = {});

    // False if the root directory does not exist; the index is then empty
    // but usable.
    bool init();
    void rescan();
    void teardown();
    bool isInitialized() const;

    QString root() const { return m_root; }
    cache::DocumentCache& cache() { return m_cache; }
    scan::ScanStats lastScanStats() const;

    QStringList manufacturers() const;
    QStringList devicesByManufacturer(const QString& manufacturer) const;
    bool device(const QString& name, model::DeviceRecord* out) const;
    QVector<model::DeviceRecord> deviceInfoByManufacturer(const QString& manufacturer) const;
    QStringList communityFolders(const QString& deviceName) const;
    QVector<model::Preset> presets(const PresetQuery& query);
    bool presetByName(const QString& presetName, model::Preset* out) const;
    QStringList collections(const QString& manufacturer, const QString& deviceName) const;
    int deviceCount() const;

private:
    QString manufacturerKey(const QString& manufacturer) const;
    QVector<model::Preset> communityPresets(const model::DeviceRecord& rec, const QString& folder);

    QString m_root;
    Options m_opts;
    cache::DocumentCache m_cache;
    scan::CatalogScanner m_scanner;

    QMutex m_scanMutex; // one orchestrator at a time
    mutable QReadWriteLock m_stateLock;
    scan::ScanResult m_state;
    bool m_initialized = false;
};

} // namespace catalog::index
