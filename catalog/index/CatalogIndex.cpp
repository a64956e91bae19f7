#include "catalog/index/CatalogIndex.h"

#include "catalog/ops/PathSafety.h"

#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QReadLocker>
#include <QWriteLocker>
#include <QDebug>
#include <QtGlobal>

#include <algorithm>

namespace catalog::index {
namespace {

static scan::CatalogScanner::Options scannerOptions(const CatalogIndex::Options& o) {
    scan::CatalogScanner::Options so;
    so.cacheTtlSec = o.scanTtlSec;
    so.outerWidth = o.outerWidth;
    so.innerWidth = o.innerWidth;
    return so;
}

static void appendPrimaryPresets(const model::DeviceRecord& rec, QVector<model::Preset>* out) {
    for (const auto& c : rec.document.collections) {
        for (auto p : c.presets) {
            p.source = "default";
            out->push_back(p);
        }
    }
}

} // namespace

CatalogIndex::CatalogIndex(const QString& root)
    : CatalogIndex(root, Options{}) {}

CatalogIndex::CatalogIndex(const QString& root, const Options& opts, cache::DocumentCache::Clock clock)
    : m_root(QFileInfo(root).absoluteFilePath())
    , m_opts(opts)
    , m_cache(std::move(clock))
    , m_scanner(m_cache, scannerOptions(opts)) {}

bool CatalogIndex::init() {
    rescan();
    QWriteLocker lock(&m_stateLock);
    m_initialized = true;
    return QFileInfo(m_root).isDir();
}

void CatalogIndex::rescan() {
    QMutexLocker scanLock(&m_scanMutex);
    scan::ScanResult fresh = m_scanner.scan(m_root);
    QWriteLocker lock(&m_stateLock);
    m_state = fresh;
}

void CatalogIndex::teardown() {
    QMutexLocker scanLock(&m_scanMutex);
    QWriteLocker lock(&m_stateLock);
    m_state = scan::ScanResult{};
    m_cache.clear();
    m_initialized = false;
}

bool CatalogIndex::isInitialized() const {
    QReadLocker lock(&m_stateLock);
    return m_initialized;
}

scan::ScanStats CatalogIndex::lastScanStats() const {
    QReadLocker lock(&m_stateLock);
    return m_state.stats;
}

QStringList CatalogIndex::manufacturers() const {
    QReadLocker lock(&m_stateLock);
    return m_state.manufacturers;
}

// Manufacturers are indexed by directory name; a display name such as
// "Dave Smith" maps to its sanitized directory "Dave_Smith". Caller holds
// m_stateLock.
QString CatalogIndex::manufacturerKey(const QString& manufacturer) const {
    if (manufacturer.isEmpty() || m_state.manufacturers.contains(manufacturer)) return manufacturer;
    const QString safe = ops::sanitizeComponent(manufacturer);
    return safe.isEmpty() ? manufacturer : safe;
}

QStringList CatalogIndex::devicesByManufacturer(const QString& manufacturer) const {
    QReadLocker lock(&m_stateLock);
    return m_state.deviceStructure.value(manufacturerKey(manufacturer));
}

bool CatalogIndex::device(const QString& name, model::DeviceRecord* out) const {
    QReadLocker lock(&m_stateLock);
    const auto it = m_state.devices.constFind(name);
    if (it == m_state.devices.constEnd()) return false;
    if (out) *out = it.value();
    return true;
}

QVector<model::DeviceRecord> CatalogIndex::deviceInfoByManufacturer(const QString& manufacturer) const {
    QReadLocker lock(&m_stateLock);
    QVector<model::DeviceRecord> out;
    for (const auto& name : m_state.deviceStructure.value(manufacturerKey(manufacturer))) {
        const auto it = m_state.devices.constFind(name);
        if (it != m_state.devices.constEnd()) out.push_back(it.value());
    }
    return out;
}

QStringList CatalogIndex::communityFolders(const QString& deviceName) const {
    QReadLocker lock(&m_stateLock);
    return m_state.devices.value(deviceName).communityFolders;
}

QVector<model::Preset> CatalogIndex::communityPresets(const model::DeviceRecord& rec, const QString& folder) {
    QVector<model::Preset> out;
    if (!rec.communityFolders.contains(folder)) {
        qWarning().noquote() << QString("CatalogIndex: device %1 has no community folder '%2'").arg(rec.name, folder);
        return out;
    }
    const QString path = QDir(m_root).filePath(QString("%1/community/%2.json").arg(rec.manufacturer, folder));
    const QJsonObject raw = m_cache.get(path, m_opts.communityTtlSec);
    if (raw.isEmpty()) return out;

    model::CommunityDocument doc;
    QString err;
    if (!model::CommunityDocument::fromJson(raw, &doc, &err)) {
        qWarning().noquote() << QString("CatalogIndex: invalid community document %1: %2").arg(path, err);
        return out;
    }
    for (auto p : doc.presets) {
        p.source = folder;
        out.push_back(p);
    }
    return out;
}

QVector<model::Preset> CatalogIndex::presets(const PresetQuery& query) {
    QVector<model::DeviceRecord> selected;
    {
        QReadLocker lock(&m_stateLock);
        const QString manufacturer = manufacturerKey(query.manufacturer);
        if (!query.device.isEmpty()) {
            const auto it = m_state.devices.constFind(query.device);
            if (it != m_state.devices.constEnd()
                && (manufacturer.isEmpty() || it->manufacturer == manufacturer)) {
                selected.push_back(it.value());
            }
        } else if (!manufacturer.isEmpty()) {
            for (const auto& name : m_state.deviceStructure.value(manufacturer)) {
                selected.push_back(m_state.devices.value(name));
            }
        } else {
            for (const auto& m : m_state.manufacturers) {
                for (const auto& name : m_state.deviceStructure.value(m)) {
                    selected.push_back(m_state.devices.value(name));
                }
            }
        }
    }

    QVector<model::Preset> out;
    if (!query.communityFolder.isEmpty()) {
        // Overlay documents are per manufacturer; read each one once.
        QStringList seen;
        for (const auto& rec : selected) {
            if (seen.contains(rec.manufacturer)) continue;
            seen.push_back(rec.manufacturer);
            out += communityPresets(rec, query.communityFolder);
        }
        return out;
    }
    for (const auto& rec : selected) appendPrimaryPresets(rec, &out);
    return out;
}

bool CatalogIndex::presetByName(const QString& presetName, model::Preset* out) const {
    QReadLocker lock(&m_stateLock);
    for (const auto& m : m_state.manufacturers) {
        for (const auto& name : m_state.deviceStructure.value(m)) {
            const auto it = m_state.devices.constFind(name);
            if (it == m_state.devices.constEnd()) continue;
            for (const auto& c : it->document.collections) {
                const int idx = c.indexOf(presetName);
                if (idx < 0) continue;
                if (out) {
                    *out = c.presets[idx];
                    out->source = "default";
                }
                return true;
            }
        }
    }
    return false;
}

QStringList CatalogIndex::collections(const QString& manufacturer, const QString& deviceName) const {
    QReadLocker lock(&m_stateLock);
    const auto it = m_state.devices.constFind(deviceName);
    if (it == m_state.devices.constEnd()) return {};
    if (!manufacturer.isEmpty() && it->manufacturer != manufacturerKey(manufacturer)) return {};
    return it->document.collectionKeys();
}

int CatalogIndex::deviceCount() const {
    QReadLocker lock(&m_stateLock);
    return m_state.devices.size();
}

} // namespace catalog::index
