#pragma once

#include <QHash>
#include <QJsonObject>
#include <QPair>
#include <QString>
#include <QStringList>
#include <QThreadPool>
#include <QVector>

#include <functional>

#include "catalog/cache/DocumentCache.h"
#include "catalog/model/DeviceDocument.h"

namespace catalog::scan {

struct ScanStats {
    int documentsParsed = 0;
    int documentsSkipped = 0;
    int cacheHits = 0;
    int manufacturersFailed = 0; // listing or fan-out threw; indexed as empty
    qint64 elapsedMs = 0;
    bool fallbackRan = false;
};

// Everything one scan produces. A scan result always replaces the previous
// one wholesale.
struct ScanResult {
    QHash<QString, model::DeviceRecord> devices; // device name -> record
    QStringList manufacturers;                   // sorted
    QHash<QString, QStringList> deviceStructure; // manufacturer -> sorted device names
    ScanStats stats;
};

/**
 * CatalogScanner: walks <root>/<manufacturer>/[<device>/]*.json and builds a
 * ScanResult.
 *
 * Two-level fan-out: one task per manufacturer on the outer pool, one task
 * per document on the inner pool. Workers only read (cache lookup, disk read,
 * parse); the cache and the result maps are written by the calling thread as
 * each manufacturer future completes.
 */
class CatalogScanner {
public:
    struct Options {
        int cacheTtlSec = cache::DocumentCache::kDefaultScanTtlSec;
        int outerWidth = 0; // 0 => min(32, 4 x ideal thread count)
        int innerWidth = 0; // 0 => min(32, 2 x ideal thread count)
        // Lists the documents of one manufacturer directory; empty =>
        // listDocumentFiles().
        std::function<QStringList(const QString& manufacturerDir)> documentLister;
    };

    explicit CatalogScanner(cache::DocumentCache& cache);
    CatalogScanner(cache::DocumentCache& cache, const Options& opts);

    // Never fails: a manufacturer that throws is indexed with no devices, and
    // anything else thrown on the concurrent path falls back to
    // scanSequential().
    ScanResult scan(const QString& root);
    ScanResult scanSequential(const QString& root);

    int outerWidth() const { return m_outerPool.maxThreadCount(); }
    int innerWidth() const { return m_innerPool.maxThreadCount(); }

    static int defaultOuterWidth();
    static int defaultInnerWidth();

    // Basenames of <manufacturerDir>/community/*.json, sorted.
    static QStringList listCommunityFolders(const QString& manufacturerDir);
    // JSON files directly under manufacturerDir and under each device
    // subdirectory except community/ and hidden ones.
    static QStringList listDocumentFiles(const QString& manufacturerDir);
    static QStringList listManufacturers(const QString& root);

private:
    struct FileOutcome {
        QString path;
        bool fromCache = false;
        bool readOk = false;      // valid JSON object
        bool isDevice = false;    // passed schema validation
        QJsonObject raw;
        model::DeviceDocument document;
    };

    struct ManufacturerOutcome {
        QString manufacturer;
        QVector<model::DeviceRecord> devices;
        QVector<QPair<QString, QJsonObject>> freshDocuments; // to publish into the cache
        int parsed = 0;
        int skipped = 0;
        int cacheHits = 0;
        bool failed = false;
    };

    FileOutcome loadFile(const QString& path);
    // Never throws: a failure yields an empty, failed outcome.
    ManufacturerOutcome scanManufacturer(const QString& root, const QString& manufacturer, bool concurrent);
    ManufacturerOutcome collectManufacturer(const QString& root, const QString& manufacturer, bool concurrent);
    void merge(const ManufacturerOutcome& mo, ScanResult* out);
    static void finalize(ScanResult* out);

    cache::DocumentCache& m_cache;
    Options m_opts;
    QThreadPool m_outerPool;
    QThreadPool m_innerPool;
};

} // namespace catalog::scan
