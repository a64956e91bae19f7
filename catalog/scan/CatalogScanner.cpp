#include "catalog/scan/CatalogScanner.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QFuture>
#include <QThread>
#include <QtConcurrent>
#include <QDebug>
#include <QtGlobal>

#include <algorithm>
#include <exception>

namespace catalog::scan {
namespace {

static bool isHidden(const QString& name) {
    return name.startsWith('.');
}

static QStringList jsonFilesIn(const QDir& dir) {
    QStringList out;
    const auto files = dir.entryInfoList(QStringList{"*.json"}, QDir::Files | QDir::Readable, QDir::Name);
    for (const auto& fi : files) out.push_back(fi.absoluteFilePath());
    return out;
}

} // namespace

CatalogScanner::CatalogScanner(cache::DocumentCache& cache)
    : CatalogScanner(cache, Options{}) {}

CatalogScanner::CatalogScanner(cache::DocumentCache& cache, const Options& opts)
    : m_cache(cache)
    , m_opts(opts) {
    m_outerPool.setMaxThreadCount(opts.outerWidth > 0 ? opts.outerWidth : defaultOuterWidth());
    m_innerPool.setMaxThreadCount(opts.innerWidth > 0 ? opts.innerWidth : defaultInnerWidth());
}

int CatalogScanner::defaultOuterWidth() {
    return qMin(32, qMax(1, QThread::idealThreadCount()) * 4);
}

int CatalogScanner::defaultInnerWidth() {
    return qMin(32, qMax(1, QThread::idealThreadCount()) * 2);
}

QStringList CatalogScanner::listManufacturers(const QString& root) {
    QStringList out;
    const QDir dir(root);
    const auto subdirs = dir.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const auto& name : subdirs) {
        if (!isHidden(name)) out.push_back(name);
    }
    return out;
}

QStringList CatalogScanner::listCommunityFolders(const QString& manufacturerDir) {
    QStringList out;
    const QDir community(QDir(manufacturerDir).filePath("community"));
    if (!community.exists()) return out;
    const auto files = community.entryInfoList(QStringList{"*.json"}, QDir::Files, QDir::Name);
    for (const auto& fi : files) out.push_back(fi.completeBaseName());
    return out;
}

QStringList CatalogScanner::listDocumentFiles(const QString& manufacturerDir) {
    const QDir dir(manufacturerDir);
    QStringList out = jsonFilesIn(dir);
    const auto subdirs = dir.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const auto& name : subdirs) {
        if (name == "community" || isHidden(name)) continue;
        out += jsonFilesIn(QDir(dir.filePath(name)));
    }
    return out;
}

CatalogScanner::FileOutcome CatalogScanner::loadFile(const QString& path) {
    FileOutcome fo;
    fo.path = path;

    if (m_cache.lookup(path, m_opts.cacheTtlSec, &fo.raw)) {
        fo.fromCache = true;
        fo.readOk = true;
    } else {
        QString err;
        fo.raw = m_cache.load(path, &fo.readOk, &err);
        if (!fo.readOk) {
            qWarning().noquote() << QString("CatalogScanner: skipping %1").arg(err);
            return fo;
        }
    }

    if (!fo.raw.value("device_info").toObject().value("name").isString()) {
        qWarning().noquote() << QString("Device file '%1' does not have a device_info.name field").arg(path);
        return fo;
    }

    QString err;
    if (!model::DeviceDocument::fromJson(fo.raw, &fo.document, &err)) {
        qWarning().noquote() << QString("CatalogScanner: skipping %1: %2").arg(path, err);
        return fo;
    }
    fo.isDevice = true;
    return fo;
}

CatalogScanner::ManufacturerOutcome CatalogScanner::scanManufacturer(const QString& root,
                                                                      const QString& manufacturer,
                                                                      bool concurrent) {
    try {
        return collectManufacturer(root, manufacturer, concurrent);
    } catch (const std::exception& e) {
        qWarning().noquote() << QString("CatalogScanner: scanning manufacturer %1 failed (%2), indexing it empty")
            .arg(manufacturer, QString::fromUtf8(e.what()));
    }
    ManufacturerOutcome empty;
    empty.manufacturer = manufacturer;
    empty.failed = true;
    return empty;
}

CatalogScanner::ManufacturerOutcome CatalogScanner::collectManufacturer(const QString& root,
                                                                         const QString& manufacturer,
                                                                         bool concurrent) {
    ManufacturerOutcome mo;
    mo.manufacturer = manufacturer;

    const QString manufacturerDir = QDir(root).filePath(manufacturer);
    const QStringList files = m_opts.documentLister ? m_opts.documentLister(manufacturerDir)
                                                    : listDocumentFiles(manufacturerDir);
    // Shared by every device of this manufacturer.
    const QStringList communityFolders = listCommunityFolders(manufacturerDir);

    QVector<FileOutcome> outcomes;
    outcomes.reserve(files.size());
    if (concurrent) {
        QVector<QFuture<FileOutcome>> futures;
        futures.reserve(files.size());
        for (const auto& path : files) {
            futures.append(QtConcurrent::run(&m_innerPool, [this, path]() { return loadFile(path); }));
        }
        for (auto& f : futures) {
            f.waitForFinished();
            outcomes.push_back(f.result());
        }
    } else {
        for (const auto& path : files) outcomes.push_back(loadFile(path));
    }

    for (const auto& fo : outcomes) {
        if (fo.fromCache) ++mo.cacheHits;
        else if (fo.readOk) mo.freshDocuments.push_back(qMakePair(fo.path, fo.raw));

        if (!fo.isDevice) {
            ++mo.skipped;
            continue;
        }
        ++mo.parsed;

        model::DeviceRecord rec;
        rec.name = fo.document.info.name;
        rec.manufacturer = manufacturer;
        rec.documentPath = fo.path;
        rec.communityFolders = communityFolders;
        rec.document = fo.document;
        mo.devices.push_back(rec);
    }
    return mo;
}

void CatalogScanner::merge(const ManufacturerOutcome& mo, ScanResult* out) {
    for (const auto& doc : mo.freshDocuments) m_cache.store(doc.first, doc.second);

    out->manufacturers.push_back(mo.manufacturer);
    QStringList& names = out->deviceStructure[mo.manufacturer];
    for (const auto& rec : mo.devices) {
        const auto prev = out->devices.constFind(rec.name);
        if (prev != out->devices.constEnd() && prev->documentPath != rec.documentPath) {
            qWarning().noquote() << QString("CatalogScanner: device name '%1' in %2 replaces the one in %3")
                .arg(rec.name, rec.documentPath, prev->documentPath);
            if (prev->manufacturer != rec.manufacturer) {
                out->deviceStructure[prev->manufacturer].removeAll(rec.name);
            }
        }
        out->devices.insert(rec.name, rec);
        if (!names.contains(rec.name)) names.push_back(rec.name);
    }
    out->stats.documentsParsed += mo.parsed;
    out->stats.documentsSkipped += mo.skipped;
    out->stats.cacheHits += mo.cacheHits;
    if (mo.failed) ++out->stats.manufacturersFailed;
}

void CatalogScanner::finalize(ScanResult* out) {
    std::sort(out->manufacturers.begin(), out->manufacturers.end());
    for (auto it = out->deviceStructure.begin(); it != out->deviceStructure.end(); ++it) {
        std::sort(it.value().begin(), it.value().end());
    }
}

ScanResult CatalogScanner::scanSequential(const QString& root) {
    QElapsedTimer timer;
    timer.start();

    ScanResult result;
    if (!QFileInfo(root).isDir()) {
        qWarning().noquote() << QString("CatalogScanner: catalog root %1 does not exist").arg(root);
        return result;
    }
    for (const auto& m : listManufacturers(root)) {
        merge(scanManufacturer(root, m, false), &result);
    }
    finalize(&result);
    result.stats.elapsedMs = timer.elapsed();
    return result;
}

ScanResult CatalogScanner::scan(const QString& root) {
    QElapsedTimer timer;
    timer.start();

    if (!QFileInfo(root).isDir()) {
        qWarning().noquote() << QString("CatalogScanner: catalog root %1 does not exist").arg(root);
        return {};
    }

    const QStringList manufacturers = listManufacturers(root);
    ScanResult result;
    try {
        QVector<QFuture<ManufacturerOutcome>> futures;
        futures.reserve(manufacturers.size());
        for (const auto& m : manufacturers) {
            futures.append(QtConcurrent::run(&m_outerPool, [this, root, m]() { return scanManufacturer(root, m, true); }));
        }
        for (auto& f : futures) {
            f.waitForFinished();
            merge(f.result(), &result);
        }
    } catch (const std::exception& e) {
        qWarning().noquote() << QString("CatalogScanner: concurrent scan failed (%1), rescanning sequentially").arg(e.what());
        m_outerPool.waitForDone();
        m_innerPool.waitForDone();
        result = scanSequential(root);
        result.stats.fallbackRan = true;
        result.stats.elapsedMs = timer.elapsed();
        return result;
    }

    finalize(&result);
    result.stats.elapsedMs = timer.elapsed();
    qInfo().noquote() << QString("CatalogScanner: %1 devices across %2 manufacturers (%3 parsed, %4 skipped, %5 cache hits, %6 failed) in %7ms")
        .arg(result.devices.size()).arg(result.manufacturers.size())
        .arg(result.stats.documentsParsed).arg(result.stats.documentsSkipped)
        .arg(result.stats.cacheHits).arg(result.stats.manufacturersFailed).arg(result.stats.elapsedMs);
    return result;
}

} // namespace catalog::scan
