#include "catalog/cache/DocumentCache.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QReadLocker>
#include <QWriteLocker>
#include <QDebug>
#include <QtGlobal>

namespace catalog::cache {

DocumentCache::DocumentCache() {
    m_monotonic.start();
    m_clock = [this]() { return m_monotonic.elapsed(); };
}

DocumentCache::DocumentCache(Clock clock)
    : m_clock(std::move(clock)) {
    m_monotonic.start();
    if (!m_clock) m_clock = [this]() { return m_monotonic.elapsed(); };
}

QString DocumentCache::keyFor(const QString& path) {
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

QJsonObject DocumentCache::readFromDisk(const QString& path, bool* ok, QString* outError) {
    if (ok) *ok = false;
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        if (outError) *outError = QString("cannot open %1: %2").arg(path, f.errorString());
        return {};
    }
    const QByteArray bytes = f.readAll();
    f.close();

    QJsonParseError err;
    const auto doc = QJsonDocument::fromJson(bytes, &err);
    if (err.error != QJsonParseError::NoError) {
        if (outError) *outError = QString("invalid JSON in %1 at offset %2: %3").arg(path).arg(err.offset).arg(err.errorString());
        return {};
    }
    if (!doc.isObject()) {
        if (outError) *outError = QString("%1: top-level JSON value is not an object").arg(path);
        return {};
    }
    if (ok) *ok = true;
    return doc.object();
}

QJsonObject DocumentCache::load(const QString& path, bool* ok, QString* outError) {
    m_diskReads.fetchAndAddRelaxed(1);
    return readFromDisk(path, ok, outError);
}

bool DocumentCache::lookup(const QString& path, int ttlSec, QJsonObject* out) const {
    if (ttlSec <= 0) return false;
    const QString key = keyFor(path);
    QReadLocker lock(&m_lock);
    const auto it = m_entries.constFind(key);
    if (it == m_entries.constEnd()) return false;
    if (nowMs() - it->loadedAtMs >= qint64(ttlSec) * 1000) return false;
    if (out) *out = it->doc;
    return true;
}

QJsonObject DocumentCache::get(const QString& path, int ttlSec) {
    QJsonObject cached;
    if (lookup(path, ttlSec, &cached)) return cached;

    bool ok = false;
    QString err;
    const QJsonObject doc = load(path, &ok, &err);
    if (!ok) {
        qWarning().noquote() << QString("DocumentCache: %1").arg(err);
        return {};
    }
    store(path, doc);
    return doc;
}

void DocumentCache::store(const QString& path, const QJsonObject& doc) {
    const QString key = keyFor(path);
    QWriteLocker lock(&m_lock);
    m_entries.insert(key, Entry{nowMs(), doc});
}

void DocumentCache::remove(const QString& path) {
    const QString key = keyFor(path);
    QWriteLocker lock(&m_lock);
    m_entries.remove(key);
}

void DocumentCache::clear() {
    QWriteLocker lock(&m_lock);
    m_entries.clear();
}

int DocumentCache::size() const {
    QReadLocker lock(&m_lock);
    return m_entries.size();
}

} // namespace catalog::cache
