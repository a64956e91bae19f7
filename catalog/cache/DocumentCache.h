#pragma once

#include <QAtomicInt>
#include <QElapsedTimer>
#include <QHash>
#include <QJsonObject>
#include <QReadWriteLock>
#include <QString>

#include <functional>

namespace catalog::cache {

/**
 * DocumentCache: parsed JSON documents memoized by absolute path.
 *
 * Each entry remembers when it was loaded; a request within ttl seconds of
 * that load is served from memory. Entries are never invalidated on write:
 * a caller that rewrites a document reads it back with readFromDisk() and
 * drops the stale entry with remove(), or wipes everything with clear().
 *
 * Threading: lookup() may be called from any thread. store(), remove() and
 * clear() are meant for one orchestrating thread; the lock only keeps
 * concurrent readers consistent with it.
 */
class DocumentCache {
public:
    // Milliseconds on any monotonic scale.
    using Clock = std::function<qint64()>;

    static constexpr int kDefaultScanTtlSec = 3600;
    static constexpr int kDefaultCommunityTtlSec = 300;

    DocumentCache();
    explicit DocumentCache(Clock clock);

    // Cached value if fresh, otherwise a disk read that is stored. Malformed or
    // missing input yields an empty object and a warning.
    QJsonObject get(const QString& path, int ttlSec);

    // Read-only lookup; never touches disk.
    bool lookup(const QString& path, int ttlSec, QJsonObject* out) const;

    // Reads and parses one file without touching any cache state.
    // Counts as a disk read when called through the instance overload.
    static QJsonObject readFromDisk(const QString& path, bool* ok = nullptr, QString* outError = nullptr);
    QJsonObject load(const QString& path, bool* ok = nullptr, QString* outError = nullptr);

    void store(const QString& path, const QJsonObject& doc);
    void remove(const QString& path);
    void clear();

    int size() const;
    int diskReads() const { return m_diskReads.loadRelaxed(); }

    static QString keyFor(const QString& path);

private:
    struct Entry {
        qint64 loadedAtMs = 0;
        QJsonObject doc;
    };

    qint64 nowMs() const { return m_clock(); }

    Clock m_clock;
    QElapsedTimer m_monotonic;
    mutable QReadWriteLock m_lock;
    QHash<QString, Entry> m_entries;
    QAtomicInt m_diskReads{0};
};

} // namespace catalog::cache
