#pragma once

#include <QHash>
#include <QMutex>
#include <QString>

#include <memory>

namespace catalog::ops {

// Process-wide advisory locks keyed by resolved document path. Holders of
// the same path serialize their load-modify-write; different paths proceed
// independently. An entry lives only while some DocumentLock refers to it,
// so the table holds at most one mutex per document being written.
class DocumentLocks {
public:
    static DocumentLocks& instance();

    // Symlinks and relative spellings of one document map to one key.
    static QString keyFor(const QString& path);

    std::shared_ptr<QMutex> acquire(const QString& key);
    // Drops the caller's reference and erases the entry once unused.
    void release(const QString& key, std::shared_ptr<QMutex>* mutex);

    int size() const;

private:
    DocumentLocks() = default;

    mutable QMutex m_guard;
    QHash<QString, std::shared_ptr<QMutex>> m_locks;
};

// RAII holder for one document path.
class DocumentLock {
public:
    explicit DocumentLock(const QString& path);
    ~DocumentLock();

    DocumentLock(const DocumentLock&) = delete;
    DocumentLock& operator=(const DocumentLock&) = delete;

private:
    QString m_key;
    std::shared_ptr<QMutex> m_mutex;
};

} // namespace catalog::ops
