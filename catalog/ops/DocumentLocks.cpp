#include "catalog/ops/DocumentLocks.h"

#include "catalog/ops/PathSafety.h"

#include <QMutexLocker>

namespace catalog::ops {

DocumentLocks& DocumentLocks::instance() {
    static DocumentLocks locks;
    return locks;
}

QString DocumentLocks::keyFor(const QString& path) {
    return resolvePath(path);
}

std::shared_ptr<QMutex> DocumentLocks::acquire(const QString& key) {
    QMutexLocker lock(&m_guard);
    auto& slot = m_locks[key];
    if (!slot) slot = std::make_shared<QMutex>();
    return slot;
}

void DocumentLocks::release(const QString& key, std::shared_ptr<QMutex>* mutex) {
    QMutexLocker lock(&m_guard);
    mutex->reset();
    auto it = m_locks.find(key);
    // Only the table's own reference left: nobody holds or waits on it.
    if (it != m_locks.end() && it.value().use_count() == 1) m_locks.erase(it);
}

int DocumentLocks::size() const {
    QMutexLocker lock(&m_guard);
    return int(m_locks.size());
}

DocumentLock::DocumentLock(const QString& path)
    : m_key(DocumentLocks::keyFor(path)),
      m_mutex(DocumentLocks::instance().acquire(m_key)) {
    m_mutex->lock();
}

DocumentLock::~DocumentLock() {
    m_mutex->unlock();
    DocumentLocks::instance().release(m_key, &m_mutex);
}

} // namespace catalog::ops
