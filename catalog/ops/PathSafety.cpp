#include "catalog/ops/PathSafety.h"

#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>

namespace catalog::ops {

QString resolvePath(const QString& path) {
    QString current = QDir::cleanPath(QFileInfo(path).absoluteFilePath());
    QStringList missing;
    while (!current.isEmpty()) {
        const QFileInfo fi(current);
        if (fi.exists()) {
            QString resolved = fi.canonicalFilePath();
            for (int i = missing.size() - 1; i >= 0; --i) resolved += "/" + missing[i];
            return QDir::cleanPath(resolved);
        }
        const QString parent = fi.path();
        if (parent == current) break;
        missing.push_back(fi.fileName());
        current = parent;
    }
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

QString sanitizeComponent(const QString& name) {
    static const QRegularExpression unsafe("[^A-Za-z0-9_\\-.]");
    QString s = name.trimmed();
    s.replace(' ', '_');
    s.remove(unsafe);
    if (s.isEmpty() || s == "." || s.contains("..")) return QString();
    if (s.startsWith('.')) s.prepend('x');
    return s;
}

bool isWithinRoot(const QString& root, const QString& path) {
    const QString r = resolvePath(root);
    const QString p = resolvePath(path);
    if (p == r) return true;
    const QString prefix = r.endsWith('/') ? r : r + "/";
    return p.startsWith(prefix);
}

bool resolveUnderRoot(const QString& root, const QStringList& components, QString* outPath, QString* outError) {
    QString path = QDir::cleanPath(QFileInfo(root).absoluteFilePath());
    for (const auto& c : components) {
        const QString safe = sanitizeComponent(c);
        if (safe.isEmpty()) {
            if (outError) *outError = QString("Invalid name '%1'").arg(c);
            return false;
        }
        path += "/" + safe;
    }
    if (!isWithinRoot(root, path)) {
        if (outError) *outError = QString("Path '%1' resolves outside the catalog root").arg(path);
        return false;
    }
    if (outPath) *outPath = path;
    return true;
}

} // namespace catalog::ops
