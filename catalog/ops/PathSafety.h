#pragma once

#include <QString>
#include <QStringList>

namespace catalog::ops {

// "My Synth!" -> "My_Synth", ".hidden" -> "x.hidden". Returns an empty string
// for a component that cannot be made safe (empty, ".", "..", anything
// containing "..").
QString sanitizeComponent(const QString& name);

// Canonical form of a path that may not exist yet: the deepest existing
// ancestor is symlink-resolved and the missing tail appended.
QString resolvePath(const QString& path);

// True if path, once resolved (symlinks of existing ancestors included),
// lies at or below root.
bool isWithinRoot(const QString& root, const QString& path);

// Sanitizes each component and joins them under root. Fails with a message
// naming the offending component, or if the result escapes root.
bool resolveUnderRoot(const QString& root, const QStringList& components, QString* outPath, QString* outError);

} // namespace catalog::ops
