#include "catalog/sync/SyncEngine.h"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QDebug>
#include <QtGlobal>

namespace catalog::sync {
namespace {

static const char* const kPullConflictMarkers[] = {"You have unstaged changes", "cannot pull with rebase"};

static bool isPullConflict(const GitResult& r) {
    const QString text = r.stdErr + "\n" + r.stdOut;
    for (const char* marker : kPullConflictMarkers) {
        if (text.contains(QString::fromUtf8(marker))) return true;
    }
    return false;
}

// A full repository has a .git directory with a HEAD; a submodule checkout
// has a .git file instead.
static bool hasGitDir(const QString& dir) {
    const QFileInfo gitPath(QDir(dir).filePath(".git"));
    return gitPath.isDir() && QFileInfo::exists(QDir(gitPath.absoluteFilePath()).filePath("HEAD"));
}

static bool hasGitFile(const QString& dir) {
    return QFileInfo(QDir(dir).filePath(".git")).isFile();
}

static bool isCheckout(const QString& dir) {
    return hasGitDir(dir) || hasGitFile(dir);
}

// Copies src into dst, skipping git metadata.
static bool copyTree(const QString& src, const QString& dst) {
    if (!QDir().mkpath(dst)) return false;
    QDirIterator it(src, QDir::Files | QDir::Dirs | QDir::Hidden | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    const QDir srcDir(src);
    bool ok = true;
    while (it.hasNext()) {
        const QString path = it.next();
        const QString rel = srcDir.relativeFilePath(path);
        if (rel == ".git" || rel.startsWith(".git/")) continue;
        const QString target = QDir(dst).filePath(rel);
        if (it.fileInfo().isDir()) {
            ok = QDir().mkpath(target) && ok;
        } else {
            QDir().mkpath(QFileInfo(target).absolutePath());
            ok = QFile::copy(path, target) && ok;
        }
    }
    return ok;
}

// Copies every file of src that dst lacks. Returns the number restored.
static int restoreMissing(const QString& src, const QString& dst) {
    int restored = 0;
    QDirIterator it(src, QDir::Files | QDir::Hidden, QDirIterator::Subdirectories);
    const QDir srcDir(src);
    while (it.hasNext()) {
        const QString path = it.next();
        const QString target = QDir(dst).filePath(srcDir.relativeFilePath(path));
        if (QFileInfo::exists(target)) continue;
        QDir().mkpath(QFileInfo(target).absolutePath());
        if (QFile::copy(path, target)) ++restored;
        else qWarning().noquote() << QString("SyncEngine: could not restore %1").arg(target);
    }
    return restored;
}

} // namespace

const char* const SyncEngine::kDefaultRemoteUrl = "https://github.com/tirans/midi-presets.git";

SyncMode syncModeFromRole(const QString& role) {
    const QString r = role.trimmed().toLower();
    return (r == "dev" || r == "submodule") ? SyncMode::Submodule : SyncMode::Clone;
}

QString syncModeName(SyncMode mode) {
    return mode == SyncMode::Submodule ? QString("submodule") : QString("clone");
}

SyncEngine::SyncEngine(IGitRunner& git, const SyncSettings& settings)
    : m_git(git)
    , m_settings(settings) {
    m_settings.catalogRoot = QDir::cleanPath(QFileInfo(settings.catalogRoot).absoluteFilePath());
    if (!m_settings.parentRepoRoot.isEmpty()) {
        m_settings.parentRepoRoot = QDir::cleanPath(QFileInfo(settings.parentRepoRoot).absoluteFilePath());
    }
}

QString SyncEngine::remoteUrl() const {
    return m_settings.remoteUrl.isEmpty() ? QString::fromUtf8(kDefaultRemoteUrl) : m_settings.remoteUrl;
}

QString SyncEngine::submodulePath() const {
    if (!m_settings.submodulePath.isEmpty()) return m_settings.submodulePath;
    if (m_settings.parentRepoRoot.isEmpty()) return QFileInfo(m_settings.catalogRoot).fileName();
    return QDir(m_settings.parentRepoRoot).relativeFilePath(m_settings.catalogRoot);
}

GitResult SyncEngine::git(const QString& dir, const QStringList& args) {
    const GitResult r = m_git.run(dir, args);
    if (r.ok) {
        qInfo().noquote() << QString("SyncEngine: git %1: ok").arg(args.join(' '));
    } else {
        qWarning().noquote() << QString("SyncEngine: git %1 failed (%2): %3").arg(args.join(' ')).arg(r.exitCode).arg(r.output());
    }
    return r;
}

SyncResult SyncEngine::sync(SyncMode mode) {
    if (!m_settings.enabled) return SyncResult::disabled();
    return mode == SyncMode::Submodule ? repair() : ensureHealthy(SyncMode::Clone);
}

SyncResult SyncEngine::ensureHealthy(SyncMode mode) {
    if (!m_settings.enabled) {
        qInfo("SyncEngine: sync is disabled");
        return SyncResult::disabled();
    }
    qInfo().noquote() << QString("SyncEngine: ensuring %1 is a healthy %2").arg(m_settings.catalogRoot, syncModeName(mode));
    return mode == SyncMode::Submodule ? ensureSubmodule() : ensureClone();
}

SyncResult SyncEngine::ensureClone() {
    const QString root = m_settings.catalogRoot;
    const QString url = remoteUrl();

    if (QFileInfo::exists(root)) {
        if (hasGitFile(root)) {
            qInfo().noquote() << QString("SyncEngine: %1 is a submodule checkout, replacing it with a clone").arg(root);
            if (!QDir(root).removeRecursively()) {
                return SyncResult::failure(QString("Error ensuring catalog clone: cannot remove %1").arg(root));
            }
        } else if (hasGitDir(root)) {
            const GitResult status = git(root, {"status", "--porcelain"});
            if (!status.ok) return SyncResult::failure(QString("Error ensuring catalog clone: %1").arg(status.output()));

            if (!status.stdOut.trimmed().isEmpty()) {
                qInfo("SyncEngine: committing local changes before pull");
                const GitResult add = git(root, {"add", "."});
                if (!add.ok) return SyncResult::failure(QString("Error ensuring catalog clone: %1").arg(add.output()));
                const GitResult commit = git(root, {"commit", "-m", "Auto-commit of local changes before pull"});
                if (!commit.ok) return SyncResult::failure(QString("Error ensuring catalog clone: %1").arg(commit.output()));
            }

            const GitResult pull = git(root, {"pull"});
            if (!pull.ok) {
                if (!isPullConflict(pull)) {
                    return SyncResult::failure(QString("Error ensuring catalog clone: %1").arg(pull.output()));
                }
                qWarning("SyncEngine: pull refused, retrying with stash");
                for (const QStringList& args : {QStringList{"stash"}, QStringList{"pull"}, QStringList{"stash", "pop"}}) {
                    const GitResult r = git(root, args);
                    if (!r.ok) return SyncResult::failure(QString("Error ensuring catalog clone: %1").arg(r.output()));
                }
            }
            return SyncResult::success("Catalog repository ready");
        } else {
            qWarning().noquote() << QString("SyncEngine: %1 exists but is not a git repository, cloning fresh").arg(root);
            if (!QDir(root).removeRecursively()) {
                return SyncResult::failure(QString("Error ensuring catalog clone: cannot remove %1").arg(root));
            }
        }
    }

    const QString parentDir = QFileInfo(root).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        return SyncResult::failure(QString("Error ensuring catalog clone: cannot create %1").arg(parentDir));
    }
    qInfo().noquote() << QString("SyncEngine: cloning %1 to %2").arg(url, root);
    const GitResult clone = git(parentDir, {"clone", url, root});
    if (!clone.ok) return SyncResult::failure(QString("Error ensuring catalog clone: %1").arg(clone.output()));
    return SyncResult::success("Catalog repository cloned successfully");
}

bool SyncEngine::isRegisteredSubmodule() const {
    QFile f(QDir(m_settings.parentRepoRoot).filePath(".gitmodules"));
    if (!f.open(QIODevice::ReadOnly)) return false;
    const QString content = QString::fromUtf8(f.readAll());
    const QRegularExpression re(QString("^\\s*path\\s*=\\s*%1\\s*$").arg(QRegularExpression::escape(submodulePath())),
                                QRegularExpression::MultilineOption);
    return re.match(content).hasMatch();
}

SyncResult SyncEngine::ensureSubmodule() {
    const QString parent = m_settings.parentRepoRoot;
    if (parent.isEmpty() || !isCheckout(parent)) {
        return SyncResult::failure(QString("Not a valid git repository: %1").arg(parent));
    }
    const QString rel = submodulePath();
    const QString root = m_settings.catalogRoot;

    if (!isRegisteredSubmodule()) {
        qInfo().noquote() << QString("SyncEngine: %1 is not registered as a submodule, adding it").arg(rel);
        if (QFileInfo::exists(root) && !QDir(root).removeRecursively()) {
            return SyncResult::failure(QString("Error ensuring catalog submodule: cannot remove %1").arg(root));
        }
        const GitResult add = git(parent, {"submodule", "add", remoteUrl(), rel});
        if (!add.ok) return SyncResult::failure(QString("Error ensuring catalog submodule: %1").arg(add.output()));
    } else if (hasGitDir(root)) {
        qInfo().noquote() << QString("SyncEngine: %1 is a plain clone, re-creating it as a submodule").arg(root);
        if (!QDir(root).removeRecursively()) {
            return SyncResult::failure(QString("Error ensuring catalog submodule: cannot remove %1").arg(root));
        }
    }

    const GitResult update = git(parent, {"submodule", "update", "--init", "--recursive"});
    if (!update.ok) return SyncResult::failure(QString("Error ensuring catalog submodule: %1").arg(update.output()));
    return SyncResult::success("Catalog submodule ready");
}

SyncResult SyncEngine::repair() {
    if (!m_settings.enabled) return SyncResult::disabled();
    const QString parent = m_settings.parentRepoRoot;
    if (parent.isEmpty() || !isCheckout(parent)) {
        return SyncResult::failure(QString("Not a valid git repository: %1").arg(parent));
    }

    QString err;
    qInfo("SyncEngine: step 1: submodule sync and update");
    if (ladderStandard(&err)) return SyncResult::success("Git submodule sync completed successfully");
    qWarning().noquote() << QString("SyncEngine: standard submodule update failed: %1").arg(err);

    qInfo("SyncEngine: step 2: deinit and forced update");
    if (ladderForce(&err)) return SyncResult::success("Git submodule sync completed successfully");
    qWarning().noquote() << QString("SyncEngine: forced submodule update failed: %1").arg(err);

    qInfo("SyncEngine: step 3: complete removal and re-initialization");
    if (ladderReinitialize(&err)) {
        return SyncResult::success("Git submodule sync completed successfully with complete re-initialization");
    }
    qCritical().noquote() << QString("SyncEngine: complete re-initialization failed: %1").arg(err);
    return SyncResult::failure(QString("All git sync approaches failed. Last error: %1").arg(err));
}

bool SyncEngine::ladderStandard(QString* outError) {
    const QString parent = m_settings.parentRepoRoot;
    const QString root = m_settings.catalogRoot;

    if (isCheckout(root)) {
        const GitResult status = git(root, {"status", "--porcelain"});
        if (status.ok && !status.stdOut.trimmed().isEmpty()) {
            qInfo("SyncEngine: committing local submodule changes before update");
            if (git(root, {"add", "."}).ok) {
                git(root, {"commit", "-m", "Auto-commit of local changes before submodule update"});
            }
        }
    }

    const GitResult syncRes = git(parent, {"submodule", "sync"});
    if (!syncRes.ok) {
        *outError = syncRes.output();
        return false;
    }

    const QStringList update{"submodule", "update", "--init", "--recursive"};
    GitResult r = git(parent, update);
    if (r.ok) return true;
    if (!isPullConflict(r) || !isCheckout(root)) {
        *outError = r.output();
        return false;
    }

    qWarning("SyncEngine: submodule update refused, retrying with stash");
    r = git(root, {"stash"});
    if (r.ok) r = git(parent, update);
    if (r.ok) r = git(root, {"stash", "pop"});
    if (!r.ok) *outError = r.output();
    return r.ok;
}

bool SyncEngine::ladderForce(QString* outError) {
    const QString parent = m_settings.parentRepoRoot;
    GitResult r = git(parent, {"submodule", "deinit", "-f", "--", submodulePath()});
    if (r.ok) r = git(parent, {"submodule", "update", "--init", "--recursive", "--force"});
    if (!r.ok) *outError = r.output();
    return r.ok;
}

QString SyncEngine::resolveSubmoduleUrl() {
    const QString rel = submodulePath();
    const QString expected = remoteUrl();
    QString url;

    const GitResult cfg = m_git.run(m_settings.parentRepoRoot, {"config", "--get", QString("submodule.%1.url").arg(rel)});
    if (cfg.ok) url = cfg.stdOut.trimmed();

    if (url.isEmpty()) {
        QFile f(QDir(m_settings.parentRepoRoot).filePath(".gitmodules"));
        if (f.open(QIODevice::ReadOnly)) {
            const QString content = QString::fromUtf8(f.readAll());
            const QRegularExpression re(QString("\\[submodule\\s+\"%1\"\\][^\\[]*?url\\s*=\\s*(\\S+)")
                                            .arg(QRegularExpression::escape(rel)));
            const auto m = re.match(content);
            if (m.hasMatch()) url = m.captured(1);
        }
    }

    if (url.isEmpty()) {
        qWarning().noquote() << QString("SyncEngine: no URL configured for %1, using %2").arg(rel, expected);
        return expected;
    }
    if (url != expected) {
        qWarning().noquote() << QString("SyncEngine: submodule URL %1 does not match %2, using %2").arg(url, expected);
        return expected;
    }
    return url;
}

bool SyncEngine::ladderReinitialize(QString* outError) {
    const QString parent = m_settings.parentRepoRoot;
    const QString root = m_settings.catalogRoot;
    const QString rel = submodulePath();
    const QString url = resolveSubmoduleUrl();
    const QFileInfo rootInfo(root);
    const QString temp = QDir(rootInfo.absolutePath()).filePath(rootInfo.fileName() + "-temp");

    if (rootInfo.exists()) {
        if (QFileInfo::exists(temp)) QDir(temp).removeRecursively();
        if (copyTree(root, temp)) {
            qInfo().noquote() << QString("SyncEngine: preserved working tree in %1").arg(temp);
        } else {
            qWarning().noquote() << QString("SyncEngine: could not fully copy %1 to %2").arg(root, temp);
        }
        if (!QDir(root).removeRecursively()) {
            qWarning().noquote() << QString("SyncEngine: could not remove %1").arg(root);
        }
    }

    git(parent, {"rm", "-f", "--cached", rel});

    // The gitlink is gone from the index, so update alone would check out
    // nothing; the submodule has to be added again.
    GitResult r;
    r.ok = true;
    if (isRegisteredSubmodule()) {
        r = git(parent, {"config", "-f", ".gitmodules", QString("submodule.%1.url").arg(rel), url});
    }
    if (r.ok) r = git(parent, {"submodule", "add", "--force", url, rel});
    if (r.ok) r = git(parent, {"submodule", "update", "--init", "--recursive"});
    if (!r.ok) {
        *outError = r.output();
        return false;
    }
    if (!QFileInfo(root).isDir()) {
        *outError = QString("Submodule directory not found after re-initialization: %1").arg(root);
        return false;
    }

    if (QFileInfo(temp).isDir()) {
        const int restored = restoreMissing(temp, root);
        qInfo().noquote() << QString("SyncEngine: restored %1 local files").arg(restored);
        QDir(temp).removeRecursively();
    }
    return true;
}

SyncResult SyncEngine::remoteSync(SyncMode mode) {
    if (!m_settings.enabled) return SyncResult::disabled();

    const QString root = m_settings.catalogRoot;
    const QFileInfo fi(root);
    if (!fi.exists()) return SyncResult::failure(QString("Catalog directory not found at %1").arg(root), 404);
    if (!fi.isDir()) return SyncResult::failure(QString("Path exists but is not a directory: %1").arg(root), 400);
    if (!isCheckout(root)) return SyncResult::failure(QString("Not a git repository: %1").arg(root), 400);

    GitResult r = git(root, {"add", "."});
    if (!r.ok) return SyncResult::failure(QString("Git remote sync failed: %1").arg(r.output()));

    r = git(root, {"status", "--porcelain"});
    if (!r.ok) return SyncResult::failure(QString("Git remote sync failed: %1").arg(r.output()));
    if (r.stdOut.trimmed().isEmpty()) {
        return SyncResult::success(QString("No changes to commit in %1").arg(fi.fileName()));
    }

    r = git(root, {"commit", "-m", "new presets"});
    if (r.ok) r = git(root, {"push"});
    if (!r.ok) return SyncResult::failure(QString("Git remote sync failed: %1").arg(r.output()));

    if (mode == SyncMode::Submodule) {
        r = git(m_settings.parentRepoRoot, {"add", submodulePath()});
        if (!r.ok) return SyncResult::failure(QString("Git remote sync failed: %1").arg(r.output()));
    }
    return SyncResult::success(QString("Successfully added, committed, and pushed changes to %1").arg(fi.fileName()));
}

} // namespace catalog::sync
