#pragma once

#include <QString>

#include "catalog/sync/GitRunner.h"

namespace catalog::sync {

enum class SyncMode {
    Clone,     // independent clone of the remote (release default)
    Submodule  // submodule of the parent repository (development)
};

// "dev" and "submodule" select Submodule; anything else selects Clone.
SyncMode syncModeFromRole(const QString& role);
QString syncModeName(SyncMode mode);

// (success, message, code). Codes: 200 ok, 400 not a directory / not a
// repository, 404 root missing, 500 git failure.
struct SyncResult {
    bool ok = false;
    QString message;
    int code = 500;

    static SyncResult success(const QString& msg) { return SyncResult{true, msg, 200}; }
    static SyncResult failure(const QString& msg, int code = 500) { return SyncResult{false, msg, code}; }
    static SyncResult disabled() { return SyncResult{false, "Sync is disabled", 200}; }
};

struct SyncSettings {
    QString catalogRoot;    // working tree being synchronized
    QString parentRepoRoot; // submodule mode: the superproject
    QString submodulePath;  // relative to parentRepoRoot; derived from catalogRoot if empty
    QString remoteUrl;      // empty => kDefaultRemoteUrl
    bool enabled = true;
};

/**
 * SyncEngine: keeps the catalog root a healthy clone or submodule of the
 * remote.
 *
 * ensureHealthy() is idempotent and only destroys a root that is the wrong
 * kind of checkout. repair() is the escalating ladder for submodule mode:
 * sync+update, then deinit+forced update, then remove and re-register
 * (keeping local files the fresh checkout lacks). remoteSync() pushes local
 * edits upstream.
 */
class SyncEngine {
public:
    static const char* const kDefaultRemoteUrl;

    SyncEngine(IGitRunner& git, const SyncSettings& settings);

    SyncResult ensureHealthy(SyncMode mode);
    SyncResult repair();
    SyncResult remoteSync(SyncMode mode);

    // Role-driven entry point: clone mode runs ensureHealthy(Clone),
    // submodule mode runs the repair ladder.
    SyncResult sync(SyncMode mode);

    QString remoteUrl() const;
    QString submodulePath() const;
    // Submodule URL from git config, then .gitmodules, then the default;
    // a URL other than the expected remote is replaced by it.
    QString resolveSubmoduleUrl();

private:
    SyncResult ensureClone();
    SyncResult ensureSubmodule();

    bool ladderStandard(QString* outError);
    bool ladderForce(QString* outError);
    bool ladderReinitialize(QString* outError);

    bool isRegisteredSubmodule() const;
    GitResult git(const QString& dir, const QStringList& args);

    IGitRunner& m_git;
    SyncSettings m_settings;
};

} // namespace catalog::sync
