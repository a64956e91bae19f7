#include "catalog/sync/GitRunner.h"
#include "catalog/sync/SyncEngine.h"

#include "catalog/tests/TestSupport.h"

#include <QCoreApplication>
#include <QHash>
#include <QSet>
#include <QTemporaryDir>
#include <QVector>

using catalog::sync::GitResult;
using catalog::sync::IGitRunner;
using catalog::sync::SyncEngine;
using catalog::sync::SyncMode;
using catalog::sync::SyncResult;
using catalog::sync::SyncSettings;

namespace {

// Scripted git: records every call, fails commands by prefix and mimics the
// filesystem effects of clone, submodule add and submodule update. Gitlinks
// (submodule entries in the parent's index) are tracked: rm --cached drops
// one, submodule add records one, and update only checks out recorded paths.
class FakeGitRunner : public IGitRunner {
public:
    struct Call {
        QString dir;
        QString command;
    };

    GitResult run(const QString& workingDir, const QStringList& args) override {
        const QString command = args.join(' ');
        calls.append(Call{workingDir, command});

        for (auto it = failures.begin(); it != failures.end(); ++it) {
            if (!command.startsWith(it.key()) || it->remaining == 0) continue;
            if (it->remaining > 0) --it->remaining;
            return GitResult{false, 1, QString(), it->stdErr};
        }
        for (auto it = responses.constBegin(); it != responses.constEnd(); ++it) {
            if (command.startsWith(it.key())) return GitResult{true, 0, it.value(), QString()};
        }

        if (command == "status --porcelain") {
            return GitResult{true, 0, porcelain.isEmpty() ? QString() : porcelain.takeFirst(), QString()};
        }
        if (command.startsWith("config --get")) return GitResult{false, 1, QString(), QString()};
        if (args.value(0) == "clone") {
            makeRepository(args.value(2));
            writeFile(QDir(args.value(2)).filePath("README.md"), "catalog\n");
        } else if (command.startsWith("rm -f --cached")) {
            gitlinks.remove(args.last());
        } else if (command.startsWith("submodule add")) {
            const QString url = args.value(args.size() - 2);
            const QString rel = args.last();
            gitlinks.insert(rel);
            makeSubmoduleCheckout(QDir(workingDir).filePath(rel));
            QFile f(QDir(workingDir).filePath(".gitmodules"));
            const bool listed = f.open(QIODevice::ReadOnly)
                && QString::fromUtf8(f.readAll()).contains(QString("path = %1\n").arg(rel));
            f.close();
            if (!listed && f.open(QIODevice::Append)) {
                f.write(QString("[submodule \"%1\"]\n\tpath = %1\n\turl = %2\n").arg(rel, url).toUtf8());
            }
        } else if (command.startsWith("submodule update")) {
            for (const QString& rel : gitlinks) {
                const QString dir = QDir(workingDir).filePath(rel);
                if (!QFileInfo::exists(dir)) makeSubmoduleCheckout(dir);
            }
        }
        return GitResult{true, 0, QString(), QString()};
    }

    // times < 0: fail every time.
    void failOn(const QString& prefix, int times = -1, const QString& stdErr = "fatal: scripted failure") {
        failures.insert(prefix, Failure{times, stdErr});
    }

    QStringList commands() const {
        QStringList out;
        for (const auto& c : calls) out.append(c.command);
        return out;
    }

    bool ran(const QString& command) const { return commands().contains(command); }

    static void makeRepository(const QString& dir) {
        writeFile(QDir(dir).filePath(".git/HEAD"), "ref: refs/heads/main\n");
    }

    static void makeSubmoduleCheckout(const QString& dir) {
        writeFile(QDir(dir).filePath(".git"), "gitdir: ../.git/modules/catalog\n");
        writeFile(QDir(dir).filePath("remote.json"), "{}\n");
    }

    struct Failure {
        int remaining = -1;
        QString stdErr;
    };

    QVector<Call> calls;
    QHash<QString, Failure> failures;
    QHash<QString, QString> responses;
    QStringList porcelain;
    QSet<QString> gitlinks;
};

struct SubmoduleFixture {
    QTemporaryDir tmp;
    QString parent;
    QString root;
    FakeGitRunner git;

    explicit SubmoduleFixture(bool registered = true) {
        parent = tmp.filePath("app");
        root = parent + "/midi-presets";
        FakeGitRunner::makeRepository(parent);
        if (registered) {
            writeFile(parent + "/.gitmodules",
                      QString("[submodule \"midi-presets\"]\n\tpath = midi-presets\n\turl = %1\n")
                          .arg(SyncEngine::kDefaultRemoteUrl).toUtf8());
            FakeGitRunner::makeSubmoduleCheckout(root);
            git.gitlinks.insert("midi-presets");
        }
    }

    SyncSettings settings() const {
        SyncSettings s;
        s.catalogRoot = root;
        s.parentRepoRoot = parent;
        return s;
    }
};

} // namespace

static void testCloneFromDefaultUrl() {
    QTemporaryDir tmp;
    const QString root = tmp.filePath("midi-presets");
    FakeGitRunner git;
    SyncSettings s;
    s.catalogRoot = root;
    SyncEngine engine(git, s);

    const SyncResult r = engine.ensureHealthy(SyncMode::Clone);
    expect(r.ok, "Clone: succeeds: " + r.message);
    expectEq(r.code, 200, "Clone: code");
    expectStrEq(r.message, "Catalog repository cloned successfully", "Clone: message");
    expectEq(git.calls.size(), 1, "Clone: single git call");
    expectStrEq(git.calls.value(0).command, QString("clone %1 %2").arg(SyncEngine::kDefaultRemoteUrl, QDir::cleanPath(root)),
                "Clone: default remote URL");
    expectStrEq(QDir::cleanPath(git.calls.value(0).dir), QDir::cleanPath(tmp.path()), "Clone: runs in the parent directory");
    expect(QFileInfo(root + "/.git").isDir(), "Clone: root is a repository");

    // Healthy clone: no destructive action, just status and pull.
    git.calls.clear();
    const SyncResult again = engine.ensureHealthy(SyncMode::Clone);
    expect(again.ok, "Clone: idempotent call succeeds");
    expectStrEq(again.message, "Catalog repository ready", "Clone: ready message");
    expectListEq(git.commands(), QStringList{"status --porcelain", "pull"}, "Clone: only status and pull");
    expect(QFileInfo::exists(root + "/README.md"), "Clone: working tree kept");
}

static void testCloneCustomUrlAndDirtyTree() {
    QTemporaryDir tmp;
    const QString root = tmp.filePath("catalog");
    FakeGitRunner::makeRepository(root);
    writeFile(root + "/Moog/local.json", "{}");

    FakeGitRunner git;
    git.porcelain << "?? Moog/local.json\n";
    SyncSettings s;
    s.catalogRoot = root;
    s.remoteUrl = "https://example.com/presets.git";
    SyncEngine engine(git, s);
    expectStrEq(engine.remoteUrl(), "https://example.com/presets.git", "Dirty: configured URL");

    const SyncResult r = engine.ensureHealthy(SyncMode::Clone);
    expect(r.ok, "Dirty: succeeds: " + r.message);
    expectListEq(git.commands(),
                 QStringList{"status --porcelain", "add .", "commit -m Auto-commit of local changes before pull", "pull"},
                 "Dirty: auto-commit before pull");
    expect(QFileInfo::exists(root + "/Moog/local.json"), "Dirty: local file kept");
}

static void testPullConflictStashes() {
    QTemporaryDir tmp;
    const QString root = tmp.filePath("catalog");
    FakeGitRunner::makeRepository(root);

    FakeGitRunner git;
    git.failOn("pull", 1, "error: cannot pull with rebase: You have unstaged changes.");
    SyncSettings s;
    s.catalogRoot = root;
    SyncEngine engine(git, s);

    const SyncResult r = engine.ensureHealthy(SyncMode::Clone);
    expect(r.ok, "Stash: recovers: " + r.message);
    expectListEq(git.commands(), QStringList{"status --porcelain", "pull", "stash", "pull", "stash pop"},
                 "Stash: stash, pull, pop");

    FakeGitRunner broken;
    broken.failOn("pull", -1, "fatal: unable to access remote");
    SyncEngine failing(broken, s);
    const SyncResult f = failing.ensureHealthy(SyncMode::Clone);
    expect(!f.ok, "Stash: other pull errors fail");
    expectEq(f.code, 500, "Stash: failure code");
    expect(f.message.contains("unable to access remote"), "Stash: git output surfaced: " + f.message);
    expect(!broken.ran("stash"), "Stash: no stash for unrelated errors");
}

static void testWrongKindOfRootIsReplaced() {
    QTemporaryDir tmp;
    const QString root = tmp.filePath("catalog");
    writeFile(root + "/junk.txt", "not a repo");

    FakeGitRunner git;
    SyncSettings s;
    s.catalogRoot = root;
    SyncEngine engine(git, s);
    const SyncResult r = engine.ensureHealthy(SyncMode::Clone);
    expect(r.ok, "Replace: non-repository root re-cloned");
    expect(!QFileInfo::exists(root + "/junk.txt"), "Replace: stale content removed");
    expect(git.ran(QString("clone %1 %2").arg(SyncEngine::kDefaultRemoteUrl, QDir::cleanPath(root))), "Replace: cloned");

    // A submodule checkout (.git file) is the wrong kind in clone mode.
    QDir(root).removeRecursively();
    FakeGitRunner::makeSubmoduleCheckout(root);
    git.calls.clear();
    const SyncResult g = engine.ensureHealthy(SyncMode::Clone);
    expect(g.ok, "Replace: gitfile root re-cloned");
    expect(QFileInfo(root + "/.git").isDir(), "Replace: now a full clone");
    expectEq(git.calls.size(), 1, "Replace: clone only");
}

static void testEnsureSubmodule() {
    SubmoduleFixture fx(false);
    SyncEngine engine(fx.git, fx.settings());
    expectStrEq(engine.submodulePath(), "midi-presets", "Submodule: relative path derived");

    const SyncResult r = engine.ensureHealthy(SyncMode::Submodule);
    expect(r.ok, "Submodule: registered and initialized: " + r.message);
    expectStrEq(r.message, "Catalog submodule ready", "Submodule: message");
    expectListEq(fx.git.commands(),
                 QStringList{QString("submodule add %1 midi-presets").arg(SyncEngine::kDefaultRemoteUrl),
                             "submodule update --init --recursive"},
                 "Submodule: add then update");
    expect(QFileInfo(fx.root + "/.git").isFile(), "Submodule: root is a submodule checkout");

    fx.git.calls.clear();
    expect(engine.ensureHealthy(SyncMode::Submodule).ok, "Submodule: idempotent");
    expectListEq(fx.git.commands(), QStringList{"submodule update --init --recursive"}, "Submodule: update only");

    // A plain clone where the submodule belongs is replaced.
    QDir(fx.root).removeRecursively();
    FakeGitRunner::makeRepository(fx.root);
    const SyncResult c = engine.ensureHealthy(SyncMode::Submodule);
    expect(c.ok, "Submodule: plain clone replaced");
    expect(QFileInfo(fx.root + "/.git").isFile(), "Submodule: checkout restored");

    QTemporaryDir notRepo;
    SyncSettings bad;
    bad.catalogRoot = notRepo.filePath("midi-presets");
    bad.parentRepoRoot = notRepo.path();
    FakeGitRunner git;
    SyncEngine orphan(git, bad);
    const SyncResult o = orphan.ensureHealthy(SyncMode::Submodule);
    expect(!o.ok && o.message.startsWith("Not a valid git repository"), "Submodule: parent must be a repository");
    expect(git.calls.isEmpty(), "Submodule: no git call without a parent repository");
}

static void testRepairStandard() {
    SubmoduleFixture fx;
    fx.git.porcelain << " M Moog/Moog_Sub37.json\n";
    SyncEngine engine(fx.git, fx.settings());

    const SyncResult r = engine.sync(SyncMode::Submodule);
    expect(r.ok, "Ladder1: succeeds: " + r.message);
    expectStrEq(r.message, "Git submodule sync completed successfully", "Ladder1: message");
    expect(fx.git.ran("commit -m Auto-commit of local changes before submodule update"), "Ladder1: local changes committed");
    expect(fx.git.ran("submodule sync"), "Ladder1: submodule sync");
    expect(!fx.git.ran("submodule deinit -f -- midi-presets"), "Ladder1: no escalation");
}

static void testRepairForce() {
    SubmoduleFixture fx;
    fx.git.failOn("submodule sync");
    SyncEngine engine(fx.git, fx.settings());

    const SyncResult r = engine.repair();
    expect(r.ok, "Ladder2: succeeds: " + r.message);
    expectStrEq(r.message, "Git submodule sync completed successfully", "Ladder2: message");
    expect(fx.git.ran("submodule deinit -f -- midi-presets"), "Ladder2: deinit");
    expect(fx.git.ran("submodule update --init --recursive --force"), "Ladder2: forced update");
    expect(!fx.git.ran("rm -f --cached midi-presets"), "Ladder2: no re-initialization");
}

static void testRepairReinitializePreservesLocalFiles() {
    SubmoduleFixture fx;
    writeFile(fx.root + "/Moog/Moog_Local.json", "{\"local\": true}");
    fx.git.failOn("submodule sync");
    fx.git.failOn("submodule deinit");
    SyncEngine engine(fx.git, fx.settings());

    const SyncResult r = engine.repair();
    expect(r.ok, "Ladder3: succeeds: " + r.message);
    expectStrEq(r.message, "Git submodule sync completed successfully with complete re-initialization", "Ladder3: message");
    expect(fx.git.ran("rm -f --cached midi-presets"), "Ladder3: index entry removed");
    expect(fx.git.ran(QString("config -f .gitmodules submodule.midi-presets.url %1").arg(SyncEngine::kDefaultRemoteUrl)),
           "Ladder3: URL rewritten");
    const QStringList cmds = fx.git.commands();
    const int removed = cmds.indexOf("rm -f --cached midi-presets");
    const int added = cmds.indexOf(QString("submodule add --force %1 midi-presets").arg(SyncEngine::kDefaultRemoteUrl));
    expect(removed >= 0 && added > removed, "Ladder3: submodule added again after its index entry is removed");
    expect(fx.git.gitlinks.contains("midi-presets"), "Ladder3: gitlink restored");
    expect(QFileInfo::exists(fx.root + "/remote.json"), "Ladder3: fresh checkout");
    expect(QFileInfo::exists(fx.root + "/Moog/Moog_Local.json"), "Ladder3: local file restored");
    expect(QFileInfo(fx.root + "/.git").isFile(), "Ladder3: fresh git metadata kept");
    expect(!QFileInfo::exists(fx.parent + "/midi-presets-temp"), "Ladder3: temporary copy removed");
}

static void testRepairAllFail() {
    SubmoduleFixture fx;
    writeFile(fx.root + "/Moog/Moog_Local.json", "{}");
    fx.git.failOn("submodule", -1, "fatal: boom");
    SyncEngine engine(fx.git, fx.settings());

    const SyncResult r = engine.repair();
    expect(!r.ok, "LadderFail: fails");
    expectEq(r.code, 500, "LadderFail: code");
    expectStrEq(r.message, "All git sync approaches failed. Last error: fatal: boom", "LadderFail: message");
    expect(QFileInfo::exists(fx.parent + "/midi-presets-temp/Moog/Moog_Local.json"), "LadderFail: local files preserved");
}

static void testResolveSubmoduleUrl() {
    SubmoduleFixture fx(false);
    writeFile(fx.parent + "/.gitmodules",
              "[submodule \"midi-presets\"]\n\tpath = midi-presets\n\turl = https://example.com/fork.git\n");
    SyncEngine engine(fx.git, fx.settings());
    expectStrEq(engine.resolveSubmoduleUrl(), SyncEngine::kDefaultRemoteUrl, "Url: mismatched URL replaced");

    fx.git.responses.insert("config --get", QString("%1\n").arg(SyncEngine::kDefaultRemoteUrl));
    expectStrEq(engine.resolveSubmoduleUrl(), SyncEngine::kDefaultRemoteUrl, "Url: configured URL used");

    SubmoduleFixture bare(false);
    SyncEngine fallback(bare.git, bare.settings());
    expectStrEq(fallback.resolveSubmoduleUrl(), SyncEngine::kDefaultRemoteUrl, "Url: default when unconfigured");
}

static void testDisabled() {
    SubmoduleFixture fx;
    SyncSettings s = fx.settings();
    s.enabled = false;
    SyncEngine engine(fx.git, s);

    for (const SyncResult& r : {engine.ensureHealthy(SyncMode::Clone), engine.sync(SyncMode::Submodule), engine.repair(),
                                engine.remoteSync(SyncMode::Clone)}) {
        expect(!r.ok, "Disabled: not successful");
        expectEq(r.code, 200, "Disabled: code");
        expectStrEq(r.message, "Sync is disabled", "Disabled: message");
    }
    expect(fx.git.calls.isEmpty(), "Disabled: no git calls");
}

static void testRemoteSync() {
    QTemporaryDir tmp;
    FakeGitRunner git;
    SyncSettings s;

    s.catalogRoot = tmp.filePath("missing");
    const SyncResult missing = SyncEngine(git, s).remoteSync(SyncMode::Clone);
    expect(!missing.ok && missing.code == 404, "Remote: missing root is 404");
    expect(missing.message.startsWith("Catalog directory not found at"), "Remote: missing message");

    s.catalogRoot = tmp.filePath("file");
    writeFile(s.catalogRoot, "x");
    expectEq(SyncEngine(git, s).remoteSync(SyncMode::Clone).code, 400, "Remote: file root is 400");

    s.catalogRoot = tmp.filePath("plain");
    QDir().mkpath(s.catalogRoot);
    const SyncResult plain = SyncEngine(git, s).remoteSync(SyncMode::Clone);
    expect(!plain.ok && plain.code == 400 && plain.message.startsWith("Not a git repository"), "Remote: non-repository is 400");
    expect(git.calls.isEmpty(), "Remote: validation before git");

    s.catalogRoot = tmp.filePath("midi-presets");
    FakeGitRunner::makeRepository(s.catalogRoot);
    const SyncResult clean = SyncEngine(git, s).remoteSync(SyncMode::Clone);
    expect(clean.ok, "Remote: clean tree ok");
    expectStrEq(clean.message, "No changes to commit in midi-presets", "Remote: clean message");
    expectListEq(git.commands(), QStringList{"add .", "status --porcelain"}, "Remote: clean tree does not commit");

    git.calls.clear();
    git.porcelain << "A  Moog/Moog_New.json\n";
    const SyncResult pushed = SyncEngine(git, s).remoteSync(SyncMode::Clone);
    expect(pushed.ok, "Remote: push ok");
    expectStrEq(pushed.message, "Successfully added, committed, and pushed changes to midi-presets", "Remote: push message");
    expectListEq(git.commands(), QStringList{"add .", "status --porcelain", "commit -m new presets", "push"},
                 "Remote: add, commit, push");

    git.calls.clear();
    git.porcelain << "A  Moog/Moog_New.json\n";
    git.failOn("push", 1, "rejected: non-fast-forward");
    const SyncResult rejected = SyncEngine(git, s).remoteSync(SyncMode::Clone);
    expect(!rejected.ok && rejected.code == 500, "Remote: push failure is 500");
    expect(rejected.message.contains("non-fast-forward"), "Remote: push error surfaced");

    SubmoduleFixture fx;
    fx.git.porcelain << "A  Moog/Moog_New.json\n";
    const SyncResult sub = SyncEngine(fx.git, fx.settings()).remoteSync(SyncMode::Submodule);
    expect(sub.ok, "Remote: submodule push ok");
    expectStrEq(fx.git.calls.last().command, "add midi-presets", "Remote: parent records new submodule commit");
    expectStrEq(QDir::cleanPath(fx.git.calls.last().dir), QDir::cleanPath(fx.parent), "Remote: in the parent repository");
}

static void testModeFromRole() {
    expect(catalog::sync::syncModeFromRole("dev") == SyncMode::Submodule, "Role: dev");
    expect(catalog::sync::syncModeFromRole(" Submodule ") == SyncMode::Submodule, "Role: submodule");
    expect(catalog::sync::syncModeFromRole("release") == SyncMode::Clone, "Role: release");
    expect(catalog::sync::syncModeFromRole(QString()) == SyncMode::Clone, "Role: default");
    expectStrEq(catalog::sync::syncModeName(SyncMode::Submodule), "submodule", "Role: name");
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    testCloneFromDefaultUrl();
    testCloneCustomUrlAndDirtyTree();
    testPullConflictStashes();
    testWrongKindOfRootIsReplaced();
    testEnsureSubmodule();
    testRepairStandard();
    testRepairForce();
    testRepairReinitializePreservesLocalFiles();
    testRepairAllFail();
    testResolveSubmoduleUrl();
    testDisabled();
    testRemoteSync();
    testModeFromRole();

    if (g_failures == 0) {
        qInfo("CatalogSyncTests: PASS");
        return 0;
    }

    qWarning("CatalogSyncTests: FAIL (%d failures)", g_failures);
    return 1;
}
