#pragma once

#include <QString>
#include <QStringList>

namespace catalog::sync {

struct GitResult {
    bool ok = false;
    int exitCode = -1;
    QString stdOut;
    QString stdErr;

    // stderr if present, otherwise stdout; used in user-facing messages.
    QString output() const { return stdErr.trimmed().isEmpty() ? stdOut.trimmed() : stdErr.trimmed(); }
};

// Runs one git command ("git <args>") in a working directory.
class IGitRunner {
public:
    virtual ~IGitRunner() = default;

    virtual GitResult run(const QString& workingDir, const QStringList& args) = 0;
};

// Real git through QProcess. Prompts are disabled so a missing credential
// fails the command instead of hanging it.
class ProcessGitRunner : public IGitRunner {
public:
    explicit ProcessGitRunner(int timeoutMs = 120000, const QString& gitExecutable = "git");

    GitResult run(const QString& workingDir, const QStringList& args) override;

private:
    int m_timeoutMs;
    QString m_git;
};

} // namespace catalog::sync
