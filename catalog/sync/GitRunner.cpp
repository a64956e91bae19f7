#include "catalog/sync/GitRunner.h"

#include <QProcess>
#include <QProcessEnvironment>
#include <QDebug>
#include <QtGlobal>

namespace catalog::sync {

ProcessGitRunner::ProcessGitRunner(int timeoutMs, const QString& gitExecutable)
    : m_timeoutMs(timeoutMs)
    , m_git(gitExecutable) {}

GitResult ProcessGitRunner::run(const QString& workingDir, const QStringList& args) {
    GitResult r;

    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    env.insert("GIT_TERMINAL_PROMPT", "0");

    QProcess proc;
    proc.setProcessEnvironment(env);
    proc.setWorkingDirectory(workingDir);
    qDebug().noquote() << QString("git %1 (in %2)").arg(args.join(' '), workingDir);
    proc.start(m_git, args);

    if (!proc.waitForStarted()) {
        r.stdErr = QString("failed to start %1: %2").arg(m_git, proc.errorString());
        return r;
    }
    if (!proc.waitForFinished(m_timeoutMs)) {
        proc.kill();
        proc.waitForFinished();
        r.stdErr = QString("git %1 timed out after %2ms").arg(args.join(' ')).arg(m_timeoutMs);
        return r;
    }

    r.stdOut = QString::fromUtf8(proc.readAllStandardOutput());
    r.stdErr = QString::fromUtf8(proc.readAllStandardError());
    r.exitCode = proc.exitCode();
    r.ok = (proc.exitStatus() == QProcess::NormalExit && r.exitCode == 0);
    return r;
}

} // namespace catalog::sync
