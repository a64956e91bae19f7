#include "catalog/util/LogSink.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>

#include <cstdio>

namespace catalog::util {
namespace {

static QMutex g_mutex;
static LogSinkOptions g_opts;
static QFile g_file;
static QtMessageHandler g_previous = nullptr;
static bool g_installed = false;

static const char* levelName(QtMsgType type) {
    switch (type) {
    case QtDebugMsg: return "DEBUG";
    case QtInfoMsg: return "INFO";
    case QtWarningMsg: return "WARNING";
    case QtCriticalMsg: return "CRITICAL";
    case QtFatalMsg: return "FATAL";
    }
    return "INFO";
}

static bool openLogFile() {
    if (g_opts.filePath.isEmpty()) return true;
    QDir().mkpath(QFileInfo(g_opts.filePath).absolutePath());
    g_file.setFileName(g_opts.filePath);
    return g_file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text);
}

static void messageHandler(QtMsgType type, const QMessageLogContext&, const QString& msg) {
    if (type == QtDebugMsg && !g_opts.verbose) return;
    const QByteArray line = LogSink::formatLine(type, msg, QDateTime::currentDateTime()).toUtf8() + '\n';

    QMutexLocker lock(&g_mutex);
    if (g_opts.mirrorToStderr) {
        std::fwrite(line.constData(), 1, size_t(line.size()), stderr);
        std::fflush(stderr);
    }
    if (!g_file.isOpen()) return;
    if (g_opts.maxBytes > 0 && g_file.size() + line.size() > g_opts.maxBytes) {
        g_file.close();
        LogSink::rotateFiles(g_opts.filePath, g_opts.backups);
        if (!openLogFile()) return;
    }
    g_file.write(line);
    g_file.flush();
}

} // namespace

QString LogSink::formatLine(QtMsgType type, const QString& msg, const QDateTime& when) {
    return QString("%1 - %2 - %3").arg(when.toString(Qt::ISODateWithMs), QString::fromLatin1(levelName(type)), msg);
}

void LogSink::rotateFiles(const QString& path, int backups) {
    if (backups <= 0) {
        QFile::remove(path);
        return;
    }
    QFile::remove(QString("%1.%2").arg(path).arg(backups));
    for (int i = backups - 1; i >= 1; --i) {
        const QString from = QString("%1.%2").arg(path).arg(i);
        if (QFileInfo::exists(from)) QFile::rename(from, QString("%1.%2").arg(path).arg(i + 1));
    }
    if (QFileInfo::exists(path)) QFile::rename(path, path + ".1");
}

bool LogSink::install(const LogSinkOptions& opts) {
    QMutexLocker lock(&g_mutex);
    if (g_file.isOpen()) g_file.close();
    g_opts = opts;
    const bool ok = openLogFile();
    if (!g_installed) {
        g_previous = qInstallMessageHandler(messageHandler);
        g_installed = true;
    }
    if (!ok) {
        std::fprintf(stderr, "LogSink: cannot open %s\n", qPrintable(opts.filePath));
    }
    return ok;
}

void LogSink::uninstall() {
    QMutexLocker lock(&g_mutex);
    if (!g_installed) return;
    qInstallMessageHandler(g_previous);
    g_previous = nullptr;
    g_installed = false;
    if (g_file.isOpen()) g_file.close();
}

} // namespace catalog::util
