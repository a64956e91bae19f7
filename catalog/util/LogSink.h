#pragma once

#include <QDateTime>
#include <QString>
#include <QtGlobal>

namespace catalog::util {

struct LogSinkOptions {
    QString filePath;                    // empty => no file
    qint64 maxBytes = 10 * 1024 * 1024;  // rotate once the file would exceed this
    int backups = 10;                    // file.1 .. file.N
    bool verbose = false;                // keep qDebug output
    bool mirrorToStderr = true;
};

// Routes Qt's message log (qDebug/qInfo/qWarning/...) to stderr and a
// size-rotated file. Lines read "<ISO timestamp> - <LEVEL> - <message>".
class LogSink {
public:
    static bool install(const LogSinkOptions& opts);
    static void uninstall();

    static QString formatLine(QtMsgType type, const QString& msg, const QDateTime& when);
    // path -> path.1 -> ... -> path.<backups>; the oldest is dropped.
    static void rotateFiles(const QString& path, int backups);
};

} // namespace catalog::util
