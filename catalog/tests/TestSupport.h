#pragma once

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutex>
#include <QMutexLocker>
#include <QString>
#include <QStringList>
#include <QtGlobal>

namespace {

static int g_failures = 0;

static void expect(bool cond, const QString& msg) {
    if (!cond) {
        ++g_failures;
        qWarning().noquote() << "FAIL:" << msg;
    }
}

static void expectEq(int a, int b, const QString& msg) {
    expect(a == b, msg + QString(" (got %1 expected %2)").arg(a).arg(b));
}

static void expectStrEq(const QString& a, const QString& b, const QString& msg) {
    expect(a == b, msg + QString(" (got '%1' expected '%2')").arg(a, b));
}

static void expectListEq(const QStringList& a, const QStringList& b, const QString& msg) {
    expect(a == b, msg + QString(" (got [%1] expected [%2])").arg(a.join(", "), b.join(", ")));
}

static QMutex g_captureMutex;
static QStringList g_capturedWarnings;
static QtMessageHandler g_previousHandler = nullptr;

static void captureHandler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    if (type == QtWarningMsg) {
        QMutexLocker lock(&g_captureMutex);
        g_capturedWarnings.append(msg);
    }
    if (g_previousHandler) g_previousHandler(type, ctx, msg);
}

// Records qWarning output (from any thread) while in scope.
struct WarningCapture {
    WarningCapture() {
        QMutexLocker lock(&g_captureMutex);
        g_capturedWarnings.clear();
        g_previousHandler = qInstallMessageHandler(captureHandler);
    }
    ~WarningCapture() { qInstallMessageHandler(g_previousHandler); }

    WarningCapture(const WarningCapture&) = delete;
    WarningCapture& operator=(const WarningCapture&) = delete;

    bool contains(const QString& needle) const {
        QMutexLocker lock(&g_captureMutex);
        for (const auto& w : g_capturedWarnings) {
            if (w.contains(needle)) return true;
        }
        return false;
    }
};

static bool writeFile(const QString& path, const QByteArray& bytes) {
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) return false;
    return f.write(bytes) == bytes.size();
}

static bool writeJson(const QString& path, const QJsonObject& o) {
    return writeFile(path, QJsonDocument(o).toJson(QJsonDocument::Indented));
}

static QJsonObject readJson(const QString& path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) return {};
    return QJsonDocument::fromJson(f.readAll()).object();
}

static QJsonObject presetJson(const QString& name, int pgm, int cc0 = -1) {
    QJsonObject p;
    p.insert("preset_name", name);
    p.insert("category", "Lead");
    p.insert("characters", QJsonArray{"Warm"});
    p.insert("cc_0", cc0 >= 0 ? QJsonValue(cc0) : QJsonValue(QJsonValue::Null));
    p.insert("pgm", pgm);
    return p;
}

// Minimal schema-valid device document with one factory_presets collection.
static QJsonObject deviceJson(const QString& name, const QString& manufacturer, const QJsonArray& presets = QJsonArray()) {
    QJsonObject info;
    info.insert("name", name);
    info.insert("manufacturer", manufacturer);
    info.insert("version", "1.0");
    info.insert("midi_ports", QJsonObject{{"IN", "Port In"}, {"OUT", "Port Out"}});
    info.insert("midi_channels", QJsonObject{{"IN", 1}, {"OUT", 2}});

    QJsonObject md;
    md.insert("name", "Factory Presets");
    md.insert("preset_count", presets.size());
    QJsonObject coll;
    coll.insert("metadata", md);
    coll.insert("presets", presets);
    coll.insert("preset_metadata", QJsonObject());

    QJsonObject doc;
    doc.insert("_metadata", QJsonObject{{"schema_version", "2.0"}, {"file_revision", 1}});
    doc.insert("device_info", info);
    doc.insert("capabilities", QJsonObject());
    doc.insert("preset_collections", QJsonObject{{"factory_presets", coll}});
    return doc;
}

static QJsonObject communityJson(const QJsonArray& presets) {
    return QJsonObject{{"presets", presets}};
}

} // namespace
