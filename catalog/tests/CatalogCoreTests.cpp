#include "catalog/cache/DocumentCache.h"
#include "catalog/config/CatalogConfig.h"
#include "catalog/model/DeviceDocument.h"
#include "catalog/util/LogSink.h"

#include "catalog/tests/TestSupport.h"

#include <QCoreApplication>
#include <QSettings>
#include <QTemporaryDir>

using catalog::cache::DocumentCache;
using catalog::model::DeviceDocument;
using catalog::model::Preset;

static void testCacheServesWithinTtl() {
    QTemporaryDir dir;
    expect(dir.isValid(), "Cache: temp dir");
    const QString path = dir.filePath("Moog/Sub37/Moog_Sub37.json");
    writeJson(path, deviceJson("Sub37", "Moog"));

    qint64 now = 0;
    DocumentCache cache([&now]() { return now; });

    const auto first = cache.get(path, 10);
    expectStrEq(first.value("device_info").toObject().value("name").toString(), "Sub37", "Cache: first load parses");
    expectEq(cache.diskReads(), 1, "Cache: first load reads disk");

    now += 9000;
    const auto second = cache.get(path, 10);
    expectEq(cache.diskReads(), 1, "Cache: second load within ttl is served from memory");
    expect(first == second, "Cache: cached value equals loaded value");

    // Two spellings of one file share an entry.
    cache.get(dir.filePath("Moog/./Sub37/../Sub37/Moog_Sub37.json"), 10);
    expectEq(cache.diskReads(), 1, "Cache: equivalent path hits the same entry");
    expectEq(cache.size(), 1, "Cache: one entry");
}

static void testCacheExpiryToleratesExternalWrites() {
    QTemporaryDir dir;
    const QString path = dir.filePath("doc.json");
    writeJson(path, deviceJson("Before", "Moog"));

    qint64 now = 1000;
    DocumentCache cache([&now]() { return now; });
    cache.get(path, 5);

    writeJson(path, deviceJson("After", "Moog"));
    now += 4999;
    expectStrEq(cache.get(path, 5).value("device_info").toObject().value("name").toString(), "Before",
                "Cache: external write invisible within ttl");

    now += 1;
    expectStrEq(cache.get(path, 5).value("device_info").toObject().value("name").toString(), "After",
                "Cache: external write visible after expiry");
    expectEq(cache.diskReads(), 2, "Cache: expiry re-reads disk once");

    cache.clear();
    expectEq(cache.size(), 0, "Cache: clear wipes entries");
    cache.get(path, 5);
    expectEq(cache.diskReads(), 3, "Cache: load after clear reads disk");
}

static void testCacheMalformedInput() {
    QTemporaryDir dir;
    const QString bad = dir.filePath("bad.json");
    writeFile(bad, "{ \"device_info\": ");

    DocumentCache cache;
    expect(cache.get(bad, 60).isEmpty(), "Cache: malformed JSON yields empty document");
    expect(cache.get(dir.filePath("missing.json"), 60).isEmpty(), "Cache: missing file yields empty document");
    expectEq(cache.size(), 0, "Cache: failures are not cached");

    writeFile(bad, "[1, 2, 3]");
    bool ok = true;
    QString err;
    DocumentCache::readFromDisk(bad, &ok, &err);
    expect(!ok, "Cache: non-object top level rejected");
    expect(!err.isEmpty(), "Cache: rejection carries a message");
}

static void testCacheSplitApi() {
    QTemporaryDir dir;
    const QString path = dir.filePath("x.json");
    qint64 now = 0;
    DocumentCache cache([&now]() { return now; });

    QJsonObject out;
    expect(!cache.lookup(path, 60, &out), "Cache: lookup misses on empty cache");
    cache.store(path, QJsonObject{{"k", 1}});
    expect(cache.lookup(path, 60, &out), "Cache: lookup hits after store");
    expectEq(out.value("k").toInt(), 1, "Cache: lookup returns stored value");
    expect(!cache.lookup(path, 0, &out), "Cache: ttl 0 never hits");
    expectEq(cache.diskReads(), 0, "Cache: lookup and store never touch disk");

    cache.remove(path);
    expect(!cache.lookup(path, 60, &out), "Cache: remove drops the entry");
}

static void testDocumentSchema() {
    QJsonArray presets;
    presets.append(presetJson("Lead 1", 5, 0));
    QJsonObject extraPreset = presetJson("Pad", 7);
    extraPreset.insert("vendor_tag", "x");
    presets.append(extraPreset);
    QJsonObject raw = deviceJson("Sub37", "Moog", presets);
    raw.insert("vendor_block", QJsonObject{{"a", 1}});

    DeviceDocument doc;
    QString err;
    expect(DeviceDocument::fromJson(raw, &doc, &err), "Schema: valid document parses: " + err);
    expectStrEq(doc.info.name, "Sub37", "Schema: device name");
    expectStrEq(doc.info.midiPorts.value("IN"), "Port In", "Schema: midi port");
    expectEq(doc.info.midiChannels.value("OUT"), 2, "Schema: midi channel");
    expectEq(doc.collections.size(), 1, "Schema: one collection");
    if (!doc.collections.isEmpty()) {
        const auto& c = doc.collections[0];
        expectEq(c.presets.size(), 2, "Schema: presets parsed");
        expectEq(c.presets[0].cc0, 0, "Schema: cc_0 value");
        expect(!c.presets[1].hasCc0(), "Schema: null cc_0");
        expectEq(c.indexOf("Pad"), 1, "Schema: indexOf");
    }

    const QJsonObject back = doc.toJson();
    expect(back.contains("vendor_block"), "Schema: unknown document keys survive");
    const auto backPresets = back.value("preset_collections").toObject().value("factory_presets").toObject().value("presets").toArray();
    expectStrEq(backPresets.at(1).toObject().value("vendor_tag").toString(), "x", "Schema: unknown preset keys survive");
    expect(backPresets.at(1).toObject().value("cc_0").isNull(), "Schema: null cc_0 written as null");

    QJsonObject noName = deviceJson("", "Moog");
    expect(!DeviceDocument::fromJson(noName, &doc, &err), "Schema: empty device_info.name rejected");
    expect(err.contains("device_info.name"), "Schema: error names the field");

    QJsonArray badPresets;
    badPresets.append(QJsonObject{{"preset_name", "NoPgm"}});
    expect(!DeviceDocument::fromJson(deviceJson("X", "Moog", badPresets), &doc, &err), "Schema: preset without pgm rejected");

    QJsonObject badChannels = deviceJson("X", "Moog");
    QJsonObject info = badChannels.value("device_info").toObject();
    info.insert("midi_channels", QJsonObject{{"IN", "one"}});
    badChannels.insert("device_info", info);
    expect(!DeviceDocument::fromJson(badChannels, &doc, &err), "Schema: non-numeric channel rejected");
}

static void testPresetIds() {
    expectStrEq(catalog::model::presetSlug("Lead 1!"), "lead_1", "Ids: slug");
    expectStrEq(catalog::model::presetSlug("  ***  "), "preset", "Ids: empty slug fallback");
    expectStrEq(catalog::model::makePresetId("Lead 1!", 1), "lead_1_001", "Ids: slug plus ordinal");
    expectStrEq(catalog::model::makePresetId("Bass", 42), "bass_042", "Ids: zero padded");
}

static void testNewDocument() {
    catalog::model::DeviceInfo info;
    info.name = "Sub37";
    info.manufacturer = "Moog";
    const auto doc = DeviceDocument::createNew(info, "tester", "2024-01-01T00:00:00.000");
    expectEq(doc.metadata.fileRevision, 0, "NewDocument: unwritten revision");
    const auto* c = doc.collection("factory_presets");
    expect(c != nullptr, "NewDocument: factory_presets present");
    if (c) {
        expectStrEq(c->metadata.name, "Factory Presets", "NewDocument: display name");
        expectStrEq(c->metadata.description, "Factory Presets for Sub37", "NewDocument: description");
        expectEq(c->metadata.presetCount, 0, "NewDocument: empty");
    }
}

static void testConfig() {
    QTemporaryDir dir;
    const QString ini = dir.filePath("catalog.ini");
    {
        QSettings s(ini, QSettings::IniFormat);
        auto c = catalog::config::defaultCatalogConfig();
        c.catalogRoot = "/srv/presets";
        c.role = "submodule";
        c.syncEnabled = false;
        c.scanCacheTtlSec = 120;
        c.logFile = dir.filePath("catalog.log");
        catalog::config::saveCatalogConfig(s, c);
    }
    {
        QSettings s(ini, QSettings::IniFormat);
        const auto c = catalog::config::loadCatalogConfig(s);
        expectStrEq(c.catalogRoot, "/srv/presets", "Config: root round-trips");
        expectStrEq(c.role, "submodule", "Config: role round-trips");
        expect(!c.syncEnabled, "Config: sync flag round-trips");
        expectEq(c.scanCacheTtlSec, 120, "Config: ttl round-trips");
        expectEq(c.communityCacheTtlSec, 300, "Config: unspecified ttl keeps default");
    }

    qputenv("PRESETCATALOG_ROOT", "/tmp/override");
    qputenv("PRESETCATALOG_ROLE", "dev");
    qputenv("PRESETCATALOG_SYNC", "1");
    const auto overridden = catalog::config::loadCatalogConfigFile(ini);
    expectStrEq(overridden.catalogRoot, "/tmp/override", "Config: env root wins");
    expectStrEq(overridden.role, "submodule", "Config: dev role selects submodule");
    expect(overridden.syncEnabled, "Config: env enables sync");

    qputenv("PRESETCATALOG_ROLE", "release");
    qputenv("PRESETCATALOG_SYNC", "false");
    const auto release = catalog::config::loadCatalogConfigFile(ini);
    expectStrEq(release.role, "clone", "Config: other roles select clone");
    expect(!release.syncEnabled, "Config: false disables sync");

    qunsetenv("PRESETCATALOG_ROOT");
    qunsetenv("PRESETCATALOG_ROLE");
    qunsetenv("PRESETCATALOG_SYNC");
}

static void testLogSink() {
    const QString line = catalog::util::LogSink::formatLine(QtWarningMsg, "disk full",
                                                           QDateTime(QDate(2024, 5, 1), QTime(12, 30, 0)));
    expect(line.startsWith("2024-05-01T12:30:00"), "LogSink: ISO timestamp first");
    expect(line.endsWith(" - WARNING - disk full"), "LogSink: level and message");

    QTemporaryDir dir;
    const QString path = dir.filePath("catalog.log");
    writeFile(path, "current");
    writeFile(path + ".1", "older");
    writeFile(path + ".2", "oldest");
    catalog::util::LogSink::rotateFiles(path, 2);
    expect(!QFileInfo::exists(path), "LogSink: active file rotated away");
    expect(QFileInfo::exists(path + ".1") && QFileInfo::exists(path + ".2"), "LogSink: backups kept");
    QFile f(path + ".2");
    f.open(QIODevice::ReadOnly);
    expectStrEq(QString::fromUtf8(f.readAll()), "older", "LogSink: oldest backup dropped");

    catalog::util::LogSinkOptions opts;
    opts.filePath = dir.filePath("live.log");
    opts.maxBytes = 200;
    opts.backups = 1;
    opts.mirrorToStderr = false;
    expect(catalog::util::LogSink::install(opts), "LogSink: install opens file");
    for (int i = 0; i < 10; ++i) qInfo().noquote() << QString("rotation line %1").arg(i);
    qDebug("dropped unless verbose");
    catalog::util::LogSink::uninstall();
    expect(QFileInfo::exists(opts.filePath + ".1"), "LogSink: size limit triggers rotation");
    expect(QFileInfo(opts.filePath).size() <= opts.maxBytes, "LogSink: active file within limit");
    QFile live(opts.filePath);
    live.open(QIODevice::ReadOnly);
    expect(!QString::fromUtf8(live.readAll()).contains("dropped unless verbose"), "LogSink: debug dropped");
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    testCacheServesWithinTtl();
    testCacheExpiryToleratesExternalWrites();
    testCacheMalformedInput();
    testCacheSplitApi();
    testDocumentSchema();
    testPresetIds();
    testNewDocument();
    testConfig();
    testLogSink();

    if (g_failures == 0) {
        qInfo("CatalogCoreTests: PASS");
        return 0;
    }

    qWarning("CatalogCoreTests: FAIL (%d failures)", g_failures);
    return 1;
}
