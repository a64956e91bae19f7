#include "catalog/model/DeviceDocument.h"

#include <QDateTime>
#include <QRegularExpression>
#include <QSet>

#include <algorithm>

namespace catalog::model {
namespace {

static bool fail(QString* outError, const QString& msg) {
    if (outError) *outError = msg;
    return false;
}

static QString jsonGetString(const QJsonObject& o, const char* k, const QString& def = QString()) {
    const auto v = o.value(QString::fromUtf8(k));
    if (v.isString()) return v.toString();
    return def;
}

static int jsonGetInt(const QJsonObject& o, const char* k, int def) {
    const auto v = o.value(QString::fromUtf8(k));
    if (v.isDouble()) return v.toInt();
    return def;
}

static bool jsonGetBool(const QJsonObject& o, const char* k, bool def) {
    const auto v = o.value(QString::fromUtf8(k));
    if (v.isBool()) return v.toBool();
    return def;
}

static QStringList jsonGetStringList(const QJsonObject& o, const char* k) {
    QStringList out;
    const auto v = o.value(QString::fromUtf8(k));
    if (!v.isArray()) return out;
    for (const auto& e : v.toArray()) {
        if (e.isString()) out.push_back(e.toString());
    }
    return out;
}

static QJsonArray toJsonArray(const QStringList& list) {
    QJsonArray a;
    for (const auto& s : list) a.append(s);
    return a;
}

// Copies every key of o that is not in known.
static QJsonObject unknownKeys(const QJsonObject& o, const QSet<QString>& known) {
    QJsonObject extra;
    for (auto it = o.begin(); it != o.end(); ++it) {
        if (!known.contains(it.key())) extra.insert(it.key(), it.value());
    }
    return extra;
}

static const QSet<QString>& presetKeys() {
    static const QSet<QString> k = {"preset_id", "preset_name", "category", "characters",
                                    "cc_0", "pgm", "sendmidi_command", "source"};
    return k;
}

static const QSet<QString>& collectionMetadataKeys() {
    static const QSet<QString> k = {"name", "version", "revision", "author", "description", "readonly",
                                    "preset_count", "parent_collections", "sync_status",
                                    "created_at", "modified_at"};
    return k;
}

static const QSet<QString>& documentMetadataKeys() {
    static const QSet<QString> k = {"schema_version", "file_revision", "created_by", "modified_by",
                                    "created_at", "modified_at", "migration_path", "compatibility"};
    return k;
}

static const QSet<QString>& deviceInfoKeys() {
    static const QSet<QString> k = {"name", "version", "manufacturer", "manufacturer_id", "device_id",
                                    "ports", "midi_channels", "midi_ports"};
    return k;
}

static const QSet<QString>& documentKeys() {
    static const QSet<QString> k = {"_metadata", "device_info", "capabilities", "preset_collections",
                                    // attached by the scanner in older tools, never persisted
                                    "manufacturer", "community_folders"};
    return k;
}

static CollectionMetadata collectionMetadataFromJson(const QString& key, const QJsonObject& m) {
    CollectionMetadata md;
    md.name = jsonGetString(m, "name", key);
    const auto versionV = m.value("version");
    if (versionV.isString()) md.version = versionV.toString();
    else if (versionV.isDouble()) md.version = QString::number(versionV.toDouble());
    md.revision = jsonGetInt(m, "revision", md.revision);
    md.author = jsonGetString(m, "author");
    md.description = jsonGetString(m, "description");
    md.readonly = jsonGetBool(m, "readonly", false);
    md.presetCount = jsonGetInt(m, "preset_count", 0);
    md.parentCollections = jsonGetStringList(m, "parent_collections");
    md.syncStatus = jsonGetString(m, "sync_status", md.syncStatus);
    md.createdAt = jsonGetString(m, "created_at");
    md.modifiedAt = jsonGetString(m, "modified_at");
    md.extra = unknownKeys(m, collectionMetadataKeys());
    return md;
}

static QJsonObject collectionMetadataToJson(const CollectionMetadata& md) {
    QJsonObject m = md.extra;
    m.insert("name", md.name);
    m.insert("version", md.version);
    m.insert("revision", md.revision);
    m.insert("author", md.author);
    m.insert("description", md.description);
    m.insert("readonly", md.readonly);
    m.insert("preset_count", md.presetCount);
    m.insert("parent_collections", toJsonArray(md.parentCollections));
    m.insert("sync_status", md.syncStatus);
    m.insert("created_at", md.createdAt);
    m.insert("modified_at", md.modifiedAt);
    return m;
}

static bool collectionFromJson(const QString& key, const QJsonValue& v, PresetCollection* out, QString* outError) {
    if (!v.isObject()) return fail(outError, QString("collection '%1' is not an object").arg(key));
    const auto o = v.toObject();

    PresetCollection c;
    c.key = key;
    c.metadata = collectionMetadataFromJson(key, o.value("metadata").toObject());

    const auto presetsV = o.value("presets");
    if (!presetsV.isUndefined() && !presetsV.isNull() && !presetsV.isArray()) {
        return fail(outError, QString("collection '%1': presets is not an array").arg(key));
    }
    const auto arr = presetsV.toArray();
    c.presets.reserve(arr.size());
    for (int i = 0; i < arr.size(); ++i) {
        if (!arr[i].isObject()) {
            return fail(outError, QString("collection '%1': preset #%2 is not an object").arg(key).arg(i));
        }
        Preset p;
        QString err;
        if (!presetFromJson(arr[i].toObject(), &p, &err)) {
            return fail(outError, QString("collection '%1': preset #%2: %3").arg(key).arg(i).arg(err));
        }
        c.presets.push_back(p);
    }
    c.presetMetadata = o.value("preset_metadata").toObject();
    *out = c;
    return true;
}

static QJsonObject collectionToJson(const PresetCollection& c) {
    QJsonArray presets;
    for (const auto& p : c.presets) presets.append(presetToJson(p));
    QJsonObject o;
    o.insert("metadata", collectionMetadataToJson(c.metadata));
    o.insert("presets", presets);
    o.insert("preset_metadata", c.presetMetadata);
    return o;
}

} // namespace

bool presetFromJson(const QJsonObject& o, Preset* out, QString* outError) {
    const auto nameV = o.value("preset_name");
    if (!nameV.isString() || nameV.toString().isEmpty()) return fail(outError, "missing preset_name");
    const auto pgmV = o.value("pgm");
    if (!pgmV.isDouble()) return fail(outError, QString("preset '%1': missing pgm").arg(nameV.toString()));

    Preset p;
    p.presetName = nameV.toString();
    p.pgm = pgmV.toInt();
    p.presetId = jsonGetString(o, "preset_id");
    p.category = jsonGetString(o, "category");
    p.characters = jsonGetStringList(o, "characters");
    p.sendmidiCommand = jsonGetString(o, "sendmidi_command");

    const auto ccV = o.value("cc_0");
    if (ccV.isDouble()) {
        p.cc0 = ccV.toInt();
    } else if (!ccV.isUndefined() && !ccV.isNull()) {
        return fail(outError, QString("preset '%1': cc_0 must be an integer or null").arg(p.presetName));
    }

    p.extra = unknownKeys(o, presetKeys());
    *out = p;
    return true;
}

QJsonObject presetToJson(const Preset& p) {
    QJsonObject o = p.extra;
    if (!p.presetId.isEmpty()) o.insert("preset_id", p.presetId);
    o.insert("preset_name", p.presetName);
    o.insert("category", p.category);
    o.insert("characters", toJsonArray(p.characters));
    o.insert("cc_0", p.hasCc0() ? QJsonValue(p.cc0) : QJsonValue(QJsonValue::Null));
    o.insert("pgm", p.pgm);
    if (!p.sendmidiCommand.isEmpty()) o.insert("sendmidi_command", p.sendmidiCommand);
    return o;
}

QString presetSlug(const QString& presetName) {
    static const QRegularExpression nonAlnum("[^a-z0-9]+");
    QString s = presetName.trimmed().toLower();
    s.replace(nonAlnum, "_");
    while (s.startsWith('_')) s.remove(0, 1);
    while (s.endsWith('_')) s.chop(1);
    return s.isEmpty() ? QString("preset") : s;
}

QString makePresetId(const QString& presetName, int ordinal) {
    return QString("%1_%2").arg(presetSlug(presetName)).arg(ordinal, 3, 10, QChar('0'));
}

QString nowIsoTimestamp() {
    return QDateTime::currentDateTime().toString(Qt::ISODateWithMs);
}

int PresetCollection::indexOf(const QString& presetName) const {
    for (int i = 0; i < presets.size(); ++i) {
        if (presets[i].presetName == presetName) return i;
    }
    return -1;
}

bool PresetCollection::hasPresetId(const QString& presetId) const {
    for (const auto& p : presets) {
        if (p.presetId == presetId) return true;
    }
    return presetMetadata.contains(presetId);
}

PresetCollection* DeviceDocument::collection(const QString& key) {
    for (auto& c : collections) {
        if (c.key == key) return &c;
    }
    return nullptr;
}

const PresetCollection* DeviceDocument::collection(const QString& key) const {
    for (const auto& c : collections) {
        if (c.key == key) return &c;
    }
    return nullptr;
}

PresetCollection& DeviceDocument::addCollection(const QString& key, const QString& deviceName, const QString& nowIso) {
    if (auto* existing = collection(key)) return *existing;

    PresetCollection c;
    c.key = key;
    const QString display = (key == "factory_presets") ? QString("Factory Presets") : key;
    c.metadata.name = display;
    c.metadata.author = "presetcatalog";
    c.metadata.description = QString("%1 for %2").arg(display, deviceName);
    c.metadata.createdAt = nowIso;
    c.metadata.modifiedAt = nowIso;

    auto it = std::lower_bound(collections.begin(), collections.end(), key,
                               [](const PresetCollection& a, const QString& k) { return a.key < k; });
    it = collections.insert(it, c);
    return *it;
}

bool DeviceDocument::removeCollection(const QString& key) {
    for (int i = 0; i < collections.size(); ++i) {
        if (collections[i].key == key) {
            collections.removeAt(i);
            return true;
        }
    }
    return false;
}

QStringList DeviceDocument::collectionKeys() const {
    QStringList keys;
    for (const auto& c : collections) keys.push_back(c.key);
    return keys;
}

bool DeviceDocument::fromJson(const QJsonObject& o, DeviceDocument* out, QString* outError) {
    const auto infoV = o.value("device_info");
    if (!infoV.isObject()) return fail(outError, "missing device_info");
    const auto info = infoV.toObject();
    const auto nameV = info.value("name");
    if (!nameV.isString() || nameV.toString().trimmed().isEmpty()) return fail(outError, "missing device_info.name");

    DeviceDocument d;
    d.info.name = nameV.toString();
    d.info.version = jsonGetString(info, "version");
    d.info.manufacturer = jsonGetString(info, "manufacturer");
    d.info.manufacturerId = jsonGetInt(info, "manufacturer_id", 0);
    d.info.deviceId = jsonGetInt(info, "device_id", 0);
    d.info.ports = info.value("ports").toObject();

    const auto chV = info.value("midi_channels");
    if (!chV.isUndefined() && !chV.isNull()) {
        if (!chV.isObject()) return fail(outError, "device_info.midi_channels is not an object");
        const auto ch = chV.toObject();
        for (auto it = ch.begin(); it != ch.end(); ++it) {
            if (it.value().isNull()) continue;
            if (!it.value().isDouble()) {
                return fail(outError, QString("device_info.midi_channels.%1 is not a number").arg(it.key()));
            }
            d.info.midiChannels.insert(it.key(), it.value().toInt());
        }
    }

    const auto portsV = info.value("midi_ports");
    if (!portsV.isUndefined() && !portsV.isNull()) {
        if (!portsV.isObject()) return fail(outError, "device_info.midi_ports is not an object");
        const auto ports = portsV.toObject();
        for (auto it = ports.begin(); it != ports.end(); ++it) {
            if (it.value().isNull()) continue;
            if (!it.value().isString()) {
                return fail(outError, QString("device_info.midi_ports.%1 is not a string").arg(it.key()));
            }
            d.info.midiPorts.insert(it.key(), it.value().toString());
        }
    }
    d.info.extra = unknownKeys(info, deviceInfoKeys());

    const auto mdV = o.value("_metadata");
    if (mdV.isObject()) {
        const auto md = mdV.toObject();
        const auto sv = md.value("schema_version");
        if (sv.isString()) d.metadata.schemaVersion = sv.toString();
        else if (sv.isDouble()) d.metadata.schemaVersion = QString::number(sv.toDouble());
        d.metadata.fileRevision = jsonGetInt(md, "file_revision", 0);
        d.metadata.createdBy = jsonGetString(md, "created_by");
        d.metadata.modifiedBy = jsonGetString(md, "modified_by");
        d.metadata.createdAt = jsonGetString(md, "created_at");
        d.metadata.modifiedAt = jsonGetString(md, "modified_at");
        d.metadata.migrationPath = md.value("migration_path").toArray();
        d.metadata.compatibility = md.value("compatibility").toObject();
        d.metadata.extra = unknownKeys(md, documentMetadataKeys());
    } else {
        // Documents that predate the version stamp start at revision 0.
        d.metadata.fileRevision = 0;
    }

    d.capabilities = o.value("capabilities").toObject();

    const auto pcV = o.value("preset_collections");
    if (!pcV.isUndefined() && !pcV.isNull()) {
        if (!pcV.isObject()) return fail(outError, "preset_collections is not an object");
        const auto pc = pcV.toObject();
        // QJsonObject iterates in key order, so collections stay sorted.
        for (auto it = pc.begin(); it != pc.end(); ++it) {
            PresetCollection c;
            if (!collectionFromJson(it.key(), it.value(), &c, outError)) return false;
            d.collections.push_back(c);
        }
    }

    d.extra = unknownKeys(o, documentKeys());
    *out = d;
    return true;
}

QJsonObject DeviceDocument::toJson() const {
    QJsonObject o = extra;

    QJsonObject md = metadata.extra;
    md.insert("schema_version", metadata.schemaVersion);
    md.insert("file_revision", metadata.fileRevision);
    md.insert("created_by", metadata.createdBy);
    md.insert("modified_by", metadata.modifiedBy);
    md.insert("created_at", metadata.createdAt);
    md.insert("modified_at", metadata.modifiedAt);
    md.insert("migration_path", metadata.migrationPath);
    md.insert("compatibility", metadata.compatibility);
    o.insert("_metadata", md);

    QJsonObject di = info.extra;
    di.insert("name", info.name);
    di.insert("version", info.version);
    di.insert("manufacturer", info.manufacturer);
    di.insert("manufacturer_id", info.manufacturerId);
    di.insert("device_id", info.deviceId);
    di.insert("ports", info.ports);
    QJsonObject channels;
    for (auto it = info.midiChannels.constBegin(); it != info.midiChannels.constEnd(); ++it) {
        channels.insert(it.key(), it.value());
    }
    di.insert("midi_channels", channels);
    QJsonObject ports;
    for (auto it = info.midiPorts.constBegin(); it != info.midiPorts.constEnd(); ++it) {
        ports.insert(it.key(), it.value());
    }
    di.insert("midi_ports", ports);
    o.insert("device_info", di);

    o.insert("capabilities", capabilities);

    QJsonObject pc;
    for (const auto& c : collections) pc.insert(c.key, collectionToJson(c));
    o.insert("preset_collections", pc);
    return o;
}

DeviceDocument DeviceDocument::createNew(const DeviceInfo& info, const QString& author, const QString& nowIso) {
    DeviceDocument d;
    d.info = info;
    d.metadata.fileRevision = 0;
    d.metadata.createdBy = author;
    d.metadata.modifiedBy = author;
    d.metadata.createdAt = nowIso;
    d.metadata.modifiedAt = nowIso;
    d.metadata.compatibility.insert("min_reader_version", d.metadata.schemaVersion);
    d.addCollection("factory_presets", info.name, nowIso);
    return d;
}

bool CommunityDocument::fromJson(const QJsonObject& o, CommunityDocument* out, QString* outError) {
    const auto presetsV = o.value("presets");
    if (!presetsV.isArray()) return fail(outError, "missing presets array");
    CommunityDocument d;
    const auto arr = presetsV.toArray();
    for (int i = 0; i < arr.size(); ++i) {
        Preset p;
        QString err;
        if (!arr[i].isObject() || !presetFromJson(arr[i].toObject(), &p, &err)) {
            return fail(outError, QString("preset #%1: %2").arg(i).arg(err.isEmpty() ? QString("not an object") : err));
        }
        d.presets.push_back(p);
    }
    *out = d;
    return true;
}

} // namespace catalog::model
