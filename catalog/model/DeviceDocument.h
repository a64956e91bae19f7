#pragma once

#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>

namespace catalog::model {

// One preset entry, as stored in a collection's "presets" array or in a
// community document.
struct Preset {
    QString presetId;        // slug + ordinal, assigned once at creation
    QString presetName;      // unique within its collection
    QString category;
    QStringList characters;  // character tags ("Warm", "Bright", ...)
    int cc0 = -1;            // bank select; -1 => null
    int pgm = 0;             // program change
    QString sendmidiCommand; // optional pre-rendered command string

    // Not persisted: "default" for primary collections, otherwise the
    // community folder the preset came from. Filled by read accessors.
    QString source;

    // Keys this schema does not know about; written back untouched.
    QJsonObject extra;

    bool hasCc0() const { return cc0 >= 0; }
};

struct CollectionMetadata {
    QString name;
    QString version = "1.0";
    int revision = 1;
    QString author;
    QString description;
    bool readonly = false;
    int presetCount = 0;
    QStringList parentCollections;
    QString syncStatus = "synced";
    QString createdAt;
    QString modifiedAt;
    QJsonObject extra;
};

struct PresetCollection {
    QString key; // map key under preset_collections
    CollectionMetadata metadata;
    QVector<Preset> presets;
    QJsonObject presetMetadata; // preset_id -> metadata object

    int indexOf(const QString& presetName) const;
    bool hasPresetId(const QString& presetId) const;
};

struct DocumentMetadata {
    QString schemaVersion = "2.0";
    int fileRevision = 1;
    QString createdBy;
    QString modifiedBy;
    QString createdAt;
    QString modifiedAt;
    QJsonArray migrationPath;
    QJsonObject compatibility;
    QJsonObject extra;
};

struct DeviceInfo {
    QString name; // required
    QString version;
    QString manufacturer;
    int manufacturerId = 0;
    int deviceId = 0;
    QJsonObject ports;
    QHash<QString, int> midiChannels;  // direction -> channel
    QHash<QString, QString> midiPorts; // direction -> port
    QJsonObject extra;
};

// Typed view of a device document. Parsing validates the schema: a missing
// device_info.name or a preset without preset_name/pgm is a parse error.
struct DeviceDocument {
    DocumentMetadata metadata;
    DeviceInfo info;
    QJsonObject capabilities;
    QVector<PresetCollection> collections; // sorted by key
    QJsonObject extra;

    PresetCollection* collection(const QString& key);
    const PresetCollection* collection(const QString& key) const;
    PresetCollection& addCollection(const QString& key, const QString& deviceName, const QString& nowIso);
    bool removeCollection(const QString& key);
    QStringList collectionKeys() const;

    static bool fromJson(const QJsonObject& o, DeviceDocument* out, QString* outError = nullptr);
    QJsonObject toJson() const;

    // Skeleton written by create-device and directory-structure creation.
    // Starts at file_revision 0; the first write makes it 1.
    static DeviceDocument createNew(const DeviceInfo& info, const QString& author, const QString& nowIso);
};

struct CommunityDocument {
    QVector<Preset> presets;

    static bool fromJson(const QJsonObject& o, CommunityDocument* out, QString* outError = nullptr);
};

// Parses one preset entry. Shared by device and community documents.
bool presetFromJson(const QJsonObject& o, Preset* out, QString* outError = nullptr);
QJsonObject presetToJson(const Preset& p);

// "Lead 1!" -> "lead_1"
QString presetSlug(const QString& presetName);
// slug + "_" + zero-padded ordinal, e.g. "lead_1_001".
QString makePresetId(const QString& presetName, int ordinal);

QString nowIsoTimestamp();

// A device as held by the catalog index: the parsed document plus the
// provenance the scanner attaches.
struct DeviceRecord {
    QString name;
    QString manufacturer; // manufacturer directory key
    QString documentPath; // absolute path of the backing JSON
    QStringList communityFolders;
    DeviceDocument document;

    const QHash<QString, QString>& midiPorts() const { return document.info.midiPorts; }
    const QHash<QString, int>& midiChannels() const { return document.info.midiChannels; }
};

} // namespace catalog::model
