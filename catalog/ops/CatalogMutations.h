#pragma once

#include <QHash>
#include <QString>
#include <QStringList>

#include "catalog/index/CatalogIndex.h"
#include "catalog/model/CatalogTypes.h"
#include "catalog/model/DeviceDocument.h"

namespace catalog::ops {

struct DeviceSpec {
    QString name;
    QString manufacturer;
    QString version = "1.0";
    int manufacturerId = 0;
    int deviceId = 0;
    QHash<QString, QString> midiPorts;  // empty => {"IN": "", "OUT": ""}
    QHash<QString, int> midiChannels;   // empty => {"IN": 1, "OUT": 1}
};

struct PresetSpec {
    QString manufacturer;
    QString device;
    QString collection = "factory_presets";
    QString presetName;
    QString category;
    QStringList characters;
    int cc0 = -1; // -1 => null
    int pgm = 0;
    QString sendmidiCommand;
    int expectedRevision = -1; // >= 0 => must match _metadata.file_revision
};

// Fields left at their defaults are not touched.
struct CollectionUpdate {
    QString description;
    QString version;
    QString author;
    int readonly = -1; // -1 unchanged, 0 false, 1 true
    bool setParentCollections = false;
    QStringList parentCollections;
    int expectedRevision = -1;
};

struct DirectoryStatus {
    bool ok = false;
    QString message;
    bool manufacturerExists = false;
    bool deviceExists = false;
    bool jsonExists = false;
    bool created = false;
    QString manufacturerPath;
    QString devicePath;
    QString jsonPath;
};

/**
 * CatalogMutations: create/update/delete against the documents behind a
 * CatalogIndex.
 *
 * Each operation validates, resolves a path that must stay under the catalog
 * root, reloads the document from disk (never from the cache), applies the
 * change in memory and replaces the whole file through QSaveFile. Writes to
 * one document are serialized by a per-path lock. Successful mutations end
 * with a rescan so the index reflects disk.
 */
class CatalogMutations {
public:
    explicit CatalogMutations(index::CatalogIndex& index, const QString& author = "presetcatalog");

    OpResult createManufacturer(const QString& name);
    OpResult deleteManufacturer(const QString& name);

    OpResult createDevice(const DeviceSpec& spec);
    OpResult deleteDevice(const QString& manufacturer, const QString& deviceName);

    OpResult createPreset(const PresetSpec& spec);
    OpResult updatePreset(const PresetSpec& spec);
    OpResult deletePreset(const QString& manufacturer, const QString& deviceName, const QString& collection,
                          const QString& presetName, int expectedRevision = -1);

    OpResult createCollection(const QString& manufacturer, const QString& deviceName, const QString& collection);
    OpResult updateCollection(const QString& manufacturer, const QString& deviceName, const QString& collection,
                              const CollectionUpdate& update);
    OpResult renameCollection(const QString& manufacturer, const QString& deviceName, const QString& collection,
                              const QString& newName, int expectedRevision = -1);
    OpResult deleteCollection(const QString& manufacturer, const QString& deviceName, const QString& collection,
                              int expectedRevision = -1);
    QStringList listCollections(const QString& manufacturer, const QString& deviceName) const;

    DirectoryStatus checkDirectoryStructure(const QString& manufacturer, const QString& deviceName, bool createIfMissing);

    // <manufacturer>_<device>.json, both components sanitized; empty if either
    // cannot be sanitized.
    static QString documentFileName(const QString& manufacturer, const QString& deviceName);

private:
    bool locateDevice(const QString& manufacturer, const QString& deviceName, model::DeviceRecord* out, OpResult* fail) const;
    bool loadDocument(const QString& path, model::DeviceDocument* out, OpResult* fail) const;
    bool writeDocument(const QString& path, model::DeviceDocument* doc, OpResult* fail);
    void refresh(const QString& writtenPath);

    index::CatalogIndex& m_index;
    QString m_author;
};

} // namespace catalog::ops
