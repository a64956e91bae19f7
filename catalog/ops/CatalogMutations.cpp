#include "catalog/ops/CatalogMutations.h"

#include "catalog/cache/DocumentCache.h"
#include "catalog/ops/DocumentLocks.h"
#include "catalog/ops/PathSafety.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>
#include <QDebug>
#include <QtGlobal>

namespace catalog::ops {
namespace {

static bool checkRevision(const model::DeviceDocument& doc, int expected, const QString& path, OpResult* fail) {
    if (expected < 0 || doc.metadata.fileRevision == expected) return true;
    *fail = OpResult::failure(ErrorKind::Conflict,
                              QString("Document %1 is at revision %2, expected %3")
                                  .arg(path).arg(doc.metadata.fileRevision).arg(expected));
    return false;
}

static bool validMidiValue(int v) {
    return v >= 0 && v <= 127;
}

static bool validatePresetSpec(const PresetSpec& spec, OpResult* fail) {
    if (spec.presetName.trimmed().isEmpty()) {
        *fail = OpResult::failure(ErrorKind::Validation, "Preset name is required");
        return false;
    }
    if (spec.manufacturer.isEmpty() || spec.device.isEmpty()) {
        *fail = OpResult::failure(ErrorKind::Validation, "Manufacturer and device are required");
        return false;
    }
    if (!validMidiValue(spec.pgm)) {
        *fail = OpResult::failure(ErrorKind::Validation, QString("pgm %1 is outside 0-127").arg(spec.pgm));
        return false;
    }
    if (spec.cc0 != -1 && !validMidiValue(spec.cc0)) {
        *fail = OpResult::failure(ErrorKind::Validation, QString("cc_0 %1 is outside 0-127").arg(spec.cc0));
        return false;
    }
    return true;
}

static void applyPresetFields(const PresetSpec& spec, model::Preset* p) {
    p->presetName = spec.presetName;
    p->category = spec.category;
    p->characters = spec.characters;
    p->cc0 = spec.cc0;
    p->pgm = spec.pgm;
    p->sendmidiCommand = spec.sendmidiCommand;
}

static QString collectionKeyOf(const PresetSpec& spec) {
    return spec.collection.isEmpty() ? QString("factory_presets") : spec.collection;
}

static void touchCollection(model::PresetCollection* c, const QString& now) {
    c->metadata.presetCount = c->presets.size();
    c->metadata.modifiedAt = now;
}

} // namespace

CatalogMutations::CatalogMutations(index::CatalogIndex& index, const QString& author)
    : m_index(index)
    , m_author(author) {}

QString CatalogMutations::documentFileName(const QString& manufacturer, const QString& deviceName) {
    const QString m = sanitizeComponent(manufacturer);
    const QString d = sanitizeComponent(deviceName);
    if (m.isEmpty() || d.isEmpty()) return QString();
    return QString("%1_%2.json").arg(m, d);
}

bool CatalogMutations::locateDevice(const QString& manufacturer, const QString& deviceName,
                                    model::DeviceRecord* out, OpResult* fail) const {
    // Callers may pass the display name ("Dave Smith") or the directory key.
    const QStringList manufacturers = m_index.manufacturers();
    const QString key = manufacturers.contains(manufacturer) ? manufacturer : sanitizeComponent(manufacturer);
    if (key.isEmpty() || !manufacturers.contains(key)) {
        *fail = OpResult::failure(ErrorKind::NotFound, QString("Manufacturer '%1' not found").arg(manufacturer));
        return false;
    }
    model::DeviceRecord rec;
    if (!m_index.device(deviceName, &rec) || rec.manufacturer != key) {
        *fail = OpResult::failure(ErrorKind::NotFound, QString("Device '%1' not found").arg(deviceName));
        return false;
    }
    if (!isWithinRoot(m_index.root(), rec.documentPath)) {
        *fail = OpResult::failure(ErrorKind::Validation,
                                  QString("Document for device '%1' resolves outside the catalog root").arg(deviceName));
        return false;
    }
    *out = rec;
    return true;
}

bool CatalogMutations::loadDocument(const QString& path, model::DeviceDocument* out, OpResult* fail) const {
    bool ok = false;
    QString err;
    const QJsonObject raw = cache::DocumentCache::readFromDisk(path, &ok, &err);
    if (!ok) {
        *fail = OpResult::failure(QFileInfo::exists(path) ? ErrorKind::Parse : ErrorKind::Io, err);
        return false;
    }
    if (!model::DeviceDocument::fromJson(raw, out, &err)) {
        *fail = OpResult::failure(ErrorKind::Parse, QString("%1: %2").arg(path, err));
        return false;
    }
    return true;
}

bool CatalogMutations::writeDocument(const QString& path, model::DeviceDocument* doc, OpResult* fail) {
    doc->metadata.fileRevision += 1;
    doc->metadata.modifiedAt = model::nowIsoTimestamp();
    doc->metadata.modifiedBy = m_author;

    const QByteArray bytes = QJsonDocument(doc->toJson()).toJson(QJsonDocument::Indented);
    QSaveFile f(path);
    if (!f.open(QIODevice::WriteOnly)) {
        *fail = OpResult::failure(ErrorKind::Io, QString("Cannot write %1: %2").arg(path, f.errorString()));
        return false;
    }
    if (f.write(bytes) != bytes.size()) {
        const QString err = f.errorString();
        f.cancelWriting();
        *fail = OpResult::failure(ErrorKind::Io, QString("Cannot write %1: %2").arg(path, err));
        return false;
    }
    if (!f.commit()) {
        *fail = OpResult::failure(ErrorKind::Io, QString("Cannot replace %1: %2").arg(path, f.errorString()));
        return false;
    }
    return true;
}

void CatalogMutations::refresh(const QString& writtenPath) {
    if (!writtenPath.isEmpty()) m_index.cache().remove(writtenPath);
    m_index.rescan();
}

OpResult CatalogMutations::createManufacturer(const QString& name) {
    QString path;
    QString err;
    if (!resolveUnderRoot(m_index.root(), QStringList{name}, &path, &err)) {
        qWarning().noquote() << QString("CatalogMutations: rejected manufacturer '%1': %2").arg(name, err);
        return OpResult::failure(ErrorKind::Validation, err);
    }
    if (QFileInfo::exists(path)) {
        return OpResult::failure(ErrorKind::Validation,
                                 QString("Manufacturer '%1' already exists").arg(QFileInfo(path).fileName()));
    }
    if (!QDir().mkpath(path)) {
        return OpResult::failure(ErrorKind::Io, QString("Cannot create directory %1").arg(path));
    }
    refresh(QString());
    qInfo().noquote() << QString("CatalogMutations: created manufacturer %1").arg(path);
    return OpResult::success(QString("Manufacturer '%1' created successfully").arg(QFileInfo(path).fileName()), path);
}

OpResult CatalogMutations::deleteManufacturer(const QString& name) {
    QString path;
    QString err;
    if (!resolveUnderRoot(m_index.root(), QStringList{name}, &path, &err)) {
        return OpResult::failure(ErrorKind::Validation, err);
    }
    if (!QFileInfo(path).isDir()) {
        return OpResult::failure(ErrorKind::NotFound, QString("Manufacturer '%1' not found").arg(name));
    }
    if (!QDir(path).removeRecursively()) {
        return OpResult::failure(ErrorKind::Io, QString("Cannot remove %1").arg(path));
    }
    m_index.cache().clear();
    refresh(QString());
    qInfo().noquote() << QString("CatalogMutations: deleted manufacturer %1").arg(path);
    return OpResult::success(QString("Manufacturer '%1' deleted successfully").arg(name));
}

OpResult CatalogMutations::createDevice(const DeviceSpec& spec) {
    if (spec.name.trimmed().isEmpty()) return OpResult::failure(ErrorKind::Validation, "Device name is required");
    if (spec.manufacturer.trimmed().isEmpty()) return OpResult::failure(ErrorKind::Validation, "Manufacturer is required");

    const QString fileName = documentFileName(spec.manufacturer, spec.name);
    QString path;
    QString err;
    if (fileName.isEmpty()
        || !resolveUnderRoot(m_index.root(), QStringList{spec.manufacturer, spec.name, fileName}, &path, &err)) {
        if (err.isEmpty()) err = QString("Invalid manufacturer or device name '%1/%2'").arg(spec.manufacturer, spec.name);
        qWarning().noquote() << QString("CatalogMutations: rejected device: %1").arg(err);
        return OpResult::failure(ErrorKind::Validation, err);
    }

    const QFileInfo fi(path);
    const QString deviceDir = fi.absolutePath();
    const QString manufacturerDir = QFileInfo(deviceDir).absolutePath();
    if (!QFileInfo(manufacturerDir).isDir()) {
        return OpResult::failure(ErrorKind::NotFound, QString("Manufacturer '%1' not found").arg(spec.manufacturer));
    }
    if (m_index.device(spec.name, nullptr)) {
        return OpResult::failure(ErrorKind::Validation, QString("Device '%1' already exists").arg(spec.name));
    }
    if (fi.exists()) {
        return OpResult::failure(ErrorKind::Validation, QString("Device file %1 already exists").arg(path));
    }
    if (!QDir().mkpath(deviceDir)) {
        return OpResult::failure(ErrorKind::Io, QString("Cannot create directory %1").arg(deviceDir));
    }

    model::DeviceInfo info;
    info.name = spec.name;
    info.manufacturer = spec.manufacturer;
    info.version = spec.version;
    info.manufacturerId = spec.manufacturerId;
    info.deviceId = spec.deviceId;
    info.midiPorts = spec.midiPorts;
    if (info.midiPorts.isEmpty()) {
        info.midiPorts.insert("IN", QString());
        info.midiPorts.insert("OUT", QString());
    }
    info.midiChannels = spec.midiChannels;
    if (info.midiChannels.isEmpty()) {
        info.midiChannels.insert("IN", 1);
        info.midiChannels.insert("OUT", 1);
    }

    DocumentLock lock(path);
    auto doc = model::DeviceDocument::createNew(info, m_author, model::nowIsoTimestamp());
    OpResult fail;
    if (!writeDocument(path, &doc, &fail)) return fail;

    refresh(path);
    qInfo().noquote() << QString("CatalogMutations: created device %1").arg(path);
    return OpResult::success(QString("Device '%1' created successfully").arg(spec.name), path);
}

OpResult CatalogMutations::deleteDevice(const QString& manufacturer, const QString& deviceName) {
    model::DeviceRecord rec;
    OpResult fail;
    if (!locateDevice(manufacturer, deviceName, &rec, &fail)) return fail;

    const QString docDir = QFileInfo(rec.documentPath).absolutePath();
    const QString manufacturerDir = QDir(m_index.root()).filePath(rec.manufacturer);
    DocumentLock lock(rec.documentPath);
    if (QDir::cleanPath(docDir) == QDir::cleanPath(QFileInfo(manufacturerDir).absoluteFilePath())) {
        // Flat layout: the document sits next to its siblings.
        if (!QFile::remove(rec.documentPath)) {
            return OpResult::failure(ErrorKind::Io, QString("Cannot remove %1").arg(rec.documentPath));
        }
    } else if (!QDir(docDir).removeRecursively()) {
        return OpResult::failure(ErrorKind::Io, QString("Cannot remove %1").arg(docDir));
    }

    refresh(rec.documentPath);
    qInfo().noquote() << QString("CatalogMutations: deleted device %1").arg(rec.documentPath);
    return OpResult::success(QString("Device '%1' deleted successfully").arg(deviceName));
}

OpResult CatalogMutations::createPreset(const PresetSpec& spec) {
    OpResult fail;
    if (!validatePresetSpec(spec, &fail)) return fail;
    model::DeviceRecord rec;
    if (!locateDevice(spec.manufacturer, spec.device, &rec, &fail)) return fail;

    DocumentLock lock(rec.documentPath);
    model::DeviceDocument doc;
    if (!loadDocument(rec.documentPath, &doc, &fail)) return fail;
    if (!checkRevision(doc, spec.expectedRevision, rec.documentPath, &fail)) return fail;

    const QString now = model::nowIsoTimestamp();
    const QString key = collectionKeyOf(spec);
    auto& c = doc.addCollection(key, doc.info.name, now);
    if (c.metadata.readonly) {
        return OpResult::failure(ErrorKind::Validation, QString("Collection '%1' is read-only").arg(key));
    }
    if (c.indexOf(spec.presetName) >= 0) {
        return OpResult::failure(ErrorKind::Validation,
                                 QString("Preset '%1' already exists in collection '%2'").arg(spec.presetName, key));
    }

    model::Preset p;
    applyPresetFields(spec, &p);
    int ordinal = c.presets.size() + 1;
    while (c.hasPresetId(model::makePresetId(spec.presetName, ordinal))) ++ordinal;
    p.presetId = model::makePresetId(spec.presetName, ordinal);
    c.presets.push_back(p);

    QJsonObject pm;
    pm.insert("created_at", now);
    pm.insert("modified_at", now);
    pm.insert("author", m_author);
    c.presetMetadata.insert(p.presetId, pm);
    touchCollection(&c, now);

    if (!writeDocument(rec.documentPath, &doc, &fail)) return fail;
    refresh(rec.documentPath);
    return OpResult::success(QString("Preset '%1' created successfully").arg(spec.presetName), rec.documentPath);
}

OpResult CatalogMutations::updatePreset(const PresetSpec& spec) {
    OpResult fail;
    if (!validatePresetSpec(spec, &fail)) return fail;
    model::DeviceRecord rec;
    if (!locateDevice(spec.manufacturer, spec.device, &rec, &fail)) return fail;

    DocumentLock lock(rec.documentPath);
    model::DeviceDocument doc;
    if (!loadDocument(rec.documentPath, &doc, &fail)) return fail;
    if (!checkRevision(doc, spec.expectedRevision, rec.documentPath, &fail)) return fail;

    const QString key = collectionKeyOf(spec);
    auto* c = doc.collection(key);
    if (!c) return OpResult::failure(ErrorKind::NotFound, QString("Collection '%1' not found").arg(key));
    const int idx = c->indexOf(spec.presetName);
    if (idx < 0) {
        return OpResult::failure(ErrorKind::NotFound,
                                 QString("Preset '%1' not found in collection '%2'").arg(spec.presetName, key));
    }
    if (c->metadata.readonly) {
        return OpResult::failure(ErrorKind::Validation, QString("Collection '%1' is read-only").arg(key));
    }

    const QString now = model::nowIsoTimestamp();
    auto& p = c->presets[idx];
    applyPresetFields(spec, &p);
    if (!p.presetId.isEmpty()) {
        QJsonObject pm = c->presetMetadata.value(p.presetId).toObject();
        pm.insert("modified_at", now);
        c->presetMetadata.insert(p.presetId, pm);
    }
    touchCollection(c, now);

    if (!writeDocument(rec.documentPath, &doc, &fail)) return fail;
    refresh(rec.documentPath);
    return OpResult::success(QString("Preset '%1' updated successfully").arg(spec.presetName));
}

OpResult CatalogMutations::deletePreset(const QString& manufacturer, const QString& deviceName, const QString& collection,
                                        const QString& presetName, int expectedRevision) {
    model::DeviceRecord rec;
    OpResult fail;
    if (!locateDevice(manufacturer, deviceName, &rec, &fail)) return fail;

    DocumentLock lock(rec.documentPath);
    model::DeviceDocument doc;
    if (!loadDocument(rec.documentPath, &doc, &fail)) return fail;
    if (!checkRevision(doc, expectedRevision, rec.documentPath, &fail)) return fail;

    auto* c = doc.collection(collection);
    if (!c) return OpResult::failure(ErrorKind::NotFound, QString("Collection '%1' not found").arg(collection));
    const int idx = c->indexOf(presetName);
    if (idx < 0) {
        return OpResult::failure(ErrorKind::NotFound,
                                 QString("Preset '%1' not found in collection '%2'").arg(presetName, collection));
    }
    if (c->metadata.readonly) {
        return OpResult::failure(ErrorKind::Validation, QString("Collection '%1' is read-only").arg(collection));
    }

    const QString id = c->presets[idx].presetId;
    c->presets.removeAt(idx);
    if (!id.isEmpty()) c->presetMetadata.remove(id);
    touchCollection(c, model::nowIsoTimestamp());

    if (!writeDocument(rec.documentPath, &doc, &fail)) return fail;
    refresh(rec.documentPath);
    return OpResult::success(QString("Preset '%1' deleted successfully").arg(presetName));
}

OpResult CatalogMutations::createCollection(const QString& manufacturer, const QString& deviceName, const QString& collection) {
    if (collection.trimmed().isEmpty()) return OpResult::failure(ErrorKind::Validation, "Collection name is required");
    model::DeviceRecord rec;
    OpResult fail;
    if (!locateDevice(manufacturer, deviceName, &rec, &fail)) return fail;

    DocumentLock lock(rec.documentPath);
    model::DeviceDocument doc;
    if (!loadDocument(rec.documentPath, &doc, &fail)) return fail;
    if (doc.collection(collection)) {
        return OpResult::success(QString("Collection '%1' already exists").arg(collection));
    }
    doc.addCollection(collection, doc.info.name, model::nowIsoTimestamp());

    if (!writeDocument(rec.documentPath, &doc, &fail)) return fail;
    refresh(rec.documentPath);
    return OpResult::success(QString("Collection '%1' created successfully").arg(collection), rec.documentPath);
}

OpResult CatalogMutations::updateCollection(const QString& manufacturer, const QString& deviceName, const QString& collection,
                                            const CollectionUpdate& update) {
    model::DeviceRecord rec;
    OpResult fail;
    if (!locateDevice(manufacturer, deviceName, &rec, &fail)) return fail;

    DocumentLock lock(rec.documentPath);
    model::DeviceDocument doc;
    if (!loadDocument(rec.documentPath, &doc, &fail)) return fail;
    if (!checkRevision(doc, update.expectedRevision, rec.documentPath, &fail)) return fail;

    auto* c = doc.collection(collection);
    if (!c) return OpResult::failure(ErrorKind::NotFound, QString("Collection '%1' not found").arg(collection));

    auto& md = c->metadata;
    if (!update.description.isEmpty()) md.description = update.description;
    if (!update.version.isEmpty()) md.version = update.version;
    if (!update.author.isEmpty()) md.author = update.author;
    if (update.readonly >= 0) md.readonly = (update.readonly != 0);
    if (update.setParentCollections) md.parentCollections = update.parentCollections;
    md.revision += 1;
    touchCollection(c, model::nowIsoTimestamp());

    if (!writeDocument(rec.documentPath, &doc, &fail)) return fail;
    refresh(rec.documentPath);
    return OpResult::success(QString("Collection '%1' updated successfully").arg(collection));
}

OpResult CatalogMutations::renameCollection(const QString& manufacturer, const QString& deviceName, const QString& collection,
                                            const QString& newName, int expectedRevision) {
    if (newName.trimmed().isEmpty()) return OpResult::failure(ErrorKind::Validation, "New name is required");
    model::DeviceRecord rec;
    OpResult fail;
    if (!locateDevice(manufacturer, deviceName, &rec, &fail)) return fail;

    DocumentLock lock(rec.documentPath);
    model::DeviceDocument doc;
    if (!loadDocument(rec.documentPath, &doc, &fail)) return fail;
    if (!checkRevision(doc, expectedRevision, rec.documentPath, &fail)) return fail;

    const auto* c = doc.collection(collection);
    if (!c) return OpResult::failure(ErrorKind::NotFound, QString("Collection '%1' not found").arg(collection));
    if (doc.collection(newName)) {
        return OpResult::failure(ErrorKind::Validation, QString("Collection with name '%1' already exists").arg(newName));
    }

    model::PresetCollection moved = *c;
    moved.key = newName;
    moved.metadata.name = newName;
    touchCollection(&moved, model::nowIsoTimestamp());
    doc.addCollection(newName, doc.info.name, moved.metadata.modifiedAt) = moved;
    doc.removeCollection(collection);

    if (!writeDocument(rec.documentPath, &doc, &fail)) return fail;
    refresh(rec.documentPath);
    return OpResult::success(QString("Collection '%1' renamed to '%2' successfully").arg(collection, newName));
}

OpResult CatalogMutations::deleteCollection(const QString& manufacturer, const QString& deviceName, const QString& collection,
                                            int expectedRevision) {
    model::DeviceRecord rec;
    OpResult fail;
    if (!locateDevice(manufacturer, deviceName, &rec, &fail)) return fail;

    DocumentLock lock(rec.documentPath);
    model::DeviceDocument doc;
    if (!loadDocument(rec.documentPath, &doc, &fail)) return fail;
    if (!checkRevision(doc, expectedRevision, rec.documentPath, &fail)) return fail;

    if (!doc.removeCollection(collection)) {
        return OpResult::failure(ErrorKind::NotFound, QString("Collection '%1' not found").arg(collection));
    }

    if (!writeDocument(rec.documentPath, &doc, &fail)) return fail;
    refresh(rec.documentPath);
    return OpResult::success(QString("Collection '%1' deleted successfully").arg(collection));
}

QStringList CatalogMutations::listCollections(const QString& manufacturer, const QString& deviceName) const {
    return m_index.collections(manufacturer, deviceName);
}

DirectoryStatus CatalogMutations::checkDirectoryStructure(const QString& manufacturer, const QString& deviceName,
                                                          bool createIfMissing) {
    DirectoryStatus st;
    const QString fileName = documentFileName(manufacturer, deviceName);
    QString canonicalJson;
    QString err;
    if (fileName.isEmpty()
        || !resolveUnderRoot(m_index.root(), QStringList{manufacturer, deviceName, fileName}, &canonicalJson, &err)) {
        st.message = err.isEmpty() ? QString("Invalid path components") : err;
        return st;
    }

    st.devicePath = QFileInfo(canonicalJson).absolutePath();
    st.manufacturerPath = QFileInfo(st.devicePath).absolutePath();
    st.manufacturerExists = QFileInfo(st.manufacturerPath).isDir();
    st.deviceExists = QFileInfo(st.devicePath).isDir();

    st.jsonPath = canonicalJson;
    if (st.deviceExists) {
        // An existing document wins over the canonical name.
        const auto existing = QDir(st.devicePath).entryInfoList(QStringList{"*.json"}, QDir::Files, QDir::Name);
        if (!existing.isEmpty()) st.jsonPath = existing.first().absoluteFilePath();
    }
    st.jsonExists = QFileInfo::exists(st.jsonPath);

    if (createIfMissing && !(st.manufacturerExists && st.deviceExists && st.jsonExists)) {
        // Device names are unique across manufacturers; a second document
        // would shadow the first in the index.
        model::DeviceRecord known;
        if (!st.jsonExists && m_index.device(deviceName, &known)
            && QFileInfo(known.documentPath).absoluteFilePath() != QFileInfo(st.jsonPath).absoluteFilePath()) {
            st.message = QString("Device '%1' already exists").arg(deviceName);
            qWarning().noquote() << QString("CatalogMutations: not creating %1/%2: %3")
                                        .arg(manufacturer, deviceName, st.message);
            return st;
        }
        if (!QDir().mkpath(st.devicePath)) {
            st.message = QString("Cannot create directory %1").arg(st.devicePath);
            return st;
        }
        st.manufacturerExists = true;
        st.deviceExists = true;
        if (!st.jsonExists) {
            model::DeviceInfo info;
            info.name = deviceName;
            info.manufacturer = manufacturer;
            info.version = "1.0";
            info.midiPorts.insert("IN", QString());
            info.midiPorts.insert("OUT", QString());
            info.midiChannels.insert("IN", 1);
            info.midiChannels.insert("OUT", 1);

            DocumentLock lock(st.jsonPath);
            auto doc = model::DeviceDocument::createNew(info, m_author, model::nowIsoTimestamp());
            OpResult fail;
            if (!writeDocument(st.jsonPath, &doc, &fail)) {
                st.message = fail.message;
                return st;
            }
            st.jsonExists = true;
        }
        st.created = true;
        refresh(st.jsonPath);
    }

    st.ok = true;
    st.message = st.created
        ? QString("Created directory structure for %1/%2").arg(manufacturer, deviceName)
        : QString("Checked directory structure for %1/%2").arg(manufacturer, deviceName);
    return st;
}

} // namespace catalog::ops
