#pragma once

#include <QString>

namespace catalog {

// Failure taxonomy shared by every public entry point. Nothing in the catalog
// throws across its API; callers branch on ok/error instead.
enum class ErrorKind {
    None,
    NotFound,   // absent manufacturer/device/collection/preset
    Validation, // missing required field, unsafe path component, duplicate name
    Io,         // per-document read/write failure
    Parse,      // malformed JSON or schema violation
    Git,        // git subprocess failure
    Conflict    // expected file revision does not match disk
};

inline QString errorKindName(ErrorKind k) {
    switch (k) {
    case ErrorKind::None: return "none";
    case ErrorKind::NotFound: return "not_found";
    case ErrorKind::Validation: return "validation";
    case ErrorKind::Io: return "io";
    case ErrorKind::Parse: return "parse";
    case ErrorKind::Git: return "git";
    case ErrorKind::Conflict: return "conflict";
    }
    return "unknown";
}

// (success, message) pair returned by mutations. On a successful create,
// path holds the document that was written.
struct OpResult {
    bool ok = false;
    QString message;
    ErrorKind error = ErrorKind::None;
    QString path;

    static OpResult success(const QString& msg, const QString& writtenPath = QString()) {
        OpResult r;
        r.ok = true;
        r.message = msg;
        r.path = writtenPath;
        return r;
    }

    static OpResult failure(ErrorKind kind, const QString& msg) {
        OpResult r;
        r.ok = false;
        r.message = msg;
        r.error = kind;
        return r;
    }
};

} // namespace catalog
