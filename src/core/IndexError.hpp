#pragma once

#include <QString>

namespace rkl {

/// Failure report shared by the walker, the detectors, the config loader
/// and the repositories. Fallible calls return bool and fill an optional
/// IndexError* out parameter.
struct IndexError {
    enum Kind {
        NoError,
        AcquisitionError,   // fetching the repository failed
        FilesystemError,    // a directory or file could not be read
        ConfigParseError    // a present reckless.yaml/.yml is malformed
    };

    Kind kind = NoError;
    QString message;
    QString path;

    bool isError() const { return kind != NoError; }

    /// Short machine-friendly name of the kind ("filesystem", ...).
    QString kindName() const;

    /// Human-readable, kind-prefixed message.
    QString toString() const;

    static IndexError make(Kind kind, const QString& message, const QString& path = {});
};

/// Fill `error` (when given) and return false, for one-line early returns.
inline bool setError(IndexError* error, IndexError::Kind kind,
                     const QString& message, const QString& path = {})
{
    if (error)
        *error = IndexError::make(kind, message, path);
    return false;
}

} // namespace rkl
