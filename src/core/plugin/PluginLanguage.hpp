#pragma once

#include <QString>
#include <QStringList>

namespace rkl {

enum class PluginLanguage {
    Unknown,
    Python,
    Go,
    Rust,
    Dart,
    JavaScript,
    TypeScript
};

/// Marker table: exact, case-sensitive file name -> language.
///   requirements.txt  Python
///   go.mod            Go
///   cargo.toml        Rust
///   pubspec.yaml      Dart
///   package.json      JavaScript
///   tsconfig.json     TypeScript
/// Any other name is Unknown.
PluginLanguage markerLanguage(const QString& fileName);

/// Marker file names in table order.
QStringList markerFileNames();

/// Canonical lowercase name ("python", "go", ..., "unknown").
QString languageName(PluginLanguage lang);

/// Parse a declared language (canonical names and the usual short aliases,
/// case-insensitive). Unrecognised text is Unknown.
PluginLanguage languageFromString(const QString& text);

} // namespace rkl
