#include "PluginLanguage.hpp"

namespace rkl {

namespace {

struct Marker {
    const char* fileName;
    PluginLanguage language;
};

const Marker kMarkers[] = {
    {"requirements.txt", PluginLanguage::Python},
    {"go.mod", PluginLanguage::Go},
    {"cargo.toml", PluginLanguage::Rust},
    {"pubspec.yaml", PluginLanguage::Dart},
    {"package.json", PluginLanguage::JavaScript},
    {"tsconfig.json", PluginLanguage::TypeScript},
};

} // namespace

PluginLanguage markerLanguage(const QString& fileName)
{
    for (const auto& marker : kMarkers) {
        if (fileName == QLatin1String(marker.fileName))
            return marker.language;
    }
    return PluginLanguage::Unknown;
}

QStringList markerFileNames()
{
    QStringList names;
    for (const auto& marker : kMarkers)
        names.append(QString::fromLatin1(marker.fileName));
    return names;
}

QString languageName(PluginLanguage lang)
{
    switch (lang) {
    case PluginLanguage::Python: return QStringLiteral("python");
    case PluginLanguage::Go: return QStringLiteral("go");
    case PluginLanguage::Rust: return QStringLiteral("rust");
    case PluginLanguage::Dart: return QStringLiteral("dart");
    case PluginLanguage::JavaScript: return QStringLiteral("javascript");
    case PluginLanguage::TypeScript: return QStringLiteral("typescript");
    case PluginLanguage::Unknown: break;
    }
    return QStringLiteral("unknown");
}

PluginLanguage languageFromString(const QString& text)
{
    const QString v = text.trimmed().toLower();
    if (v == "python" || v == "py" || v == "python3")
        return PluginLanguage::Python;
    if (v == "go" || v == "golang")
        return PluginLanguage::Go;
    if (v == "rust" || v == "rs")
        return PluginLanguage::Rust;
    if (v == "dart")
        return PluginLanguage::Dart;
    if (v == "javascript" || v == "js" || v == "node")
        return PluginLanguage::JavaScript;
    if (v == "typescript" || v == "ts")
        return PluginLanguage::TypeScript;
    return PluginLanguage::Unknown;
}

} // namespace rkl
