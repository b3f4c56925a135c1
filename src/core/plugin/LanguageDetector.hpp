#pragma once

#include "PluginLanguage.hpp"
#include "core/IndexError.hpp"
#include <QString>
#include <QStringList>

namespace rkl {

/// Infers a plugin's language from the marker files directly inside its
/// directory and derives the plugin's name and path.
class LanguageDetector {
public:
    struct Detection {
        QString name;
        QString path;
        PluginLanguage language = PluginLanguage::Unknown;
    };

    /// Fold file names (in enumeration order) over the marker table.
    /// Every marker overwrites the running result, so when several marker
    /// files are present the last one wins. No marker gives Unknown.
    static PluginLanguage foldMarkers(const QStringList& fileNames);

    /// Scan the non-hidden files at depth 1 of `pluginDir` (in walker order)
    /// and fill `detection`. Walk failures propagate as FilesystemError.
    static bool detect(const QString& pluginDir, Detection& detection, IndexError* error = nullptr);
};

} // namespace rkl
