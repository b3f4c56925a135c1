#include "LanguageDetector.hpp"
#include "DirectoryWalker.hpp"
#include <QDir>
#include <QFileInfo>
#include <boost/log/trivial.hpp>

namespace rkl {

PluginLanguage LanguageDetector::foldMarkers(const QStringList& fileNames)
{
    PluginLanguage result = PluginLanguage::Unknown;
    for (const auto& fileName : fileNames) {
        const PluginLanguage lang = markerLanguage(fileName);
        if (lang != PluginLanguage::Unknown)
            result = lang;
    }
    return result;
}

bool LanguageDetector::detect(const QString& pluginDir, Detection& detection, IndexError* error)
{
    QFileInfoList files;
    if (!DirectoryWalker::children(pluginDir, DirectoryWalker::Files, files, error))
        return false;

    QStringList fileNames;
    for (const auto& file : files)
        fileNames.append(file.fileName());

    const QFileInfo dirInfo(pluginDir);
    detection.name = dirInfo.fileName();
    detection.path = QDir::cleanPath(dirInfo.absoluteFilePath());
    detection.language = foldMarkers(fileNames);

    BOOST_LOG_TRIVIAL(debug) << "Possible language for " << detection.name.toStdString()
                             << ": " << languageName(detection.language).toStdString();
    return true;
}

} // namespace rkl
