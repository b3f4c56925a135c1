#include "ConfigLoader.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <boost/log/trivial.hpp>

namespace rkl {

ConfigLoader::ConfigLoader(Parser parser)
    : parser_(parser ? std::move(parser) : Parser(&PluginConfig::parse))
{
}

QStringList ConfigLoader::candidateFileNames()
{
    return {QStringLiteral("reckless.yaml"), QStringLiteral("reckless.yml")};
}

bool ConfigLoader::load(const QString& pluginDir, PluginConfig& config, IndexError* error) const
{
    PluginConfig result;
    const QDir dir(pluginDir);

    for (const auto& candidate : candidateFileNames()) {
        const QString filePath = dir.filePath(candidate);
        const QFileInfo info(filePath);
        if (!info.exists() || info.isDir())
            continue;

        QFile file(filePath);
        if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
            return setError(error, IndexError::FilesystemError, file.errorString(), filePath);

        const QString text = QString::fromUtf8(file.readAll());
        BOOST_LOG_TRIVIAL(debug) << "Found plugin configuration " << filePath.toStdString();

        PluginConfig parsed;
        QString message;
        if (!parser_(text, &parsed, &message)) {
            BOOST_LOG_TRIVIAL(error) << "Failed to parse plugin configuration " << filePath.toStdString()
                                      << ": " << message.toStdString();
            return setError(error, IndexError::ConfigParseError, message, filePath);
        }

        result = parsed;
    }

    config = result;
    return true;
}

} // namespace rkl
