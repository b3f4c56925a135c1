#include "PluginIndexBuilder.hpp"
#include "DirectoryWalker.hpp"
#include "LanguageDetector.hpp"
#include <boost/log/trivial.hpp>
#include <utility>

namespace rkl {

LanguagePolicy languagePolicyFromString(const QString& text, bool* ok)
{
    const QString v = text.trimmed().toLower();
    if (ok) *ok = true;
    if (v == "detected") return LanguagePolicy::PreferDetected;
    if (v == "config") return LanguagePolicy::PreferConfig;
    if (ok) *ok = false;
    return LanguagePolicy::PreferDetected;
}

QString languagePolicyName(LanguagePolicy policy)
{
    return policy == LanguagePolicy::PreferConfig ? QStringLiteral("config") : QStringLiteral("detected");
}

PluginIndexBuilder::PluginIndexBuilder(ConfigLoader loader)
    : loader_(std::move(loader))
{
}

bool PluginIndexBuilder::index(const QString& root, QList<Plugin>& plugins, IndexError* error) const
{
    QFileInfoList dirs;
    if (!DirectoryWalker::children(root, DirectoryWalker::Dirs, dirs, error))
        return false;

    QList<Plugin> results;
    for (const auto& dir : dirs) {
        Plugin plugin;
        if (!indexPlugin(dir.filePath(), plugin, error))
            return false;

        BOOST_LOG_TRIVIAL(info) << "Indexed plugin: " << plugin.name.toStdString()
                                << " (" << languageName(plugin.language).toStdString()
                                << (plugin.hasConfig() ? ", configured" : "") << ") at "
                                << plugin.path.toStdString();
        results.append(plugin);
    }

    if (results.isEmpty())
        BOOST_LOG_TRIVIAL(debug) << "No plugin directories under " << root.toStdString();

    plugins = results;
    return true;
}

bool PluginIndexBuilder::indexPlugin(const QString& pluginDir, Plugin& plugin, IndexError* error) const
{
    LanguageDetector::Detection detection;
    if (!LanguageDetector::detect(pluginDir, detection, error))
        return false;

    PluginConfig config;
    if (!loader_.load(pluginDir, config, error))
        return false;

    plugin.name = detection.name;
    plugin.path = detection.path;
    plugin.language = detection.language;
    plugin.config = config;

    if (policy_ == LanguagePolicy::PreferConfig && plugin.hasConfig()) {
        const PluginLanguage declared = config.language();
        if (declared != PluginLanguage::Unknown) {
            if (declared != detection.language) {
                BOOST_LOG_TRIVIAL(debug) << "Plugin " << plugin.name.toStdString() << " declares "
                                         << languageName(declared).toStdString() << ", detected "
                                         << languageName(detection.language).toStdString();
            }
            plugin.language = declared;
        } else if (!config.declaredLanguage().isEmpty()) {
            BOOST_LOG_TRIVIAL(warning) << "Plugin " << plugin.name.toStdString()
                                        << " declares unrecognised language '"
                                        << config.declaredLanguage().toStdString()
                                        << "', keeping detected language";
        }
    }

    return true;
}

} // namespace rkl
