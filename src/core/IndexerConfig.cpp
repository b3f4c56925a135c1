#include "core/IndexerConfig.hpp"
#include <QDir>
#include <QFile>
#include <boost/log/trivial.hpp>
#include <fstream>

namespace rkl {

namespace {

// Overlay wins; mappings merge key by key, anything else is replaced.
YAML::Node overlayYaml(const YAML::Node& base, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);
    if (!base.IsMap() || !overlay.IsMap())
        return YAML::Clone(overlay);

    YAML::Node merged = YAML::Clone(base);
    for (const auto& item : overlay) {
        const std::string key = item.first.as<std::string>();
        merged[key] = merged[key] ? overlayYaml(merged[key], item.second) : YAML::Clone(item.second);
    }
    return merged;
}

QString expandHome(const QString& path)
{
    if (path == "~")
        return QDir::homePath();
    if (path.startsWith("~/"))
        return QDir::homePath() + path.mid(1);
    return path;
}

QString scalarOr(const YAML::Node& node, const QString& fallback)
{
    if (!node.IsDefined() || !node.IsScalar())
        return fallback;
    return QString::fromStdString(node.as<std::string>());
}

} // namespace

IndexerConfig::IndexerConfig()
{
    initDefaults();
}

void IndexerConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["log_level"] = "info";
    root_["index"]["language_policy"] = "detected";
    root_["git"]["program"] = "git";
    root_["git"]["timeout_ms"] = RepositoryOptions::DEFAULT_GIT_TIMEOUT_MS;
    root_["storage"]["root"] = "~/.reckless/repositories";
    root_["repositories"] = YAML::Node(YAML::NodeType::Sequence);
}

QString IndexerConfig::defaultPath()
{
    return QDir::homePath() + "/.reckless/config.yaml";
}

bool IndexerConfig::load(const QString& filePath, QString* errorMessage)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (errorMessage)
            *errorMessage = filePath + ": " + file.errorString();
        return false;
    }
    return loadFromString(QString::fromUtf8(file.readAll()), errorMessage);
}

bool IndexerConfig::loadFromString(const QString& text, QString* errorMessage)
{
    YAML::Node loaded;
    try {
        loaded = YAML::Load(text.toStdString());
    } catch (const YAML::Exception& e) {
        if (errorMessage)
            *errorMessage = QString::fromStdString(e.what());
        return false;
    }
    return applyDocument(loaded, errorMessage);
}

bool IndexerConfig::applyDocument(const YAML::Node& loaded, QString* errorMessage)
{
    // An empty file keeps the defaults.
    if (!loaded.IsDefined() || loaded.IsNull())
        return true;

    if (!loaded.IsMap()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("top-level value must be a mapping");
        return false;
    }

    const YAML::Node repos = loaded["repositories"];
    if (repos.IsDefined() && !repos.IsNull()) {
        if (!repos.IsSequence()) {
            if (errorMessage)
                *errorMessage = QStringLiteral("repositories must be a sequence");
            return false;
        }
        for (const auto& repo : repos) {
            if (!repo.IsMap() || !repo["name"].IsScalar()) {
                if (errorMessage)
                    *errorMessage = QStringLiteral("every repository needs a name");
                return false;
            }
        }
    }

    try {
        const IndexerConfig defaults;
        root_ = overlayYaml(defaults.root_, loaded);
    } catch (const YAML::Exception& e) {
        if (errorMessage)
            *errorMessage = QString::fromStdString(e.what());
        return false;
    }

    bool policyOk = true;
    languagePolicyFromString(scalarOr(root_["index"]["language_policy"], "detected"), &policyOk);
    if (!policyOk)
        BOOST_LOG_TRIVIAL(warning) << "Unknown index.language_policy, using 'detected'";

    return true;
}

bool IndexerConfig::save(const QString& filePath, QString* errorMessage) const
{
    std::ofstream fout(filePath.toStdString());
    if (!fout) {
        if (errorMessage)
            *errorMessage = "cannot open file for writing";
        return false;
    }

    fout << root_ << '\n';
    fout.close();
    if (!fout) {
        if (errorMessage)
            *errorMessage = "write failed";
        return false;
    }
    return true;
}

LogLevel IndexerConfig::logLevel() const
{
    return logLevelFromString(scalarOr(root_["log_level"], "info"));
}

LanguagePolicy IndexerConfig::languagePolicy() const
{
    return languagePolicyFromString(scalarOr(root_["index"]["language_policy"], "detected"));
}

void IndexerConfig::setLanguagePolicy(LanguagePolicy policy)
{
    root_["index"]["language_policy"] = languagePolicyName(policy).toStdString();
}

QString IndexerConfig::gitProgram() const
{
    return scalarOr(root_["git"]["program"], "git");
}

int IndexerConfig::gitTimeoutMs() const
{
    try {
        return root_["git"]["timeout_ms"].as<int>(RepositoryOptions::DEFAULT_GIT_TIMEOUT_MS);
    } catch (const YAML::Exception&) {
        return RepositoryOptions::DEFAULT_GIT_TIMEOUT_MS;
    }
}

QString IndexerConfig::storageRoot() const
{
    return QDir::cleanPath(expandHome(scalarOr(root_["storage"]["root"], "~/.reckless/repositories")));
}

RepositoryOptions IndexerConfig::repositoryOptions() const
{
    RepositoryOptions options;
    options.languagePolicy = languagePolicy();
    options.gitProgram = gitProgram();
    options.gitTimeoutMs = gitTimeoutMs();
    return options;
}

QList<RepositoryEntry> IndexerConfig::repositories() const
{
    QList<RepositoryEntry> result;
    const YAML::Node repos = root_["repositories"];
    if (!repos.IsSequence())
        return result;

    for (const auto& repo : repos) {
        RepositoryEntry entry;
        entry.name = scalarOr(repo["name"], {});
        entry.url = expandHome(scalarOr(repo["url"], {}));
        entry.path = expandHome(scalarOr(repo["path"], {}));
        if (entry.path.isEmpty())
            entry.path = storageRoot() + "/" + entry.name;
        result.append(entry);
    }
    return result;
}

void IndexerConfig::addRepository(const RepositoryEntry& entry)
{
    YAML::Node repo;
    repo["name"] = entry.name.toStdString();
    if (!entry.url.isEmpty())
        repo["url"] = entry.url.toStdString();
    if (!entry.path.isEmpty())
        repo["path"] = entry.path.toStdString();
    root_["repositories"].push_back(repo);
}

} // namespace rkl
