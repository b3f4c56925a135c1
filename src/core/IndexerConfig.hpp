#pragma once

#include "core/IndexError.hpp"
#include "core/Logging.hpp"
#include "core/plugin/PluginIndexBuilder.hpp"
#include "core/repository/Repository.hpp"
#include <QList>
#include <QString>
#include <yaml-cpp/yaml.h>

namespace rkl {

/// One entry of the `repositories:` list.
struct RepositoryEntry {
    QString name;
    QString url;
    QString path;   // local checkout; <storage.root>/<name> when omitted
};

/// Application configuration, built-in defaults deep-merged with an
/// optional YAML file:
///
///   log_level: info
///   index:
///     language_policy: detected     # or "config"
///   git:
///     program: git
///     timeout_ms: 300000
///   storage:
///     root: ~/.reckless/repositories
///   repositories:
///     - name: lightning
///       url: https://github.com/lightningd/plugins
class IndexerConfig {
public:
    IndexerConfig();

    /// ~/.reckless/config.yaml
    static QString defaultPath();

    /// Merge the file over the defaults. On a missing, unreadable or
    /// malformed file returns false and keeps the current values.
    bool load(const QString& filePath, QString* errorMessage = nullptr);
    bool loadFromString(const QString& text, QString* errorMessage = nullptr);

    /// Write the merged document. Returns false if the file cannot be
    /// opened or written.
    bool save(const QString& filePath, QString* errorMessage = nullptr) const;

    LogLevel logLevel() const;
    LanguagePolicy languagePolicy() const;
    void setLanguagePolicy(LanguagePolicy policy);

    QString gitProgram() const;
    int gitTimeoutMs() const;

    QString storageRoot() const;

    /// Policy and git settings for createRepository.
    RepositoryOptions repositoryOptions() const;

    QList<RepositoryEntry> repositories() const;
    void addRepository(const RepositoryEntry& entry);

private:
    void initDefaults();
    bool applyDocument(const YAML::Node& loaded, QString* errorMessage);

    YAML::Node root_;
};

} // namespace rkl
