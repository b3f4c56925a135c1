#pragma once

#include "core/IndexError.hpp"
#include "core/plugin/Plugin.hpp"
#include "core/plugin/PluginIndexBuilder.hpp"
#include <QList>
#include <QString>
#include <memory>

namespace rkl {

/// A source of plugins: identity (name, url, local path) plus the index of
/// the plugins found in the local copy.
///
/// Lifecycle: Uninitialized -> init() -> Indexed. init() acquires the
/// contents (subclass specific) and then indexes the local path; it either
/// fully succeeds or leaves the repository exactly as it was. A repository
/// that never indexed successfully lists nothing and finds nothing.
///
/// Not thread-safe: init()/reindex() must not run concurrently on the same
/// instance.
class Repository {
public:
    enum class State { Uninitialized, Indexed };

    Repository(const QString& name, const QString& url, const QString& localPath);
    virtual ~Repository() = default;

    Repository(const Repository&) = delete;
    Repository& operator=(const Repository&) = delete;

    QString name() const { return name_; }
    QString url() const { return url_; }
    QString localPath() const { return localPath_; }

    /// Backend name for diagnostics ("github", "local").
    virtual QString kind() const = 0;

    State state() const { return state_; }
    bool isIndexed() const { return state_ == State::Indexed; }

    void setLanguagePolicy(LanguagePolicy policy) { builder_.setLanguagePolicy(policy); }
    LanguagePolicy languagePolicy() const { return builder_.languagePolicy(); }

    /// Acquire then index. Returns false on AcquisitionError,
    /// FilesystemError or ConfigParseError; see lastError().
    bool init();

    /// Index the local copy again without acquiring. The whole collection
    /// is replaced on success and kept on failure.
    bool reindex();

    /// Copy of the plugin collection in index order.
    QList<Plugin> list() const { return plugins_; }

    /// First plugin (in index order) whose name matches exactly; an invalid
    /// Plugin when there is none.
    Plugin pluginByName(const QString& name) const;
    bool contains(const QString& name) const;

    IndexError lastError() const { return lastError_; }

protected:
    /// Make the repository contents available at localPath().
    virtual bool acquire(IndexError* error) = 0;

private:
    bool runIndex();

    QString name_;
    QString url_;
    QString localPath_;
    State state_ = State::Uninitialized;
    PluginIndexBuilder builder_;
    QList<Plugin> plugins_;
    IndexError lastError_;
};

/// Settings createRepository applies to the repository it builds. The git
/// fields only matter for GithubRepository.
struct RepositoryOptions {
    static constexpr int DEFAULT_GIT_TIMEOUT_MS = 300000;

    LanguagePolicy languagePolicy = LanguagePolicy::PreferDetected;
    QString gitProgram = QStringLiteral("git");
    int gitTimeoutMs = DEFAULT_GIT_TIMEOUT_MS;
};

/// LocalRepository for an empty url, a file: url or a plain path;
/// GithubRepository otherwise.
std::unique_ptr<Repository> createRepository(const QString& name, const QString& url,
                                             const QString& localPath,
                                             const RepositoryOptions& options = {});

} // namespace rkl
