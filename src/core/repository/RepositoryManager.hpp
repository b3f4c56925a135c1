#pragma once

#include "Repository.hpp"
#include <QList>
#include <QMap>
#include <QObject>
#include <QString>
#include <memory>
#include <vector>

namespace rkl {

/// Owns the configured repositories, keyed by name in registration order.
/// Drives init() on each of them and answers plugin lookups across all of
/// them.
class RepositoryManager : public QObject {
    Q_OBJECT
public:
    explicit RepositoryManager(QObject* parent = nullptr);
    ~RepositoryManager() override;

    /// Take ownership. Returns false (and drops the repository) when the
    /// name is empty or already registered.
    bool addRepository(std::unique_ptr<Repository> repository);

    /// init() every repository that is not indexed yet, in registration
    /// order. A failure is logged and signalled but does not stop the
    /// others. Returns the number of repositories indexed by this call.
    int initializeAll();

    QList<Repository*> repositories() const;

    /// nullptr when no repository has that name.
    Repository* repository(const QString& name) const;

    /// First plugin with that name, searching repositories in registration
    /// order. `repositoryName` (when given) receives the owning repository.
    Plugin findPlugin(const QString& pluginName, QString* repositoryName = nullptr) const;

    int count() const { return static_cast<int>(repositories_.size()); }

signals:
    void repositoryAdded(const QString& name);
    void repositoryIndexed(const QString& name, int pluginCount);
    void repositoryFailed(const QString& name, const QString& reason);

private:
    std::vector<std::unique_ptr<Repository>> repositories_;
    QMap<QString, int> nameIndex_;  // repository name -> index in repositories_
};

} // namespace rkl
