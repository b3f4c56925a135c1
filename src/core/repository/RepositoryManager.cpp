#include "RepositoryManager.hpp"
#include <boost/log/trivial.hpp>
#include <utility>

namespace rkl {

RepositoryManager::RepositoryManager(QObject* parent)
    : QObject(parent)
{
}

RepositoryManager::~RepositoryManager() = default;

bool RepositoryManager::addRepository(std::unique_ptr<Repository> repository)
{
    if (!repository) return false;

    const QString name = repository->name();
    if (name.isEmpty()) {
        BOOST_LOG_TRIVIAL(warning) << "Ignoring repository without a name: " << repository->url().toStdString();
        return false;
    }
    if (nameIndex_.contains(name)) {
        BOOST_LOG_TRIVIAL(warning) << "Repository " << name.toStdString() << " already registered, skipping "
                                    << repository->url().toStdString();
        return false;
    }

    nameIndex_[name] = static_cast<int>(repositories_.size());
    repositories_.push_back(std::move(repository));

    BOOST_LOG_TRIVIAL(info) << "Registered repository: " << name.toStdString();
    emit repositoryAdded(name);
    return true;
}

int RepositoryManager::initializeAll()
{
    int indexed = 0;
    for (auto& repository : repositories_) {
        if (repository->isIndexed()) continue;

        if (repository->init()) {
            ++indexed;
            emit repositoryIndexed(repository->name(), static_cast<int>(repository->list().size()));
        } else {
            const QString reason = repository->lastError().toString();
            BOOST_LOG_TRIVIAL(error) << "Repository " << repository->name().toStdString()
                                      << " failed to initialize: " << reason.toStdString();
            emit repositoryFailed(repository->name(), reason);
        }
    }
    return indexed;
}

QList<Repository*> RepositoryManager::repositories() const
{
    QList<Repository*> result;
    for (const auto& repository : repositories_)
        result.append(repository.get());
    return result;
}

Repository* RepositoryManager::repository(const QString& name) const
{
    auto it = nameIndex_.find(name);
    if (it == nameIndex_.end())
        return nullptr;
    return repositories_[it.value()].get();
}

Plugin RepositoryManager::findPlugin(const QString& pluginName, QString* repositoryName) const
{
    for (const auto& repository : repositories_) {
        Plugin plugin = repository->pluginByName(pluginName);
        if (plugin.isValid()) {
            if (repositoryName)
                *repositoryName = repository->name();
            return plugin;
        }
    }
    return {};
}

} // namespace rkl
