#include "Repository.hpp"
#include "GithubRepository.hpp"
#include "LocalRepository.hpp"
#include <QDir>
#include <QUrl>
#include <boost/log/trivial.hpp>

namespace rkl {

Repository::Repository(const QString& name, const QString& url, const QString& localPath)
    : name_(name), url_(url), localPath_(localPath)
{
    BOOST_LOG_TRIVIAL(debug) << "Creating repository: " << name_.toStdString() << " " << url_.toStdString();
}

bool Repository::init()
{
    BOOST_LOG_TRIVIAL(info) << "Initializing repository " << name_.toStdString() << " ("
                            << kind().toStdString() << "): " << url_.toStdString() << " > "
                            << localPath_.toStdString();

    IndexError error;
    if (!acquire(&error)) {
        if (!error.isError())
            error = IndexError::make(IndexError::AcquisitionError, "unknown failure", url_);
        lastError_ = error;
        BOOST_LOG_TRIVIAL(error) << "Repository " << name_.toStdString() << ": "
                                  << lastError_.toString().toStdString();
        return false;
    }

    return runIndex();
}

bool Repository::reindex()
{
    BOOST_LOG_TRIVIAL(info) << "Re-indexing repository " << name_.toStdString();
    return runIndex();
}

bool Repository::runIndex()
{
    IndexError error;
    QList<Plugin> plugins;
    if (!builder_.index(localPath_, plugins, &error)) {
        lastError_ = error;
        BOOST_LOG_TRIVIAL(error) << "Repository " << name_.toStdString() << ": "
                                  << lastError_.toString().toStdString();
        return false;
    }

    plugins_ = plugins;
    state_ = State::Indexed;
    lastError_ = IndexError();
    BOOST_LOG_TRIVIAL(info) << "Repository " << name_.toStdString() << " indexed "
                            << plugins_.size() << " plugin(s)";
    return true;
}

Plugin Repository::pluginByName(const QString& name) const
{
    for (const auto& plugin : plugins_) {
        if (plugin.name == name)
            return plugin;
    }
    return {};
}

bool Repository::contains(const QString& name) const
{
    return pluginByName(name).isValid();
}

namespace {

std::unique_ptr<Repository> makeRepository(const QString& name, const QString& url,
                                           const QString& localPath, const RepositoryOptions& options)
{
    if (url.isEmpty())
        return std::make_unique<LocalRepository>(name, localPath);

    const QUrl parsed(url);
    if (parsed.isLocalFile())
        return std::make_unique<LocalRepository>(name, parsed.toLocalFile());
    // Plain paths ("/srv/plugins", "./plugins") have no scheme.
    if (parsed.scheme().isEmpty() && !url.contains('@'))
        return std::make_unique<LocalRepository>(name, QDir::cleanPath(url));

    auto github = std::make_unique<GithubRepository>(name, url, localPath);
    github->setGitProgram(options.gitProgram);
    github->setTimeoutMs(options.gitTimeoutMs);
    return github;
}

} // namespace

std::unique_ptr<Repository> createRepository(const QString& name, const QString& url,
                                             const QString& localPath, const RepositoryOptions& options)
{
    auto repository = makeRepository(name, url, localPath, options);
    repository->setLanguagePolicy(options.languagePolicy);
    return repository;
}

} // namespace rkl
