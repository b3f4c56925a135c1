#pragma once

#include "Repository.hpp"

namespace rkl {

/// Repository fetched with git: clone (with submodules) into localPath, or
/// fast-forward an existing checkout there, then bring nested submodules up
/// to date. Runs git synchronously through
/// QProcess; init() blocks until git exits or the timeout expires.
class GithubRepository : public Repository {
public:
    static constexpr int DEFAULT_TIMEOUT_MS = RepositoryOptions::DEFAULT_GIT_TIMEOUT_MS;

    GithubRepository(const QString& name, const QString& url, const QString& localPath);

    QString kind() const override { return QStringLiteral("github"); }

    /// git executable, "git" by default (resolved through PATH).
    void setGitProgram(const QString& program) { gitProgram_ = program; }
    QString gitProgram() const { return gitProgram_; }

    /// Per git invocation; <= 0 waits forever.
    void setTimeoutMs(int timeoutMs) { timeoutMs_ = timeoutMs; }
    int timeoutMs() const { return timeoutMs_; }

protected:
    bool acquire(IndexError* error) override;

private:
    bool runGit(const QStringList& arguments, IndexError* error) const;

    QString gitProgram_ = QStringLiteral("git");
    int timeoutMs_ = DEFAULT_TIMEOUT_MS;
};

} // namespace rkl
