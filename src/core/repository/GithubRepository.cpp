#include "GithubRepository.hpp"
#include <QDir>
#include <QFileInfo>
#include <QProcess>
#include <boost/log/trivial.hpp>

namespace rkl {

GithubRepository::GithubRepository(const QString& name, const QString& url, const QString& localPath)
    : Repository(name, url, localPath)
{
}

bool GithubRepository::acquire(IndexError* error)
{
    if (url().isEmpty())
        return setError(error, IndexError::AcquisitionError, "no remote url configured");
    if (localPath().isEmpty())
        return setError(error, IndexError::AcquisitionError, "no local path configured", url());

    if (QFileInfo::exists(localPath() + "/.git")) {
        // Checkout left by an earlier run: bring it up to date instead of cloning.
        BOOST_LOG_TRIVIAL(info) << "Updating existing checkout " << localPath().toStdString();
        if (!runGit({"-C", localPath(), "pull", "--ff-only"}, error))
            return false;
    } else {
        // git creates the leaf directory itself but not missing parents.
        const QString parent = QFileInfo(localPath()).absolutePath();
        if (!QDir().mkpath(parent))
            return setError(error, IndexError::AcquisitionError, "cannot create parent directory", parent);

        if (!runGit({"clone", "--recurse-submodules", url(), localPath()}, error))
            return false;
    }

    // Nested submodules are not always checked out by the clone itself.
    return runGit({"-C", localPath(), "submodule", "update", "--init", "--recursive"}, error);
}

bool GithubRepository::runGit(const QStringList& arguments, IndexError* error) const
{
    BOOST_LOG_TRIVIAL(debug) << "Running " << gitProgram_.toStdString() << " "
                             << arguments.join(' ').toStdString();

    // "-C <dir> pull" reports as "pull"
    const QString command = arguments.value(0) == "-C" ? arguments.value(2) : arguments.value(0);

    QProcess git;
    git.start(gitProgram_, arguments);
    if (!git.waitForStarted(-1)) {
        return setError(error, IndexError::AcquisitionError,
                        "cannot run " + gitProgram_ + ": " + git.errorString(), url());
    }

    if (!git.waitForFinished(timeoutMs_ > 0 ? timeoutMs_ : -1)) {
        git.kill();
        git.waitForFinished(-1);
        return setError(error, IndexError::AcquisitionError,
                        QString("git %1 timed out").arg(command), url());
    }

    if (git.exitStatus() != QProcess::NormalExit || git.exitCode() != 0) {
        QString stderrText = QString::fromUtf8(git.readAllStandardError()).trimmed();
        if (stderrText.isEmpty())
            stderrText = QString("exit code %1").arg(git.exitCode());
        return setError(error, IndexError::AcquisitionError,
                        QString("git %1 failed: %2").arg(command, stderrText), url());
    }

    return true;
}

} // namespace rkl
