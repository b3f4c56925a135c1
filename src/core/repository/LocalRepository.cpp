#include "LocalRepository.hpp"
#include <QFileInfo>
#include <QUrl>

namespace rkl {

LocalRepository::LocalRepository(const QString& name, const QString& localPath)
    : Repository(name, QUrl::fromLocalFile(localPath).toString(), localPath)
{
}

bool LocalRepository::acquire(IndexError* error)
{
    const QFileInfo info(localPath());
    if (!info.exists())
        return setError(error, IndexError::AcquisitionError, "repository path does not exist", localPath());
    if (!info.isDir())
        return setError(error, IndexError::AcquisitionError, "repository path is not a directory", localPath());
    return true;
}

} // namespace rkl
