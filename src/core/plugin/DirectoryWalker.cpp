#include "DirectoryWalker.hpp"
#include <QDir>
#include <QFileInfo>
#include <boost/log/trivial.hpp>

namespace rkl {

namespace {

bool walkInto(const QString& dirPath, int depth, int maxDepth, int filter,
              QFileInfoList& out, IndexError* error)
{
    QFileInfo info(dirPath);
    if (!info.exists())
        return setError(error, IndexError::FilesystemError, "directory does not exist", dirPath);
    if (!info.isDir())
        return setError(error, IndexError::FilesystemError, "not a directory", dirPath);
    if (!info.isReadable() || !info.isExecutable())
        return setError(error, IndexError::FilesystemError, "permission denied", dirPath);

    // QDir::Hidden lists dot entries too; hiding is decided by name below so
    // the rule is identical on every platform.
    QDir dir(dirPath);
    const auto entries = dir.entryInfoList(QDir::Dirs | QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot,
                                           QDir::Name);

    for (const auto& entry : entries) {
        if (DirectoryWalker::isHidden(entry.fileName())) {
            BOOST_LOG_TRIVIAL(debug) << "Skipping hidden entry " << entry.filePath().toStdString();
            continue;
        }

        const bool isDir = entry.isDir();
        if ((isDir && (filter & DirectoryWalker::Dirs)) || (!isDir && (filter & DirectoryWalker::Files)))
            out.append(entry);

        if (isDir && depth < maxDepth) {
            if (!walkInto(entry.filePath(), depth + 1, maxDepth, filter, out, error))
                return false;
        }
    }

    return true;
}

} // namespace

bool DirectoryWalker::walk(const QString& root, int maxDepth, int filter,
                           QFileInfoList& out, IndexError* error)
{
    if (maxDepth < 1)
        return true;

    QFileInfoList collected;
    if (!walkInto(root, 1, maxDepth, filter, collected, error)) {
        BOOST_LOG_TRIVIAL(error) << "Cannot walk " << root.toStdString();
        return false;
    }

    out.append(collected);
    return true;
}

bool DirectoryWalker::children(const QString& root, int filter,
                               QFileInfoList& out, IndexError* error)
{
    return walk(root, 1, filter, out, error);
}

bool DirectoryWalker::isHidden(const QString& fileName)
{
    return fileName.startsWith(QLatin1Char('.'));
}

} // namespace rkl
