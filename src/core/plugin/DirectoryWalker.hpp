#pragma once

#include "core/IndexError.hpp"
#include <QFileInfoList>
#include <QString>

namespace rkl {

/// Enumerates the entries below a root directory, skipping hidden entries
/// (names starting with '.'). Hidden directories are never descended into.
///
/// Order is fixed: the entries of each directory are visited sorted by
/// name (QDir::Name, case-sensitive) and sub-trees are walked depth-first,
/// parents before children. Callers rely on this order for tie-breaks.
class DirectoryWalker {
public:
    enum Filter {
        Dirs = 0x1,
        Files = 0x2,
        AllEntries = Dirs | Files
    };

    /// Collect entries at depth 1..maxDepth below `root` into `out`.
    /// Fails with FilesystemError when `root` (or a directory being
    /// descended into) is missing, not a directory, or unreadable; `out`
    /// is left untouched in that case.
    static bool walk(const QString& root, int maxDepth, int filter,
                     QFileInfoList& out, IndexError* error = nullptr);

    /// walk() with depth 1, the only depth indexing uses.
    static bool children(const QString& root, int filter,
                         QFileInfoList& out, IndexError* error = nullptr);

    static bool isHidden(const QString& fileName);
};

} // namespace rkl
