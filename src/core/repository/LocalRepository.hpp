#pragma once

#include "Repository.hpp"

namespace rkl {

/// Repository that already lives on disk. Nothing is fetched; the plugins
/// are indexed in place.
class LocalRepository : public Repository {
public:
    LocalRepository(const QString& name, const QString& localPath);

    QString kind() const override { return QStringLiteral("local"); }

protected:
    bool acquire(IndexError* error) override;
};

} // namespace rkl
