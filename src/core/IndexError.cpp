#include "core/IndexError.hpp"

namespace rkl {

QString IndexError::kindName() const
{
    switch (kind) {
    case NoError: return QStringLiteral("none");
    case AcquisitionError: return QStringLiteral("acquisition");
    case FilesystemError: return QStringLiteral("filesystem");
    case ConfigParseError: return QStringLiteral("config");
    }
    return QStringLiteral("none");
}

QString IndexError::toString() const
{
    QString prefix;
    switch (kind) {
    case NoError:
        return {};
    case AcquisitionError:
        prefix = QStringLiteral("acquisition failed");
        break;
    case FilesystemError:
        prefix = QStringLiteral("filesystem error");
        break;
    case ConfigParseError:
        prefix = QStringLiteral("configuration parse error");
        break;
    }

    if (path.isEmpty())
        return prefix + ": " + message;
    return prefix + " (" + path + "): " + message;
}

IndexError IndexError::make(Kind kind, const QString& message, const QString& path)
{
    IndexError e;
    e.kind = kind;
    e.message = message;
    e.path = path;
    return e;
}

} // namespace rkl
