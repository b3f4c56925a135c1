#include "core/Logging.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

namespace rkl {

LogLevel logLevelFromString(const QString& text)
{
    const QString v = text.trimmed().toLower();
    if (v == "debug") return LogLevel::Debug;
    if (v == "warning" || v == "warn") return LogLevel::Warning;
    if (v == "error") return LogLevel::Error;
    return LogLevel::Info;
}

void initLogging(LogLevel level)
{
    namespace logging = boost::log;

    logging::trivial::severity_level severity = logging::trivial::info;
    switch (level) {
    case LogLevel::Debug: severity = logging::trivial::debug; break;
    case LogLevel::Info: severity = logging::trivial::info; break;
    case LogLevel::Warning: severity = logging::trivial::warning; break;
    case LogLevel::Error: severity = logging::trivial::error; break;
    }

    logging::core::get()->set_filter(logging::trivial::severity >= severity);
}

} // namespace rkl
