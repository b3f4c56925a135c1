#pragma once

#include <QString>

namespace rkl {

enum class LogLevel { Debug, Info, Warning, Error };

/// Parse "debug", "info", "warning" or "error" (case-insensitive).
/// Anything else maps to Info.
LogLevel logLevelFromString(const QString& text);

/// Install a severity filter on the Boost.Log core so that only records at
/// `level` or above reach the sink.
void initLogging(LogLevel level);

} // namespace rkl
