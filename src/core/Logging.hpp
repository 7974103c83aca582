#pragma once

#include <QString>
#include <string>

namespace hush {

/// Installs the Boost.Log severity filter. HUSHD_LOG, when set, wins over
/// the configured level. Safe to call again after a config reload.
void initLogging(const QString& configuredLevel);

/// Level actually in effect after the environment override.
QString effectiveLogLevel(const QString& configuredLevel);

/// True when HUSHD_DIAGNOSTIC is set to a truthy value.
bool diagnosticMode();

/// Snippet length cap used in diagnostic mode (HUSHD_LOG_LIMIT, 32..1024).
int logLimit();

/// Content for log lines. Outside diagnostic mode the text is redacted to
/// its length; in diagnostic mode newlines are stripped and the result is
/// capped at logLimit() characters.
std::string logSnippet(const QString& text);

} // namespace hush
