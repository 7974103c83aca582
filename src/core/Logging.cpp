#include "core/Logging.hpp"
#include <QByteArray>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

namespace hush {

namespace {

constexpr int kDefaultLogLimit = 160;

boost::log::trivial::severity_level parseLevel(const QString& level)
{
    const QString l = level.trimmed().toLower();
    if (l == "trace") return boost::log::trivial::trace;
    if (l == "debug") return boost::log::trivial::debug;
    if (l == "warn" || l == "warning") return boost::log::trivial::warning;
    if (l == "error") return boost::log::trivial::error;
    if (l == "fatal") return boost::log::trivial::fatal;
    return boost::log::trivial::info;
}

} // namespace

QString effectiveLogLevel(const QString& configuredLevel)
{
    const QByteArray env = qgetenv("HUSHD_LOG");
    if (!env.trimmed().isEmpty())
        return QString::fromUtf8(env).trimmed();
    return configuredLevel.isEmpty() ? QStringLiteral("info") : configuredLevel;
}

void initLogging(const QString& configuredLevel)
{
    const QString level = effectiveLogLevel(configuredLevel);
    boost::log::core::get()->set_filter(
        boost::log::trivial::severity >= parseLevel(level));
}

bool diagnosticMode()
{
    const QByteArray env = qgetenv("HUSHD_DIAGNOSTIC").trimmed().toLower();
    return env == "1" || env == "true" || env == "yes" || env == "on";
}

int logLimit()
{
    bool ok = false;
    int limit = qEnvironmentVariableIntValue("HUSHD_LOG_LIMIT", &ok);
    if (!ok)
        return kDefaultLogLimit;
    return qBound(32, limit, 1024);
}

std::string logSnippet(const QString& text)
{
    if (!diagnosticMode())
        return "<redacted " + std::to_string(text.toUtf8().size()) + " bytes>";

    QString clean;
    clean.reserve(text.size());
    for (QChar c : text) {
        if (c == '\n' || c == '\r' || c == '\t')
            clean.append(' ');
        else if (c.isPrint())
            clean.append(c);
    }

    const int limit = logLimit();
    if (clean.size() > limit) {
        clean.truncate(limit);
        clean.append(QStringLiteral("..."));
    }
    return clean.toStdString();
}

} // namespace hush
