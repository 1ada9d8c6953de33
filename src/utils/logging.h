/**
 * @file logging.h
 * @brief Simple logging utility with runtime verbose flag.
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <QDebug>
#include <QString>

namespace fftp {

/// Global verbose logging flag, set via --verbose command line argument
inline bool verboseLogging = false;

/// Replaces a secret with a fixed mask so its length is not leaked either
[[nodiscard]] inline QString redacted(const QString &secret)
{
    return secret.isEmpty() ? QString() : QStringLiteral("****");
}

} // namespace fftp

/// Log only when verbose mode is enabled
#define LOG_VERBOSE() if (fftp::verboseLogging) qDebug()

#endif // LOGGING_H
