#include "errorhandler.h"

#include <QDebug>

ErrorHandler::ErrorHandler(QObject *parent)
    : QObject(parent)
{
}

void ErrorHandler::handleError(ErrorCategory category,
                               ErrorSeverity severity,
                               const QString &title,
                               const QString &details)
{
    logError(category, severity, title, details);

    QString message = title;
    if (!details.isEmpty() && details != title) {
        message = QString("%1: %2").arg(title, details);
    }

    emit statusMessage(message, timeoutForSeverity(severity));
}

void ErrorHandler::handleError(const FftpError &error)
{
    handleError(categoryFor(error.kind()),
                severityFor(error.kind()),
                QString::fromLatin1(errorKindToString(error.kind())),
                error.message());
}

void ErrorHandler::handleConnectionError(const QString &message)
{
    handleError(ErrorCategory::Connection,
                ErrorSeverity::Critical,
                tr("Connection Error"),
                message);
}

void ErrorHandler::handleOperationFailed(const QString &operation, const QString &error)
{
    handleError(ErrorCategory::FileOperation,
                ErrorSeverity::Warning,
                tr("%1 failed").arg(operation),
                error);
}

ErrorCategory ErrorHandler::categoryFor(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::WrongPassword:
    case ErrorKind::CorruptVault:
    case ErrorKind::UnsupportedVersion:
    case ErrorKind::ProfileNotFound:
        return ErrorCategory::Vault;
    case ErrorKind::Authentication:
    case ErrorKind::Network:
    case ErrorKind::Protocol:
        return ErrorCategory::Connection;
    case ErrorKind::LocalIO:
    case ErrorKind::Cancelled:
        return ErrorCategory::FileOperation;
    case ErrorKind::WeakParameter:
        return ErrorCategory::Validation;
    case ErrorKind::Internal:
        return ErrorCategory::System;
    }
    return ErrorCategory::System;
}

ErrorSeverity ErrorHandler::severityFor(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::Cancelled:
        return ErrorSeverity::Info;
    case ErrorKind::WrongPassword:
    case ErrorKind::ProfileNotFound:
    case ErrorKind::WeakParameter:
    case ErrorKind::Network:
    case ErrorKind::Protocol:
    case ErrorKind::LocalIO:
        return ErrorSeverity::Warning;
    case ErrorKind::CorruptVault:
    case ErrorKind::UnsupportedVersion:
    case ErrorKind::Authentication:
    case ErrorKind::Internal:
        return ErrorSeverity::Critical;
    }
    return ErrorSeverity::Critical;
}

int ErrorHandler::exitCodeFor(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::WrongPassword:
        return 2;
    case ErrorKind::CorruptVault:
        return 3;
    case ErrorKind::UnsupportedVersion:
        return 4;
    case ErrorKind::ProfileNotFound:
        return 5;
    case ErrorKind::WeakParameter:
        return 6;
    case ErrorKind::Authentication:
        return 7;
    case ErrorKind::Network:
        return 8;
    case ErrorKind::Protocol:
        return 9;
    case ErrorKind::LocalIO:
        return 10;
    case ErrorKind::Cancelled:
        return 11;
    case ErrorKind::Internal:
        return 12;
    }
    return 1;
}

void ErrorHandler::logError(ErrorCategory category,
                            ErrorSeverity severity,
                            const QString &title,
                            const QString &details)
{
    QString logMessage = QString("[%1/%2] %3")
        .arg(categoryToString(category),
             severityToString(severity),
             title);

    if (!details.isEmpty() && details != title) {
        logMessage += QString(": %1").arg(details);
    }

    switch (severity) {
    case ErrorSeverity::Info:
        qInfo().noquote() << logMessage;
        break;
    case ErrorSeverity::Warning:
        qWarning().noquote() << logMessage;
        break;
    case ErrorSeverity::Critical:
        qCritical().noquote() << logMessage;
        break;
    }

    emit errorLogged(category, severity, title, details);
}

int ErrorHandler::timeoutForSeverity(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return 3000;
    case ErrorSeverity::Warning:
        return 5000;
    case ErrorSeverity::Critical:
        return 0;
    }
    return 5000;
}

QString ErrorHandler::categoryToString(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Vault:
        return QStringLiteral("Vault");
    case ErrorCategory::Connection:
        return QStringLiteral("Connection");
    case ErrorCategory::FileOperation:
        return QStringLiteral("FileOp");
    case ErrorCategory::Validation:
        return QStringLiteral("Validation");
    case ErrorCategory::System:
        return QStringLiteral("System");
    }
    return QStringLiteral("Unknown");
}

QString ErrorHandler::severityToString(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return QStringLiteral("INFO");
    case ErrorSeverity::Warning:
        return QStringLiteral("WARN");
    case ErrorSeverity::Critical:
        return QStringLiteral("CRIT");
    }
    return QStringLiteral("UNKNOWN");
}
