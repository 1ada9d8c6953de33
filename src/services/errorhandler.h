/**
 * @file errorhandler.h
 * @brief Centralized error handling service for consistent error presentation.
 *
 * This service standardizes how errors are categorized, reported, and logged
 * across the client, whether the front end is the command line or a GUI.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QObject>
#include <QString>

#include "errors.h"

/**
 * @brief Categories of errors for appropriate handling.
 */
enum class ErrorCategory {
    Vault,          ///< Master password, vault file, profile lookup
    Connection,     ///< Network, authentication, protocol errors
    FileOperation,  ///< Local I/O and transfer errors
    Validation,     ///< Input validation, configuration errors
    System          ///< General system/application errors
};

/**
 * @brief Severity levels determining how errors are reported.
 */
enum class ErrorSeverity {
    Info,      ///< Informational, short timeout
    Warning,   ///< Warning, longer timeout
    Critical   ///< Critical, stays until replaced
};

/**
 * @brief Centralized error handling service.
 *
 * ErrorHandler provides consistent error presentation:
 * - Maps FftpError kinds to categories and severities
 * - Logs errors through the Qt logging framework
 * - Emits statusMessage() for whatever front end is listening
 * - Maps error kinds to process exit codes for the command line
 *
 * @par Example usage:
 * @code
 * ErrorHandler handler;
 * connect(&handler, &ErrorHandler::statusMessage, this, &MyClass::showStatus);
 *
 * try {
 *     store.unlock(path, password);
 * } catch (const FftpError &e) {
 *     handler.handleError(e);
 *     return ErrorHandler::exitCodeFor(e.kind());
 * }
 * @endcode
 */
class ErrorHandler : public QObject
{
    Q_OBJECT

public:
    explicit ErrorHandler(QObject *parent = nullptr);
    ~ErrorHandler() override = default;

    /// @name Generic Error Handling
    /// @{

    /**
     * @brief Handles an error with specified category and severity.
     * @param category The error category.
     * @param severity The error severity.
     * @param title Short error title/summary.
     * @param details Detailed error message.
     */
    void handleError(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details = QString());

    /**
     * @brief Handles a typed client error.
     *
     * Category and severity are derived from the error kind.
     */
    void handleError(const FftpError &error);
    /// @}

    /// @name Convenience Methods for Common Error Sources
    /// @{

    /**
     * @brief Handles a connection error (critical severity).
     * @param message The error message.
     */
    void handleConnectionError(const QString &message);

    /**
     * @brief Handles a file operation error (warning severity).
     * @param operation The operation that failed (e.g., "upload", "download").
     * @param error The error message.
     */
    void handleOperationFailed(const QString &operation, const QString &error);
    /// @}

    /// @name Classification
    /// @{
    [[nodiscard]] static ErrorCategory categoryFor(ErrorKind kind);
    [[nodiscard]] static ErrorSeverity severityFor(ErrorKind kind);

    /**
     * @brief Process exit code for an error kind.
     *
     * Zero is never returned; every kind has its own code so scripts can
     * tell a wrong password from a network failure.
     */
    [[nodiscard]] static int exitCodeFor(ErrorKind kind);

    [[nodiscard]] static QString categoryToString(ErrorCategory category);
    [[nodiscard]] static QString severityToString(ErrorSeverity severity);
    /// @}

signals:
    /**
     * @brief Emitted to display a status message.
     * @param message The message text.
     * @param timeout Display timeout in milliseconds (0 for no timeout).
     */
    void statusMessage(const QString &message, int timeout);

    /**
     * @brief Emitted when an error is logged (for debugging/monitoring).
     */
    void errorLogged(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details);

private:
    void logError(ErrorCategory category,
                  ErrorSeverity severity,
                  const QString &title,
                  const QString &details);

    [[nodiscard]] static int timeoutForSeverity(ErrorSeverity severity);
};

#endif // ERRORHANDLER_H
