#ifndef TRANSFERTASK_H
#define TRANSFERTASK_H

#include <QDateTime>
#include <QMetaType>
#include <QString>

#include <optional>

#include "services/errors.h"

using TransferId = quint64;

enum class TransferDirection { Upload, Download };

/**
 * @brief Lifecycle of a transfer task.
 *
 * Queued -> Running -> Completed | Failed | Cancelled.
 * Failed -> Queued for an automatic retry, Running -> Queued on pause.
 */
enum class TransferState {
    Queued,     ///< Waiting for a worker and a session
    Running,    ///< Data is moving
    Completed,  ///< Finished successfully
    Failed,     ///< Finished with an error (possibly followed by a retry)
    Cancelled   ///< Stopped by the user
};

/// @brief Convert TransferState to string for debugging
[[nodiscard]] inline const char *transferStateToString(TransferState state)
{
    switch (state) {
        case TransferState::Queued: return "Queued";
        case TransferState::Running: return "Running";
        case TransferState::Completed: return "Completed";
        case TransferState::Failed: return "Failed";
        case TransferState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

[[nodiscard]] inline bool isTerminal(TransferState state)
{
    return state == TransferState::Completed || state == TransferState::Failed
        || state == TransferState::Cancelled;
}

struct TransferError {
    ErrorKind kind = ErrorKind::Internal;
    QString message;
};

/**
 * @brief One file transfer, as owned and reported by TransferQueue.
 */
struct TransferTask {
    TransferId id = 0;  ///< Assigned on enqueue
    QString profileId;
    TransferDirection direction = TransferDirection::Download;
    QString localPath;
    QString remotePath;
    qint64 totalBytes = -1;  ///< -1 while unknown
    TransferState state = TransferState::Queued;
    qint64 bytesTransferred = 0;
    std::optional<TransferError> lastError;
    int retryCount = 0;
    int priority = 0;  ///< Higher runs first, FIFO within equal priority

    QDateTime created;
    QDateTime started;
    QDateTime finished;
    double bytesPerSecond = 0.0;
    qint64 etaSeconds = -1;

    [[nodiscard]] static TransferTask upload(const QString &profileId,
                                             const QString &localPath,
                                             const QString &remotePath)
    {
        TransferTask task;
        task.profileId = profileId;
        task.direction = TransferDirection::Upload;
        task.localPath = localPath;
        task.remotePath = remotePath;
        return task;
    }

    [[nodiscard]] static TransferTask download(const QString &profileId,
                                               const QString &remotePath,
                                               const QString &localPath)
    {
        TransferTask task;
        task.profileId = profileId;
        task.direction = TransferDirection::Download;
        task.localPath = localPath;
        task.remotePath = remotePath;
        return task;
    }

    /// Percentage 0-100, or -1 if the size is unknown.
    [[nodiscard]] int progressPercent() const
    {
        if (totalBytes < 0) {
            return -1;
        }
        if (totalBytes == 0) {
            return state == TransferState::Completed ? 100 : 0;
        }
        return static_cast<int>(bytesTransferred * 100 / totalBytes);
    }
};

/**
 * @brief One entry of the transfer event stream.
 */
struct TransferEvent {
    enum class Type {
        Added,         ///< Task admitted (state Queued)
        StateChanged,  ///< State transition
        Progress,      ///< bytesTransferred advanced
        Removed        ///< Terminal task acknowledged and dropped
    };

    Type type = Type::StateChanged;
    TransferId taskId = 0;
    TransferState state = TransferState::Queued;
    TransferState previousState = TransferState::Queued;
    qint64 bytesTransferred = 0;
    qint64 totalBytes = -1;
    int retryCount = 0;
    bool willRetry = false;  ///< Failed, but re-queued automatically
    std::optional<TransferError> error;
    double bytesPerSecond = 0.0;
    qint64 etaSeconds = -1;
};

Q_DECLARE_METATYPE(TransferEvent)

#endif // TRANSFERTASK_H
