#ifndef REMOTEENTRY_H
#define REMOTEENTRY_H

#include <QDateTime>
#include <QString>

/**
 * @brief Represents a single entry in a remote directory listing.
 */
struct RemoteEntry {
    QString name;              ///< Name of the file or directory
    bool isDirectory = false;  ///< True if this entry is a directory
    bool isSymlink = false;    ///< True if the server reported a symbolic link
    qint64 size = 0;           ///< Size in bytes (0 for directories)
    QString permissions;       ///< Unix-style permission string
    QDateTime modified;        ///< Last modification timestamp, if reported
};

#endif // REMOTEENTRY_H
