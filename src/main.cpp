#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>

#include <iostream>
#include <string>

#include <termios.h>
#include <unistd.h>

#include "models/transferqueue.h"
#include "services/errorhandler.h"
#include "services/errors.h"
#include "services/knownhostsstore.h"
#include "services/sessionfactory.h"
#include "services/settings.h"
#include "services/vaultstore.h"
#include "utils/logging.h"
#include "version.h"

namespace {

constexpr int UsageExitCode = 1;
constexpr const char *MasterPasswordVariable = "FFTP_MASTER_PASSWORD";

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

/// Reads one line from the terminal with echo disabled.
QString readSecret(const QString &prompt)
{
    err() << prompt << Qt::flush;

    termios saved{};
    const bool interactive = isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &saved) == 0;
    if (interactive) {
        termios silent = saved;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        tcsetattr(STDIN_FILENO, TCSANOW, &silent);
    }

    std::string line;
    std::getline(std::cin, line);

    if (interactive) {
        tcsetattr(STDIN_FILENO, TCSANOW, &saved);
        err() << "\n" << Qt::flush;
    }
    return QString::fromStdString(line);
}

QString masterPassword(const QString &prompt)
{
    const QByteArray fromEnv = qgetenv(MasterPasswordVariable);
    if (!fromEnv.isEmpty()) {
        return QString::fromUtf8(fromEnv);
    }
    return readSecret(prompt);
}

QString newPassword(const QString &prompt)
{
    const QByteArray fromEnv = qgetenv(MasterPasswordVariable);
    if (!fromEnv.isEmpty()) {
        return QString::fromUtf8(fromEnv);
    }
    const QString first = readSecret(prompt);
    const QString second = readSecret(QStringLiteral("Repeat password: "));
    if (first != second) {
        throw WeakParameterError("Passwords do not match");
    }
    return first;
}

/// Resolves a profile by id first, then by name.
ConnectionProfile resolveProfile(const VaultStore &store, const VaultHandle &vault, const QString &key)
{
    if (auto byId = store.findProfile(vault, key)) {
        return *byId;
    }
    const QList<ConnectionProfile> profiles = store.listProfiles(vault);
    for (const ConnectionProfile &profile : profiles) {
        if (profile.name == key) {
            return profile;
        }
    }
    throw ProfileNotFoundError(key);
}

QString joinRemote(const QString &directory, const QString &name)
{
    if (directory.endsWith('/')) {
        return directory + name;
    }
    return directory + '/' + name;
}

QString remoteFileName(const QString &remotePath)
{
    const int slash = remotePath.lastIndexOf('/');
    return slash < 0 ? remotePath : remotePath.mid(slash + 1);
}

/**
 * @brief Runs a batch of transfers to completion.
 * @return 0 if all completed, else the exit code of the first failure.
 */
int runTransfers(QCoreApplication &app, TransferQueue &queue, ErrorHandler &errors,
                 const QList<TransferTask> &batch)
{
    QObject::connect(&queue, &TransferQueue::transferEvent, &app, [&queue](const TransferEvent &event) {
        if (event.type != TransferEvent::Type::StateChanged) {
            return;
        }
        const auto task = queue.task(event.taskId);
        const QString name = task
            ? (task->direction == TransferDirection::Upload ? task->localPath : task->remotePath)
            : QString::number(event.taskId);
        out() << "[" << event.taskId << "] " << transferStateToString(event.state) << " " << name;
        if (event.state == TransferState::Failed && event.error) {
            out() << ": " << event.error->message;
            if (event.willRetry) {
                out() << " (retrying)";
            }
        }
        out() << Qt::endl;
    });
    QObject::connect(&queue, &TransferQueue::taskFailed, &app, [&queue, &errors](TransferId id, const QString &error) {
        const auto task = queue.task(id);
        const QString operation = task && task->direction == TransferDirection::Download
            ? QStringLiteral("Download") : QStringLiteral("Upload");
        errors.handleOperationFailed(operation, error);
    });
    QObject::connect(&queue, &TransferQueue::allTasksFinished,
                     &app, &QCoreApplication::quit, Qt::QueuedConnection);

    // Held until the whole batch is admitted so a fast first task cannot report the queue idle
    queue.pauseAll();
    for (const TransferTask &task : batch) {
        queue.enqueue(task);
    }
    queue.resumeAll();
    app.exec();

    for (const TransferTask &task : queue.tasks()) {
        if (task.state != TransferState::Completed) {
            const ErrorKind kind = task.lastError ? task.lastError->kind : ErrorKind::Cancelled;
            return ErrorHandler::exitCodeFor(kind);
        }
    }
    return 0;
}

int listRemote(IProtocolSession &session, ErrorHandler &errors,
               const ConnectionProfile &profile, const QString &path)
{
    try {
        session.connectToHost(profile);
    } catch (const NetworkError &e) {
        errors.handleConnectionError(e.message());
        return ErrorHandler::exitCodeFor(e.kind());
    }
    const QList<RemoteEntry> entries = session.listDirectory(path);
    for (const RemoteEntry &entry : entries) {
        out() << (entry.isDirectory ? "d " : "- ")
              << QString::number(entry.size).rightJustified(12) << " "
              << (entry.modified.isValid() ? entry.modified.toString(Qt::ISODate) : QString(19, ' ')) << " "
              << entry.name << Qt::endl;
    }
    session.disconnectFromHost();
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("fftp");
    app.setApplicationVersion(FFTP_VERSION);
    app.setOrganizationName("fftp");

    QCommandLineParser parser;
    parser.setApplicationDescription("FTP, FTPS and SFTP client with an encrypted profile vault");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "init | list | add | remove | passwd | ls | put | get");
    parser.addPositionalArgument("args", "Command arguments", "[args...]");

    QCommandLineOption verboseOption(QStringList() << "V" << "verbose", "Enable verbose logging output");
    QCommandLineOption configOption("config", "Settings file (INI)", "file");
    QCommandLineOption vaultOption("vault", "Vault file", "file");
    QCommandLineOption nameOption("name", "Profile name (add)", "name");
    QCommandLineOption protocolOption("protocol", "ftp, ftps or sftp (add)", "protocol", "sftp");
    QCommandLineOption hostOption("host", "Server host (add)", "host");
    QCommandLineOption portOption("port", "Server port, 0 for default (add)", "port", "0");
    QCommandLineOption userOption("user", "User name (add)", "user");
    QCommandLineOption keyOption("key", "Private key file, SFTP only (add)", "file");
    QCommandLineOption remotePathOption("remote-path", "Initial remote directory (add)", "path");
    QCommandLineOption implicitOption("implicit-tls", "Use implicit FTPS (add)");
    QCommandLineOption activeOption("active", "Disable passive mode (add)");
    parser.addOptions({verboseOption, configOption, vaultOption, nameOption, protocolOption, hostOption,
                       portOption, userOption, keyOption, remotePathOption, implicitOption, activeOption});

    parser.process(app);

    fftp::verboseLogging = parser.isSet(verboseOption);
    if (fftp::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(UsageExitCode);
    }
    const QString command = args.first();
    const QStringList rest = args.mid(1);

    ErrorHandler errors;

    try {
        Settings settings = parser.isSet(configOption)
            ? Settings::loadFile(parser.value(configOption))
            : Settings();
        if (parser.isSet(vaultOption)) {
            settings.vaultPath = parser.value(vaultOption);
        }
        QDir().mkpath(QFileInfo(settings.vaultPath).absolutePath());

        const VaultStore store(settings.vaultPolicy());

        if (command == "init") {
            VaultHandle vault = store.create(settings.vaultPath, newPassword("New master password: "));
            out() << "Created vault " << vault.path() << Qt::endl;
            return 0;
        }

        VaultHandle vault = store.unlock(settings.vaultPath, masterPassword("Master password: "));

        if (command == "list") {
            const QList<ConnectionProfile> profiles = store.listProfiles(vault);
            for (const ConnectionProfile &profile : profiles) {
                out() << profile.id << "  " << profile.name << "  "
                      << protocolToString(profile.protocol) << "://" << profile.displayAddress() << Qt::endl;
            }
            return 0;
        }

        if (command == "add") {
            const auto protocol = protocolFromString(parser.value(protocolOption));
            if (!protocol || !parser.isSet(hostOption) || !parser.isSet(userOption)) {
                err() << "add needs --host, --user and a valid --protocol" << Qt::endl;
                return UsageExitCode;
            }
            const QString name = parser.isSet(nameOption) ? parser.value(nameOption) : parser.value(hostOption);
            ConnectionProfile profile = ConnectionProfile::create(name, *protocol,
                                                                  parser.value(hostOption),
                                                                  parser.value(userOption));
            profile.port = static_cast<quint16>(parser.value(portOption).toUInt());
            profile.remotePath = parser.value(remotePathOption);
            profile.ftpsImplicit = parser.isSet(implicitOption);
            profile.passiveMode = !parser.isSet(activeOption);
            if (parser.isSet(keyOption)) {
                profile.credentialKind = CredentialKind::PrivateKey;
                profile.keyPath = parser.value(keyOption);
                profile.secret = readSecret("Key passphrase (empty for none): ");
            } else {
                profile.secret = readSecret(QString("Password for %1: ").arg(profile.displayAddress()));
            }
            const QString id = store.addProfile(vault, profile);
            out() << id << Qt::endl;
            return 0;
        }

        if (command == "remove") {
            if (rest.size() != 1) {
                err() << "usage: fftp remove <profile>" << Qt::endl;
                return UsageExitCode;
            }
            store.removeProfile(vault, resolveProfile(store, vault, rest.first()).id);
            return 0;
        }

        if (command == "passwd") {
            if (!qEnvironmentVariableIsEmpty(MasterPasswordVariable)) {
                err() << "passwd reads the new password from the terminal only" << Qt::endl;
                return UsageExitCode;
            }
            const QString first = readSecret("New master password: ");
            if (first != readSecret("Repeat password: ")) {
                throw WeakParameterError("Passwords do not match");
            }
            store.changeMasterPassword(vault, first);
            return 0;
        }

        KnownHostsStore knownHosts(settings.knownHostsPath);
        SessionOptions options = settings.sessionOptions();
        options.knownHosts = &knownHosts;
        SessionFactory factory(options);

        if (command == "ls") {
            if (rest.isEmpty() || rest.size() > 2) {
                err() << "usage: fftp ls <profile> [path]" << Qt::endl;
                return UsageExitCode;
            }
            const ConnectionProfile profile = resolveProfile(store, vault, rest.first());
            store.touchProfile(vault, profile.id);
            const QString path = rest.size() == 2 ? rest.at(1)
                : (profile.remotePath.isEmpty() ? QStringLiteral("/") : profile.remotePath);
            std::unique_ptr<IProtocolSession> session = factory.createSession(profile);
            return listRemote(*session, errors, profile, path);
        }

        if (command == "put" || command == "get") {
            if (rest.size() < 3) {
                err() << "usage: fftp " << command << " <profile> <source>... <destination>" << Qt::endl;
                return UsageExitCode;
            }
            const ConnectionProfile profile = resolveProfile(store, vault, rest.first());
            store.touchProfile(vault, profile.id);

            const QStringList sources = rest.mid(1, rest.size() - 2);
            const QString destination = rest.last();
            QList<TransferTask> batch;

            if (command == "put") {
                const bool intoDirectory = sources.size() > 1 || destination.endsWith('/');
                for (const QString &local : sources) {
                    const QString remote = intoDirectory
                        ? joinRemote(destination, QFileInfo(local).fileName()) : destination;
                    batch.append(TransferTask::upload(profile.id, local, remote));
                }
            } else {
                const bool intoDirectory = sources.size() > 1 || QFileInfo(destination).isDir();
                for (const QString &remote : sources) {
                    const QString local = intoDirectory
                        ? QDir(destination).filePath(remoteFileName(remote)) : destination;
                    batch.append(TransferTask::download(profile.id, remote, local));
                }
            }

            TransferQueue queue(&factory, [&store, &vault](const QString &id) {
                return store.findProfile(vault, id);
            }, settings);
            return runTransfers(app, queue, errors, batch);
        }

        err() << "Unknown command: " << command << Qt::endl;
        return UsageExitCode;
    } catch (const FftpError &e) {
        errors.handleError(e);
        return ErrorHandler::exitCodeFor(e.kind());
    }
}
