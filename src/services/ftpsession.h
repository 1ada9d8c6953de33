/**
 * @file ftpsession.h
 * @brief Blocking FTP and FTPS session.
 *
 * Implements IProtocolSession over the QtNetwork socket classes. The control
 * and data connections are QSslSocket instances; for plain FTP they are
 * simply never encrypted.
 */

#ifndef FTPSESSION_H
#define FTPSESSION_H

#include "iprotocolsession.h"

#include <QByteArray>
#include <QSslSocket>

#include <memory>

/**
 * @brief FTP/FTPS implementation of IProtocolSession.
 *
 * Supports:
 * - Plain FTP, explicit FTPS (AUTH TLS) and implicit FTPS
 * - Passive data connections (PASV, falling back to EPSV)
 * - Resume via REST, cancellation via ABOR
 * - Unix-style LIST parsing
 *
 * Passwords are never written to the log; the PASS command is masked.
 */
class FtpSession : public IProtocolSession
{
public:
    /// @name FTP Protocol Constants
    /// @{
    static constexpr int FtpReplyCodeLength = 3;  ///< Length of FTP reply code
    static constexpr int FtpReplyTextOffset = 4;  ///< Offset to reply text after code
    static constexpr int PassivePortMultiplier = 256;  ///< Multiplier for passive port calculation
    static constexpr int AbortReplyTimeoutMs = 5000;  ///< Wait for ABOR acknowledgement
    /// @}

    /// @name FTP Response Codes (RFC 959, RFC 2228, RFC 2428)
    /// @{
    static constexpr int FtpReplyDataConnectionOpen = 125;  ///< Data connection already open
    static constexpr int FtpReplyFileStatusOk = 150;  ///< File status okay, opening connection
    static constexpr int FtpReplyCommandOk = 200;  ///< Command okay
    static constexpr int FtpReplyFileStatus = 213;  ///< File status (SIZE)
    static constexpr int FtpReplyServiceReady = 220;  ///< Service ready for new user
    static constexpr int FtpReplyTransferComplete = 226;  ///< Transfer complete
    static constexpr int FtpReplyEnteringPassive = 227;  ///< Entering passive mode
    static constexpr int FtpReplyEnteringExtendedPassive = 229;  ///< Entering extended passive mode
    static constexpr int FtpReplyUserLoggedIn = 230;  ///< User logged in, proceed
    static constexpr int FtpReplySecurityExchangeOk = 234;  ///< AUTH TLS accepted
    static constexpr int FtpReplyActionOk = 250;  ///< Requested file action okay
    static constexpr int FtpReplyPathCreated = 257;  ///< Pathname created
    static constexpr int FtpReplyPasswordRequired = 331;  ///< User name okay, need password
    static constexpr int FtpReplyPendingFurtherInfo = 350;  ///< Requested action pending further info
    static constexpr int FtpReplyServiceClosing = 421;  ///< Service not available, closing
    static constexpr int FtpReplyCantOpenData = 425;  ///< Can't open data connection
    static constexpr int FtpReplyTransferAborted = 426;  ///< Connection closed, transfer aborted
    static constexpr int FtpReplyNotLoggedIn = 530;  ///< Not logged in
    static constexpr int FtpReplyErrorThreshold = 400;  ///< Codes >= this indicate error
    /// @}

    /**
     * @brief A complete (possibly multi-line) server reply.
     */
    struct Reply {
        int code = 0;
        QString text;  ///< Text of the final line, without the code

        [[nodiscard]] bool isPreliminary() const { return code >= 100 && code < 200; }
        [[nodiscard]] bool isError() const { return code >= FtpReplyErrorThreshold; }
    };

    /**
     * @brief Constructs a session.
     * @param secure True for FTPS.
     */
    explicit FtpSession(bool secure, const SessionOptions &options = SessionOptions());
    ~FtpSession() override;

    FtpSession(const FtpSession &) = delete;
    FtpSession &operator=(const FtpSession &) = delete;

    /// @name IProtocolSession Implementation
    /// @{
    [[nodiscard]] Protocol protocol() const override { return secure_ ? Protocol::Ftps : Protocol::Ftp; }

    void connectToHost(const ConnectionProfile &profile) override;
    void disconnectFromHost() override;
    [[nodiscard]] bool isConnected() const override;

    [[nodiscard]] QList<RemoteEntry> listDirectory(const QString &path) override;
    void remove(const QString &path) override;
    void makeDirectory(const QString &path) override;
    void removeDirectory(const QString &path) override;
    void rename(const QString &from, const QString &to) override;
    [[nodiscard]] std::optional<qint64> remoteSize(const QString &path) override;

    void upload(const QString &localPath, const QString &remotePath, qint64 resumeOffset,
                const ProgressCallback &progress, const std::atomic_bool &cancel) override;
    void download(const QString &remotePath, const QString &localPath, qint64 resumeOffset,
                  const ProgressCallback &progress, const std::atomic_bool &cancel) override;
    [[nodiscard]] bool supportsResume() const override { return true; }

    void attachToCurrentThread() override;
    void detachFromThread() override;
    /// @}

    /// @name Parsers (public for testing)
    /// @{

    /// Parses "227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)".
    static bool parsePassiveResponse(const QString &text, QString &host, quint16 &port);

    /// Parses "229 Entering Extended Passive Mode (|||port|)".
    static bool parseExtendedPassiveResponse(const QString &text, quint16 &port);

    /// Parses a LIST response; Unix-style lines and bare names are accepted.
    static QList<RemoteEntry> parseDirectoryListing(const QByteArray &data);

    /**
     * @brief Splits one reply line into code and text.
     * @param isFinal Set to false for a "123-" continuation line.
     * @return False if the line does not start with a three-digit code.
     */
    static bool parseReplyLine(const QString &line, int &code, QString &text, bool &isFinal);

    /// Decodes one control line, dropping only the CRLF terminator.
    static QString decodeControlLine(const QByteArray &raw);

    /// Control command as written to the verbose log, with any password masked.
    static QString commandForLog(const QString &command);
    /// @}

private:
    void sendCommand(const QString &command);
    [[nodiscard]] Reply readReply(int timeoutMs);
    Reply command(const QString &command);
    void expectReply(const Reply &reply, std::initializer_list<int> accepted, const QString &what);
    [[noreturn]] void failWith(const Reply &reply, const QString &what);

    void login(const ConnectionProfile &profile);
    void startTls(QSslSocket *socket, const QString &what);
    void openDataConnection();
    void startDataTransfer(const QString &command, const QString &what);
    void finishDataTransfer(const QString &what);
    void abortTransfer();
    void closeSockets();

    [[nodiscard]] QString describe() const;

    bool secure_;
    SessionOptions options_;
    std::unique_ptr<QSslSocket> controlSocket_;
    std::unique_ptr<QSslSocket> dataSocket_;
    QString host_;
    quint16 port_ = 0;
    QString profileName_;
    bool protectedData_ = false;
    bool loggedIn_ = false;
};

#endif // FTPSESSION_H
