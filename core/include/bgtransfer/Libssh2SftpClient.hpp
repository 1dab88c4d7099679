#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <string>

// Forward declarations of the internal libssh2 types (underscore names)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace bgtransfer {

class Libssh2SftpClient : public SftpClient {
public:
    Libssh2SftpClient();
    ~Libssh2SftpClient() override;

    bool connect(const SessionOptions &opt, std::string &err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }
    void interrupt() override;

    bool get(const std::string &remote, const std::string &local,
             std::string &err, ProgressCB progress, CancelCB shouldCancel,
             bool resume) override;

    bool put(const std::string &local, const std::string &remote,
             std::string &err, ProgressCB progress, CancelCB shouldCancel,
             bool resume) override;

    bool exists(const std::string &remote_path, bool &isDir,
                std::string &err) override;

    bool mkdir(const std::string &remote_dir, std::string &err,
               unsigned int mode) override;

    SftpErrorKind lastErrorKind() const override { return lastKind_; }

    std::unique_ptr<SftpClient> newConnectionLike(const SessionOptions &opt,
                                                  std::string &err) override;

private:
    bool connected_ = false;
    int sock_ = -1;
    std::atomic<bool> interrupted_{false};
    SftpErrorKind lastKind_ = SftpErrorKind::None;
    _LIBSSH2_SESSION *session_ = nullptr;
    _LIBSSH2_SFTP *sftp_ = nullptr;

    bool tcpConnect(const std::string &host, uint16_t port, std::string &err);
    bool sshHandshakeAuth(const SessionOptions &opt, std::string &err);
    bool verifyHostKey(const SessionOptions &opt, std::string &err);
    bool authenticate(const SessionOptions &opt, std::string &err);
    // Sets err and the error kind from the SFTP status of the last call.
    void failFromSftp(const std::string &what, std::string &err);
    bool fail(SftpErrorKind kind, const std::string &msg, std::string &err);
};

} // namespace bgtransfer
