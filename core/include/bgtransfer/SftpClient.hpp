// Abstract interface for SFTP operations. Concrete backends (libssh2, mock)
// implement it so the transfer gateway stays decoupled from the transport.
#pragma once
#include "SftpTypes.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace bgtransfer {

class SftpClient {
public:
    using ProgressCB =
        std::function<void(std::size_t /*done*/, std::size_t /*total*/)>;
    using CancelCB = std::function<bool()>;

    virtual ~SftpClient() = default;

    // Connect and disconnect
    virtual bool connect(const SessionOptions &opt, std::string &err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Unblock any I/O in progress from another thread. The running
    // operation fails with SftpErrorKind::Canceled.
    virtual void interrupt() = 0;

    // Download a remote file to a local path; total is 0 when the remote
    // size is unknown. With resume=true an existing partial file is kept.
    virtual bool get(const std::string &remote, const std::string &local,
                     std::string &err, ProgressCB progress = {},
                     CancelCB shouldCancel = {}, bool resume = false) = 0;

    // Upload a local file to a remote path.
    virtual bool put(const std::string &local, const std::string &remote,
                     std::string &err, ProgressCB progress = {},
                     CancelCB shouldCancel = {}, bool resume = false) = 0;

    // Existence check (leaves err empty when the path does not exist)
    virtual bool exists(const std::string &remote_path, bool &isDir,
                        std::string &err) = 0;

    virtual bool mkdir(const std::string &remote_dir, std::string &err,
                       unsigned int mode = 0755) = 0;

    // Classification of the last failure reported by this client.
    virtual SftpErrorKind lastErrorKind() const = 0;

    // Create a new connection of the same type with the given options.
    virtual std::unique_ptr<SftpClient>
    newConnectionLike(const SessionOptions &opt, std::string &err) = 0;
};

} // namespace bgtransfer
