// Basic types shared between the transfer gateway and the SFTP backends.
// Keep these structures plain so they can be built from settings or URLs.
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace bgtransfer {

// known_hosts validation policy for the server key.
enum class KnownHostsPolicy {
    Strict,    // Requires an exact match in known_hosts.
    AcceptNew, // TOFU: accept and store new hosts; reject key changes.
    Off        // No verification (not recommended).
};

// Coarse classification of the last failed operation of a client.
// The gateway maps it to a response code for the status machine.
enum class SftpErrorKind {
    None,
    Connection,       // TCP/SSH level failure or lost session
    NotFound,         // remote path does not exist
    PermissionDenied, // remote refused access
    LocalIo,          // local file could not be read or written
    Canceled,         // shouldCancel() or interrupt() stopped the operation
    Remote            // any other SFTP failure
};

inline const char *sftpErrorKindName(SftpErrorKind k) {
    switch (k) {
    case SftpErrorKind::None:
        return "None";
    case SftpErrorKind::Connection:
        return "Connection";
    case SftpErrorKind::NotFound:
        return "NotFound";
    case SftpErrorKind::PermissionDenied:
        return "PermissionDenied";
    case SftpErrorKind::LocalIo:
        return "LocalIo";
    case SftpErrorKind::Canceled:
        return "Canceled";
    case SftpErrorKind::Remote:
        return "Remote";
    }
    return "Unknown";
}

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    // SSH security
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Fingerprint confirmation (TOFU) when known_hosts has no entry.
    // Return true to accept and store, false to reject. Unattended
    // transfers leave it empty, which rejects unknown hosts.
    std::function<bool(const std::string &host, std::uint16_t port,
                       const std::string &algorithm,
                       const std::string &fingerprint)>
        hostkey_confirm_cb;
};

} // namespace bgtransfer
