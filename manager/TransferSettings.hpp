// Settings value handed to the coordinator and the gateway. Persisted with
// QSettings("BgTransfer", "BgTransfer").
#pragma once
#include "TransferTypes.hpp"
#include "bgtransfer/SftpTypes.hpp"
#include <QSettings>
#include <QString>

namespace bgtransfer {

struct TransferSettings {
    // Ceiling imposed by the external subsystem.
    static constexpr int kSubsystemRequestLimit = 5;

    int maxActiveRequests = kSubsystemRequestLimit;
    TransferPreferences preferences =
        TransferPreferences::AllowCellularAndBattery;
    QString storeRoot;       // empty: QStandardPaths::AppDataLocation
    qint64 minFreeBytes = 0; // submit fails below this free space

    // SFTP defaults for requests whose URL carries no credentials.
    QString sftpKeyPath;
    QString sftpKnownHosts;
    KnownHostsPolicy sftpKnownHostsPolicy = KnownHostsPolicy::Strict;

    // Clamps maxActiveRequests to 1..kSubsystemRequestLimit.
    void setMaxActiveRequests(int n);

    static TransferSettings load(QSettings &s);
    void save(QSettings &s) const;

    // Resolved store root (storeRoot or the platform data directory).
    QString effectiveStoreRoot() const;
    // Applies key, known_hosts path and policy to opt.
    void applyTo(SessionOptions &opt) const;
};

} // namespace bgtransfer
