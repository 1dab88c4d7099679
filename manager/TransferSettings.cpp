#include "TransferSettings.hpp"
#include <QStandardPaths>
#include <algorithm>

namespace bgtransfer {

void TransferSettings::setMaxActiveRequests(int n) {
    maxActiveRequests = std::clamp(n, 1, kSubsystemRequestLimit);
}

TransferSettings TransferSettings::load(QSettings &s) {
    TransferSettings t;
    t.setMaxActiveRequests(
        s.value("Transfers/maxActiveRequests", kSubsystemRequestLimit).toInt());
    const int pref =
        s.value("Transfers/preferences",
                static_cast<int>(TransferPreferences::AllowCellularAndBattery))
            .toInt();
    if (pref >= static_cast<int>(TransferPreferences::None) &&
        pref <= static_cast<int>(TransferPreferences::AllowCellularAndBattery))
        t.preferences = static_cast<TransferPreferences>(pref);
    t.storeRoot = s.value("Transfers/storeRoot").toString().trimmed();
    t.minFreeBytes =
        std::max<qint64>(0, s.value("Transfers/minFreeBytes", 0).toLongLong());
    t.sftpKeyPath = s.value("Sftp/keyPath").toString();
    t.sftpKnownHosts = s.value("Sftp/knownHosts").toString();
    const int kh =
        s.value("Sftp/khPolicy", static_cast<int>(KnownHostsPolicy::Strict))
            .toInt();
    if (kh >= static_cast<int>(KnownHostsPolicy::Strict) &&
        kh <= static_cast<int>(KnownHostsPolicy::Off))
        t.sftpKnownHostsPolicy = static_cast<KnownHostsPolicy>(kh);
    return t;
}

void TransferSettings::save(QSettings &s) const {
    s.setValue("Transfers/maxActiveRequests", maxActiveRequests);
    s.setValue("Transfers/preferences", static_cast<int>(preferences));
    s.setValue("Transfers/storeRoot", storeRoot);
    s.setValue("Transfers/minFreeBytes", minFreeBytes);
    s.setValue("Sftp/keyPath", sftpKeyPath);
    s.setValue("Sftp/knownHosts", sftpKnownHosts);
    s.setValue("Sftp/khPolicy", static_cast<int>(sftpKnownHostsPolicy));
}

QString TransferSettings::effectiveStoreRoot() const {
    if (!storeRoot.isEmpty())
        return storeRoot;
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

void TransferSettings::applyTo(SessionOptions &opt) const {
    if (!sftpKeyPath.isEmpty() && !opt.private_key_path)
        opt.private_key_path = sftpKeyPath.toStdString();
    if (!sftpKnownHosts.isEmpty())
        opt.known_hosts_path = sftpKnownHosts.toStdString();
    opt.known_hosts_policy = sftpKnownHostsPolicy;
}

} // namespace bgtransfer
