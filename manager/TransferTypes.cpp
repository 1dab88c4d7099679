#include "TransferTypes.hpp"
#include <QtGlobal>

namespace bgtransfer {

const char *statusName(TransferStatus st) {
    switch (st) {
    case TransferStatus::None:
        return "None";
    case TransferStatus::Queued:
        return "Queued";
    case TransferStatus::Transferring:
        return "Transferring";
    case TransferStatus::Waiting:
        return "Waiting";
    case TransferStatus::WaitingForRetry:
        return "WaitingForRetry";
    case TransferStatus::WaitingForWiFi:
        return "WaitingForWiFi";
    case TransferStatus::WaitingForExternalPower:
        return "WaitingForExternalPower";
    case TransferStatus::WaitingForExternalPowerDueToBatterySaverMode:
        return "WaitingForExternalPowerDueToBatterySaverMode";
    case TransferStatus::WaitingForNonVoiceBlockingNetwork:
        return "WaitingForNonVoiceBlockingNetwork";
    case TransferStatus::Paused:
        return "Paused";
    case TransferStatus::Completed:
        return "Completed";
    case TransferStatus::Failed:
        return "Failed";
    case TransferStatus::FailedServer:
        return "FailedServer";
    case TransferStatus::Canceled:
        return "Canceled";
    }
    return "Unknown";
}

const char *externalStatusName(ExternalStatus st) {
    switch (st) {
    case ExternalStatus::None:
        return "None";
    case ExternalStatus::Queued:
        return "Queued";
    case ExternalStatus::Transferring:
        return "Transferring";
    case ExternalStatus::Waiting:
        return "Waiting";
    case ExternalStatus::WaitingForWiFi:
        return "WaitingForWiFi";
    case ExternalStatus::WaitingForExternalPower:
        return "WaitingForExternalPower";
    case ExternalStatus::WaitingForExternalPowerDueToBatterySaverMode:
        return "WaitingForExternalPowerDueToBatterySaverMode";
    case ExternalStatus::WaitingForNonVoiceBlockingNetwork:
        return "WaitingForNonVoiceBlockingNetwork";
    case ExternalStatus::Paused:
        return "Paused";
    case ExternalStatus::Completed:
        return "Completed";
    case ExternalStatus::Unknown:
        return "Unknown";
    }
    return "Unknown";
}

const char *transferErrorName(TransferError e) {
    switch (e) {
    case TransferError::None:
        return "None";
    case TransferError::Canceled:
        return "Canceled";
    case TransferError::Network:
        return "Network";
    case TransferError::Remote:
        return "Remote";
    case TransferError::LocalStorage:
        return "LocalStorage";
    }
    return "Unknown";
}

const char *preferencesName(TransferPreferences p) {
    switch (p) {
    case TransferPreferences::None:
        return "None";
    case TransferPreferences::AllowBattery:
        return "AllowBattery";
    case TransferPreferences::AllowCellular:
        return "AllowCellular";
    case TransferPreferences::AllowCellularAndBattery:
        return "AllowCellularAndBattery";
    }
    return "Unknown";
}

bool isTerminal(TransferStatus st) {
    switch (st) {
    case TransferStatus::Completed:
    case TransferStatus::Failed:
    case TransferStatus::FailedServer:
    case TransferStatus::Canceled:
        return true;
    default:
        return false;
    }
}

TransferDirection directionForMethod(const QString &method) {
    return method.compare(QStringLiteral("GET"), Qt::CaseInsensitive) == 0
               ? TransferDirection::Download
               : TransferDirection::Upload;
}

namespace {

QString envValue(const char *name) {
    return qEnvironmentVariable(name).trimmed().toLower();
}

// BGTRANSFER_ENV=dev together with BGTRANSFER_LOG_SENSITIVE=1.
bool sensitiveLoggingEnabled() {
    const QString env = envValue("BGTRANSFER_ENV");
    if (env != QLatin1String("dev") && env != QLatin1String("development") &&
        env != QLatin1String("local") && env != QLatin1String("debug"))
        return false;
    const QString flag = envValue("BGTRANSFER_LOG_SENSITIVE");
    return flag == QLatin1String("1") || flag == QLatin1String("true") ||
           flag == QLatin1String("yes") || flag == QLatin1String("on");
}

} // namespace

QString redactedUrl(const QUrl &url) {
    if (sensitiveLoggingEnabled())
        return url.toString();
    return url.toString(QUrl::RemoveUserInfo | QUrl::RemoveQuery |
                        QUrl::RemoveFragment);
}

} // namespace bgtransfer
