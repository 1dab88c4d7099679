// bgtransfer: queues sftp:// transfers through the admission-controlled
// coordinator and prints status changes until every job is terminal.
#include "MemoryTransferRepository.hpp"
#include "SftpTransferGateway.hpp"
#include "StatusStateMachine.hpp"
#include "TransferCoordinator.hpp"
#include "TransferSettings.hpp"
#include "TransferStore.hpp"
#include "bgtransfer/Libssh2SftpClient.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QSettings>
#include <QTimer>
#include <QUrl>
#include <memory>
#include <iostream>
#include <mutex>
#include <vector>

Q_LOGGING_CATEGORY(bgCli, "bgtransfer.cli")

using namespace bgtransfer;

namespace {

std::mutex g_outMutex;

void printLine(const QString &line) {
    std::lock_guard<std::mutex> lk(g_outMutex);
    std::cout << line.toStdString() << std::endl;
}

bool parsePolicy(const QString &v, KnownHostsPolicy &out) {
    const QString s = v.trimmed().toLower();
    if (s == QStringLiteral("strict"))
        out = KnownHostsPolicy::Strict;
    else if (s == QStringLiteral("accept-new"))
        out = KnownHostsPolicy::AcceptNew;
    else if (s == QStringLiteral("off"))
        out = KnownHostsPolicy::Off;
    else
        return false;
    return true;
}

// Splits a store-relative file path into directory and file name.
bool splitLocal(const QString &path, QString &dir, QString &name) {
    const int slash = path.lastIndexOf('/');
    if (slash < 0) {
        dir = QString();
        name = path;
    } else {
        dir = path.left(slash);
        name = path.mid(slash + 1);
    }
    return !name.isEmpty();
}

// get <sftp-url> <local-path> | put <local-path> <sftp-url>
// A local path ending in '/' takes its file name from the URL.
TransferJobPtr buildJob(const QString &verb, const QString &a,
                        const QString &b, QString *why) {
    const bool download = verb.compare(QStringLiteral("get"),
                                       Qt::CaseInsensitive) == 0;
    const bool upload = verb.compare(QStringLiteral("put"),
                                     Qt::CaseInsensitive) == 0;
    if (!download && !upload) {
        *why = QStringLiteral("Unknown command: %1").arg(verb);
        return {};
    }
    const QString url = download ? a : b;
    QString local = download ? b : a;
    if (local.endsWith('/'))
        local += QUrl(url).fileName();

    QString dir, name;
    if (!splitLocal(local, dir, name)) {
        *why = QStringLiteral("No file name in %1").arg(local);
        return {};
    }
    // The store root itself is not a valid job directory.
    if (dir.isEmpty()) {
        *why = QStringLiteral("Local path needs a directory: %1").arg(local);
        return {};
    }

    auto job = std::make_shared<TransferJob>(download ? QStringLiteral("GET")
                                                      : QStringLiteral("PUT"));
    if (!job->setRemoteUrl(url, why) || !job->setLocalPath(dir, why) ||
        !job->setFilename(name, why))
        return {};
    return job;
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("BgTransfer"));
    QCoreApplication::setApplicationName(QStringLiteral("BgTransfer"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Queues SFTP transfers behind a limit of concurrent requests.\n"
        "Local paths are relative to the store root."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(
        QStringLiteral("transfers"),
        QStringLiteral("get <sftp-url> <local-path> | "
                       "put <local-path> <sftp-url>, repeatable."),
        QStringLiteral("<get|put> <from> <to>..."));

    const QCommandLineOption storeOpt(
        {QStringLiteral("s"), QStringLiteral("store")},
        QStringLiteral("Store root directory."), QStringLiteral("dir"));
    const QCommandLineOption maxOpt(
        {QStringLiteral("j"), QStringLiteral("max-active")},
        QStringLiteral("Concurrent requests (1-5)."), QStringLiteral("n"));
    const QCommandLineOption userOpt(
        {QStringLiteral("u"), QStringLiteral("user")},
        QStringLiteral("User for URLs without one."), QStringLiteral("name"));
    const QCommandLineOption keyOpt(
        {QStringLiteral("i"), QStringLiteral("identity")},
        QStringLiteral("Private key file."), QStringLiteral("path"));
    const QCommandLineOption knownHostsOpt(
        QStringLiteral("known-hosts"), QStringLiteral("known_hosts file."),
        QStringLiteral("path"));
    const QCommandLineOption policyOpt(
        QStringLiteral("host-key-policy"),
        QStringLiteral("strict, accept-new or off."), QStringLiteral("policy"));
    const QCommandLineOption saveOpt(
        QStringLiteral("save-settings"),
        QStringLiteral("Persist the effective settings."));
    parser.addOptions(
        {storeOpt, maxOpt, userOpt, keyOpt, knownHostsOpt, policyOpt, saveOpt});
    parser.process(app);

    QSettings qs;
    TransferSettings settings = TransferSettings::load(qs);
    if (parser.isSet(storeOpt))
        settings.storeRoot = parser.value(storeOpt);
    if (parser.isSet(maxOpt)) {
        bool ok = false;
        const int n = parser.value(maxOpt).toInt(&ok);
        if (!ok) {
            std::cerr << "Error: --max-active expects a number\n";
            return 2;
        }
        settings.setMaxActiveRequests(n);
    }
    if (parser.isSet(keyOpt))
        settings.sftpKeyPath = parser.value(keyOpt);
    if (parser.isSet(knownHostsOpt))
        settings.sftpKnownHosts = parser.value(knownHostsOpt);
    if (parser.isSet(policyOpt) &&
        !parsePolicy(parser.value(policyOpt), settings.sftpKnownHostsPolicy)) {
        std::cerr << "Error: unknown host key policy "
                  << parser.value(policyOpt).toStdString() << "\n";
        return 2;
    }
    if (parser.isSet(saveOpt)) {
        settings.save(qs);
        qs.sync();
    }

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty() || args.size() % 3 != 0) {
        parser.showHelp(2);
    }

    std::vector<TransferJobPtr> jobs;
    for (int i = 0; i < args.size(); i += 3) {
        QString why;
        auto job = buildJob(args[i], args[i + 1], args[i + 2], &why);
        if (!job) {
            std::cerr << "Error: " << why.toStdString() << "\n";
            return 2;
        }
        jobs.push_back(job);
    }

    SessionOptions base;
    if (parser.isSet(userOpt))
        base.username = parser.value(userOpt).toStdString();
    else
        base.username = qEnvironmentVariable("USER").toStdString();

    TransferStore store(settings.effectiveStoreRoot());
    MemoryTransferRepository repository;
    Libssh2SftpClient prototype;
    SftpTransferGateway gateway(prototype, store, settings, base);

    for (const auto &job : jobs)
        repository.insert(job);
    QString why;
    if (!repository.commit(&why)) {
        std::cerr << "Error: " << why.toStdString() << "\n";
        return 1;
    }

    for (const auto &job : jobs) {
        job->subscribe([](TransferStatus, TransferStatus cur, TransferJob &j) {
            QString line = QStringLiteral("[%1] %2 %3")
                               .arg(j.id())
                               .arg(QString::fromUtf8(statusName(cur)),
                                    j.fullLocalPath());
            if (cur == TransferStatus::Transferring && !j.isIndeterminate())
                line += QStringLiteral(" %1%").arg(
                    static_cast<int>(j.progress() * 100.0));
            printLine(line);
        });
    }

    qCInfo(bgCli) << "Starting" << "jobs=" << jobs.size()
                  << "maxActive=" << settings.maxActiveRequests
                  << "store=" << store.root();

    std::unique_ptr<TransferCoordinator> coordinator;
    try {
        coordinator = std::make_unique<TransferCoordinator>(
            gateway, repository, store, settings);
        coordinator->enqueueBatch(jobs);
    } catch (const UnhandledSuccessStatus &e) {
        qCCritical(bgCli) << "Aborting:" << e.what();
        return 1;
    }

    int exitCode = 0;
    QTimer poll;
    poll.setInterval(100);
    QObject::connect(&poll, &QTimer::timeout, &app, [&]() {
        for (const auto &job : jobs) {
            if (!isTerminal(job->status()))
                return;
        }
        poll.stop();
        coordinator->waitForCompletions();
        for (const auto &job : jobs) {
            if (job->status() != TransferStatus::Completed)
                exitCode = 1;
        }
        app.quit();
    });
    poll.start();
    app.exec();

    // The coordinator detaches from the gateway before the gateway goes.
    coordinator.reset();
    qCInfo(bgCli) << "Finished" << "exit=" << exitCode;
    return exitCode;
}
