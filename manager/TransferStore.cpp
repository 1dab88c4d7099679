#include "TransferStore.hpp"
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
Q_LOGGING_CATEGORY(bgStore, "bgtransfer.store")

namespace bgtransfer {

static QString stripLeadingSlash(QString p) {
    while (p.startsWith('/'))
        p.remove(0, 1);
    return p;
}

TransferStore::TransferStore(const QString &root) : root_(root) {}

QString TransferStore::absolutePath(const QString &relative) const {
    return QDir::cleanPath(root_.absoluteFilePath(stripLeadingSlash(relative)));
}

bool TransferStore::exists(const QString &relative) const {
    return QFileInfo(absolutePath(relative)).isFile();
}

qint64 TransferStore::fileSize(const QString &relative) const {
    const QFileInfo fi(absolutePath(relative));
    return fi.isFile() ? fi.size() : -1;
}

bool TransferStore::ensureDirectory(const QString &relativeDir, QString *why) {
    const QString abs = absolutePath(relativeDir);
    if (QFileInfo(abs).isDir())
        return true;
    if (!QDir().mkpath(abs)) {
        if (why)
            *why = QStringLiteral("Could not create directory: %1").arg(abs);
        qCWarning(bgStore) << "mkpath failed" << "path=" << abs;
        return false;
    }
    return true;
}

bool TransferStore::copyFile(const QString &from, const QString &to,
                             QString *why) {
    const QString src = absolutePath(from);
    const QString dst = absolutePath(to);
    if (QFile::exists(dst) && !QFile::remove(dst)) {
        if (why)
            *why = QStringLiteral("Could not replace: %1").arg(dst);
        return false;
    }
    QFile in(src);
    if (!in.copy(dst)) {
        if (why)
            *why = QStringLiteral("Could not copy %1 to %2: %3")
                       .arg(src, dst, in.errorString());
        qCWarning(bgStore) << "copy failed"
                           << "from=" << src << "to=" << dst
                           << "error=" << in.errorString();
        return false;
    }
    return true;
}

bool TransferStore::moveIntoPlace(const QString &from, const QString &to,
                                  QString *why) {
    const QString src = absolutePath(from);
    const QString dst = absolutePath(to);
    if (!QFileInfo(src).isFile()) {
        if (why)
            *why = QStringLiteral("Staged file missing: %1").arg(src);
        return false;
    }
    if (QFile::exists(dst) && !QFile::remove(dst)) {
        if (why)
            *why = QStringLiteral("Could not replace: %1").arg(dst);
        return false;
    }
    QFile staged(src);
    if (!staged.rename(dst)) {
        if (why)
            *why = QStringLiteral("Could not move %1 to %2: %3")
                       .arg(src, dst, staged.errorString());
        qCWarning(bgStore) << "rename failed"
                           << "from=" << src << "to=" << dst
                           << "error=" << staged.errorString();
        return false;
    }
    qCInfo(bgStore) << "moved into place" << "to=" << dst;
    return true;
}

bool TransferStore::removeFile(const QString &relative, QString *why) {
    const QString abs = absolutePath(relative);
    if (!QFile::exists(abs))
        return true;
    QFile f(abs);
    if (!f.remove()) {
        if (why)
            *why = QStringLiteral("Could not remove %1: %2")
                       .arg(abs, f.errorString());
        return false;
    }
    return true;
}

} // namespace bgtransfer
