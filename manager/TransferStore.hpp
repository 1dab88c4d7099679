// Local file area shared by the jobs and the gateway. Every path handed to
// the store is relative to its root; a leading '/' is ignored.
#pragma once
#include <QDir>
#include <QString>

namespace bgtransfer {

class TransferStore {
public:
    explicit TransferStore(const QString &root);

    QString root() const { return root_.absolutePath(); }
    QString absolutePath(const QString &relative) const;

    bool exists(const QString &relative) const;
    // -1 when the file does not exist.
    qint64 fileSize(const QString &relative) const;

    bool ensureDirectory(const QString &relativeDir, QString *why = nullptr);
    // Copies from -> to, replacing an existing destination.
    bool copyFile(const QString &from, const QString &to,
                  QString *why = nullptr);
    // Renames from -> to, replacing an existing destination.
    bool moveIntoPlace(const QString &from, const QString &to,
                       QString *why = nullptr);
    // Missing files count as removed.
    bool removeFile(const QString &relative, QString *why = nullptr);

private:
    QDir root_;
};

} // namespace bgtransfer
