#ifndef LOCALBACKEND_H
#define LOCALBACKEND_H

#include "mediabackend.h"

// Reads a folder that was already copied off the phone
class LocalBackend : public MediaBackend
{
public:
    explicit LocalBackend(const QString &sourceFolder);

    QString displayName() const override { return "Local Folder"; }
    QString sourceFolder() const { return m_sourceFolder; }

    // <source>/Media when present, else the source folder itself
    static QString detectMediaRoot(const QString &sourceFolder);

    MediaRootsResult mediaRoots() override;
    FileListResult listFiles(const MediaRoot &root,
                             const QString &subfolder) override;
    PathExistsResult exists(const QString &path) override;
    ModTimeResult modificationTime(const QString &path) override;
    TransferResult transfer(const QString &path,
                            const QString &destinationPath,
                            TransferMode mode) override;
    qint64 countFiles(const QString &directory, qint64 cap) override;
    QString joinPath(const QString &root,
                     const QString &subfolder) const override;

private:
    QString m_sourceFolder;
};

#endif // LOCALBACKEND_H
