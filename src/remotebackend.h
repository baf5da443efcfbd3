#ifndef REMOTEBACKEND_H
#define REMOTEBACKEND_H

#include "mediabackend.h"

class AdbBridge;

class RemoteBackend : public MediaBackend
{
public:
    RemoteBackend(AdbBridge *bridge, const QString &serial);

    QString displayName() const override { return "ADB"; }
    QString serial() const { return m_serial; }

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
    AdbBridge *m_bridge;
    QString m_serial;
};

#endif // REMOTEBACKEND_H
