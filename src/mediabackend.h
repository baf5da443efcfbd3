#ifndef MEDIABACKEND_H
#define MEDIABACKEND_H

#include "waexporter.h"
#include <QString>
#include <memory>

class AdbBridge;

/**
 * @brief Where the media files physically live
 *
 * A backend is bound to one locator (device serial or source folder) when
 * it is created. All calls block and are only made from the export worker.
 */
class MediaBackend
{
public:
    virtual ~MediaBackend() = default;

    virtual QString displayName() const = 0;

    /**
     * @brief Media roots that exist for this backend's locator
     *
     * Fails with BackendError::Unreachable when no root can be confirmed.
     */
    virtual MediaRootsResult mediaRoots() = 0;

    // Regular files below root/subfolder, recursively
    virtual FileListResult listFiles(const MediaRoot &root,
                                     const QString &subfolder) = 0;

    /**
     * @brief Whether @p path is a folder that can be scanned
     *
     * A missing folder is a successful probe with exists == false. Failing
     * to ask at all is reported as an error, never as absence.
     */
    virtual PathExistsResult exists(const QString &path) = 0;

    virtual ModTimeResult modificationTime(const QString &path) = 0;

    /**
     * @brief Transfer one file to a local destination path
     *
     * The parent directory of @p destinationPath is created when missing.
     * The call is never interrupted once started.
     */
    virtual TransferResult transfer(const QString &path,
                                    const QString &destinationPath,
                                    TransferMode mode) = 0;

    // Upfront estimate, stops counting once the count exceeds @p cap
    virtual qint64 countFiles(const QString &directory, qint64 cap) = 0;

    // Joins a root and a subfolder the way the backend names its paths
    virtual QString joinPath(const QString &root,
                             const QString &subfolder) const = 0;
};

/**
 * @brief Builds the backend variant a request asks for
 *
 * @p bridge is only used, and must outlive the backend, for remote
 * requests.
 */
std::unique_ptr<MediaBackend> createMediaBackend(const ExportRequest &request,
                                                 AdbBridge *bridge);

#endif // MEDIABACKEND_H
