#ifndef EXPORTPLANNER_H
#define EXPORTPLANNER_H

#include "waexporter.h"
#include <QList>
#include <QString>
#include <QStringList>

class MediaBackend;

struct PlannedFolder {
    MediaRoot root;
    QString subfolder;
    // Backend path of root/subfolder
    QString path;
    bool exists = false;
    qint64 estimatedFiles = 0;
};

struct PlannedWork {
    // Every root x subfolder pair, roots first, in request order
    QList<PlannedFolder> folders;
    qint64 estimatedTotal = 0;
    // The estimate walk hit ESTIMATE_FILE_CAP, progress is indeterminate
    bool capped = false;
    // Set when a folder could not be probed, planning stops there
    QString probeError;

    bool probeFailed() const { return !probeError.isEmpty(); }
    int existingFolderCount() const;
};

class ExportPlanner
{
public:
    explicit ExportPlanner(qint64 estimateCap = ESTIMATE_FILE_CAP);

    PlannedWork plan(MediaBackend &backend, const QList<MediaRoot> &roots,
                     const QStringList &subfolders) const;

    /**
     * @brief First free variant of @p path
     *
     * Returns @p path itself when nothing exists there, otherwise inserts
     * DUPLICATE_MARKER and an increasing number before the extension
     * ("IMG.jpg" -> "IMG__dup1.jpg", "IMG__dup2.jpg", ...). Existing files
     * are never chosen, so repeated runs only add siblings.
     */
    static QString uniqueDestinationPath(const QString &path);

    // Path of @p file below @p root, or its file name when it is not below
    static QString relativePath(const QString &root, const QString &file);

private:
    qint64 m_estimateCap;
};

#endif // EXPORTPLANNER_H
