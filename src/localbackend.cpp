/*
 * waexporter: A free and open-source WhatsApp media export tool.
 *
 * Copyright (C) 2025 Uncore <https://github.com/uncor3>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */


#include "localbackend.h"
#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>

namespace
{
const QDir::Filters kFileFilters =
    QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot;

bool restoreModificationTime(const QString &path, const QDateTime &time)
{
    // Ownership is enough for futimens, read-only copies must work too
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return false;
    }
    const bool ok = file.setFileTime(time, QFileDevice::FileModificationTime);
    file.close();
    return ok;
}
} // namespace

LocalBackend::LocalBackend(const QString &sourceFolder)
    : m_sourceFolder(sourceFolder)
{
}

QString LocalBackend::detectMediaRoot(const QString &sourceFolder)
{
    const QString candidate =
        QDir(sourceFolder).filePath(LOCAL_MEDIA_SUBFOLDER);
    if (QFileInfo(candidate).isDir())
        return QDir::cleanPath(candidate);
    return QDir::cleanPath(sourceFolder);
}

MediaRootsResult LocalBackend::mediaRoots()
{
    MediaRootsResult result;
    result.triedPaths = {m_sourceFolder};

    if (!QFileInfo(m_sourceFolder).isDir()) {
        result.error = BackendError::Unreachable;
        result.errorMessage =
            QString("Source folder does not exist: %1").arg(m_sourceFolder);
        return result;
    }

    result.roots.append(MediaRoot{detectMediaRoot(m_sourceFolder)});
    result.success = true;
    return result;
}

FileListResult LocalBackend::listFiles(const MediaRoot &root,
                                       const QString &subfolder)
{
    FileListResult result;
    const QString directory = joinPath(root.path, subfolder);
    if (!QFileInfo(directory).isDir()) {
        result.error = BackendError::ListFailed;
        result.errorMessage = QString("Not a directory: %1").arg(directory);
        return result;
    }

    QDirIterator it(directory, kFileFilters, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        result.files.append(it.next());
    }
    result.success = true;
    return result;
}

PathExistsResult LocalBackend::exists(const QString &path)
{
    // A plain file named like a subfolder is as good as missing
    PathExistsResult result;
    result.exists = QFileInfo(path).isDir();
    result.success = true;
    return result;
}

ModTimeResult LocalBackend::modificationTime(const QString &path)
{
    ModTimeResult result;
    QFileInfo info(path);
    if (!info.exists()) {
        result.error = BackendError::StatFailed;
        result.errorMessage = QString("No such file: %1").arg(path);
        return result;
    }

    result.modificationTime = info.lastModified();
    if (!result.modificationTime.isValid()) {
        result.error = BackendError::StatFailed;
        result.errorMessage =
            QString("Could not read modification time of %1").arg(path);
        return result;
    }

    result.success = true;
    return result;
}

TransferResult LocalBackend::transfer(const QString &path,
                                      const QString &destinationPath,
                                      TransferMode mode)
{
    TransferResult result;
    result.error = BackendError::TransferFailed;

    const QString parentDir = QFileInfo(destinationPath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        result.errorMessage =
            QString("Could not create directory: %1").arg(parentDir);
        return result;
    }

    if (QFileInfo::exists(destinationPath)) {
        result.errorMessage =
            QString("Destination already exists: %1").arg(destinationPath);
        return result;
    }

    const QDateTime modificationTime = QFileInfo(path).lastModified();
    QFile source(path);

    if (mode == TransferMode::Copy) {
        if (!source.copy(destinationPath)) {
            result.errorMessage = source.errorString();
            return result;
        }
    } else {
        // Falls back to copy + remove across filesystems
        if (!source.rename(destinationPath)) {
            result.errorMessage = source.errorString();
            return result;
        }
    }

    if (modificationTime.isValid() &&
        QFileInfo(destinationPath).lastModified() != modificationTime &&
        !restoreModificationTime(destinationPath, modificationTime)) {
        qWarning() << "Could not set modification time for"
                   << destinationPath;
    }

    result.error = BackendError::None;
    result.success = true;
    return result;
}

qint64 LocalBackend::countFiles(const QString &directory, qint64 cap)
{
    qint64 count = 0;
    QDirIterator it(directory, kFileFilters, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        if (++count > cap)
            break;
    }
    return count;
}

QString LocalBackend::joinPath(const QString &root,
                               const QString &subfolder) const
{
    return QDir(root).filePath(subfolder);
}
