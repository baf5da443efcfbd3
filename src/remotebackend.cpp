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


#include "remotebackend.h"
#include "adbbridge.h"
#include <QDebug>
#include <QDir>
#include <QFileInfo>

RemoteBackend::RemoteBackend(AdbBridge *bridge, const QString &serial)
    : m_bridge(bridge), m_serial(serial)
{
}

MediaRootsResult RemoteBackend::mediaRoots()
{
    MediaRootsResult result;
    result.triedPaths = REMOTE_MEDIA_ROOT_CANDIDATES;

    for (const QString &candidate : REMOTE_MEDIA_ROOT_CANDIDATES) {
        PathExistsResult probe = m_bridge->pathExists(m_serial, candidate);
        if (!probe.success) {
            result.error = BackendError::Unreachable;
            result.errorMessage = QString("Could not reach device %1: %2")
                                      .arg(m_serial, probe.errorMessage);
            result.roots.clear();
            return result;
        }
        if (probe.exists)
            result.roots.append(MediaRoot{candidate});
    }

    if (result.roots.isEmpty()) {
        result.error = BackendError::Unreachable;
        result.errorMessage =
            "Could not find WhatsApp Media folder on the device.";
        return result;
    }

    result.success = true;
    return result;
}

FileListResult RemoteBackend::listFiles(const MediaRoot &root,
                                        const QString &subfolder)
{
    // One round trip per subfolder, never one per file
    return m_bridge->findFiles(m_serial, joinPath(root.path, subfolder));
}

PathExistsResult RemoteBackend::exists(const QString &path)
{
    PathExistsResult probe = m_bridge->pathExists(m_serial, path);
    if (!probe.success)
        qWarning() << "Existence check failed for" << path << ":"
                   << probe.errorMessage;
    return probe;
}

ModTimeResult RemoteBackend::modificationTime(const QString &path)
{
    return m_bridge->statModificationTime(m_serial, path);
}

TransferResult RemoteBackend::transfer(const QString &path,
                                       const QString &destinationPath,
                                       TransferMode mode)
{
    // adb only pulls, move requests never get this far
    Q_UNUSED(mode);

    TransferResult result;
    const QString parentDir = QFileInfo(destinationPath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        result.error = BackendError::TransferFailed;
        result.errorMessage =
            QString("Could not create directory: %1").arg(parentDir);
        return result;
    }

    AdbCommandResult command = m_bridge->pull(m_serial, path, destinationPath);
    if (!command.success) {
        result.error = BackendError::TransferFailed;
        result.errorMessage = command.errorMessage;
        return result;
    }

    result.success = true;
    return result;
}

qint64 RemoteBackend::countFiles(const QString &directory, qint64 cap)
{
    // The device counts in one round trip, the cap only bounds local walks
    Q_UNUSED(cap);
    return m_bridge->countFiles(m_serial, directory);
}

QString RemoteBackend::joinPath(const QString &root,
                                const QString &subfolder) const
{
    QString joined = root;
    while (joined.endsWith('/'))
        joined.chop(1);
    return joined + "/" + subfolder;
}
