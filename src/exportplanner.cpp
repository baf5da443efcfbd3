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


#include "exportplanner.h"
#include "mediabackend.h"
#include <QDebug>
#include <QFileInfo>

int PlannedWork::existingFolderCount() const
{
    int count = 0;
    for (const PlannedFolder &folder : folders) {
        if (folder.exists)
            ++count;
    }
    return count;
}

ExportPlanner::ExportPlanner(qint64 estimateCap) : m_estimateCap(estimateCap)
{
}

PlannedWork ExportPlanner::plan(MediaBackend &backend,
                                const QList<MediaRoot> &roots,
                                const QStringList &subfolders) const
{
    PlannedWork work;

    for (const MediaRoot &root : roots) {
        for (const QString &subfolder : subfolders) {
            PlannedFolder folder;
            folder.root = root;
            folder.subfolder = subfolder;
            folder.path = backend.joinPath(root.path, subfolder);

            PathExistsResult probe = backend.exists(folder.path);
            if (!probe.success) {
                work.probeError = QString("Could not check folder %1: %2")
                                      .arg(folder.path, probe.errorMessage);
                qWarning() << "Planning stopped:" << work.probeError;
                return work;
            }
            folder.exists = probe.exists;
            work.folders.append(folder);
        }
    }

    for (PlannedFolder &folder : work.folders) {
        if (!folder.exists)
            continue;
        if (work.capped)
            break;

        folder.estimatedFiles = backend.countFiles(
            folder.path, m_estimateCap - work.estimatedTotal);
        work.estimatedTotal += folder.estimatedFiles;
        if (work.estimatedTotal > m_estimateCap) {
            work.capped = true;
            work.estimatedTotal = m_estimateCap;
        }
    }

    qDebug() << "Planned" << work.folders.size() << "folders,"
             << work.existingFolderCount() << "present, estimate"
             << work.estimatedTotal << (work.capped ? "(capped)" : "");
    return work;
}

QString ExportPlanner::uniqueDestinationPath(const QString &path)
{
    if (!QFileInfo::exists(path))
        return path;

    const int nameStart = path.lastIndexOf('/') + 1;
    const int dot = path.lastIndexOf('.');
    // A dot leading the file name is part of the name, not an extension
    const bool hasExtension = dot > nameStart;
    const QString base = hasExtension ? path.left(dot) : path;
    const QString extension = hasExtension ? path.mid(dot) : QString();

    for (qint64 counter = 1;; ++counter) {
        const QString candidate = base + DUPLICATE_MARKER +
                                  QString::number(counter) + extension;
        if (!QFileInfo::exists(candidate))
            return candidate;
    }
}

QString ExportPlanner::relativePath(const QString &root, const QString &file)
{
    QString prefix = root;
    while (prefix.endsWith('/'))
        prefix.chop(1);
    prefix += '/';

    if (file.startsWith(prefix) && file.size() > prefix.size())
        return file.mid(prefix.size());
    return file.mid(file.lastIndexOf('/') + 1);
}
