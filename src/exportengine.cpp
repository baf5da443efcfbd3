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


#include "exportengine.h"
#include "cancellationtoken.h"
#include "mediabackend.h"
#include <QDebug>
#include <QDir>
#include <exception>

ExportEngine::ExportEngine(MediaBackend &backend, ExportEventChannel &channel,
                           const CancellationToken &token)
    : m_backend(backend), m_channel(channel), m_token(token)
{
}

ExportSummary ExportEngine::run(const ExportRequest &request,
                                const ExportPlanner &planner)
{
    ExportOutcome outcome = ExportOutcome::Fatal;
    try {
        outcome = execute(request, planner);
    } catch (const std::exception &e) {
        qWarning() << "Export run aborted:" << e.what();
        m_message = QString::fromUtf8(e.what());
        recordError(QString("FATAL (%1 mode): %2")
                        .arg(m_backend.displayName(), QString(e.what())));
        outcome = ExportOutcome::Fatal;
    }

    finish(outcome);
    return summary();
}

ExportSummary ExportEngine::summary() const
{
    ExportSummary summary;
    summary.outcome = m_outcome;
    summary.scanned = m_scanned;
    summary.exported = m_exported;
    summary.errors = m_errors;
    summary.message = m_message;
    return summary;
}

QString ExportEngine::summaryLine(qint64 scanned, qint64 exported,
                                  qint64 errors)
{
    return QString("Finished. Scanned=%1, Exported=%2, Errors=%3.")
        .arg(scanned)
        .arg(exported)
        .arg(errors);
}

ExportOutcome ExportEngine::execute(const ExportRequest &request,
                                    const ExportPlanner &planner)
{
    m_state = State::Scanning;

    MediaRootsResult rootsResult = m_backend.mediaRoots();
    if (!rootsResult.success) {
        m_message = rootsResult.errorMessage;
        log(QString("ERROR: %1").arg(rootsResult.errorMessage));
        if (!rootsResult.triedPaths.isEmpty())
            log(QString("Tried: %1").arg(rootsResult.triedPaths.join(" and ")));
        return ExportOutcome::Fatal;
    }

    QStringList rootPaths;
    for (const MediaRoot &root : rootsResult.roots)
        rootPaths.append(root.path);
    log(QString("Using media root(s): %1").arg(rootPaths.join(", ")));

    const PlannedWork work =
        planner.plan(m_backend, rootsResult.roots, request.subfolders);
    if (work.probeFailed()) {
        m_message = work.probeError;
        recordError(QString("FATAL (%1 mode): %2")
                        .arg(m_backend.displayName(), work.probeError));
        return ExportOutcome::Fatal;
    }

    if (work.capped) {
        emitEvent(ExportEvent::progressIndeterminate());
        log(QString("Estimated total files to scan: more than %1")
                .arg(work.estimatedTotal));
    } else if (work.estimatedTotal > 0) {
        emitEvent(ExportEvent::progressTotal(work.estimatedTotal));
        log(QString("Estimated total files to scan: %1")
                .arg(work.estimatedTotal));
    } else {
        emitEvent(ExportEvent::progressIndeterminate());
        log("Scanning... (progress is indeterminate)");
    }

    for (const MediaRoot &root : rootsResult.roots) {
        if (checkpoint())
            break;

        for (const PlannedFolder &folder : work.folders) {
            if (folder.root.path != root.path)
                continue;
            if (checkpoint())
                break;

            if (!folder.exists) {
                log(QString("Skipping missing folder: %1").arg(folder.path));
                continue;
            }
            exportFolder(folder, request);
        }
    }

    return checkpoint() ? ExportOutcome::Cancelled : ExportOutcome::Completed;
}

void ExportEngine::exportFolder(const PlannedFolder &folder,
                                const ExportRequest &request)
{
    FileListResult listing = m_backend.listFiles(folder.root, folder.subfolder);
    if (!listing.success) {
        recordError(QString("ERROR listing files in: %1 (%2)")
                        .arg(folder.path, listing.errorMessage));
        return;
    }

    for (const QString &path : listing.files) {
        if (checkpoint())
            return;

        FileRecord record;
        record.sourcePath = path;
        record.rootPath = folder.root.path;
        record.relativePath = ExportPlanner::relativePath(folder.root.path, path);
        processFile(record, request);
    }
}

void ExportEngine::processFile(FileRecord &record,
                               const ExportRequest &request)
{
    m_state = State::Filtering;

    ++m_scanned;
    emitEvent(ExportEvent::scannedCount(m_scanned));
    emitEvent(ExportEvent::progressTick(1));

    ModTimeResult modTime = m_backend.modificationTime(record.sourcePath);
    if (!modTime.success) {
        recordError(QString("ERROR reading time: %1 (%2)")
                        .arg(record.sourcePath, modTime.errorMessage));
        return;
    }
    record.modificationTime = modTime.modificationTime;

    // The date window is the only selection criterion
    if (*record.modificationTime < request.start ||
        *record.modificationTime > request.end)
        return;

    const QString destination = ExportPlanner::uniqueDestinationPath(
        QDir(request.destinationRoot).filePath(record.relativePath));

    m_state = State::Transferring;
    TransferResult transfer = m_backend.transfer(
        record.sourcePath, destination, request.transferMode);
    m_state = State::Filtering;

    if (!transfer.success) {
        recordError(QString("ERROR exporting: %1 (%2)")
                        .arg(record.relativePath, transfer.errorMessage));
        return;
    }

    ++m_exported;
    emitEvent(ExportEvent::exportedCount(m_exported));
    log(QString("Exported: %1  (modified: %2)")
            .arg(record.relativePath,
                 record.modificationTime->toString(TIMESTAMP_FORMAT)));
}

void ExportEngine::finish(ExportOutcome outcome)
{
    if (m_state == State::Finished)
        return;

    m_outcome = outcome;
    m_state = State::Finished;

    if (outcome == ExportOutcome::Cancelled) {
        log("Cancelled by user.");
    } else if (outcome == ExportOutcome::Completed) {
        log(QString("Export complete (%1 mode).").arg(m_backend.displayName()));
    }

    log(summaryLine(m_scanned, m_exported, m_errors));
    emitEvent(ExportEvent::done());

    qDebug() << "Export finished -" << exportOutcomeName(outcome)
             << "Scanned:" << m_scanned << "Exported:" << m_exported
             << "Errors:" << m_errors;
}

bool ExportEngine::checkpoint()
{
    if (!m_token.isCancelled())
        return false;

    if (!m_cancelLogged) {
        qDebug() << "Export cancellation observed after" << m_scanned
                 << "scanned files";
        m_cancelLogged = true;
    }
    return true;
}

void ExportEngine::emitEvent(const ExportEvent &event)
{
    m_channel.push(event);
}

void ExportEngine::log(const QString &message)
{
    emitEvent(ExportEvent::log(message));
}

void ExportEngine::recordError(const QString &message)
{
    ++m_errors;
    emitEvent(ExportEvent::errorCount(m_errors));
    log(message);
}
