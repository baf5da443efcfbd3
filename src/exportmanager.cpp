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


#include "exportmanager.h"
#include "cancellationtoken.h"
#include "exportengine.h"
#include "mediabackend.h"
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QScopeGuard>
#include <QtConcurrent/QtConcurrent>
#include <exception>

ExportManager::ExportManager(AdbBridge *bridge) : m_bridge(bridge) {}

RequestValidation ExportManager::checkRequest(const ExportRequest &request)
{
    RequestValidation validation;

    if (request.destinationRoot.trimmed().isEmpty()) {
        validation.errorMessage = "Please select a Destination folder.";
        return validation;
    }

    if (!request.start.isValid() || !request.end.isValid()) {
        validation.errorMessage = "Please enter valid start and end dates.";
        return validation;
    }

    if (request.end < request.start) {
        validation.errorMessage =
            "End date must be the same as or later than start date.";
        return validation;
    }

    if (request.subfolders.isEmpty()) {
        validation.errorMessage =
            "Please select at least one subfolder to scan.";
        return validation;
    }

    if (request.backendKind == BackendKind::Remote) {
        if (request.transferMode == TransferMode::Move) {
            validation.errorMessage = "Move mode is not supported in USB "
                                      "Device (ADB) mode. Use Copy.";
            return validation;
        }
        if (request.locator.trimmed().isEmpty()) {
            validation.errorMessage = "Please select a connected device.";
            return validation;
        }
    } else if (request.locator.trimmed().isEmpty() ||
               !QFileInfo(request.locator).isDir()) {
        validation.errorMessage =
            "Please select a valid Source folder (copied from phone).";
        return validation;
    }

    validation.valid = true;
    return validation;
}

RequestValidation ExportManager::validateRequest(const ExportRequest &request)
{
    RequestValidation validation = checkRequest(request);
    if (!validation.valid)
        return validation;

    // Only created once everything else about the request is fine
    QDir destDir(request.destinationRoot);
    if (!destDir.exists() && !destDir.mkpath(".")) {
        validation.valid = false;
        validation.errorMessage =
            QString("Could not create destination folder: %1")
                .arg(request.destinationRoot);
    }
    return validation;
}

ExportSummary ExportManager::run(const ExportRequest &request,
                                 ExportEventChannel &channel,
                                 const CancellationToken &token)
{
    ExportSummary summary;

    // Whatever happens below, the observer gets a summary and Done
    auto closeChannel = qScopeGuard([&summary, &channel]() {
        if (channel.isClosed())
            return;
        channel.push(ExportEvent::log(ExportEngine::summaryLine(
            summary.scanned, summary.exported, summary.errors)));
        channel.push(ExportEvent::done());
    });

    RequestValidation validation = validateRequest(request);
    if (!validation.valid) {
        qWarning() << "Rejected export request:" << validation.errorMessage;
        channel.push(
            ExportEvent::log(QString("Input error: %1")
                                 .arg(validation.errorMessage)));
        summary.outcome = ExportOutcome::Rejected;
        summary.message = validation.errorMessage;
        return summary;
    }

    qDebug() << "Starting export from" << request.locator << "to"
             << request.destinationRoot << "mode"
             << transferModeName(request.transferMode) << "range"
             << request.start << "-" << request.end;

    try {
        channel.push(ExportEvent::log("Starting export..."));

        std::unique_ptr<MediaBackend> backend =
            createMediaBackend(request, m_bridge);
        if (!backend) {
            summary.outcome = ExportOutcome::Fatal;
            summary.message = "No backend available for this request";
            channel.push(ExportEvent::log(summary.message));
            return summary;
        }

        ExportEngine engine(*backend, channel, token);
        summary = engine.run(request, m_planner);
    } catch (const std::exception &e) {
        qWarning() << "Export failed before completion:" << e.what();
        summary.outcome = ExportOutcome::Fatal;
        summary.message = QString::fromUtf8(e.what());
        ++summary.errors;
        channel.push(ExportEvent::errorCount(summary.errors));
        channel.push(
            ExportEvent::log(QString("FATAL: %1").arg(summary.message)));
    }

    return summary;
}

QFuture<ExportSummary> ExportManager::start(const ExportRequest &request,
                                            ExportEventChannel &channel,
                                            const CancellationToken &token)
{
    return QtConcurrent::run([this, request, &channel, &token]() {
        return run(request, channel, token);
    });
}

DeviceListResult ExportManager::listDevices()
{
    DeviceListResult result = m_bridge->listDevices();
    if (!result.success) {
        qWarning() << "ADB error:" << result.errorMessage;
        return result;
    }
    qDebug() << "Detected devices:" << result.authorizedSerials();
    return result;
}
