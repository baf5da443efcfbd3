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


#include "adbbridge.h"
#include "cancellationtoken.h"
#include "consoleobserver.h"
#include "exportmanager.h"
#include "settingsmanager.h"
#include "waexporter.h"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFutureWatcher>
#include <QTextStream>
#include <csignal>
#include <cstdio>

namespace
{
CancellationToken *g_cancelToken = nullptr;

void onInterrupt(int)
{
    if (g_cancelToken)
        g_cancelToken->cancel();
}

int exitCodeFor(ExportOutcome outcome)
{
    switch (outcome) {
    case ExportOutcome::Completed:
        return 0;
    case ExportOutcome::Cancelled:
        return 2;
    case ExportOutcome::Fatal:
    case ExportOutcome::Rejected:
        return 1;
    }
    return 1;
}

int listDevices(ExportManager &manager)
{
    QTextStream out(stdout);
    DeviceListResult result = manager.listDevices();
    if (!result.success) {
        out << "ADB error: " << result.errorMessage << Qt::endl;
        return 1;
    }
    if (result.devices.isEmpty()) {
        out << "No devices detected. Check USB debugging and authorization."
            << Qt::endl;
        return 0;
    }
    for (const AdbDevice &device : result.devices)
        out << device.serial << "\t" << device.state << Qt::endl;
    return 0;
}
} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(TOOL_NAME);
    QCoreApplication::setApplicationName(TOOL_NAME);
    QCoreApplication::setApplicationVersion(APP_VERSION);

    SettingsManager *settings = SettingsManager::sharedInstance();

    QCommandLineParser parser;
    parser.setApplicationDescription(
        APP_LABEL ": export WhatsApp media inside a date range, from a "
                  "phone over adb or from a folder copied off the phone.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption listDevicesOption(
        "list-devices", "List connected adb devices and exit.");
    QCommandLineOption deviceOption(
        "device", "Read from the adb device with this serial.", "serial");
    QCommandLineOption sourceOption(
        "source", "Read from a folder copied off the phone.", "dir");
    QCommandLineOption destOption("dest", "Destination export folder.",
                                  "dir", settings->lastDestination());
    QCommandLineOption startOption(
        "start", "First day of the range (yyyy-MM-dd).", "date",
        settings->lastStartDate().toString(DATE_FORMAT));
    QCommandLineOption endOption(
        "end", "Last day of the range, inclusive (yyyy-MM-dd).", "date",
        settings->lastEndDate().toString(DATE_FORMAT));
    QCommandLineOption subfolderOption(
        "subfolder", "Subfolder to scan, repeatable. Defaults to all.",
        "name");
    QCommandLineOption moveOption(
        "move", "Move instead of copy (local folders only).");
    QCommandLineOption adbOption("adb", "adb executable to use.", "path",
                                 settings->adbPath());

    parser.addOptions({listDevicesOption, deviceOption, sourceOption,
                       destOption, startOption, endOption, subfolderOption,
                       moveOption, adbOption});
    parser.process(app);

    QTextStream out(stdout);

    if (parser.isSet(adbOption))
        settings->setAdbPath(parser.value(adbOption));
    AdbBridge bridge(parser.value(adbOption));
    ExportManager manager(&bridge);

    if (parser.isSet(listDevicesOption))
        return listDevices(manager);

    const QDate startDate =
        QDate::fromString(parser.value(startOption).trimmed(), DATE_FORMAT);
    const QDate endDate =
        QDate::fromString(parser.value(endOption).trimmed(), DATE_FORMAT);
    if (!startDate.isValid() || !endDate.isValid()) {
        out << "Input error: dates must be in YYYY-MM-DD format." << Qt::endl;
        return 1;
    }

    ExportRequest request;
    request.destinationRoot = parser.value(destOption).trimmed();
    request.start = ExportRequest::startOfDay(startDate);
    request.end = ExportRequest::endOfDay(endDate);
    request.subfolders = parser.isSet(subfolderOption)
                             ? parser.values(subfolderOption)
                             : settings->defaultSubfolders();
    request.transferMode =
        parser.isSet(moveOption) ? TransferMode::Move : TransferMode::Copy;

    if (parser.isSet(sourceOption)) {
        request.backendKind = BackendKind::Local;
        request.locator = parser.value(sourceOption).trimmed();
    } else {
        request.backendKind = BackendKind::Remote;
        request.locator = parser.value(deviceOption).trimmed();
        // A move request is rejected below without touching adb
        if (request.locator.isEmpty() &&
            request.transferMode == TransferMode::Copy) {
            DeviceListResult devices = manager.listDevices();
            if (!devices.success) {
                out << "ADB error: " << devices.errorMessage << Qt::endl;
                return 1;
            }
            const QStringList serials = devices.authorizedSerials();
            if (serials.isEmpty()) {
                out << "No devices detected. Test with: adb devices"
                    << Qt::endl;
                return 1;
            }
            request.locator = serials.first();
            out << "Detected devices: " << serials.join(", ") << Qt::endl;
        }
    }

    // Reject early, before a worker is started
    RequestValidation validation = ExportManager::checkRequest(request);
    if (!validation.valid) {
        out << "Input error: " << validation.errorMessage << Qt::endl;
        return 1;
    }

    settings->setLastDestination(request.destinationRoot);
    settings->setLastDateRange(startDate, endDate);

    ExportEventChannel channel;
    CancellationToken token;
    g_cancelToken = &token;
    std::signal(SIGINT, onInterrupt);

    ConsoleObserver observer(&channel);
    QFutureWatcher<ExportSummary> watcher;
    QObject::connect(&watcher, &QFutureWatcher<ExportSummary>::finished, &app,
                     [&]() {
                         // Whatever is still queued, including Done
                         observer.poll();
                         app.exit(exitCodeFor(watcher.result().outcome));
                     });

    observer.start();
    watcher.setFuture(manager.start(request, channel, token));

    const int exitCode = app.exec();
    g_cancelToken = nullptr;
    return exitCode;
}
