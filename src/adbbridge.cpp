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
#include <QDateTime>
#include <QDebug>
#include <QProcess>

QStringList DeviceListResult::authorizedSerials() const
{
    QStringList serials;
    for (const AdbDevice &device : devices) {
        if (device.isAuthorized())
            serials.append(device.serial);
    }
    return serials;
}

AdbBridge::AdbBridge(const QString &program) : m_program(program) {}

AdbCommandResult AdbBridge::execute(const QStringList &arguments)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    AdbCommandResult result;
    QProcess process;
    process.setProgram(m_program);
    process.setArguments(arguments);

    qDebug() << "adb:" << arguments;
    process.start();
    if (!process.waitForStarted(-1)) {
        result.errorMessage = QString("Could not start %1: %2")
                                  .arg(m_program, process.errorString());
        qWarning() << result.errorMessage;
        return result;
    }

    // No timeout, a hung device call blocks until it returns
    process.waitForFinished(-1);

    result.output = QString::fromUtf8(process.readAllStandardOutput());
    const QString errorOutput =
        QString::fromUtf8(process.readAllStandardError()).trimmed();
    result.exitCode = process.exitCode();

    if (process.exitStatus() != QProcess::NormalExit ||
        process.exitCode() != 0) {
        result.errorMessage =
            errorOutput.isEmpty()
                ? QString("adb %1 failed").arg(arguments.join(' '))
                : errorOutput;
        qWarning() << "adb command failed:" << arguments
                   << "exit code:" << result.exitCode << result.errorMessage;
        return result;
    }

    result.success = true;
    return result;
}

QList<AdbDevice> AdbBridge::parseDeviceList(const QString &output)
{
    QList<AdbDevice> devices;
    const QStringList lines = output.trimmed().split('\n');
    // First line is the "List of devices attached" banner
    for (int i = 1; i < lines.size(); ++i) {
        const QStringList parts =
            lines.at(i).simplified().split(' ', Qt::SkipEmptyParts);
        if (parts.size() < 2)
            continue;
        devices.append(AdbDevice{parts.at(0), parts.at(1)});
    }
    return devices;
}

DeviceListResult AdbBridge::listDevices()
{
    DeviceListResult result;
    AdbCommandResult command = execute({"devices"});
    if (!command.success) {
        result.errorMessage = command.errorMessage.isEmpty()
                                  ? QString("adb devices failed")
                                  : command.errorMessage;
        return result;
    }

    result.devices = parseDeviceList(command.output);
    result.success = true;
    return result;
}

AdbCommandResult AdbBridge::shell(const QString &serial,
                                  const QString &command)
{
    return execute({"-s", serial, "shell", command});
}

AdbCommandResult AdbBridge::pull(const QString &serial,
                                 const QString &remotePath,
                                 const QString &localPath)
{
    return execute({"-s", serial, "pull", remotePath, localPath});
}

QString AdbBridge::shellQuote(const QString &argument)
{
    QString quoted = argument;
    quoted.replace('\'', "'\\''");
    return QString("'%1'").arg(quoted);
}

PathExistsResult AdbBridge::pathExists(const QString &serial,
                                       const QString &remotePath)
{
    PathExistsResult result;
    AdbCommandResult command =
        shell(serial, QString("ls %1 >/dev/null 2>&1; echo $?")
                          .arg(shellQuote(remotePath)));
    if (!command.success) {
        result.error = BackendError::Unreachable;
        result.errorMessage = command.errorMessage;
        return result;
    }

    const QStringList lines =
        command.output.trimmed().split('\n', Qt::SkipEmptyParts);
    result.exists = !lines.isEmpty() && lines.last().trimmed() == "0";
    result.success = true;
    return result;
}

FileListResult AdbBridge::findFiles(const QString &serial,
                                    const QString &remoteDir)
{
    FileListResult result;
    AdbCommandResult command = shell(
        serial,
        QString("find %1 -type f 2>/dev/null").arg(shellQuote(remoteDir)));
    if (!command.success) {
        result.error = BackendError::ListFailed;
        result.errorMessage = command.errorMessage;
        return result;
    }

    for (QString line : command.output.split('\n')) {
        if (line.endsWith('\r'))
            line.chop(1);
        if (!line.trimmed().isEmpty())
            result.files.append(line);
    }
    result.success = true;
    return result;
}

ModTimeResult AdbBridge::statModificationTime(const QString &serial,
                                              const QString &remotePath)
{
    ModTimeResult result;
    const QString quoted = shellQuote(remotePath);
    // Older devices ship stat only as a toybox applet
    AdbCommandResult command =
        shell(serial, QString("toybox stat -c %Y %1 2>/dev/null || "
                              "stat -c %Y %1")
                          .arg(quoted));
    if (!command.success) {
        result.error = BackendError::StatFailed;
        result.errorMessage = command.errorMessage;
        return result;
    }

    bool ok = false;
    const qint64 epoch = command.output.trimmed().toLongLong(&ok);
    if (!ok) {
        result.error = BackendError::StatFailed;
        result.errorMessage =
            QString("Unexpected stat output: %1").arg(command.output.trimmed());
        return result;
    }

    result.modificationTime = QDateTime::fromSecsSinceEpoch(epoch);
    result.success = true;
    return result;
}

qint64 AdbBridge::countFiles(const QString &serial, const QString &remoteDir)
{
    AdbCommandResult command =
        shell(serial, QString("find %1 -type f 2>/dev/null | wc -l")
                          .arg(shellQuote(remoteDir)));
    if (!command.success)
        return 0;

    bool ok = false;
    const qint64 count = command.output.trimmed().toLongLong(&ok);
    if (!ok) {
        qWarning() << "Could not parse file count for" << remoteDir << ":"
                   << command.output.trimmed();
        return 0;
    }
    return count;
}
