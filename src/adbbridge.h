#ifndef ADBBRIDGE_H
#define ADBBRIDGE_H

#include "waexporter.h"
#include <QList>
#include <QString>
#include <QStringList>
#include <mutex>

struct AdbDevice {
    QString serial;
    // "device", "unauthorized", "offline", ...
    QString state;

    bool isAuthorized() const { return state == "device"; }
};

struct AdbCommandResult {
    bool success = false;
    int exitCode = -1;
    QString output;
    QString errorMessage;
};

struct DeviceListResult {
    bool success = false;
    QList<AdbDevice> devices;
    QString errorMessage;

    QStringList authorizedSerials() const;
};

/**
 * @brief Serialized access to the adb command line client
 *
 * Every call spawns one adb process and blocks until it exits. There is no
 * timeout, a stalled device stalls the caller. A non-zero exit status is a
 * failure and the process's stderr becomes the error detail.
 */
class AdbBridge
{
public:
    explicit AdbBridge(const QString &program = ADB_DEFAULT_PROGRAM);

    QString program() const { return m_program; }

    DeviceListResult listDevices();

    AdbCommandResult shell(const QString &serial, const QString &command);
    AdbCommandResult pull(const QString &serial, const QString &remotePath,
                          const QString &localPath);

    PathExistsResult pathExists(const QString &serial,
                                const QString &remotePath);
    FileListResult findFiles(const QString &serial, const QString &remoteDir);
    ModTimeResult statModificationTime(const QString &serial,
                                       const QString &remotePath);
    // Returns 0 when the count cannot be obtained
    qint64 countFiles(const QString &serial, const QString &remoteDir);

    static QString shellQuote(const QString &argument);
    static QList<AdbDevice> parseDeviceList(const QString &output);

private:
    AdbCommandResult execute(const QStringList &arguments);

    QString m_program;
    std::mutex m_mutex;
};

#endif // ADBBRIDGE_H
