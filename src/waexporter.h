#pragma once
#include <QDate>
#include <QDateTime>
#include <QList>
#include <QString>
#include <QStringList>
#include <QtGlobal>
#include <optional>

#define TOOL_NAME "waexporter"
#define APP_LABEL "WhatsApp Media Exporter"
#define APP_VERSION "0.0.1"
#define ADB_DEFAULT_PROGRAM "adb"
#define ADB_PATH_ENV "WAEXPORTER_ADB"
#define LOCAL_MEDIA_SUBFOLDER "Media"
#define DUPLICATE_MARKER "__dup"
#define DATE_FORMAT "yyyy-MM-dd"
#define TIMESTAMP_FORMAT "yyyy-MM-dd HH:mm:ss"

// The local estimate walk stops counting past this many files
#define ESTIMATE_FILE_CAP 500000

// Probed in this order, every existing one is scanned
inline const QStringList REMOTE_MEDIA_ROOT_CANDIDATES = {
    "/storage/emulated/0/Android/media/com.whatsapp/WhatsApp/Media",
    "/storage/emulated/0/WhatsApp/Media",
};

inline const QStringList DEFAULT_SUBFOLDERS = {
    "WhatsApp Images",      "WhatsApp Video", "WhatsApp Documents",
    "WhatsApp Audio",       "WhatsApp Voice Notes", "Animated Gifs",
};

enum class BackendKind { Remote, Local };

enum class TransferMode { Copy, Move };

enum class BackendError {
    None,
    Unreachable,
    ListFailed,
    StatFailed,
    TransferFailed,
};

struct ExportRequest {
    BackendKind backendKind = BackendKind::Local;
    // Device serial for Remote, source folder for Local
    QString locator;
    QString destinationRoot;
    QDateTime start;
    QDateTime end;
    QStringList subfolders;
    TransferMode transferMode = TransferMode::Copy;

    static QDateTime startOfDay(const QDate &date);
    // Last second of the given day, the inclusive upper bound of a range
    static QDateTime endOfDay(const QDate &date);
};

struct RequestValidation {
    bool valid = false;
    QString errorMessage;
};

struct MediaRoot {
    QString path;
};

struct MediaRootsResult {
    bool success = false;
    BackendError error = BackendError::None;
    QList<MediaRoot> roots;
    QStringList triedPaths;
    QString errorMessage;
};

struct PathExistsResult {
    bool success = false;
    BackendError error = BackendError::None;
    bool exists = false;
    QString errorMessage;
};

struct FileListResult {
    bool success = false;
    BackendError error = BackendError::None;
    QStringList files;
    QString errorMessage;
};

struct ModTimeResult {
    bool success = false;
    BackendError error = BackendError::None;
    QDateTime modificationTime;
    QString errorMessage;
};

struct TransferResult {
    bool success = false;
    BackendError error = BackendError::None;
    QString errorMessage;
};

struct FileRecord {
    QString sourcePath;
    QString relativePath;
    QString rootPath;
    // Resolved on demand, only once the file is being filtered
    std::optional<QDateTime> modificationTime;
};

enum class ExportOutcome { Completed, Cancelled, Fatal, Rejected };

struct ExportSummary {
    ExportOutcome outcome = ExportOutcome::Fatal;
    qint64 scanned = 0;
    qint64 exported = 0;
    qint64 errors = 0;
    QString message;
};

QString exportOutcomeName(ExportOutcome outcome);
QString transferModeName(TransferMode mode);
