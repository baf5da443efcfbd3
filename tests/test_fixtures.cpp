#include "test_fixtures.hpp"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>
#include <QTime>

namespace waexporter_test {

QDateTime AtNoon(int year, int month, int day) {
  return QDateTime(QDate(year, month, day), QTime(12, 0, 0));
}

bool SetModificationTime(const QString& path, const QDateTime& modified) {
  QFile file(path);
  if (!file.open(QIODevice::ReadOnly)) {
    return false;
  }
  const bool ok = file.setFileTime(modified, QFileDevice::FileModificationTime);
  file.close();
  return ok;
}

QString WriteFile(const QString& root, const QString& relative_path, const QDateTime& modified,
                  const QByteArray& content) {
  const QString path = QDir(root).filePath(relative_path);
  QDir().mkpath(QFileInfo(path).absolutePath());

  QFile file(path);
  if (!file.open(QIODevice::WriteOnly)) {
    return QString();
  }
  file.write(content);
  file.close();

  if (!SetModificationTime(path, modified)) {
    return QString();
  }
  return path;
}

QStringList ListTree(const QString& root) {
  QStringList files;
  QDirIterator it(root, QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot,
                  QDirIterator::Subdirectories);
  const QDir base(root);
  while (it.hasNext()) {
    files.append(base.relativeFilePath(it.next()));
  }
  files.sort();
  return files;
}

QList<ExportEvent::Type> EventTypes(const QList<ExportEvent>& events) {
  QList<ExportEvent::Type> types;
  for (const ExportEvent& event : events) {
    types.append(event.type);
  }
  return types;
}

QStringList LogMessages(const QList<ExportEvent>& events) {
  QStringList messages;
  for (const ExportEvent& event : events) {
    if (event.type == ExportEvent::Type::Log) {
      messages.append(event.message);
    }
  }
  return messages;
}

QList<qint64> ValuesOf(const QList<ExportEvent>& events, ExportEvent::Type type) {
  QList<qint64> values;
  for (const ExportEvent& event : events) {
    if (event.type == type) {
      values.append(event.value);
    }
  }
  return values;
}

PathExistsResult RecordingBackend::exists(const QString& path) {
  exists_calls.append(path);
  if (fail_exists_for.contains(QFileInfo(path).fileName())) {
    PathExistsResult result;
    result.error        = BackendError::Unreachable;
    result.errorMessage = "injected probe failure";
    return result;
  }
  return inner_.exists(path);
}

FileListResult RecordingBackend::listFiles(const MediaRoot& root, const QString& subfolder) {
  list_calls.append(subfolder);
  if (fail_list_for.contains(subfolder)) {
    FileListResult result;
    result.error        = BackendError::ListFailed;
    result.errorMessage = "injected list failure";
    return result;
  }
  return inner_.listFiles(root, subfolder);
}

ModTimeResult RecordingBackend::modificationTime(const QString& path) {
  stat_calls.append(path);
  if (cancel_token_ && stat_calls.size() == cancel_after_) {
    cancel_token_->cancel();
  }
  if (fail_stat_for.contains(QFileInfo(path).fileName())) {
    ModTimeResult result;
    result.error        = BackendError::StatFailed;
    result.errorMessage = "injected stat failure";
    return result;
  }
  return inner_.modificationTime(path);
}

TransferResult RecordingBackend::transfer(const QString& path, const QString& destination_path,
                                          TransferMode mode) {
  transfer_calls.append(path);
  if (fail_transfer_for.contains(QFileInfo(path).fileName())) {
    TransferResult result;
    result.error        = BackendError::TransferFailed;
    result.errorMessage = "injected transfer failure";
    return result;
  }
  return inner_.transfer(path, destination_path, mode);
}

namespace {
constexpr const char* kDeviceRoot = "/storage/emulated/0";

// Plays "adb devices", "adb -s <serial> shell <cmd>" and
// "adb -s <serial> pull <remote> <local>" against the sandbox.
constexpr const char* kFakeAdbScript = R"SCRIPT(#!/bin/sh
SANDBOX='@SANDBOX@'
CALL_LOG='@CALL_LOG@'
DEVICE_ROOT='@DEVICE_ROOT@'
SERIAL='@SERIAL@'
OFFLINE_AFTER='@OFFLINE_AFTER@'

printf '%s\n' "$*" >> "$CALL_LOG"

if [ "$1" = "-s" ] && [ -f "$OFFLINE_AFTER" ]; then
  limit=$(cat "$OFFLINE_AFTER")
  made=$(grep -c '^-s ' "$CALL_LOG")
  if [ "$made" -gt "$limit" ]; then
    echo "adb: device offline" >&2
    exit 1
  fi
fi

if [ "$1" = "devices" ]; then
  printf 'List of devices attached\n%s\tdevice\nEMU5554\tunauthorized\n\n' "$SERIAL"
  exit 0
fi

if [ "$1" != "-s" ]; then
  echo "adb: usage error" >&2
  exit 1
fi

if [ "$2" != "$SERIAL" ]; then
  echo "adb: device '$2' not found" >&2
  exit 1
fi

case "$3" in
  shell)
    mapped=$(printf '%s' "$4" | sed "s#$DEVICE_ROOT#$SANDBOX#g")
    out=$(sh -c "$mapped")
    rc=$?
    if [ -n "$out" ]; then
      printf '%s\n' "$out" | sed "s#$SANDBOX#$DEVICE_ROOT#g"
    fi
    exit $rc
    ;;
  pull)
    src=$(printf '%s' "$4" | sed "s#$DEVICE_ROOT#$SANDBOX#g")
    if ! cp -p "$src" "$5" 2>/dev/null; then
      echo "adb: error: failed to stat remote object '$4'" >&2
      exit 1
    fi
    exit 0
    ;;
esac

echo "adb: unknown command $3" >&2
exit 1
)SCRIPT";
}  // namespace

FakeAdb::FakeAdb() {
  if (!dir_.isValid()) {
    return;
  }

  sandbox_  = dir_.filePath("device");
  call_log_ = dir_.filePath("calls.log");
  program_  = dir_.filePath("adb");
  offline_after_ = dir_.filePath("offline_after");
  QDir().mkpath(sandbox_);

  QString script = QString::fromUtf8(kFakeAdbScript);
  script.replace("@SANDBOX@", sandbox_);
  script.replace("@CALL_LOG@", call_log_);
  script.replace("@DEVICE_ROOT@", QString::fromUtf8(kDeviceRoot));
  script.replace("@SERIAL@", QString::fromUtf8(kSerial));
  script.replace("@OFFLINE_AFTER@", offline_after_);

  QFile file(program_);
  if (!file.open(QIODevice::WriteOnly)) {
    return;
  }
  file.write(script.toUtf8());
  file.close();

  valid_ = file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner |
                               QFileDevice::ExeOwner);
}

QString FakeAdb::DevicePath(const QString& device_path) const {
  QString mapped = device_path;
  mapped.replace(QString::fromUtf8(kDeviceRoot), sandbox_);
  return mapped;
}

bool FakeAdb::GoOfflineAfter(int calls) {
  QFile file(offline_after_);
  if (!file.open(QIODevice::WriteOnly)) {
    return false;
  }
  file.write(QByteArray::number(calls));
  file.close();
  return true;
}

QStringList FakeAdb::Calls() const {
  QFile file(call_log_);
  if (!file.open(QIODevice::ReadOnly)) {
    return {};
  }
  QStringList calls;
  QTextStream in(&file);
  while (!in.atEnd()) {
    const QString line = in.readLine();
    if (!line.isEmpty()) {
      calls.append(line);
    }
  }
  return calls;
}

}  // namespace waexporter_test
