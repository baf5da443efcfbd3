#include "remotebackend.h"

#include <gtest/gtest.h>

#include <QDir>
#include <QFileInfo>
#include <QTemporaryDir>

#include "adbbridge.h"
#include "cancellationtoken.h"
#include "exportmanager.h"
#include "test_fixtures.hpp"

namespace waexporter_test {
namespace {
const QString kScopedRoot = "/storage/emulated/0/Android/media/com.whatsapp/WhatsApp/Media";
const QString kLegacyRoot = "/storage/emulated/0/WhatsApp/Media";
}  // namespace

class RemoteBackendTests : public ::testing::Test {
 protected:
  FakeAdb       fake_;
  QTemporaryDir out_;

  void          SetUp() override {
    ASSERT_TRUE(fake_.IsValid());
    ASSERT_TRUE(out_.isValid());
  }

  QString DeviceDir(const QString& device_path) {
    const QString local = fake_.DevicePath(device_path);
    QDir().mkpath(local);
    return local;
  }
};

TEST_F(RemoteBackendTests, LegacyRootIsFoundAlone) {
  DeviceDir(kLegacyRoot);

  AdbBridge              bridge(fake_.Program());
  RemoteBackend          backend(&bridge, FakeAdb::kSerial);
  const MediaRootsResult roots = backend.mediaRoots();

  ASSERT_TRUE(roots.success) << roots.errorMessage.toStdString();
  ASSERT_EQ(roots.roots.size(), 1);
  EXPECT_EQ(roots.roots[0].path, kLegacyRoot);
}

TEST_F(RemoteBackendTests, BothRootsAreReturnedInProbeOrder) {
  DeviceDir(kLegacyRoot);
  DeviceDir(kScopedRoot);

  AdbBridge              bridge(fake_.Program());
  RemoteBackend          backend(&bridge, FakeAdb::kSerial);
  const MediaRootsResult roots = backend.mediaRoots();

  ASSERT_TRUE(roots.success);
  ASSERT_EQ(roots.roots.size(), 2);
  EXPECT_EQ(roots.roots[0].path, kScopedRoot);
  EXPECT_EQ(roots.roots[1].path, kLegacyRoot);
}

TEST_F(RemoteBackendTests, NoRootIsUnreachableAndNamesTheCandidates) {
  AdbBridge              bridge(fake_.Program());
  RemoteBackend          backend(&bridge, FakeAdb::kSerial);
  const MediaRootsResult roots = backend.mediaRoots();

  EXPECT_FALSE(roots.success);
  EXPECT_EQ(roots.error, BackendError::Unreachable);
  EXPECT_EQ(roots.errorMessage, "Could not find WhatsApp Media folder on the device.");
  EXPECT_EQ(roots.triedPaths, QStringList({kScopedRoot, kLegacyRoot}));
}

TEST_F(RemoteBackendTests, UnknownSerialIsUnreachable) {
  DeviceDir(kLegacyRoot);

  AdbBridge              bridge(fake_.Program());
  RemoteBackend          backend(&bridge, "GONE42");
  const MediaRootsResult roots = backend.mediaRoots();

  EXPECT_FALSE(roots.success);
  EXPECT_EQ(roots.error, BackendError::Unreachable);
  EXPECT_TRUE(roots.errorMessage.startsWith("Could not reach device GONE42"));

  const PathExistsResult probe = backend.exists(kLegacyRoot);
  EXPECT_FALSE(probe.success);
  EXPECT_EQ(probe.error, BackendError::Unreachable);
}

TEST_F(RemoteBackendTests, DeviceLostAfterRootProbeEndsTheRunFatally) {
  WriteFile(DeviceDir(kLegacyRoot), "WhatsApp Images/IMG-A.jpg", AtNoon(2025, 10, 1));
  // Both root candidates answer, everything after that fails
  ASSERT_TRUE(fake_.GoOfflineAfter(2));

  ExportRequest request;
  request.backendKind     = BackendKind::Remote;
  request.locator         = FakeAdb::kSerial;
  request.destinationRoot = out_.filePath("export");
  request.start           = ExportRequest::startOfDay(QDate(2025, 9, 17));
  request.end             = ExportRequest::endOfDay(QDate(2025, 12, 17));
  request.subfolders      = DEFAULT_SUBFOLDERS;

  AdbBridge           bridge(fake_.Program());
  ExportManager       manager(&bridge);
  ExportEventChannel  channel;
  CancellationToken   token;
  const ExportSummary summary = manager.run(request, channel, token);

  EXPECT_EQ(summary.outcome, ExportOutcome::Fatal);
  EXPECT_EQ(summary.scanned, 0);
  EXPECT_EQ(summary.errors, 1);

  const QList<ExportEvent> events = channel.drain();
  const QStringList        logs   = LogMessages(events);
  EXPECT_EQ(logs.filter("Skipping missing folder").size(), 0);
  EXPECT_FALSE(logs.contains("Export complete (ADB mode)."));
  ASSERT_EQ(logs.filter("FATAL (ADB mode): Could not check folder").size(), 1);
  EXPECT_TRUE(logs.filter("FATAL (ADB mode)").first().contains("device offline"));
  EXPECT_EQ(logs.last(), "Finished. Scanned=0, Exported=0, Errors=1.");
  EXPECT_EQ(ValuesOf(events, ExportEvent::Type::ErrorCount), QList<qint64>{1});
  EXPECT_EQ(events.last().type, ExportEvent::Type::Done);
  // Planning stops at the first folder that cannot be checked
  EXPECT_EQ(fake_.Calls().filter("shell").size(), 3);
}

TEST_F(RemoteBackendTests, JoinPathUsesDeviceSeparators) {
  AdbBridge     bridge(fake_.Program());
  RemoteBackend backend(&bridge, FakeAdb::kSerial);
  EXPECT_EQ(backend.joinPath(kLegacyRoot + "/", "WhatsApp Images"),
            kLegacyRoot + "/WhatsApp Images");
}

TEST_F(RemoteBackendTests, PullCreatesLocalParents) {
  WriteFile(DeviceDir(kLegacyRoot), "WhatsApp Audio/AUD 1.opus", AtNoon(2025, 10, 1), "ogg");

  AdbBridge            bridge(fake_.Program());
  RemoteBackend        backend(&bridge, FakeAdb::kSerial);
  const QString        target = out_.filePath("dest/WhatsApp Audio/AUD 1.opus");
  const TransferResult result =
      backend.transfer(kLegacyRoot + "/WhatsApp Audio/AUD 1.opus", target, TransferMode::Copy);

  ASSERT_TRUE(result.success) << result.errorMessage.toStdString();
  EXPECT_TRUE(QFileInfo::exists(target));
}

TEST_F(RemoteBackendTests, FailedPullIsATransferFailure) {
  DeviceDir(kLegacyRoot);

  AdbBridge            bridge(fake_.Program());
  RemoteBackend        backend(&bridge, FakeAdb::kSerial);
  const TransferResult result = backend.transfer(kLegacyRoot + "/nope.jpg",
                                                 out_.filePath("nope.jpg"), TransferMode::Copy);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, BackendError::TransferFailed);
  EXPECT_FALSE(result.errorMessage.isEmpty());
}

TEST_F(RemoteBackendTests, DeviceExportFiltersByDateAcrossBothRoots) {
  const QString legacy = DeviceDir(kLegacyRoot);
  const QString scoped = DeviceDir(kScopedRoot);
  WriteFile(scoped, "WhatsApp Images/IMG-A.jpg", AtNoon(2025, 10, 1));
  WriteFile(scoped, "WhatsApp Images/old.jpg", AtNoon(2025, 9, 1));
  WriteFile(legacy, "WhatsApp Images/IMG-A.jpg", AtNoon(2025, 11, 1));
  WriteFile(legacy, "WhatsApp Images/it's mine.jpg", AtNoon(2025, 11, 2));
  WriteFile(legacy, "WhatsApp Video/VID 1.mp4", AtNoon(2025, 12, 1));

  ExportRequest request;
  request.backendKind     = BackendKind::Remote;
  request.locator         = FakeAdb::kSerial;
  request.destinationRoot = out_.filePath("export");
  request.start           = ExportRequest::startOfDay(QDate(2025, 9, 17));
  request.end             = ExportRequest::endOfDay(QDate(2025, 12, 17));
  request.subfolders      = {"WhatsApp Images", "WhatsApp Video", "WhatsApp Audio"};

  AdbBridge           bridge(fake_.Program());
  ExportManager       manager(&bridge);
  ExportEventChannel  channel;
  CancellationToken   token;
  const ExportSummary summary = manager.run(request, channel, token);

  EXPECT_EQ(summary.outcome, ExportOutcome::Completed);
  EXPECT_EQ(summary.scanned, 5);
  EXPECT_EQ(summary.exported, 4);
  EXPECT_EQ(summary.errors, 0);
  EXPECT_EQ(ListTree(request.destinationRoot),
            QStringList({"WhatsApp Images/IMG-A.jpg", "WhatsApp Images/IMG-A__dup1.jpg",
                         "WhatsApp Images/it's mine.jpg", "WhatsApp Video/VID 1.mp4"}));

  const QList<ExportEvent> events = channel.drain();
  const QStringList        logs   = LogMessages(events);
  EXPECT_EQ(logs.first(), "Starting export...");
  EXPECT_TRUE(logs.contains(QString("Using media root(s): %1, %2").arg(kScopedRoot, kLegacyRoot)));
  EXPECT_TRUE(logs.contains("Export complete (ADB mode)."));
  EXPECT_TRUE(logs.contains(QString("Skipping missing folder: %1/WhatsApp Audio").arg(kScopedRoot)));
  EXPECT_EQ(events.last().type, ExportEvent::Type::Done);
}

}  // namespace waexporter_test
