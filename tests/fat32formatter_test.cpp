#include <QByteArray>
#include <QSignalSpy>
#include <QVector>
#include <QtEndian>

#include <gtest/gtest.h>

#include "support/memory_device_handle.h"

import kiln.core.fat32formatter;

using kiln::test::MemoryDeviceHandle;

namespace {

constexpr qint64 MiB = 1024LL * 1024;
constexpr qint64 GiB = 1024LL * MiB;

quint16 le16(const QByteArray& sector, int offset)
{
    return qFromLittleEndian<quint16>(sector.constData() + offset);
}

quint32 le32(const QByteArray& sector, int offset)
{
    return qFromLittleEndian<quint32>(sector.constData() + offset);
}

} // namespace

TEST(Fat32FormatterTest, SectorsPerClusterFollowsSizeBrackets)
{
    EXPECT_EQ(Fat32Formatter::sectorsPerClusterFor(64 * MiB), 1u);
    EXPECT_EQ(Fat32Formatter::sectorsPerClusterFor(64 * MiB + 1), 2u);
    EXPECT_EQ(Fat32Formatter::sectorsPerClusterFor(128 * MiB), 2u);
    EXPECT_EQ(Fat32Formatter::sectorsPerClusterFor(256 * MiB), 4u);
    EXPECT_EQ(Fat32Formatter::sectorsPerClusterFor(8 * GiB), 8u);
    EXPECT_EQ(Fat32Formatter::sectorsPerClusterFor(16 * GiB), 16u);
    EXPECT_EQ(Fat32Formatter::sectorsPerClusterFor(32 * GiB), 32u);
    EXPECT_EQ(Fat32Formatter::sectorsPerClusterFor(40 * GiB), 64u);
}

TEST(Fat32FormatterTest, FatIsLargeEnoughForEveryCluster)
{
    const qint64 sizes[] = {33 * MiB, 200 * MiB, 4 * GiB, 31 * GiB, 40 * GiB, 1024 * GiB};
    for (qint64 bytes : sizes) {
        Fat32Params p;
        ASSERT_TRUE(Fat32Formatter::calculateParams(bytes, p).ok()) << bytes;
        EXPECT_EQ(p.rootCluster, 2u);
        EXPECT_EQ(p.totalSectors, static_cast<quint32>(bytes / 512));
        EXPECT_GE(static_cast<qint64>(p.fatSizeSectors) * 512, (static_cast<qint64>(p.dataClusters) + 2) * 4);
        EXPECT_LE(32 + 2 * static_cast<qint64>(p.fatSizeSectors) + p.sectorsPerCluster, p.totalSectors);
    }
}

TEST(Fat32FormatterTest, FortyGiBUsesSixtyFourSectorClusters)
{
    Fat32Params p;
    ASSERT_TRUE(Fat32Formatter::calculateParams(40 * GiB, p).ok());
    EXPECT_EQ(p.sectorsPerCluster, 64u);
}

TEST(Fat32FormatterTest, RejectsUnaddressableAndTinyVolumes)
{
    Fat32Params p;
    EXPECT_EQ(Fat32Formatter::calculateParams(0, p).error, ErrorKind::InvalidArgument);
    EXPECT_EQ(Fat32Formatter::calculateParams(16 * 1024, p).error, ErrorKind::InvalidArgument);
    EXPECT_EQ(Fat32Formatter::calculateParams(3 * 1024 * GiB, p).error, ErrorKind::InvalidArgument);
}

TEST(Fat32FormatterTest, FewerThanMinimumClustersIsRejected)
{
    // 32 reserved sectors plus 65525 one-sector clusters.
    const qint64 smallest = (Fat32Formatter::ReservedSectors + Fat32Formatter::MinDataClusters) * 512;
    Fat32Params p;
    ASSERT_TRUE(Fat32Formatter::calculateParams(smallest, p).ok());
    EXPECT_EQ(p.dataClusters, 65525u);

    const OperationResult r = Fat32Formatter::calculateParams(smallest - 512, p);
    EXPECT_EQ(r.error, ErrorKind::InvalidArgument);
    EXPECT_EQ(r.category(), ErrorCategory::Configuration);
    EXPECT_EQ(Fat32Formatter::calculateParams(16 * MiB, p).error, ErrorKind::InvalidArgument);
}

TEST(Fat32FormatterTest, SmallDeviceIsRejectedBeforeWriting)
{
    MemoryDeviceHandle device(24 * MiB);
    Fat32Formatter formatter(&device);

    const OperationResult r = formatter.format(QStringLiteral("/dev/mem0"), QStringLiteral("x"));
    EXPECT_EQ(r.error, ErrorKind::InvalidArgument);
    EXPECT_TRUE(device.writes.isEmpty());
}

TEST(Fat32FormatterTest, VolumeLabelIsPaddedAndTruncated)
{
    EXPECT_EQ(Fat32Formatter::prepareVolumeLabel(QStringLiteral("KILN")), QByteArray("KILN       "));
    EXPECT_EQ(Fat32Formatter::prepareVolumeLabel(QStringLiteral("Provisioned card")), QByteArray("Provisioned"));
    EXPECT_EQ(Fat32Formatter::prepareVolumeLabel(QStringLiteral("sd")), QByteArray("sd         "));
    EXPECT_EQ(Fat32Formatter::prepareVolumeLabel(QString()), QByteArray(11, ' '));
}

TEST(Fat32FormatterTest, BootSectorFields)
{
    Fat32Params p;
    ASSERT_TRUE(Fat32Formatter::calculateParams(4 * GiB, p).ok());
    const QByteArray boot = Fat32Formatter::buildBootSector(p, Fat32Formatter::prepareVolumeLabel(QStringLiteral("BOOT")),
                                                            2048, 0x12345678u);
    ASSERT_EQ(boot.size(), 512);
    EXPECT_EQ(static_cast<quint8>(boot[0]), 0xEB);
    EXPECT_EQ(boot.mid(3, 8), QByteArray("MSWIN4.1"));
    EXPECT_EQ(le16(boot, 11), 512);
    EXPECT_EQ(static_cast<quint8>(boot[13]), p.sectorsPerCluster);
    EXPECT_EQ(le16(boot, 14), 32);
    EXPECT_EQ(static_cast<quint8>(boot[16]), 2);
    EXPECT_EQ(static_cast<quint8>(boot[21]), 0xF8);
    EXPECT_EQ(le32(boot, 28), 2048u);
    EXPECT_EQ(le32(boot, 32), p.totalSectors);
    EXPECT_EQ(le32(boot, 36), p.fatSizeSectors);
    EXPECT_EQ(le32(boot, 44), 2u);
    EXPECT_EQ(le16(boot, 48), 1);
    EXPECT_EQ(le16(boot, 50), 6);
    EXPECT_EQ(static_cast<quint8>(boot[66]), 0x29);
    EXPECT_EQ(le32(boot, 67), 0x12345678u);
    EXPECT_EQ(boot.mid(71, 11), QByteArray("BOOT       "));
    EXPECT_EQ(boot.mid(82, 8), QByteArray("FAT32   "));
    EXPECT_EQ(static_cast<quint8>(boot[510]), 0x55);
    EXPECT_EQ(static_cast<quint8>(boot[511]), 0xAA);
}

TEST(Fat32FormatterTest, FsInfoSignatures)
{
    const QByteArray info = Fat32Formatter::buildFsInfoSector();
    EXPECT_EQ(le32(info, 0), 0x41615252u);
    EXPECT_EQ(le32(info, 484), 0x61417272u);
    EXPECT_EQ(le32(info, 488), 0xFFFFFFFFu);
    EXPECT_EQ(le32(info, 492), 0xFFFFFFFFu);
    EXPECT_EQ(le32(info, 508), 0xAA550000u);
}

TEST(Fat32FormatterTest, WritesCompleteLayoutWithPartitionTable)
{
    const qint64 capacity = 64 * MiB;
    MemoryDeviceHandle device(capacity);
    Fat32Formatter formatter(&device);
    formatter.setVolumeSerial(0xCAFEF00Du);
    QSignalSpy finished(&formatter, &Fat32Formatter::finished);

    const OperationResult r = formatter.format(QStringLiteral("/dev/mem0"), QStringLiteral("MY CARD"));
    ASSERT_TRUE(r.ok()) << r.toString().toStdString();
    EXPECT_EQ(finished.count(), 1);
    EXPECT_FALSE(device.isOpen());
    EXPECT_EQ(device.closeCount, 1);
    EXPECT_GE(device.flushCount, 1);

    Fat32Params p;
    ASSERT_TRUE(Fat32Formatter::calculateParams(capacity - 2048 * 512, p).ok());

    const QByteArray mbr = device.sector(0);
    EXPECT_EQ(static_cast<quint8>(mbr[446]), 0x80);
    EXPECT_EQ(static_cast<quint8>(mbr[450]), 0x0C);
    EXPECT_EQ(le32(mbr, 454), 2048u);
    EXPECT_EQ(le32(mbr, 458), p.totalSectors);
    EXPECT_EQ(static_cast<quint8>(mbr[510]), 0x55);
    EXPECT_EQ(static_cast<quint8>(mbr[511]), 0xAA);

    const QByteArray boot = device.sector(2048);
    EXPECT_EQ(le32(boot, 28), 2048u);
    EXPECT_EQ(le32(boot, 67), 0xCAFEF00Du);
    EXPECT_EQ(boot.mid(71, 11), QByteArray("MY CARD    "));
    EXPECT_EQ(device.sector(2048 + 6), boot);
    EXPECT_EQ(device.sector(2048 + 7), device.sector(2048 + 1));
    EXPECT_EQ(le32(device.sector(2049), 0), 0x41615252u);

    const qint64 fat1 = 2048 + 32;
    const qint64 fat2 = fat1 + p.fatSizeSectors;
    for (qint64 fat : {fat1, fat2}) {
        const QByteArray first = device.sector(fat);
        EXPECT_EQ(le32(first, 0), 0x0FFFFFF8u);
        EXPECT_EQ(le32(first, 4), 0x0FFFFFFFu);
        EXPECT_EQ(le32(first, 8), 0x0FFFFFFFu);
    }

    const QByteArray root = device.sector(fat1 + 2 * static_cast<qint64>(p.fatSizeSectors));
    EXPECT_EQ(root.left(11), QByteArray("MY CARD    "));
    EXPECT_EQ(static_cast<quint8>(root[11]), 0x08);
}

TEST(Fat32FormatterTest, WithoutPartitionTableBootSectorIsAtStart)
{
    MemoryDeviceHandle device(40 * MiB);
    Fat32Formatter formatter(&device);
    formatter.setWritePartitionTable(false);
    formatter.setPartitionStartSector(0);

    ASSERT_TRUE(formatter.format(QStringLiteral("/dev/mem0"), QStringLiteral("raw")).ok());
    const QByteArray boot = device.sector(0);
    EXPECT_EQ(static_cast<quint8>(boot[0]), 0xEB);
    EXPECT_EQ(le32(boot, 28), 0u);
    EXPECT_EQ(le32(boot, 32), static_cast<quint32>(40 * MiB / 512));
}

TEST(Fat32FormatterTest, PartitionTableNeedsRoomBeforeStart)
{
    MemoryDeviceHandle device(40 * MiB);
    Fat32Formatter formatter(&device);
    formatter.setPartitionStartSector(0);

    const OperationResult r = formatter.format(QStringLiteral("/dev/mem0"), QStringLiteral("x"));
    EXPECT_EQ(r.error, ErrorKind::InvalidArgument);
    EXPECT_EQ(device.openCount, 0);
}

TEST(Fat32FormatterTest, ExplicitSizeOverridesDeviceCapacity)
{
    MemoryDeviceHandle device(64 * MiB);
    Fat32Formatter formatter(&device);
    ASSERT_TRUE(formatter.format(QStringLiteral("/dev/mem0"), QStringLiteral("x"), 48 * MiB).ok());
    EXPECT_EQ(le32(device.sector(0), 458), static_cast<quint32>((48 * MiB - 2048 * 512) / 512));
}

TEST(Fat32FormatterTest, PermissionDeniedIsDistinguished)
{
    MemoryDeviceHandle device(64 * MiB);
    device.openResult = DeviceResult::PermissionDenied;
    Fat32Formatter formatter(&device);

    const OperationResult r = formatter.format(QStringLiteral("/dev/mem0"), QStringLiteral("x"));
    EXPECT_EQ(r.error, ErrorKind::PermissionDenied);
    EXPECT_EQ(r.category(), ErrorCategory::Permission);
    EXPECT_TRUE(device.writes.isEmpty());
}

TEST(Fat32FormatterTest, ShortWriteIsFatalAndClosesDevice)
{
    MemoryDeviceHandle device(64 * MiB);
    device.failWriteOnCall = 3;
    Fat32Formatter formatter(&device);
    QVector<FormatProgress::Stage> stages;
    QObject::connect(&formatter, &Fat32Formatter::progress, [&stages](const FormatProgress& p) {
        stages.append(p.stage);
    });

    const OperationResult r = formatter.format(QStringLiteral("/dev/mem0"), QStringLiteral("x"));
    EXPECT_EQ(r.error, ErrorKind::ShortWrite);
    EXPECT_EQ(r.category(), ErrorCategory::Integrity);
    EXPECT_EQ(device.writeCalls, 3);
    EXPECT_FALSE(device.isOpen());
    ASSERT_FALSE(stages.isEmpty());
    EXPECT_EQ(stages.last(), FormatProgress::Stage::Error);
}

TEST(Fat32FormatterTest, CancelStopsBetweenStructures)
{
    MemoryDeviceHandle device(64 * MiB);
    Fat32Formatter formatter(&device);
    QObject::connect(&formatter, &Fat32Formatter::progress, [&formatter](const FormatProgress& p) {
        if (p.stage == FormatProgress::Stage::CreatingPartition) formatter.cancel();
    });
    QSignalSpy finished(&formatter, &Fat32Formatter::finished);

    const OperationResult r = formatter.format(QStringLiteral("/dev/mem0"), QStringLiteral("x"));
    EXPECT_TRUE(r.isCancelled());
    EXPECT_EQ(finished.count(), 1);
    ASSERT_EQ(device.writes.size(), 1);
    EXPECT_EQ(device.writes.first().first, 0);
    EXPECT_FALSE(device.isOpen());
}
