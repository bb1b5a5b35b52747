module;
#include <QByteArray>
#include <QDateTime>
#include <QDebug>
#include <QScopeGuard>
#include <QString>
#include <QtEndian>
#include <QtGlobal>

module kiln.core.fat32formatter;

import kiln.device.device_handle;
import kiln.services.debug_log;
import kiln.utils.download_utils;

namespace utils = kiln::utils;

namespace {

constexpr quint8 kMediaDescriptor = 0xF8;
constexpr quint8 kPartitionTypeFat32Lba = 0x0C;
constexpr quint8 kVolumeLabelAttribute = 0x08;

void putLe16(QByteArray& sector, int offset, quint16 value)
{
    qToLittleEndian<quint16>(value, sector.data() + offset);
}

void putLe32(QByteArray& sector, int offset, quint32 value)
{
    qToLittleEndian<quint32>(value, sector.data() + offset);
}

QByteArray zeroSector()
{
    return QByteArray(Fat32Formatter::SectorSize, '\0');
}

} // namespace

Fat32Formatter::Fat32Formatter(DeviceHandle* device, QObject* parent)
    : QObject(parent),
    m_device(device)
{
}

quint32 Fat32Formatter::sectorsPerClusterFor(qint64 bytes)
{
    constexpr qint64 mib = 1024LL * 1024;
    constexpr qint64 gib = 1024LL * mib;
    if (bytes <= 64 * mib) return 1;
    if (bytes <= 128 * mib) return 2;
    if (bytes <= 256 * mib) return 4;
    if (bytes <= 8 * gib) return 8;
    if (bytes <= 16 * gib) return 16;
    if (bytes <= 32 * gib) return 32;
    return 64;
}

OperationResult Fat32Formatter::calculateParams(qint64 partitionBytes, Fat32Params& out)
{
    if (partitionBytes <= 0) {
        return OperationResult::failure(ErrorKind::InvalidArgument,
                                        QStringLiteral("Partition size must be positive (got %1)").arg(partitionBytes));
    }
    const qint64 totalSectors = partitionBytes / SectorSize;
    if (totalSectors > static_cast<qint64>(0xFFFFFFFFu)) {
        return OperationResult::failure(ErrorKind::InvalidArgument,
                                        QStringLiteral("%1 is larger than FAT32 can address")
                                            .arg(utils::formatBytes(partitionBytes)));
    }

    const quint32 spc = sectorsPerClusterFor(partitionBytes);
    if (totalSectors <= ReservedSectors) {
        return OperationResult::failure(ErrorKind::InvalidArgument,
                                        QStringLiteral("%1 is too small for FAT32").arg(utils::formatBytes(partitionBytes)));
    }
    const qint64 dataClusters = (totalSectors - ReservedSectors) / spc;
    const qint64 fatSize = ((dataClusters + 2) * 4 + SectorSize - 1) / SectorSize;
    if (ReservedSectors + NumFats * fatSize + spc > totalSectors) {
        return OperationResult::failure(ErrorKind::InvalidArgument,
                                        QStringLiteral("%1 is too small for FAT32").arg(utils::formatBytes(partitionBytes)));
    }
    // Fewer clusters and drivers mount the volume as FAT12/16.
    if (dataClusters < MinDataClusters) {
        return OperationResult::failure(ErrorKind::InvalidArgument,
                                        QStringLiteral("%1 gives %2 clusters; FAT32 needs at least %3")
                                            .arg(utils::formatBytes(partitionBytes))
                                            .arg(dataClusters)
                                            .arg(MinDataClusters));
    }

    Fat32Params params;
    params.sectorsPerCluster = spc;
    params.totalSectors = static_cast<quint32>(totalSectors);
    params.fatSizeSectors = static_cast<quint32>(fatSize);
    params.rootCluster = 2;
    params.dataClusters = static_cast<quint32>(dataClusters);
    out = params;
    return OperationResult::success();
}

QByteArray Fat32Formatter::prepareVolumeLabel(const QString& label)
{
    QByteArray out = label.toLatin1();
    out.truncate(11);
    while (out.size() < 11) out.append(' ');
    return out;
}

QByteArray Fat32Formatter::buildBootSector(const Fat32Params& params,
                                           const QByteArray& label11,
                                           quint32 hiddenSectors,
                                           quint32 serial)
{
    QByteArray boot = zeroSector();

    // Jump instruction and OEM name.
    boot[0] = char(0xEB);
    boot[1] = char(0x58);
    boot[2] = char(0x90);
    boot.replace(3, 8, QByteArrayLiteral("MSWIN4.1"));

    // BIOS parameter block.
    putLe16(boot, 11, SectorSize);
    boot[13] = char(params.sectorsPerCluster);
    putLe16(boot, 14, ReservedSectors);
    boot[16] = char(NumFats);
    boot[21] = char(kMediaDescriptor);
    putLe16(boot, 24, 63);
    putLe16(boot, 26, 255);
    putLe32(boot, 28, hiddenSectors);
    putLe32(boot, 32, params.totalSectors);

    // FAT32 extended BPB.
    putLe32(boot, 36, params.fatSizeSectors);
    putLe32(boot, 44, params.rootCluster);
    putLe16(boot, 48, FsInfoSector);
    putLe16(boot, 50, BackupBootSector);
    boot[64] = char(0x80);
    boot[66] = char(0x29);
    putLe32(boot, 67, serial);
    boot.replace(71, 11, label11.left(11));
    boot.replace(82, 8, QByteArrayLiteral("FAT32   "));

    boot[510] = char(0x55);
    boot[511] = char(0xAA);
    return boot;
}

QByteArray Fat32Formatter::buildFsInfoSector()
{
    QByteArray info = zeroSector();
    putLe32(info, 0, 0x41615252u);
    putLe32(info, 484, 0x61417272u);
    putLe32(info, 488, 0xFFFFFFFFu);
    putLe32(info, 492, 0xFFFFFFFFu);
    putLe32(info, 508, 0xAA550000u);
    return info;
}

QByteArray Fat32Formatter::buildFatSector()
{
    QByteArray fat = zeroSector();
    putLe32(fat, 0, 0x0FFFFFF8u);
    putLe32(fat, 4, 0x0FFFFFFFu);
    putLe32(fat, 8, 0x0FFFFFFFu);
    return fat;
}

QByteArray Fat32Formatter::buildRootDirSector(const QByteArray& label11)
{
    QByteArray root = zeroSector();
    root.replace(0, 11, label11.left(11));
    root[11] = char(kVolumeLabelAttribute);
    return root;
}

QByteArray Fat32Formatter::buildMbr(quint32 startSector, quint32 sectorCount)
{
    QByteArray mbr = zeroSector();
    constexpr int entry = 446;
    mbr[entry + 0] = char(0x80);
    mbr[entry + 1] = char(0xFF);
    mbr[entry + 2] = char(0xFF);
    mbr[entry + 3] = char(0xFF);
    mbr[entry + 4] = char(kPartitionTypeFat32Lba);
    mbr[entry + 5] = char(0xFF);
    mbr[entry + 6] = char(0xFF);
    mbr[entry + 7] = char(0xFF);
    putLe32(mbr, entry + 8, startSector);
    putLe32(mbr, entry + 12, sectorCount);
    mbr[510] = char(0x55);
    mbr[511] = char(0xAA);
    return mbr;
}

quint32 Fat32Formatter::timeBasedSerial()
{
    return static_cast<quint32>(QDateTime::currentSecsSinceEpoch());
}

OperationResult Fat32Formatter::format(const QString& deviceId, const QString& label, qint64 totalBytes)
{
    m_cancelRequested.store(false);
    reportStage(FormatProgress::Stage::Started, deviceId);

    if (!m_device) {
        return finish(OperationResult::failure(ErrorKind::InvalidArgument, QStringLiteral("No device handle")));
    }
    if (m_partitionStart < 0 || m_partitionStart > 0xFFFFFFFFLL) {
        return finish(OperationResult::failure(ErrorKind::InvalidArgument,
                                               QStringLiteral("Invalid partition start sector %1").arg(m_partitionStart)));
    }
    if (m_writePartitionTable && m_partitionStart < 1) {
        return finish(OperationResult::failure(ErrorKind::InvalidArgument,
                                               QStringLiteral("Partition table needs a start sector after sector 0")));
    }

    const DeviceResult opened = m_device->open(deviceId);
    if (opened != DeviceResult::Success) {
        return finish(OperationResult::failure(DeviceHandle::toErrorKind(opened),
                                               QStringLiteral("Cannot open %1 (%2)")
                                                   .arg(deviceId, m_device->describe(opened))));
    }
    auto closeDevice = qScopeGuard([this] { m_device->close(); });

    const qint64 capacity = totalBytes > 0 ? totalBytes : m_device->size();
    if (capacity <= 0) {
        return finish(OperationResult::failure(ErrorKind::IoError,
                                               QStringLiteral("Cannot determine the size of %1").arg(deviceId)));
    }

    const qint64 partitionBytes = capacity - m_partitionStart * SectorSize;
    Fat32Params params;
    const OperationResult geometry = calculateParams(partitionBytes, params);
    if (!geometry.ok()) return finish(geometry);

    trace(QStringLiteral("Capacity %1, partition at sector %2, %3 sectors, %4 sectors/cluster, FAT %5 sectors")
              .arg(utils::formatBytes(capacity))
              .arg(m_partitionStart)
              .arg(params.totalSectors)
              .arg(params.sectorsPerCluster)
              .arg(params.fatSizeSectors));

    if (m_cancelRequested.load()) return finish(OperationResult::cancelled());

    OperationResult error;
    if (m_writePartitionTable) {
        reportStage(FormatProgress::Stage::CreatingPartition);
        const QByteArray mbr = buildMbr(static_cast<quint32>(m_partitionStart), params.totalSectors);
        if (!writeSector(0, mbr, QStringLiteral("MBR"), error)) return finish(error);
        if (m_cancelRequested.load()) return finish(OperationResult::cancelled());
    }

    reportStage(FormatProgress::Stage::Formatting);

    const QByteArray label11 = prepareVolumeLabel(label);
    const quint32 serial = m_volumeSerial != 0 ? m_volumeSerial : timeBasedSerial();
    const QByteArray boot = buildBootSector(params, label11, static_cast<quint32>(m_partitionStart), serial);
    const QByteArray fsInfo = buildFsInfoSector();
    const qint64 base = m_partitionStart;

    if (!writeSector(base, boot, QStringLiteral("boot sector"), error)) return finish(error);
    if (!writeSector(base + FsInfoSector, fsInfo, QStringLiteral("FSInfo sector"), error)) return finish(error);
    if (!writeSector(base + BackupBootSector, boot, QStringLiteral("backup boot sector"), error)) return finish(error);
    if (!writeSector(base + BackupBootSector + 1, fsInfo, QStringLiteral("backup FSInfo sector"), error)) return finish(error);
    if (m_cancelRequested.load()) return finish(OperationResult::cancelled());

    const qint64 fat1 = base + ReservedSectors;
    const qint64 fat2 = fat1 + params.fatSizeSectors;
    if (!writeFat(fat1, params, QStringLiteral("FAT1"), error)) return finish(error);
    if (m_cancelRequested.load()) return finish(OperationResult::cancelled());
    if (!writeFat(fat2, params, QStringLiteral("FAT2"), error)) return finish(error);
    if (m_cancelRequested.load()) return finish(OperationResult::cancelled());

    const qint64 dataStart = fat1 + static_cast<qint64>(NumFats) * params.fatSizeSectors;
    if (!writeSector(dataStart, buildRootDirSector(label11), QStringLiteral("root directory"), error)) return finish(error);
    const QByteArray zero = zeroSector();
    for (quint32 i = 1; i < params.sectorsPerCluster; ++i) {
        if (!writeSector(dataStart + i, zero, QStringLiteral("root directory"), error)) return finish(error);
    }

    const DeviceResult flushed = m_device->flush();
    if (flushed != DeviceResult::Success) {
        return finish(OperationResult::failure(DeviceHandle::toErrorKind(flushed),
                                               QStringLiteral("Flush failed on %1").arg(deviceId)));
    }

    trace(QStringLiteral("FAT32 volume '%1' written, serial %2")
              .arg(QString::fromLatin1(label11).trimmed())
              .arg(serial, 8, 16, QLatin1Char('0')));
    return finish(OperationResult::success());
}

bool Fat32Formatter::writeSector(qint64 sector, const QByteArray& data, const QString& what, OperationResult& error)
{
    const DeviceResult r = m_device->writeAt(sector * SectorSize, data);
    if (r == DeviceResult::Success) return true;
    error = OperationResult::failure(DeviceHandle::toErrorKind(r),
                                     QStringLiteral("Failed to write %1 at sector %2 (%3)")
                                         .arg(what).arg(sector).arg(m_device->describe(r)));
    return false;
}

bool Fat32Formatter::writeFat(qint64 firstSector, const Fat32Params& params, const QString& what, OperationResult& error)
{
    if (!writeSector(firstSector, buildFatSector(), what, error)) return false;
    const QByteArray zero = zeroSector();
    const quint32 clearCount = qMin<quint32>(FatClearSectors, params.fatSizeSectors);
    for (quint32 i = 1; i < clearCount; ++i) {
        if (!writeSector(firstSector + i, zero, what, error)) return false;
    }
    return true;
}

void Fat32Formatter::reportStage(FormatProgress::Stage stage, const QString& detail)
{
    FormatProgress p;
    p.stage = stage;
    p.detail = detail;
    emit progress(p);
}

OperationResult Fat32Formatter::finish(const OperationResult& result)
{
    FormatProgress::Stage stage = FormatProgress::Stage::Completed;
    if (result.isCancelled()) stage = FormatProgress::Stage::Cancelled;
    else if (result.isError()) stage = FormatProgress::Stage::Error;

    if (result.isError()) {
        qWarning() << "Format failed:" << result.toString();
        if (m_log) m_log->log(QStringLiteral("Format failed: %1").arg(result.toString()));
    } else {
        trace(QStringLiteral("Format %1").arg(OperationResult::outcomeName(result.outcome)));
    }

    reportStage(stage, result.detail);
    emit finished(result);
    return result;
}

void Fat32Formatter::trace(const QString& line)
{
    qDebug().noquote() << "Fat32Formatter:" << line;
    if (m_log) m_log->log(line);
}
