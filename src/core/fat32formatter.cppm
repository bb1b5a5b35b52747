/*!
 * @file        fat32formatter.cppm
 * @brief       From-scratch FAT32 formatter for raw block devices.
 * @details     Writes the minimal valid FAT32 structures directly to a device
 *              through a DeviceHandle: an optional MBR with a single FAT32 LBA
 *              partition, the boot sector and FSInfo sector with their backup
 *              copies, both FAT tables and the root directory cluster holding
 *              the volume label.
 *
 *              Going around the OS formatter lifts the 32 GiB cap some
 *              platforms impose on FAT32, so large SD cards get the cluster
 *              sizes recommended for their capacity.
 *
 *              Layout (sectors relative to the partition start):
 *              - 0      boot sector
 *              - 1      FSInfo
 *              - 6, 7   backup boot sector, backup FSInfo
 *              - 32     FAT 1 (fatSize sectors)
 *              - 32 + fatSize       FAT 2
 *              - 32 + 2 * fatSize   root directory cluster (cluster 2)
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kiln/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QObject>
#include <QString>
#include <QtGlobal>
#include <atomic>

#ifndef Q_MOC_RUN
export module kiln.core.fat32formatter;
export import kiln.core.operation;
import kiln.device.device_handle;
import kiln.services.debug_log;
#endif

#ifdef Q_MOC_RUN
#define KILN_MODULE_EXPORT
#else
#define KILN_MODULE_EXPORT export
#endif

/**
 * @brief FAT32 geometry derived from the partition size.
 */
KILN_MODULE_EXPORT struct Fat32Params {
    quint32 sectorsPerCluster = 0;  //!< Cluster size in sectors.
    quint32 totalSectors = 0;       //!< Sectors in the partition.
    quint32 fatSizeSectors = 0;     //!< Sectors per FAT copy.
    quint32 rootCluster = 2;        //!< First cluster of the root directory.
    quint32 dataClusters = 0;       //!< Clusters addressed by the FAT.
};

/**
 * @brief Stage reported while formatting.
 */
KILN_MODULE_EXPORT struct FormatProgress {
    enum class Stage {
        Started,            //!< Format request accepted.
        CreatingPartition,  //!< Writing the MBR partition table.
        Formatting,         //!< Writing FAT32 structures.
        Completed,          //!< All structures written and flushed.
        Cancelled,          //!< Stopped between structures.
        Error               //!< Failed; see detail.
    };

    Stage stage = Stage::Started;   //!< Current stage.
    QString detail;                 //!< Error or status text.
};

/**
 * @brief Formats a device as a single FAT32 volume.
 *
 * format() is blocking and is meant to run on a worker thread. Progress and
 * the final result are delivered through signals; finished() is emitted
 * exactly once per format() call.
 */
KILN_MODULE_EXPORT class Fat32Formatter : public QObject {

    Q_OBJECT

public:
    static constexpr int SectorSize = 512;              //!< Bytes per sector.
    static constexpr int ReservedSectors = 32;          //!< Sectors before FAT 1.
    static constexpr int NumFats = 2;                   //!< FAT copies.
    static constexpr int FsInfoSector = 1;              //!< FSInfo location.
    static constexpr int BackupBootSector = 6;          //!< Backup boot sector location.
    static constexpr int FatClearSectors = 16;          //!< FAT sectors initialized per copy.
    static constexpr qint64 MinDataClusters = 65525;    //!< Smallest cluster count of a FAT32 volume.
    static constexpr qint64 DefaultPartitionStart = 2048;   //!< 1 MiB alignment.

    /**
     * @brief Construct a formatter that writes through a device handle.
     * @param device Handle used for all I/O (not owned).
     * @param parent Parent QObject.
     */
    explicit Fat32Formatter(DeviceHandle* device, QObject* parent = nullptr);

    //!< @brief Attach a debug log (not owned, may be nullptr).
    void setDebugLog(DebugLog* log) { m_log = log; }

    //!< @brief First device sector of the partition.
    void setPartitionStartSector(qint64 sector) { m_partitionStart = sector; }
    qint64 partitionStartSector() const { return m_partitionStart; }

    //!< @brief Whether to write an MBR at device sector 0 first.
    void setWritePartitionTable(bool enabled) { m_writePartitionTable = enabled; }
    bool writePartitionTable() const { return m_writePartitionTable; }

    //!< @brief Fixed volume serial; 0 derives one from the current time.
    void setVolumeSerial(quint32 serial) { m_volumeSerial = serial; }

    /**
     * @brief Format a device.
     *
     * @param deviceId Device to open through the handle.
     * @param label Volume label (upper-cased, truncated to 11 characters).
     * @param totalBytes Device capacity; -1 queries the handle.
     * @return Completed, Cancelled, or Error with a distinguishable kind.
     */
    OperationResult format(const QString& deviceId, const QString& label, qint64 totalBytes = -1);

    //!< @brief Request cancellation; honored between on-disk structures.
    void cancel() { m_cancelRequested.store(true); }

    /**
     * @brief Compute FAT32 geometry for a partition.
     *
     * @param partitionBytes Partition size in bytes.
     * @param out Receives the geometry.
     * @return Completed, or InvalidArgument when the partition is too small
     *         for the reserved region, both FATs and MinDataClusters
     *         clusters, or too large for the 32-bit sector count.
     */
    static OperationResult calculateParams(qint64 partitionBytes, Fat32Params& out);

    //!< @brief Cluster size step function of the formatted size.
    static quint32 sectorsPerClusterFor(qint64 bytes);

    /**
     * @brief Normalize a volume label to the 11-byte on-disk form.
     *
     * The label bytes are copied as given (Latin-1), truncated to 11 bytes
     * and padded with spaces.
     */
    static QByteArray prepareVolumeLabel(const QString& label);

    /**
     * @brief Build the boot sector.
     * @param params Geometry.
     * @param label11 Label from prepareVolumeLabel().
     * @param hiddenSectors Sectors before the partition.
     * @param serial Volume serial number.
     */
    static QByteArray buildBootSector(const Fat32Params& params,
                                      const QByteArray& label11,
                                      quint32 hiddenSectors,
                                      quint32 serial);

    //!< @brief Build the FSInfo sector (free count and next free unknown).
    static QByteArray buildFsInfoSector();

    //!< @brief Build the first FAT sector with the media and end-of-chain entries.
    static QByteArray buildFatSector();

    //!< @brief Build the first root directory sector holding the label entry.
    static QByteArray buildRootDirSector(const QByteArray& label11);

    /**
     * @brief Build an MBR with one active FAT32 LBA partition.
     * @param startSector Partition LBA start.
     * @param sectorCount Partition length in sectors.
     */
    static QByteArray buildMbr(quint32 startSector, quint32 sectorCount);

    //!< @brief Serial derived from the current time.
    static quint32 timeBasedSerial();

signals:
    //!< @brief Emitted on every stage change.
    void progress(const FormatProgress& progress);

    //!< @brief Emitted once with the final result.
    void finished(const OperationResult& result);

private:
    //!< @brief Emit a stage change and trace it.
    void reportStage(FormatProgress::Stage stage, const QString& detail = QString());

    //!< @brief Emit the terminal stage and finished(), then return the result.
    OperationResult finish(const OperationResult& result);

    /**
     * @brief Write one full sector at an absolute device sector.
     * @param sector Absolute sector index.
     * @param data Exactly SectorSize bytes.
     * @param what Structure name for error messages.
     * @param error Receives the failure.
     * @return false on failure.
     */
    bool writeSector(qint64 sector, const QByteArray& data, const QString& what, OperationResult& error);

    //!< @brief Write a FAT copy: entries sector plus zeroed sectors.
    bool writeFat(qint64 firstSector, const Fat32Params& params, const QString& what, OperationResult& error);

    //!< @brief Trace to qDebug and the debug log.
    void trace(const QString& line);

    DeviceHandle* m_device = nullptr;                   //!< Device I/O (not owned).
    DebugLog* m_log = nullptr;                          //!< Debug log (not owned).
    qint64 m_partitionStart = DefaultPartitionStart;    //!< Partition start sector.
    bool m_writePartitionTable = true;                  //!< Write MBR first.
    quint32 m_volumeSerial = 0;                         //!< Fixed serial, 0 = time based.
    std::atomic<bool> m_cancelRequested{false};         //!< Cancellation flag.
};

#include "fat32formatter.moc"
