/*!
 * @file        unmounter.cppm
 * @brief       Unmount collaborator used before raw writes.
 * @details     Before an image is burned, every filesystem the OS mounted
 *              from the target device has to be released, otherwise the OS
 *              keeps writing its own metadata over the fresh image.
 *
 *              SystemUnmounter shells out to the platform tools through
 *              QProcess: `umount` for each partition listed in
 *              `/proc/mounts` on Linux, `diskutil unmountDisk force` on
 *              macOS. On Windows every drive-letter volume that lives on
 *              the target `\\.\PhysicalDriveN` is locked and dismounted
 *              with FSCTL_LOCK_VOLUME and FSCTL_DISMOUNT_VOLUME; the volume
 *              handles stay open, keeping the locks, until release().
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kiln/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module kiln.device.unmounter;
#endif

#ifdef Q_MOC_RUN
#define KILN_MODULE_EXPORT
#else
#define KILN_MODULE_EXPORT export
#endif

/**
 * @brief Result of an unmount request.
 */
KILN_MODULE_EXPORT enum class UnmountResult {
    Success,    //!< Nothing of the device is mounted any more.
    Denied,     //!< The OS refused to release a volume.
    Timeout,    //!< The platform tool did not finish in time.
    NotFound    //!< The device identifier does not exist.
};

/**
 * @brief Releases every mounted volume of a device.
 *
 * Implementations must be idempotent: unmounting a device that has nothing
 * mounted succeeds.
 */
KILN_MODULE_EXPORT class Unmounter {
public:
    virtual ~Unmounter() = default;

    /**
     * @brief Unmount all volumes of a device.
     * @param deviceId Device node or image file.
     * @param timeoutMs Upper bound for the whole request.
     */
    virtual UnmountResult unmount(const QString& deviceId, int timeoutMs) = 0;

    /**
     * @brief Give back whatever unmount() still holds.
     *
     * Called once the device is no longer written. Safe to call when
     * nothing is held.
     */
    virtual void release() {}

    //!< @brief Stable name of a result, used in logs.
    static QString resultName(UnmountResult result);
};

/**
 * @brief Unmounter backed by the platform's command-line tools.
 */
KILN_MODULE_EXPORT class SystemUnmounter : public Unmounter {
public:
    /**
     * @param mountTablePath Mount table consulted on Linux.
     */
    explicit SystemUnmounter(const QString& mountTablePath = QStringLiteral("/proc/mounts"));
    ~SystemUnmounter() override;

    SystemUnmounter(const SystemUnmounter&) = delete;
    SystemUnmounter& operator=(const SystemUnmounter&) = delete;

    UnmountResult unmount(const QString& deviceId, int timeoutMs) override;

    //!< @brief Unlock and close the volumes locked on Windows.
    void release() override;

    /**
     * @brief Drive number of a Windows physical drive path.
     * @param deviceId e.g. `\\.\PhysicalDrive2`.
     * @return The number, or -1 when deviceId is not a physical drive path.
     */
    static int physicalDriveNumber(const QString& deviceId);

    /**
     * @brief Mount points of a device and its partitions.
     *
     * A mount source belongs to the device when it equals the device node
     * or extends it with a partition suffix (`sdb1`, `mmcblk0p1`, `disk4s1`).
     * Octal escapes (`\040`) in mount points are decoded.
     *
     * @param deviceId Whole-device node, e.g. `/dev/sdb`.
     * @param mountTable Contents of a `/proc/mounts` style table.
     * @return Mount points in table order.
     */
    static QStringList mountPointsFor(const QString& deviceId, const QByteArray& mountTable);

private:
    QString m_mountTablePath;       //!< Mount table path (Linux).
    QVector<void*> m_lockedVolumes; //!< Locked volume HANDLEs (Windows).
};
