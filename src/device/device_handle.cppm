/*!
 * @file        device_handle.cppm
 * @brief       Raw block-device access capability.
 * @details     DeviceHandle is the single seam between Kiln's formatting and
 *              burning logic and the operating system's raw storage APIs.
 *              Callers open a device by identifier (a `/dev` node, a
 *              `\\.\PhysicalDriveN` path, or a plain image file), write and
 *              read at absolute byte offsets, flush, and close.
 *
 *              RawDeviceHandle is the portable implementation. The platform
 *              split (POSIX descriptors on Linux and macOS, Win32 handles on
 *              Windows) lives entirely in device_handle.cpp.
 *
 *              Elevation (sudo, Administrator, authorization prompts) must be
 *              obtained by the caller before open() is invoked.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kiln/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QByteArrayView>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module kiln.device.device_handle;
export import kiln.core.operation;
#endif

#ifdef Q_MOC_RUN
#define KILN_MODULE_EXPORT
#else
#define KILN_MODULE_EXPORT export
#endif

/**
 * @brief Status codes returned by DeviceHandle operations.
 */
KILN_MODULE_EXPORT enum class DeviceResult {
    Success,            //!< Operation completed in full.
    PermissionDenied,   //!< The OS refused access.
    NotFound,           //!< The device identifier does not exist.
    OpenFailed,         //!< Open failed for another reason (busy, invalid).
    SeekFailed,         //!< Positioning to the requested offset failed.
    ShortWrite,         //!< Fewer bytes were written than requested.
    ShortRead,          //!< End of device reached before the requested length.
    IoError,            //!< Generic read, write or flush failure.
    NotOpen             //!< Operation attempted on a closed handle.
};

/**
 * @brief Abstract raw-device access used by Fat32Formatter and ImageBurner.
 *
 * A handle is exclusively owned by one running operation between open()
 * and close(). close() is idempotent.
 */
KILN_MODULE_EXPORT class DeviceHandle {
public:
    virtual ~DeviceHandle() = default;

    /**
     * @brief Open a device for reading and writing.
     * @param deviceId Device node, physical drive path, or image file.
     * @return Success, PermissionDenied, NotFound or OpenFailed.
     */
    virtual DeviceResult open(const QString& deviceId) = 0;

    /**
     * @brief Write a buffer at an absolute byte offset.
     *
     * A single call either writes every byte or fails. Partial writes are
     * reported as ShortWrite and are never retried.
     */
    virtual DeviceResult writeAt(qint64 offset, QByteArrayView data) = 0;

    /**
     * @brief Read length bytes at an absolute byte offset.
     *
     * @param out Receives the bytes read. On ShortRead it holds the bytes
     *            available before the end of the device.
     */
    virtual DeviceResult readAt(qint64 offset, qint64 length, QByteArray& out) = 0;

    //!< @brief Push written data to the device and drop cached pages.
    virtual DeviceResult flush() = 0;

    //!< @brief Release the handle. Safe to call on a closed handle.
    virtual void close() = 0;

    //!< @brief Whether the handle is open.
    virtual bool isOpen() const = 0;

    //!< @brief Capacity in bytes, or -1 when it cannot be determined.
    virtual qint64 size() const = 0;

    //!< @brief Identifier passed to the last successful open().
    virtual QString deviceId() const = 0;

    //!< @brief OS error code (errno or GetLastError()) of the last failed call, 0 when none.
    virtual int lastSystemError() const { return 0; }

    /**
     * @brief Status name followed by the OS error text when one is known.
     * @param result Status returned by the last call.
     * @return e.g. "IoError: Invalid argument".
     */
    QString describe(DeviceResult result) const;

    /**
     * @brief Map a device status to an operation error kind.
     * @param result Device status.
     * @return Matching ErrorKind (None for Success).
     */
    static ErrorKind toErrorKind(DeviceResult result);

    //!< @brief Stable name of a device status, used in logs.
    static QString resultName(DeviceResult result);
};

/**
 * @brief OS-backed DeviceHandle.
 *
 * Uses POSIX file descriptors on Linux and macOS and Win32 handles on
 * Windows. Block-device capacity is queried through the platform ioctl,
 * regular files report their file size. Transfers to raw devices must be
 * whole sectors.
 */
KILN_MODULE_EXPORT class RawDeviceHandle : public DeviceHandle {
public:
    RawDeviceHandle() = default;
    ~RawDeviceHandle() override;

    RawDeviceHandle(const RawDeviceHandle&) = delete;
    RawDeviceHandle& operator=(const RawDeviceHandle&) = delete;

    DeviceResult open(const QString& deviceId) override;
    DeviceResult writeAt(qint64 offset, QByteArrayView data) override;
    DeviceResult readAt(qint64 offset, qint64 length, QByteArray& out) override;
    DeviceResult flush() override;
    void close() override;
    bool isOpen() const override;
    qint64 size() const override;
    QString deviceId() const override { return m_deviceId; }

    int lastSystemError() const override { return m_lastError; }

    /**
     * @brief Path actually opened for a device identifier.
     *
     * On macOS `/dev/diskN` maps to its raw twin `/dev/rdiskN`, which
     * bypasses the buffer cache. Other identifiers are returned unchanged.
     */
    static QString rawDevicePath(const QString& deviceId);

private:
#if defined(Q_OS_WIN)
    void* m_handle = nullptr;       //!< Win32 HANDLE, nullptr when closed.
#else
    int m_fd = -1;                  //!< POSIX descriptor, -1 when closed.
#endif
    QString m_deviceId;             //!< Opened device identifier.
    int m_lastError = 0;            //!< Last OS error code.
};
