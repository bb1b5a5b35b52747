module;
#include <QByteArray>
#include <QByteArrayView>
#include <QDebug>
#include <QString>
#include <QtGlobal>

#if defined(Q_OS_WIN)
#include <windows.h>
#include <winioctl.h>
#else
#include <errno.h>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#if defined(Q_OS_LINUX)
#include <linux/fs.h>
#elif defined(Q_OS_MAC)
#include <sys/disk.h>
#endif
#endif

module kiln.device.device_handle;

ErrorKind DeviceHandle::toErrorKind(DeviceResult result)
{
    switch (result) {
    case DeviceResult::Success:          return ErrorKind::None;
    case DeviceResult::PermissionDenied: return ErrorKind::PermissionDenied;
    case DeviceResult::NotFound:         return ErrorKind::NotFound;
    case DeviceResult::OpenFailed:       return ErrorKind::OpenFailed;
    case DeviceResult::SeekFailed:       return ErrorKind::SeekFailed;
    case DeviceResult::ShortWrite:       return ErrorKind::ShortWrite;
    case DeviceResult::ShortRead:        return ErrorKind::ShortRead;
    case DeviceResult::IoError:          return ErrorKind::IoError;
    case DeviceResult::NotOpen:          return ErrorKind::IoError;
    }
    return ErrorKind::IoError;
}

QString DeviceHandle::resultName(DeviceResult result)
{
    switch (result) {
    case DeviceResult::Success:          return QStringLiteral("Success");
    case DeviceResult::PermissionDenied: return QStringLiteral("PermissionDenied");
    case DeviceResult::NotFound:         return QStringLiteral("NotFound");
    case DeviceResult::OpenFailed:       return QStringLiteral("OpenFailed");
    case DeviceResult::SeekFailed:       return QStringLiteral("SeekFailed");
    case DeviceResult::ShortWrite:       return QStringLiteral("ShortWrite");
    case DeviceResult::ShortRead:        return QStringLiteral("ShortRead");
    case DeviceResult::IoError:          return QStringLiteral("IoError");
    case DeviceResult::NotOpen:          return QStringLiteral("NotOpen");
    }
    return QStringLiteral("Unknown");
}

QString DeviceHandle::describe(DeviceResult result) const
{
    const int code = lastSystemError();
    if (result == DeviceResult::Success || code == 0) return resultName(result);
    return QStringLiteral("%1: %2").arg(resultName(result), qt_error_string(code));
}

RawDeviceHandle::~RawDeviceHandle()
{
    close();
}

QString RawDeviceHandle::rawDevicePath(const QString& deviceId)
{
#if defined(Q_OS_MAC)
    static const QString disk = QStringLiteral("/dev/disk");
    if (deviceId.startsWith(disk)) return QStringLiteral("/dev/rdisk") + deviceId.mid(disk.size());
#endif
    return deviceId;
}

#if defined(Q_OS_WIN)

namespace {

DeviceResult fromWinError(DWORD err, DeviceResult fallback)
{
    switch (err) {
    case ERROR_ACCESS_DENIED:
    case ERROR_WRITE_PROTECT:
        return DeviceResult::PermissionDenied;
    case ERROR_FILE_NOT_FOUND:
    case ERROR_PATH_NOT_FOUND:
        return DeviceResult::NotFound;
    default:
        return fallback;
    }
}

} // namespace

DeviceResult RawDeviceHandle::open(const QString& deviceId)
{
    close();
    m_lastError = 0;
    HANDLE h = CreateFileW(reinterpret_cast<LPCWSTR>(deviceId.utf16()),
                           GENERIC_READ | GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_WRITE,
                           nullptr,
                           OPEN_EXISTING,
                           FILE_ATTRIBUTE_NORMAL,
                           nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        m_lastError = static_cast<int>(GetLastError());
        qWarning() << "CreateFile failed for" << deviceId << "error" << m_lastError;
        return fromWinError(static_cast<DWORD>(m_lastError), DeviceResult::OpenFailed);
    }
    m_handle = h;
    m_deviceId = deviceId;
    return DeviceResult::Success;
}

DeviceResult RawDeviceHandle::writeAt(qint64 offset, QByteArrayView data)
{
    m_lastError = 0;
    if (!m_handle) return DeviceResult::NotOpen;
    LARGE_INTEGER pos;
    pos.QuadPart = offset;
    if (!SetFilePointerEx(static_cast<HANDLE>(m_handle), pos, nullptr, FILE_BEGIN)) {
        m_lastError = static_cast<int>(GetLastError());
        return DeviceResult::SeekFailed;
    }
    DWORD written = 0;
    if (!WriteFile(static_cast<HANDLE>(m_handle), data.data(), static_cast<DWORD>(data.size()), &written, nullptr)) {
        m_lastError = static_cast<int>(GetLastError());
        return fromWinError(static_cast<DWORD>(m_lastError), DeviceResult::IoError);
    }
    if (static_cast<qsizetype>(written) != data.size()) return DeviceResult::ShortWrite;
    return DeviceResult::Success;
}

DeviceResult RawDeviceHandle::readAt(qint64 offset, qint64 length, QByteArray& out)
{
    out.clear();
    m_lastError = 0;
    if (!m_handle) return DeviceResult::NotOpen;
    LARGE_INTEGER pos;
    pos.QuadPart = offset;
    if (!SetFilePointerEx(static_cast<HANDLE>(m_handle), pos, nullptr, FILE_BEGIN)) {
        m_lastError = static_cast<int>(GetLastError());
        return DeviceResult::SeekFailed;
    }
    out.resize(static_cast<qsizetype>(length));
    qint64 total = 0;
    while (total < length) {
        DWORD got = 0;
        if (!ReadFile(static_cast<HANDLE>(m_handle), out.data() + total,
                      static_cast<DWORD>(length - total), &got, nullptr)) {
            m_lastError = static_cast<int>(GetLastError());
            out.resize(static_cast<qsizetype>(total));
            return DeviceResult::IoError;
        }
        if (got == 0) break;
        total += got;
    }
    if (total < length) {
        out.resize(static_cast<qsizetype>(total));
        return DeviceResult::ShortRead;
    }
    return DeviceResult::Success;
}

DeviceResult RawDeviceHandle::flush()
{
    m_lastError = 0;
    if (!m_handle) return DeviceResult::NotOpen;
    if (!FlushFileBuffers(static_cast<HANDLE>(m_handle))) {
        m_lastError = static_cast<int>(GetLastError());
        return DeviceResult::IoError;
    }
    return DeviceResult::Success;
}

void RawDeviceHandle::close()
{
    if (!m_handle) return;
    CloseHandle(static_cast<HANDLE>(m_handle));
    m_handle = nullptr;
}

bool RawDeviceHandle::isOpen() const
{
    return m_handle != nullptr;
}

qint64 RawDeviceHandle::size() const
{
    if (!m_handle) return -1;
    GET_LENGTH_INFORMATION info;
    DWORD bytes = 0;
    if (DeviceIoControl(static_cast<HANDLE>(m_handle), IOCTL_DISK_GET_LENGTH_INFO,
                        nullptr, 0, &info, sizeof(info), &bytes, nullptr)) {
        return info.Length.QuadPart;
    }
    LARGE_INTEGER fileSize;
    if (GetFileSizeEx(static_cast<HANDLE>(m_handle), &fileSize)) {
        return fileSize.QuadPart;
    }
    return -1;
}

#else

namespace {

DeviceResult fromErrno(int err, DeviceResult fallback)
{
    switch (err) {
    case EACCES:
    case EPERM:
    case EROFS:
        return DeviceResult::PermissionDenied;
    case ENOENT:
    case ENXIO:
        return DeviceResult::NotFound;
    default:
        return fallback;
    }
}

} // namespace

DeviceResult RawDeviceHandle::open(const QString& deviceId)
{
    close();
    m_lastError = 0;
    const QByteArray path = rawDevicePath(deviceId).toLocal8Bit();

    int flags = O_RDWR | O_CLOEXEC;
    struct stat st;
    if (::stat(path.constData(), &st) == 0 && !S_ISREG(st.st_mode)) {
        // Raw devices bypass the write-back cache so progress reflects the card.
        flags |= O_SYNC;
    }

    int fd = -1;
    do {
        fd = ::open(path.constData(), flags);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        m_lastError = errno;
        qWarning() << "open failed for" << deviceId << ":" << qt_error_string(m_lastError);
        return fromErrno(m_lastError, DeviceResult::OpenFailed);
    }
    m_fd = fd;
    m_deviceId = deviceId;
    return DeviceResult::Success;
}

DeviceResult RawDeviceHandle::writeAt(qint64 offset, QByteArrayView data)
{
    m_lastError = 0;
    if (m_fd < 0) return DeviceResult::NotOpen;
    if (::lseek(m_fd, static_cast<off_t>(offset), SEEK_SET) == static_cast<off_t>(-1)) {
        m_lastError = errno;
        return DeviceResult::SeekFailed;
    }

    ssize_t written = -1;
    do {
        written = ::write(m_fd, data.data(), static_cast<size_t>(data.size()));
    } while (written < 0 && errno == EINTR);

    if (written < 0) {
        m_lastError = errno;
        return fromErrno(m_lastError, DeviceResult::IoError);
    }
    if (static_cast<qsizetype>(written) != data.size()) return DeviceResult::ShortWrite;
    return DeviceResult::Success;
}

DeviceResult RawDeviceHandle::readAt(qint64 offset, qint64 length, QByteArray& out)
{
    out.clear();
    m_lastError = 0;
    if (m_fd < 0) return DeviceResult::NotOpen;
    if (::lseek(m_fd, static_cast<off_t>(offset), SEEK_SET) == static_cast<off_t>(-1)) {
        m_lastError = errno;
        return DeviceResult::SeekFailed;
    }

    out.resize(static_cast<qsizetype>(length));
    qint64 total = 0;
    while (total < length) {
        const ssize_t got = ::read(m_fd, out.data() + total, static_cast<size_t>(length - total));
        if (got < 0) {
            if (errno == EINTR) continue;
            m_lastError = errno;
            out.resize(static_cast<qsizetype>(total));
            return DeviceResult::IoError;
        }
        if (got == 0) break;
        total += got;
    }
    if (total < length) {
        out.resize(static_cast<qsizetype>(total));
        return DeviceResult::ShortRead;
    }
    return DeviceResult::Success;
}

DeviceResult RawDeviceHandle::flush()
{
    m_lastError = 0;
    if (m_fd < 0) return DeviceResult::NotOpen;
    if (::fsync(m_fd) != 0) {
        m_lastError = errno;
        return DeviceResult::IoError;
    }
#if defined(Q_OS_LINUX)
    // Verification must read the medium, not the page cache.
    ::posix_fadvise(m_fd, 0, 0, POSIX_FADV_DONTNEED);
#endif
    return DeviceResult::Success;
}

void RawDeviceHandle::close()
{
    if (m_fd < 0) return;
    ::close(m_fd);
    m_fd = -1;
}

bool RawDeviceHandle::isOpen() const
{
    return m_fd >= 0;
}

qint64 RawDeviceHandle::size() const
{
    if (m_fd < 0) return -1;
    struct stat st;
    if (::fstat(m_fd, &st) != 0) return -1;
    if (S_ISREG(st.st_mode)) return static_cast<qint64>(st.st_size);

#if defined(Q_OS_LINUX)
    quint64 bytes = 0;
    if (::ioctl(m_fd, BLKGETSIZE64, &bytes) == 0) return static_cast<qint64>(bytes);
#elif defined(Q_OS_MAC)
    quint64 blockCount = 0;
    quint32 blockSize = 0;
    if (::ioctl(m_fd, DKIOCGETBLOCKCOUNT, &blockCount) == 0
        && ::ioctl(m_fd, DKIOCGETBLOCKSIZE, &blockSize) == 0) {
        return static_cast<qint64>(blockCount * blockSize);
    }
#endif
    return -1;
}

#endif
