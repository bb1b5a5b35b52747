#ifndef KILN_TESTS_MEMORY_DEVICE_HANDLE_H
#define KILN_TESTS_MEMORY_DEVICE_HANDLE_H

#include <QByteArray>
#include <QByteArrayView>
#include <QPair>
#include <QString>
#include <QVector>
#include <QtGlobal>

#include <algorithm>

import kiln.device.device_handle;
import kiln.device.unmounter;

namespace kiln::test {

/**
 * @brief DeviceHandle over a fixed-size in-memory buffer.
 *
 * Records every write and can inject the failures a real device produces.
 */
class MemoryDeviceHandle : public DeviceHandle {
public:
    explicit MemoryDeviceHandle(qint64 capacity)
        : m_data(static_cast<qsizetype>(capacity), '\0')
    {
    }

    DeviceResult open(const QString& deviceId) override
    {
        ++openCount;
        if (openResult != DeviceResult::Success) return openResult;
        m_open = true;
        m_deviceId = deviceId;
        return DeviceResult::Success;
    }

    DeviceResult writeAt(qint64 offset, QByteArrayView data) override
    {
        if (!m_open) return DeviceResult::NotOpen;
        ++writeCalls;
        if (failWriteOnCall > 0 && writeCalls == failWriteOnCall) return failWriteResult;
        if (offset < 0) return DeviceResult::SeekFailed;
        if (offset + data.size() > m_data.size()) return DeviceResult::ShortWrite;
        std::copy(data.begin(), data.end(), m_data.begin() + offset);
        writes.append(qMakePair(offset, static_cast<qint64>(data.size())));
        return DeviceResult::Success;
    }

    DeviceResult readAt(qint64 offset, qint64 length, QByteArray& out) override
    {
        if (!m_open) return DeviceResult::NotOpen;
        if (offset < 0) return DeviceResult::SeekFailed;
        if (rejectUnalignedReads && (offset % 512 != 0 || length % 512 != 0)) return DeviceResult::IoError;
        const qint64 available = qBound<qint64>(0, m_data.size() - offset, length);
        out = m_data.mid(static_cast<qsizetype>(offset), static_cast<qsizetype>(available));
        if (flipReadOffset >= offset && flipReadOffset < offset + available) {
            out[static_cast<qsizetype>(flipReadOffset - offset)] ^= char(0xFF);
        }
        return available == length ? DeviceResult::Success : DeviceResult::ShortRead;
    }

    DeviceResult flush() override
    {
        if (!m_open) return DeviceResult::NotOpen;
        ++flushCount;
        return DeviceResult::Success;
    }

    void close() override
    {
        if (m_open) ++closeCount;
        m_open = false;
    }

    bool isOpen() const override { return m_open; }
    qint64 size() const override { return reportedSize >= 0 ? reportedSize : m_data.size(); }
    QString deviceId() const override { return m_deviceId; }
    int lastSystemError() const override { return systemError; }

    //!< @brief Raw device contents.
    const QByteArray& data() const { return m_data; }

    //!< @brief One 512-byte sector of the contents.
    QByteArray sector(qint64 index) const { return m_data.mid(static_cast<qsizetype>(index * 512), 512); }

    DeviceResult openResult = DeviceResult::Success;    //!< Returned by open().
    int failWriteOnCall = 0;                            //!< 1-based writeAt() call that fails, 0 = never.
    DeviceResult failWriteResult = DeviceResult::ShortWrite; //!< Result of the failing call.
    qint64 flipReadOffset = -1;                         //!< Byte inverted in every read covering it.
    qint64 reportedSize = -1;                           //!< Overrides size() when >= 0.
    bool rejectUnalignedReads = false;                  //!< Fail reads that are not whole sectors, like raw devices.
    int systemError = 0;                                //!< Reported by lastSystemError().

    int openCount = 0;
    int closeCount = 0;
    int flushCount = 0;
    int writeCalls = 0;
    QVector<QPair<qint64, qint64>> writes;              //!< (offset, length) of successful writes.

private:
    QByteArray m_data;
    bool m_open = false;
    QString m_deviceId;
};

/**
 * @brief Unmounter returning a fixed result.
 */
class FakeUnmounter : public Unmounter {
public:
    explicit FakeUnmounter(UnmountResult result = UnmountResult::Success) : result(result) {}

    UnmountResult unmount(const QString& deviceId, int timeoutMs) override
    {
        Q_UNUSED(timeoutMs);
        lastDevice = deviceId;
        ++calls;
        return result;
    }

    void release() override { ++releaseCalls; }

    UnmountResult result;
    QString lastDevice;
    int calls = 0;
    int releaseCalls = 0;
};

} // namespace kiln::test

#endif // KILN_TESTS_MEMORY_DEVICE_HANDLE_H
