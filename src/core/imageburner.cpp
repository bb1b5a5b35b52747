module;
#include <QByteArray>
#include <QCryptographicHash>
#include <QDebug>
#include <QScopeGuard>
#include <QString>
#include <QtGlobal>

module kiln.core.imageburner;

import kiln.core.imagesource;
import kiln.device.device_handle;
import kiln.device.unmounter;
import kiln.services.debug_log;
import kiln.utils.download_utils;

namespace utils = kiln::utils;

namespace {

qint64 alignUp(qint64 value, qint64 alignment)
{
    return ((value + alignment - 1) / alignment) * alignment;
}

QByteArray windowDigest(const QByteArray& data)
{
    return QCryptographicHash::hash(data, QCryptographicHash::Sha256);
}

} // namespace

ImageBurner::ImageBurner(DeviceHandle* device, Unmounter* unmounter, QObject* parent)
    : QObject(parent),
    m_device(device),
    m_unmounter(unmounter)
{
}

void ImageBurner::setChunkSize(qint64 bytes)
{
    if (bytes <= 0) bytes = DefaultChunkSize;
    m_chunkSize = alignUp(bytes, SectorSize);
}

QString ImageBurner::stateName(State state)
{
    switch (state) {
    case State::Idle:       return QStringLiteral("Idle");
    case State::Started:    return QStringLiteral("Started");
    case State::Writing:    return QStringLiteral("Writing");
    case State::Verifying:  return QStringLiteral("Verifying");
    case State::Completed:  return QStringLiteral("Completed");
    case State::Cancelled:  return QStringLiteral("Cancelled");
    case State::Error:      return QStringLiteral("Error");
    case State::RolledBack: return QStringLiteral("RolledBack");
    }
    return QStringLiteral("Unknown");
}

bool ImageBurner::transition(State next)
{
    const State current = m_state.load();
    bool allowed = false;
    switch (next) {
    case State::Started:
        allowed = (current == State::Idle);
        break;
    case State::Writing:
        allowed = (current == State::Started);
        break;
    case State::Verifying:
        allowed = (current == State::Writing);
        break;
    case State::Completed:
        allowed = (current == State::Verifying);
        break;
    case State::Cancelled:
        allowed = (current == State::Writing || current == State::Verifying);
        break;
    case State::Error:
        allowed = (current == State::Idle || current == State::Started
                   || current == State::Writing || current == State::Verifying);
        break;
    case State::Idle:
    case State::RolledBack:
        allowed = false;
        break;
    }
    if (!allowed) {
        qWarning() << "ImageBurner: illegal transition" << stateName(current) << "->" << stateName(next);
        return false;
    }
    m_state.store(next);
    return true;
}

OperationResult ImageBurner::burn(const QString& imagePath, const QString& deviceId)
{
    m_state.store(State::Idle);
    m_cancelRequested.store(false);
    m_processed = 0;

    if (m_log) m_log->section(QStringLiteral("BURN"));
    trace(QStringLiteral("Image %1 -> %2").arg(imagePath, deviceId));

    if (!m_device) {
        return finish(OperationResult::failure(ErrorKind::InvalidArgument, QStringLiteral("No device handle")), 0);
    }

    ImageSource image;
    if (ImageSource::isGzipPath(imagePath)) trace(QStringLiteral("Scanning compressed image for its size"));
    const OperationResult opened = image.open(imagePath);
    if (!opened.ok()) return finish(opened, 0);
    const qint64 total = image.size();

    transition(State::Started);
    report(BurnProgress::Phase::Started, 0, total);
    trace(QStringLiteral("Image size %1%2, chunk %3")
              .arg(utils::formatBytes(total),
                   image.isCompressed() ? QStringLiteral(" (decompressed)") : QString(),
                   utils::formatBytes(m_chunkSize)));

    const OperationResult written = writePhase(image, total, deviceId);
    if (!written.ok()) return finish(written, total);

    const OperationResult verified = verifyPhase(image, total, deviceId);
    if (!verified.ok()) return finish(verified, total);

    transition(State::Completed);
    return finish(OperationResult::success(), total);
}

OperationResult ImageBurner::writePhase(ImageSource& image, qint64 total, const QString& deviceId)
{
    if (m_unmounter) {
        const UnmountResult unmounted = m_unmounter->unmount(deviceId, m_unmountTimeoutMs);
        trace(QStringLiteral("Unmount: %1").arg(Unmounter::resultName(unmounted)));
        switch (unmounted) {
        case UnmountResult::Success:
            break;
        case UnmountResult::Timeout:
            qWarning() << "Unmount timed out for" << deviceId << "- continuing";
            break;
        case UnmountResult::Denied:
            return OperationResult::failure(ErrorKind::PermissionDenied,
                                            QStringLiteral("Unmount of %1 was denied").arg(deviceId));
        case UnmountResult::NotFound:
            return OperationResult::failure(ErrorKind::NotFound,
                                            QStringLiteral("Device not found: %1").arg(deviceId));
        }
    }

    const DeviceResult opened = m_device->open(deviceId);
    if (opened != DeviceResult::Success) {
        QString detail = QStringLiteral("Cannot open %1 (%2)").arg(deviceId, m_device->describe(opened));
        if (opened == DeviceResult::PermissionDenied) detail += QStringLiteral(". Are you running with sudo/root?");
        return OperationResult::failure(DeviceHandle::toErrorKind(opened), detail);
    }
    auto closeDevice = qScopeGuard([this] { m_device->close(); });

    const qint64 alignedTotal = alignUp(total, SectorSize);
    const qint64 capacity = m_device->size();
    if (capacity > 0 && capacity < total) {
        return OperationResult::failure(ErrorKind::InvalidArgument,
                                        QStringLiteral("Image (%1) does not fit on %2 (%3)")
                                            .arg(utils::formatBytes(total), deviceId, utils::formatBytes(capacity)));
    }

    transition(State::Writing);
    report(BurnProgress::Phase::Writing, 0, total);

    if (m_wipeBeforeWrite) {
        qint64 wipeLen = qMin(WipeBytes, alignedTotal);
        if (capacity > 0) wipeLen = qMin(wipeLen, capacity);
        const DeviceResult wiped = m_device->writeAt(0, QByteArray(static_cast<qsizetype>(wipeLen), '\0'));
        if (wiped != DeviceResult::Success) {
            return OperationResult::failure(DeviceHandle::toErrorKind(wiped),
                                            QStringLiteral("Failed to clear the start of %1 (%2)")
                                                .arg(deviceId, m_device->describe(wiped)));
        }
        trace(QStringLiteral("Cleared first %1").arg(utils::formatBytes(wipeLen)));
    }

    m_processed = 0;
    while (m_processed < total) {
        if (m_cancelRequested.load()) {
            trace(QStringLiteral("Cancelled after %1").arg(utils::formatBytes(m_processed)));
            return OperationResult::cancelled(QStringLiteral("Burn cancelled; the device is not usable"));
        }

        const qint64 want = qMin(m_chunkSize, total - m_processed);
        QByteArray chunk;
        const OperationResult read = image.read(want, chunk);
        if (!read.ok()) return read;
        if (chunk.size() != want) {
            return OperationResult::failure(ErrorKind::ShortRead,
                                            QStringLiteral("Short read from image at %1").arg(m_processed));
        }
        const qint64 dataLen = chunk.size();
        if (dataLen % SectorSize != 0) {
            chunk.append(QByteArray(static_cast<qsizetype>(SectorSize - dataLen % SectorSize), '\0'));
        }

        const DeviceResult r = m_device->writeAt(m_processed, chunk);
        if (r != DeviceResult::Success) {
            return OperationResult::failure(DeviceHandle::toErrorKind(r),
                                            QStringLiteral("Write failed at offset %1 (%2)")
                                                .arg(m_processed).arg(m_device->describe(r)));
        }
        m_processed += dataLen;
        report(BurnProgress::Phase::Writing, m_processed, total);
    }

    const DeviceResult flushed = m_device->flush();
    if (flushed != DeviceResult::Success) {
        return OperationResult::failure(DeviceHandle::toErrorKind(flushed),
                                        QStringLiteral("Flush failed on %1 (%2)")
                                            .arg(deviceId, m_device->describe(flushed)));
    }
    trace(QStringLiteral("Wrote %1").arg(utils::formatBytes(m_processed)));
    return OperationResult::success();
}

OperationResult ImageBurner::verifyPhase(ImageSource& image, qint64 total, const QString& deviceId)
{
    transition(State::Verifying);
    m_processed = 0;
    report(BurnProgress::Phase::Verifying, 0, total);

    const DeviceResult opened = m_device->open(deviceId);
    if (opened != DeviceResult::Success) {
        return OperationResult::failure(DeviceHandle::toErrorKind(opened),
                                        QStringLiteral("Cannot reopen %1 for verification (%2)")
                                            .arg(deviceId, m_device->describe(opened)));
    }
    auto closeDevice = qScopeGuard([this] { m_device->close(); });

    const OperationResult rewound = image.rewind();
    if (!rewound.ok()) return rewound;

    while (m_processed < total) {
        if (m_cancelRequested.load()) {
            trace(QStringLiteral("Verification cancelled after %1").arg(utils::formatBytes(m_processed)));
            return OperationResult::cancelled(QStringLiteral("Verification cancelled; the device is not trusted"));
        }

        const qint64 start = m_processed;
        const qint64 want = qMin(m_chunkSize, total - start);
        QByteArray expected;
        const OperationResult read = image.read(want, expected);
        if (!read.ok()) return read;
        if (expected.size() != want) {
            return OperationResult::failure(ErrorKind::ShortRead,
                                            QStringLiteral("Short read from image at %1").arg(start));
        }

        // Raw devices only transfer whole sectors; the padding written after the image is read and dropped.
        QByteArray actual;
        const DeviceResult r = m_device->readAt(start, alignUp(want, SectorSize), actual);
        if (r != DeviceResult::Success && r != DeviceResult::ShortRead) {
            return OperationResult::failure(DeviceHandle::toErrorKind(r),
                                            QStringLiteral("Read failed at offset %1 (%2)")
                                                .arg(start).arg(m_device->describe(r)));
        }
        if (actual.size() < want) {
            return OperationResult::mismatch(start, start + want,
                                             QStringLiteral("Device ended before offset %1").arg(start + want));
        }
        actual.truncate(static_cast<qsizetype>(want));

        if (windowDigest(expected) != windowDigest(actual)) {
            trace(QStringLiteral("Mismatch in bytes %1-%2").arg(start).arg(start + want));
            return OperationResult::mismatch(start, start + want,
                                             QStringLiteral("Verification failed: device differs from image"));
        }

        m_processed += want;
        report(BurnProgress::Phase::Verifying, m_processed, total);
    }
    trace(QStringLiteral("Verified %1").arg(utils::formatBytes(m_processed)));
    return OperationResult::success();
}

OperationResult ImageBurner::finish(const OperationResult& result, qint64 total)
{
    if (m_unmounter) m_unmounter->release();
    if (result.isCancelled()) {
        transition(State::Cancelled);
        report(BurnProgress::Phase::Cancelled, m_processed, total, result.detail);
    } else if (result.isError()) {
        transition(State::Error);
        qWarning() << "Burn failed:" << result.toString();
        if (m_log) m_log->log(QStringLiteral("Burn failed: %1").arg(result.toString()));
        report(BurnProgress::Phase::Error, m_processed, total, result.toString());
    } else {
        report(BurnProgress::Phase::Completed, total, total);
        trace(QStringLiteral("Burn completed"));
    }
    emit finished(result);
    return result;
}

void ImageBurner::report(BurnProgress::Phase phase, qint64 processed, qint64 total, const QString& detail)
{
    BurnProgress p;
    p.phase = phase;
    p.processed = processed;
    p.total = total;
    p.detail = detail;
    emit progress(p);
}

void ImageBurner::trace(const QString& line)
{
    qDebug().noquote() << "ImageBurner:" << line;
    if (m_log) m_log->log(line);
}
