module;
#include <QByteArray>
#include <QDeadlineTimer>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>
#include <utility>

#if defined(Q_OS_WIN)
#include <windows.h>
#include <winioctl.h>
#endif

module kiln.device.unmounter;

namespace {

QString decodeMountField(const QByteArray& field)
{
    QByteArray out;
    out.reserve(field.size());
    for (qsizetype i = 0; i < field.size(); ++i) {
        if (field.at(i) == '\\' && i + 3 < field.size()) {
            bool ok = false;
            const int code = field.mid(i + 1, 3).toInt(&ok, 8);
            if (ok) {
                out.append(static_cast<char>(code));
                i += 3;
                continue;
            }
        }
        out.append(field.at(i));
    }
    return QString::fromUtf8(out);
}

bool isPartitionOf(const QString& source, const QString& deviceId)
{
    if (source == deviceId) return true;
    if (!source.startsWith(deviceId)) return false;
    static const QRegularExpression suffix(QStringLiteral("^(p|s)?[0-9]+$"));
    return suffix.match(source.mid(deviceId.size())).hasMatch();
}

} // namespace

QString Unmounter::resultName(UnmountResult result)
{
    switch (result) {
    case UnmountResult::Success:  return QStringLiteral("Success");
    case UnmountResult::Denied:   return QStringLiteral("Denied");
    case UnmountResult::Timeout:  return QStringLiteral("Timeout");
    case UnmountResult::NotFound: return QStringLiteral("NotFound");
    }
    return QStringLiteral("Unknown");
}

SystemUnmounter::SystemUnmounter(const QString& mountTablePath)
    : m_mountTablePath(mountTablePath)
{
}

SystemUnmounter::~SystemUnmounter()
{
    release();
}

int SystemUnmounter::physicalDriveNumber(const QString& deviceId)
{
    static const QRegularExpression drive(QStringLiteral(R"(^\\\\\.\\PhysicalDrive([0-9]+)$)"),
                                          QRegularExpression::CaseInsensitiveOption);
    const QRegularExpressionMatch match = drive.match(deviceId);
    if (!match.hasMatch()) return -1;
    bool ok = false;
    const int number = match.captured(1).toInt(&ok);
    return ok ? number : -1;
}

void SystemUnmounter::release()
{
#if defined(Q_OS_WIN)
    for (void* volume : std::as_const(m_lockedVolumes)) {
        DWORD bytes = 0;
        DeviceIoControl(static_cast<HANDLE>(volume), FSCTL_UNLOCK_VOLUME, nullptr, 0, nullptr, 0, &bytes, nullptr);
        CloseHandle(static_cast<HANDLE>(volume));
    }
#endif
    m_lockedVolumes.clear();
}

QStringList SystemUnmounter::mountPointsFor(const QString& deviceId, const QByteArray& mountTable)
{
    QStringList points;
    const QList<QByteArray> lines = mountTable.split('\n');
    for (const QByteArray& line : lines) {
        const QList<QByteArray> fields = line.simplified().split(' ');
        if (fields.size() < 2) continue;
        const QString source = decodeMountField(fields.at(0));
        if (!isPartitionOf(source, deviceId)) continue;
        points.append(decodeMountField(fields.at(1)));
    }
    return points;
}

UnmountResult SystemUnmounter::unmount(const QString& deviceId, int timeoutMs)
{
#if defined(Q_OS_WIN)
    const int target = physicalDriveNumber(deviceId);
    if (target < 0) {
        // Image files and other paths have no volumes of their own.
        return QFileInfo::exists(deviceId) ? UnmountResult::Success : UnmountResult::NotFound;
    }

    release();
    QDeadlineTimer deadline(timeoutMs);
    const DWORD letters = GetLogicalDrives();
    for (int i = 0; i < 26; ++i) {
        if (!(letters & (1u << i))) continue;
        if (deadline.hasExpired()) {
            qWarning() << "Dismounting volumes of" << deviceId << "timed out";
            return UnmountResult::Timeout;
        }

        const QString volume = QStringLiteral("\\\\.\\%1:").arg(QChar(u'A' + i));
        const auto path = reinterpret_cast<LPCWSTR>(volume.utf16());
        HANDLE probe = CreateFileW(path, GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE,
                                   nullptr, OPEN_EXISTING, 0, nullptr);
        if (probe == INVALID_HANDLE_VALUE) continue;
        STORAGE_DEVICE_NUMBER number{};
        DWORD bytes = 0;
        const bool numbered = DeviceIoControl(probe, IOCTL_STORAGE_GET_DEVICE_NUMBER, nullptr, 0,
                                              &number, sizeof(number), &bytes, nullptr);
        CloseHandle(probe);
        if (!numbered || number.DeviceNumber != static_cast<DWORD>(target)) continue;

        HANDLE handle = CreateFileW(path, GENERIC_READ | GENERIC_WRITE, FILE_SHARE_READ | FILE_SHARE_WRITE,
                                    nullptr, OPEN_EXISTING, 0, nullptr);
        if (handle == INVALID_HANDLE_VALUE) {
            qWarning() << "Cannot open volume" << volume << "error" << GetLastError();
            release();
            return UnmountResult::Denied;
        }
        // Open files on the volume make the lock fail; the dismount below still forces it off.
        if (!DeviceIoControl(handle, FSCTL_LOCK_VOLUME, nullptr, 0, nullptr, 0, &bytes, nullptr)) {
            qWarning() << "Cannot lock volume" << volume << "error" << GetLastError();
        }
        if (!DeviceIoControl(handle, FSCTL_DISMOUNT_VOLUME, nullptr, 0, nullptr, 0, &bytes, nullptr)) {
            qWarning() << "Cannot dismount volume" << volume << "error" << GetLastError();
            CloseHandle(handle);
            release();
            return UnmountResult::Denied;
        }
        qDebug() << "Locked and dismounted" << volume;
        m_lockedVolumes.append(handle);
    }
    return UnmountResult::Success;
#else
    QFileInfo info(deviceId);
    if (!info.exists()) return UnmountResult::NotFound;
    if (info.isFile()) return UnmountResult::Success;

#if defined(Q_OS_LINUX)
    QFile table(m_mountTablePath);
    if (!table.open(QIODevice::ReadOnly)) {
        qWarning() << "Cannot read mount table" << m_mountTablePath;
        return UnmountResult::Success;
    }
    const QStringList points = mountPointsFor(deviceId, table.readAll());
    table.close();

    QDeadlineTimer deadline(timeoutMs);
    for (const QString& point : points) {
        qDebug() << "Unmounting" << point;
        QProcess proc;
        proc.setProcessChannelMode(QProcess::MergedChannels);
        proc.start(QStringLiteral("umount"), QStringList{ point });
        if (!proc.waitForStarted(2000)) return UnmountResult::Denied;
        if (!proc.waitForFinished(static_cast<int>(qMax<qint64>(1, deadline.remainingTime())))) {
            proc.kill();
            proc.waitForFinished(1000);
            qWarning() << "umount timed out for" << point;
            return UnmountResult::Timeout;
        }
        const QString output = QString::fromUtf8(proc.readAll());
        if (proc.exitStatus() != QProcess::NormalExit || proc.exitCode() != 0) {
            // Already unmounted by someone else counts as released.
            if (output.contains("not mounted", Qt::CaseInsensitive)) continue;
            qWarning() << "umount failed for" << point << output.trimmed();
            return UnmountResult::Denied;
        }
    }
    return UnmountResult::Success;

#elif defined(Q_OS_MAC)
    QProcess proc;
    proc.setProcessChannelMode(QProcess::MergedChannels);
    proc.start(QStringLiteral("diskutil"),
               QStringList{ QStringLiteral("unmountDisk"), QStringLiteral("force"), deviceId });
    if (!proc.waitForStarted(2000)) return UnmountResult::Denied;
    if (!proc.waitForFinished(timeoutMs)) {
        proc.kill();
        proc.waitForFinished(1000);
        qWarning() << "diskutil unmountDisk timed out for" << deviceId;
        return UnmountResult::Timeout;
    }
    const QString output = QString::fromUtf8(proc.readAll());
    if (proc.exitStatus() != QProcess::NormalExit || proc.exitCode() != 0) {
        qWarning() << "diskutil unmountDisk failed:" << output.trimmed();
        return UnmountResult::Denied;
    }
    return UnmountResult::Success;

#else
    Q_UNUSED(timeoutMs);
    return UnmountResult::Success;
#endif
#endif
}
