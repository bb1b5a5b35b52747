module;
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QMutexLocker>
#include <QString>
#include <QSysInfo>
#include <QtGlobal>

module kiln.services.debug_log;

DebugLog::~DebugLog()
{
    close();
}

bool DebugLog::open(const QString& path)
{
    QMutexLocker lock(&m_mutex);
    if (m_file.isOpen()) return true;

    m_file.setFileName(path);
    if (!m_file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        qWarning() << "Cannot open debug log" << path << m_file.errorString();
        return false;
    }
    m_path = path;

    QString header;
    header += QStringLiteral("=== Kiln debug log ===\n");
    header += QStringLiteral("Started: %1\n").arg(QDateTime::currentDateTime().toString(Qt::ISODate));
    header += QStringLiteral("Platform: %1 (%2)\n").arg(QSysInfo::prettyProductName(), QSysInfo::kernelVersion());
    header += QStringLiteral("Arch: %1\n").arg(QSysInfo::currentCpuArchitecture());
    header += QStringLiteral("Qt: %1\n\n").arg(QString::fromLatin1(qVersion()));
    writeLocked(header);
    return true;
}

void DebugLog::close()
{
    QMutexLocker lock(&m_mutex);
    if (m_file.isOpen()) m_file.close();
}

bool DebugLog::isOpen() const
{
    QMutexLocker lock(&m_mutex);
    return m_file.isOpen();
}

QString DebugLog::path() const
{
    QMutexLocker lock(&m_mutex);
    return m_path;
}

void DebugLog::log(const QString& line)
{
    QMutexLocker lock(&m_mutex);
    if (!m_file.isOpen()) return;
    const QString stamp = QDateTime::currentDateTime().toString(QStringLiteral("hh:mm:ss.zzz"));
    writeLocked(QStringLiteral("[%1] %2\n").arg(stamp, line));
}

void DebugLog::section(const QString& title)
{
    QMutexLocker lock(&m_mutex);
    if (!m_file.isOpen()) return;
    writeLocked(QStringLiteral("\n=== %1 ===\n").arg(title));
}

bool DebugLog::copyTo(const QString& dir, const QString& fileName)
{
    QMutexLocker lock(&m_mutex);
    if (m_path.isEmpty()) return false;
    if (m_file.isOpen()) m_file.flush();

    const QString target = QDir(dir).filePath(fileName);
    if (QFile::exists(target) && !QFile::remove(target)) {
        qWarning() << "Cannot replace" << target;
        return false;
    }
    if (!QFile::copy(m_path, target)) {
        qWarning() << "Cannot copy debug log to" << target;
        return false;
    }
    return true;
}

QString DebugLog::defaultPath()
{
    return QDir::temp().filePath(QStringLiteral("kiln_debug.txt"));
}

void DebugLog::writeLocked(const QString& text)
{
    const QByteArray data = text.toUtf8();
    if (m_file.write(data) != data.size()) {
        qWarning() << "Debug log write failed:" << m_file.errorString();
        return;
    }
    m_file.flush();
}
