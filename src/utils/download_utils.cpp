module;
#include <QByteArray>
#include <QByteArrayView>
#include <QCryptographicHash>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QUrlQuery>
#include <QtGlobal>

module kiln.utils.download_utils;

namespace kiln::utils {

QString normalizeFilePath(const QString& path)
{
    if (path.startsWith("file://")) {
        QUrl url(path);
        if (url.isValid() && url.isLocalFile()) {
            return url.toLocalFile();
        }
    }
    return path;
}

QString partialStatePath(const QString& destPath)
{
    return normalizeFilePath(destPath) + QStringLiteral(".partial");
}

QString decodeQueryValue(const QString& value)
{
    QString v = value;
    v.replace('+', ' ');
    return QUrl::fromPercentEncoding(v.toUtf8());
}

QString filenameFromDisposition(const QString& value)
{
    const QString decoded = decodeQueryValue(value);
    if (decoded.isEmpty()) return QString();
    QRegularExpression re(QStringLiteral("filename\\*?=(?:UTF-8''|\"?)([^\";]+)"));
    auto match = re.match(decoded);
    if (match.hasMatch()) return match.captured(1).trimmed();
    return QString();
}

QString fileNameFromUrl(const QUrl& url)
{
    if (!url.isValid()) return QString();
    QUrlQuery query(url);
    QString disp = query.queryItemValue(QStringLiteral("response-content-disposition"));
    if (disp.isEmpty()) disp = query.queryItemValue(QStringLiteral("content-disposition"));
    if (!disp.isEmpty()) {
        const QString fromDisp = filenameFromDisposition(disp);
        if (!fromDisp.isEmpty()) return fromDisp;
    }
    const QString filename = query.queryItemValue(QStringLiteral("filename"));
    if (!filename.isEmpty()) return decodeQueryValue(filename);

    return QFileInfo(url.path()).fileName();
}

QString normalizeChecksum(const QString& value)
{
    QString out = value.trimmed().toLower();
    out.remove(' ');
    return out;
}

QString detectChecksumAlgo(const QString& expected)
{
    const QString norm = normalizeChecksum(expected);
    const int len = norm.length();
    if (len == 32) return QStringLiteral("MD5");
    if (len == 40) return QStringLiteral("SHA1");
    if (len == 64) return QStringLiteral("SHA256");
    if (len == 128) return QStringLiteral("SHA512");
    return QString();
}

bool checksumAlgorithmFor(const QString& name, QCryptographicHash::Algorithm& out)
{
    const QString upper = name.trimmed().toUpper();
    if (upper == "MD5") out = QCryptographicHash::Md5;
    else if (upper == "SHA1") out = QCryptographicHash::Sha1;
    else if (upper == "SHA256") out = QCryptographicHash::Sha256;
    else if (upper == "SHA512") out = QCryptographicHash::Sha512;
    else return false;
    return true;
}

QString hashFile(const QString& path, QCryptographicHash::Algorithm algorithm)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) return QString();
    QCryptographicHash hash(algorithm);
    QByteArray buffer;
    buffer.resize(1024 * 1024);
    while (!file.atEnd()) {
        const qint64 readBytes = file.read(buffer.data(), buffer.size());
        if (readBytes < 0) return QString();
        if (readBytes == 0) break;
        hash.addData(QByteArrayView(buffer.constData(), static_cast<qsizetype>(readBytes)));
    }
    file.close();
    return QString::fromUtf8(hash.result().toHex());
}

bool fileExistsPath(const QString& path)
{
    const QString normalized = normalizeFilePath(path);
    if (normalized.isEmpty()) return false;
    QFileInfo info(normalized);
    return info.exists() && info.isFile();
}

QString formatBytes(qint64 bytes)
{
    constexpr double kib = 1024.0;
    constexpr double mib = kib * 1024.0;
    constexpr double gib = mib * 1024.0;
    if (bytes < 1024) return QStringLiteral("%1 B").arg(bytes);
    if (bytes < 1024 * 1024) return QStringLiteral("%1 KiB").arg(bytes / kib, 0, 'f', 2);
    if (bytes < 1024LL * 1024 * 1024) return QStringLiteral("%1 MiB").arg(bytes / mib, 0, 'f', 2);
    return QStringLiteral("%1 GiB").arg(bytes / gib, 0, 'f', 2);
}

} // namespace kiln::utils
