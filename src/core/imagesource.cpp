module;
#include <QByteArray>
#include <QDebug>
#include <QFile>
#include <QString>
#include <QtGlobal>
#include <cstring>
#include <zlib.h>

module kiln.core.imagesource;

ImageSource::~ImageSource()
{
    close();
}

bool ImageSource::isGzipPath(const QString& path)
{
    return path.endsWith(QStringLiteral(".gz"), Qt::CaseInsensitive);
}

OperationResult ImageSource::open(const QString& path)
{
    close();
    m_file.setFileName(path);
    if (!m_file.exists()) {
        return OperationResult::failure(ErrorKind::NotFound, QStringLiteral("Image not found: %1").arg(path));
    }
    if (!m_file.open(QIODevice::ReadOnly)) {
        const ErrorKind kind = m_file.error() == QFileDevice::PermissionsError ? ErrorKind::PermissionDenied
                                                                               : ErrorKind::OpenFailed;
        return OperationResult::failure(kind, QStringLiteral("Cannot open image %1: %2").arg(path, m_file.errorString()));
    }

    m_compressed = isGzipPath(path);
    if (m_compressed) {
        // 16 + MAX_WBITS selects the gzip wrapper.
        if (inflateInit2(&m_stream, 16 + MAX_WBITS) != Z_OK) {
            return OperationResult::failure(ErrorKind::IoError, QStringLiteral("Cannot start the gzip decoder"));
        }
        m_inflating = true;
        m_input.resize(static_cast<qsizetype>(InputBufferSize));
        const OperationResult scanned = scanSize();
        if (!scanned.ok()) return scanned;
        qDebug() << "Compressed image" << path << m_file.size() << "bytes, inflates to" << m_size;
    } else {
        m_size = m_file.size();
    }

    if (m_size <= 0) {
        return OperationResult::failure(ErrorKind::InvalidArgument, QStringLiteral("Image is empty: %1").arg(path));
    }
    return OperationResult::success();
}

OperationResult ImageSource::read(qint64 length, QByteArray& out)
{
    out.clear();
    if (!m_file.isOpen()) {
        return OperationResult::failure(ErrorKind::IoError, QStringLiteral("Image is not open"));
    }
    if (m_compressed) return inflateInto(length, out);

    out.resize(static_cast<qsizetype>(length));
    qint64 total = 0;
    while (total < length) {
        const qint64 got = m_file.read(out.data() + total, length - total);
        if (got < 0) {
            out.clear();
            return OperationResult::failure(ErrorKind::IoError,
                                            QStringLiteral("Read from image failed: %1").arg(m_file.errorString()));
        }
        if (got == 0) break;
        total += got;
    }
    out.resize(static_cast<qsizetype>(total));
    return OperationResult::success();
}

OperationResult ImageSource::inflateInto(qint64 length, QByteArray& out)
{
    out.resize(static_cast<qsizetype>(length));
    m_stream.next_out = reinterpret_cast<Bytef*>(out.data());
    m_stream.avail_out = static_cast<uInt>(length);

    while (m_stream.avail_out > 0 && !m_streamEnded) {
        if (m_stream.avail_in == 0) {
            const qint64 got = m_file.read(m_input.data(), m_input.size());
            if (got < 0) {
                out.clear();
                return OperationResult::failure(ErrorKind::IoError,
                                                QStringLiteral("Read from image failed: %1").arg(m_file.errorString()));
            }
            if (got == 0) {
                out.clear();
                return OperationResult::failure(ErrorKind::CorruptImage,
                                                QStringLiteral("Compressed image ends in the middle of the stream"));
            }
            m_stream.next_in = reinterpret_cast<Bytef*>(m_input.data());
            m_stream.avail_in = static_cast<uInt>(got);
        }

        const int rc = ::inflate(&m_stream, Z_NO_FLUSH);
        if (rc == Z_STREAM_END) {
            if (!nextMemberFollows()) {
                m_streamEnded = true;
                break;
            }
            ::inflateReset(&m_stream);
            continue;
        }
        if (rc != Z_OK && rc != Z_BUF_ERROR) {
            const QString reason = m_stream.msg ? QString::fromLatin1(m_stream.msg) : QStringLiteral("code %1").arg(rc);
            out.clear();
            return OperationResult::failure(ErrorKind::CorruptImage,
                                            QStringLiteral("Compressed image is damaged (%1)").arg(reason));
        }
    }

    out.resize(static_cast<qsizetype>(length - m_stream.avail_out));
    return OperationResult::success();
}

bool ImageSource::nextMemberFollows()
{
    if (m_stream.avail_in < 2) {
        const qint64 kept = m_stream.avail_in;
        if (kept > 0) std::memmove(m_input.data(), m_stream.next_in, static_cast<size_t>(kept));
        const qint64 got = m_file.read(m_input.data() + kept, m_input.size() - kept);
        if (got < 0) {
            qWarning() << "Read from image failed:" << m_file.errorString();
            return false;
        }
        m_stream.next_in = reinterpret_cast<Bytef*>(m_input.data());
        m_stream.avail_in = static_cast<uInt>(kept + got);
    }
    // Trailing bytes that are not a gzip header end the image.
    return m_stream.avail_in >= 2 && m_stream.next_in[0] == 0x1f && m_stream.next_in[1] == 0x8b;
}

OperationResult ImageSource::scanSize()
{
    qint64 total = 0;
    QByteArray window;
    for (;;) {
        const OperationResult r = inflateInto(ScanBufferSize, window);
        if (!r.ok()) return r;
        if (window.isEmpty()) break;
        total += window.size();
    }
    m_size = total;
    return rewind();
}

OperationResult ImageSource::rewind()
{
    if (!m_file.seek(0)) {
        return OperationResult::failure(ErrorKind::SeekFailed, QStringLiteral("Cannot rewind image"));
    }
    if (m_compressed) {
        ::inflateReset(&m_stream);
        m_stream.next_in = nullptr;
        m_stream.avail_in = 0;
        m_streamEnded = false;
    }
    return OperationResult::success();
}

void ImageSource::close()
{
    if (m_inflating) {
        ::inflateEnd(&m_stream);
        m_inflating = false;
    }
    m_stream = z_stream{};
    m_input.clear();
    m_file.close();
    m_compressed = false;
    m_streamEnded = false;
    m_size = -1;
}
