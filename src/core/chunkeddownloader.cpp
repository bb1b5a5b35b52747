module;
#include <QByteArray>
#include <QCryptographicHash>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QFutureWatcher>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>
#include <QSslError>
#include <QTimer>
#include <QVector>
#include <QtConcurrent>

module kiln.core.chunkeddownloader;

import kiln.core.downloadstate;
import kiln.services.debug_log;
import kiln.utils.download_utils;

namespace utils = kiln::utils;

ChunkedDownloader::ChunkedDownloader(const QUrl& url,
                                     const QString& destPath,
                                     qint64 expectedSize,
                                     int chunkCount,
                                     QObject* parent)
    : QObject(parent),
    m_url(url),
    m_destPath(utils::normalizeFilePath(destPath)),
    m_expectedSize(expectedSize),
    m_chunkCount(chunkCount)
{
    m_manager = new QNetworkAccessManager(this);
}

QNetworkRequest ChunkedDownloader::makeRequest() const
{
    QNetworkRequest req(m_url);
    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                     QNetworkRequest::NoLessSafeRedirectPolicy);
    req.setRawHeader("User-Agent", m_userAgent.toUtf8());
    return req;
}

void ChunkedDownloader::start()
{
    if (m_running) return;

    m_running = true;
    m_finished = false;
    m_cancelRequested = false;
    m_mode = Mode::Undecided;
    m_totalSize = 0;
    m_acceptsRanges = false;
    m_currentChunk = -1;
    m_chunkReceived = 0;
    m_singleReceived = 0;
    m_pendingError = OperationResult::success();

    if (m_log) m_log->section(QStringLiteral("DOWNLOAD"));
    trace(QStringLiteral("Start: %1 -> %2").arg(m_url.toString(), m_destPath));

    if (!m_url.isValid() || m_url.scheme().isEmpty()) {
        finish(OperationResult::failure(ErrorKind::InvalidArgument,
                                        QStringLiteral("Invalid URL: %1").arg(m_url.toString())));
        return;
    }
    if (m_destPath.isEmpty()) {
        finish(OperationResult::failure(ErrorKind::InvalidArgument, QStringLiteral("No destination path")));
        return;
    }
    if (m_chunkCount < 1) {
        finish(OperationResult::failure(ErrorKind::InvalidArgument,
                                        QStringLiteral("Chunk count must be at least 1 (got %1)").arg(m_chunkCount)));
        return;
    }

    QNetworkReply* headReply = m_manager->head(makeRequest());
    m_reply = headReply;

#if QT_CONFIG(ssl)
    connect(headReply, &QNetworkReply::sslErrors, this, [](const QList<QSslError>& errors) {
        qWarning() << "HEAD SSL errors:" << errors;
    });
#endif
    connect(headReply, &QNetworkReply::finished, this, [this, headReply]() {
        onProbeFinished(headReply);
    });
}

void ChunkedDownloader::onProbeFinished(QNetworkReply* reply)
{
    reply->deleteLater();
    if (m_reply == reply) m_reply = nullptr;
    if (m_finished) return;

    if (m_cancelRequested) {
        finish(OperationResult::cancelled());
        return;
    }

    if (reply->error() != QNetworkReply::NoError) {
        trace(QStringLiteral("HEAD failed: %1").arg(reply->errorString()));
        m_totalSize = qMax<qint64>(0, m_expectedSize);
        m_acceptsRanges = m_expectedSize > 0;
    } else {
        const QVariant cl = reply->header(QNetworkRequest::ContentLengthHeader);
        const qint64 contentLength = cl.isValid() ? cl.toLongLong() : -1;
        m_totalSize = contentLength > 0 ? contentLength : qMax<qint64>(0, m_expectedSize);
        m_acceptsRanges = reply->rawHeader("Accept-Ranges").trimmed().toLower() == "bytes";
        if (contentLength > 0 && m_expectedSize > 0 && contentLength != m_expectedSize) {
            qWarning() << "Server size" << contentLength << "differs from expected" << m_expectedSize;
        }
    }

    trace(QStringLiteral("Size %1, ranges %2")
              .arg(m_totalSize > 0 ? utils::formatBytes(m_totalSize) : QStringLiteral("unknown"),
                   m_acceptsRanges ? QStringLiteral("accepted") : QStringLiteral("not accepted")));

    if (m_acceptsRanges && m_totalSize > m_minChunkedSize && m_totalSize >= m_chunkCount) {
        startChunked();
    } else {
        startSingleStream();
    }
}

void ChunkedDownloader::startChunked()
{
    m_mode = Mode::Chunked;
    const QString url = m_url.toString();

    DownloadState existing;
    const DownloadState::LoadResult loaded = DownloadState::load(m_destPath, existing);
    const QFileInfo destInfo(m_destPath);
    bool resume = false;
    switch (loaded) {
    case DownloadState::LoadResult::Ok:
        if (!existing.matches(url, m_totalSize)) {
            trace(QStringLiteral("Stale resume state (different URL or size), starting fresh"));
        } else if (!destInfo.exists() || destInfo.size() != m_totalSize) {
            trace(QStringLiteral("Destination missing or resized, starting fresh"));
        } else {
            resume = true;
        }
        break;
    case DownloadState::LoadResult::Corrupt:
        finish(OperationResult::failure(ErrorKind::CorruptState,
                                        QStringLiteral("Resume state %1 is corrupt; delete it to start over")
                                            .arg(DownloadState::stateFilePath(m_destPath))));
        return;
    case DownloadState::LoadResult::IoError:
        trace(QStringLiteral("Unreadable resume state, starting fresh"));
        break;
    case DownloadState::LoadResult::NotFound:
        break;
    }

    if (resume) {
        m_state = existing;
        m_state.recomputeDownloadedBytes();
        trace(QStringLiteral("Resuming: %1 of %2 chunks done (%3%)")
                  .arg(m_state.chunks().size() - m_state.incompleteChunkIndices().size())
                  .arg(m_state.chunks().size())
                  .arg(m_state.completionPercentage(), 0, 'f', 1));
    } else {
        if (loaded != DownloadState::LoadResult::NotFound) DownloadState::remove(m_destPath);
        const OperationResult created = DownloadState::create(url, m_totalSize, m_destPath, m_chunkCount, m_state);
        if (!created.ok()) {
            finish(created);
            return;
        }
    }

    m_file.setFileName(m_destPath);
    const QIODevice::OpenMode openMode = resume ? QIODevice::ReadWrite
                                                : (QIODevice::ReadWrite | QIODevice::Truncate);
    if (!m_file.open(openMode)) {
        const ErrorKind kind = m_file.error() == QFileDevice::PermissionsError ? ErrorKind::PermissionDenied
                                                                                : ErrorKind::OpenFailed;
        finish(OperationResult::failure(kind, QStringLiteral("Cannot open %1: %2").arg(m_destPath, m_file.errorString())));
        return;
    }
    if (!resume) {
        if (!m_file.resize(m_totalSize)) {
            finish(OperationResult::failure(ErrorKind::IoError,
                                            QStringLiteral("Cannot allocate %1 for %2")
                                                .arg(utils::formatBytes(m_totalSize), m_destPath)));
            return;
        }
        const OperationResult saved = m_state.save();
        if (!saved.ok()) {
            finish(saved);
            return;
        }
    }

    emit started(m_totalSize, true);
    emit progress(m_state.downloadedBytes(), m_totalSize);
    fetchNextChunk();
}

void ChunkedDownloader::fetchNextChunk()
{
    if (m_finished) return;
    if (m_cancelRequested) {
        finish(OperationResult::cancelled(QStringLiteral("Download cancelled; run again to resume")));
        return;
    }

    const QVector<int> pending = m_state.incompleteChunkIndices();
    if (pending.isEmpty()) {
        completeTransfer();
        return;
    }

    m_currentChunk = pending.first();
    m_chunkReceived = 0;
    m_pendingError = OperationResult::success();
    const ChunkState chunk = m_state.chunks().at(m_currentChunk);

    QNetworkRequest req = makeRequest();
    req.setRawHeader("Range", QStringLiteral("bytes=%1-%2").arg(chunk.start).arg(chunk.end).toUtf8());
    QNetworkReply* reply = m_manager->get(req);
    m_reply = reply;
    QPointer<QNetworkReply> replyPtr(reply);

    connect(reply, &QNetworkReply::metaDataChanged, this, [this, replyPtr, chunk]() {
        if (!replyPtr || replyPtr != m_reply) return;
        const int status = replyPtr->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        if (status == 0 || status == 206) return;
        const bool wholeFile = chunk.start == 0 && chunk.end == m_totalSize - 1;
        if (status == 200 && wholeFile) return;
        if (status >= 300 && status < 400) return;
        m_pendingError = OperationResult::failure(ErrorKind::HttpStatus,
                                                  QStringLiteral("Chunk %1 answered with HTTP %2")
                                                      .arg(m_currentChunk).arg(status));
        replyPtr->abort();
    });

#if QT_CONFIG(ssl)
    connect(reply, &QNetworkReply::sslErrors, this, [](const QList<QSslError>& errors) {
        qWarning() << "Chunk GET SSL errors:" << errors;
    });
#endif

    connect(reply, &QNetworkReply::readyRead, this, [this, replyPtr]() {
        if (!replyPtr || replyPtr != m_reply) return;
        if (!m_pendingError.ok()) return;
        if (!writeChunkData(replyPtr)) replyPtr->abort();
    });

    connect(reply, &QNetworkReply::finished, this, [this, replyPtr]() {
        if (!replyPtr) return;
        onChunkFinished(replyPtr);
    });
}

bool ChunkedDownloader::writeChunkData(QNetworkReply* reply)
{
    const ChunkState& chunk = m_state.chunks().at(m_currentChunk);
    QByteArray data = reply->readAll();
    if (data.isEmpty()) return true;

    const qint64 remaining = chunk.length() - m_chunkReceived;
    if (data.size() > remaining) {
        m_pendingError = OperationResult::failure(ErrorKind::Network,
                                                  QStringLiteral("Server sent more than chunk %1 holds")
                                                      .arg(m_currentChunk));
        return false;
    }

    if (!m_file.seek(chunk.start + m_chunkReceived) || m_file.write(data) != data.size()) {
        m_pendingError = OperationResult::failure(ErrorKind::IoError,
                                                  QStringLiteral("Cannot write %1: %2").arg(m_destPath, m_file.errorString()));
        return false;
    }
    m_chunkReceived += data.size();
    emit progress(m_state.downloadedBytes() + m_chunkReceived, m_totalSize);
    return true;
}

void ChunkedDownloader::onChunkFinished(QNetworkReply* reply)
{
    reply->deleteLater();
    if (reply != m_reply) return;
    m_reply = nullptr;
    if (m_finished) return;

    if (m_cancelRequested) {
        m_file.flush();
        trace(QStringLiteral("Cancelled during chunk %1").arg(m_currentChunk));
        finish(OperationResult::cancelled(QStringLiteral("Download cancelled; run again to resume")));
        return;
    }
    if (m_pendingError.ok() && reply->error() == QNetworkReply::NoError) {
        if (!writeChunkData(reply)) {
            finish(m_pendingError);
            return;
        }
    }
    if (!m_pendingError.ok()) {
        finish(m_pendingError);
        return;
    }
    if (reply->error() != QNetworkReply::NoError) {
        finish(replyError(reply, QStringLiteral("Chunk %1").arg(m_currentChunk)));
        return;
    }

    const ChunkState chunk = m_state.chunks().at(m_currentChunk);
    if (m_chunkReceived != chunk.length()) {
        finish(OperationResult::failure(ErrorKind::ShortRead,
                                        QStringLiteral("Chunk %1 ended after %2 of %3 bytes")
                                            .arg(m_currentChunk).arg(m_chunkReceived).arg(chunk.length())));
        return;
    }

    if (!m_file.flush()) {
        finish(OperationResult::failure(ErrorKind::IoError,
                                        QStringLiteral("Cannot flush %1: %2").arg(m_destPath, m_file.errorString())));
        return;
    }
    m_state.markComplete(m_currentChunk, chunk.length());
    const OperationResult saved = m_state.save();
    if (!saved.ok()) {
        finish(saved);
        return;
    }

    trace(QStringLiteral("Chunk %1 complete (%2%)")
              .arg(m_currentChunk)
              .arg(m_state.completionPercentage(), 0, 'f', 1));
    emit chunkCompleted(m_currentChunk);

    QTimer::singleShot(0, this, &ChunkedDownloader::fetchNextChunk);
}

void ChunkedDownloader::startSingleStream()
{
    m_mode = Mode::SingleStream;
    m_file.setFileName(m_destPath);
    if (!m_file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        const ErrorKind kind = m_file.error() == QFileDevice::PermissionsError ? ErrorKind::PermissionDenied
                                                                                : ErrorKind::OpenFailed;
        finish(OperationResult::failure(kind, QStringLiteral("Cannot open %1: %2").arg(m_destPath, m_file.errorString())));
        return;
    }

    emit started(m_totalSize, false);
    m_pendingError = OperationResult::success();

    QNetworkReply* reply = m_manager->get(makeRequest());
    m_reply = reply;
    QPointer<QNetworkReply> replyPtr(reply);

    connect(reply, &QNetworkReply::metaDataChanged, this, [this, replyPtr]() {
        if (!replyPtr || replyPtr != m_reply) return;
        const int status = replyPtr->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        if (status == 0 || (status >= 200 && status < 400)) return;
        m_pendingError = OperationResult::failure(ErrorKind::HttpStatus,
                                                  QStringLiteral("Download answered with HTTP %1").arg(status));
        replyPtr->abort();
    });

    connect(reply, &QNetworkReply::readyRead, this, [this, replyPtr]() {
        if (!replyPtr || replyPtr != m_reply) return;
        if (!m_pendingError.ok()) return;
        const QByteArray data = replyPtr->readAll();
        if (m_file.write(data) != data.size()) {
            m_pendingError = OperationResult::failure(ErrorKind::IoError,
                                                      QStringLiteral("Cannot write %1: %2").arg(m_destPath, m_file.errorString()));
            replyPtr->abort();
            return;
        }
        m_singleReceived += data.size();
        emit progress(m_singleReceived, m_totalSize);
    });

    connect(reply, &QNetworkReply::finished, this, [this, replyPtr]() {
        if (!replyPtr) return;
        onSingleFinished(replyPtr);
    });
}

void ChunkedDownloader::onSingleFinished(QNetworkReply* reply)
{
    reply->deleteLater();
    if (reply != m_reply) return;
    m_reply = nullptr;
    if (m_finished) return;

    OperationResult failure = m_pendingError;
    if (failure.ok() && !m_cancelRequested) {
        if (reply->error() != QNetworkReply::NoError) {
            failure = replyError(reply, QStringLiteral("Download"));
        } else {
            const QByteArray tail = reply->readAll();
            if (m_file.write(tail) != tail.size()) {
                failure = OperationResult::failure(ErrorKind::IoError,
                                                   QStringLiteral("Cannot write %1: %2").arg(m_destPath, m_file.errorString()));
            } else {
                m_singleReceived += tail.size();
                if (m_totalSize > 0 && m_singleReceived != m_totalSize) {
                    failure = OperationResult::failure(ErrorKind::ShortRead,
                                                       QStringLiteral("Received %1 of %2 bytes")
                                                           .arg(m_singleReceived).arg(m_totalSize));
                }
            }
        }
    }

    if (m_cancelRequested || !failure.ok()) {
        // A single stream cannot resume, so the partial file is useless.
        m_file.close();
        QFile::remove(m_destPath);
        if (m_cancelRequested) {
            finish(OperationResult::cancelled(QStringLiteral("Download cancelled; partial file removed")));
        } else {
            finish(failure);
        }
        return;
    }

    if (m_totalSize <= 0) m_totalSize = m_singleReceived;
    emit progress(m_singleReceived, m_totalSize);
    completeTransfer();
}

void ChunkedDownloader::completeTransfer()
{
    if (m_file.isOpen()) {
        if (!m_file.flush()) {
            finish(OperationResult::failure(ErrorKind::IoError,
                                            QStringLiteral("Cannot flush %1: %2").arg(m_destPath, m_file.errorString())));
            return;
        }
        m_file.close();
    }

    const QString expected = utils::normalizeChecksum(m_expectedChecksum);
    if (expected.isEmpty()) {
        DownloadState::remove(m_destPath);
        finish(OperationResult::success());
        return;
    }

    QCryptographicHash::Algorithm algorithm = QCryptographicHash::Sha256;
    const QString algoName = utils::detectChecksumAlgo(expected);
    if (!utils::checksumAlgorithmFor(algoName, algorithm)) {
        finish(OperationResult::failure(ErrorKind::InvalidArgument,
                                        QStringLiteral("Unrecognized checksum: %1").arg(m_expectedChecksum)));
        return;
    }

    trace(QStringLiteral("Verifying %1 checksum").arg(algoName));
    const QString path = m_destPath;
    QPointer<QFutureWatcher<QString>> watcher = new QFutureWatcher<QString>(this);
    connect(watcher, &QFutureWatcher<QString>::finished, this, [this, watcher, expected, algoName]() {
        const QString actual = watcher ? watcher->result() : QString();
        if (watcher) watcher->deleteLater();
        if (m_finished) return;

        if (actual.isEmpty()) {
            finish(OperationResult::failure(ErrorKind::IoError,
                                            QStringLiteral("Cannot read %1 for checksum").arg(m_destPath)));
            return;
        }
        if (utils::normalizeChecksum(actual) != expected) {
            // The bytes on disk are wrong; resuming would only keep them.
            DownloadState::remove(m_destPath);
            QFile::remove(m_destPath);
            finish(OperationResult::failure(ErrorKind::ChecksumMismatch,
                                            QStringLiteral("%1 mismatch: expected %2, got %3")
                                                .arg(algoName, expected, actual)));
            return;
        }
        trace(QStringLiteral("Checksum OK"));
        DownloadState::remove(m_destPath);
        finish(OperationResult::success());
    });
    watcher->setFuture(QtConcurrent::run([path, algorithm]() -> QString {
        return utils::hashFile(path, algorithm);
    }));
}

void ChunkedDownloader::cancel()
{
    if (!m_running || m_finished) return;
    trace(QStringLiteral("Cancel requested"));
    m_cancelRequested = true;
    if (m_reply) m_reply->abort();
}

OperationResult ChunkedDownloader::replyError(QNetworkReply* reply, const QString& what) const
{
    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status >= 400) {
        return OperationResult::failure(ErrorKind::HttpStatus,
                                        QStringLiteral("%1 failed with HTTP %2: %3")
                                            .arg(what).arg(status).arg(reply->errorString()));
    }
    return OperationResult::failure(ErrorKind::Network,
                                    QStringLiteral("%1 failed: %2").arg(what, reply->errorString()));
}

void ChunkedDownloader::finish(const OperationResult& result)
{
    if (m_finished) return;
    m_finished = true;
    m_running = false;
    if (m_file.isOpen()) {
        m_file.flush();
        m_file.close();
    }
    if (result.isError()) {
        qWarning() << "Download failed:" << result.toString();
        if (m_log) m_log->log(QStringLiteral("Download failed: %1").arg(result.toString()));
    } else {
        trace(QStringLiteral("Download %1").arg(OperationResult::outcomeName(result.outcome)));
    }
    emit finished(result);
}

void ChunkedDownloader::trace(const QString& line)
{
    qDebug().noquote() << "ChunkedDownloader:" << line;
    if (m_log) m_log->log(line);
}
