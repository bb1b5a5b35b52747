/*!
 * @file        chunkeddownloader.cppm
 * @brief       Resumable chunked HTTP download into a single file.
 * @details     ChunkedDownloader fetches one remote resource into one
 *              destination file. When the server accepts byte ranges and the
 *              resource is large enough, the transfer is split into a chunk
 *              plan that is persisted beside the destination after every
 *              completed chunk, so a cancelled or crashed transfer resumes
 *              with only the missing chunks. Otherwise the resource is
 *              fetched as a single stream.
 *
 *              Chunks are fetched one at a time in ascending index order and
 *              every received buffer is written straight into the
 *              destination at the chunk offset. Progress is reported per
 *              buffer. A failed chunk aborts the transfer without retry;
 *              running the same download again is the retry.
 *
 *              On cancellation a chunked transfer keeps both the destination
 *              and its sidecar. A single-stream transfer deletes the partial
 *              destination because it cannot be resumed.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kiln/blob/main/LICENSE.md
 */

module;
#include <QFile>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QUrl>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module kiln.core.chunkeddownloader;
export import kiln.core.downloadstate;
import kiln.services.debug_log;
#endif

#ifdef Q_MOC_RUN
#define KILN_MODULE_EXPORT
#else
#define KILN_MODULE_EXPORT export
#endif

/**
 * @brief Downloads a resource with chunk-level resume.
 *
 * Runs on the thread that owns it and needs a running event loop.
 * finished() is emitted exactly once per start().
 */
KILN_MODULE_EXPORT class ChunkedDownloader : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Transfer strategy chosen after the HEAD probe.
     */
    enum class Mode {
        Undecided,      //!< Probe not finished.
        Chunked,        //!< Ranged, resumable chunks.
        SingleStream    //!< One GET for the whole body.
    };

    static constexpr int DefaultChunkCount = 8;                         //!< Chunks per ranged download.
    static constexpr qint64 DefaultMinChunkedSize = 10LL * 1024 * 1024; //!< Smaller resources use one stream.

    /**
     * @brief Construct a downloader.
     *
     * @param url Source URL.
     * @param destPath Destination file path.
     * @param expectedSize Size published by the release feed, or -1.
     * @param chunkCount Number of chunks for a ranged download.
     * @param parent Parent QObject.
     */
    ChunkedDownloader(const QUrl& url,
                      const QString& destPath,
                      qint64 expectedSize = -1,
                      int chunkCount = DefaultChunkCount,
                      QObject* parent = nullptr);

    //!< @brief Attach a debug log (not owned, may be nullptr).
    void setDebugLog(DebugLog* log) { m_log = log; }

    //!< @brief HTTP User-Agent sent with every request.
    void setUserAgent(const QString& agent) { m_userAgent = agent; }

    //!< @brief Published checksum to verify on completion (MD5/SHA-1/SHA-256/SHA-512 hex).
    void setExpectedChecksum(const QString& checksum) { m_expectedChecksum = checksum; }

    //!< @brief Resources at or below this size are fetched as a single stream.
    void setMinChunkedSize(qint64 bytes) { m_minChunkedSize = bytes; }

    QUrl url() const { return m_url; }                      //!< @brief Source URL.
    QString destPath() const { return m_destPath; }         //!< @brief Destination path.
    Mode mode() const { return m_mode; }                    //!< @brief Chosen strategy.
    qint64 totalSize() const { return m_totalSize; }        //!< @brief Resource size, 0 if unknown.
    bool isRunning() const { return m_running; }            //!< @brief Whether a transfer is active.
    const DownloadState& state() const { return m_state; }  //!< @brief Chunk state (chunked mode).

public slots:
    //!< @brief Probe the resource and begin the transfer.
    void start();

    //!< @brief Abort the in-flight request and stop before the next chunk.
    void cancel();

signals:
    /**
     * @brief Emitted once the strategy is chosen.
     * @param totalSize Resource size, 0 if unknown.
     * @param chunked Whether the chunked strategy is used.
     */
    void started(qint64 totalSize, bool chunked);

    //!< @brief Bytes on disk so far, emitted per received buffer.
    void progress(qint64 received, qint64 total);

    //!< @brief Emitted after a chunk is complete and the sidecar is saved.
    void chunkCompleted(int index);

    //!< @brief Emitted once with the final result.
    void finished(const OperationResult& result);

private slots:
    //!< @brief Fetch the lowest incomplete chunk, or complete the transfer.
    void fetchNextChunk();

private:
    //!< @brief Handle the HEAD response and choose a strategy.
    void onProbeFinished(QNetworkReply* reply);

    //!< @brief Resume or plan the chunked transfer.
    void startChunked();

    //!< @brief Fetch the whole body in one request.
    void startSingleStream();

    //!< @brief Write buffered chunk data at the chunk offset.
    bool writeChunkData(QNetworkReply* reply);

    //!< @brief Handle the end of a chunk request.
    void onChunkFinished(QNetworkReply* reply);

    //!< @brief Handle the end of the single-stream request.
    void onSingleFinished(QNetworkReply* reply);

    //!< @brief Verify the optional checksum, drop the sidecar and finish.
    void completeTransfer();

    //!< @brief Emit finished() once and release resources.
    void finish(const OperationResult& result);

    //!< @brief Build a request with the common headers.
    QNetworkRequest makeRequest() const;

    //!< @brief Map a failed reply to an error result.
    OperationResult replyError(QNetworkReply* reply, const QString& what) const;

    //!< @brief Trace to qDebug and the debug log.
    void trace(const QString& line);

    QUrl m_url;                                     //!< Source URL.
    QString m_destPath;                             //!< Destination file path.
    qint64 m_expectedSize = -1;                     //!< Size from the release feed.
    int m_chunkCount = DefaultChunkCount;           //!< Requested chunk count.
    qint64 m_minChunkedSize = DefaultMinChunkedSize;//!< Chunked strategy threshold.
    QString m_userAgent = QStringLiteral("kiln/0.1");   //!< User-Agent header.
    QString m_expectedChecksum;                     //!< Published checksum.
    DebugLog* m_log = nullptr;                      //!< Debug log (not owned).

    QNetworkAccessManager* m_manager = nullptr;     //!< Network manager.
    QPointer<QNetworkReply> m_reply;                //!< In-flight request.
    QFile m_file;                                   //!< Destination file.
    DownloadState m_state;                          //!< Chunk plan and completion.

    Mode m_mode = Mode::Undecided;                  //!< Chosen strategy.
    qint64 m_totalSize = 0;                         //!< Resource size.
    bool m_acceptsRanges = false;                   //!< Server accepts byte ranges.
    bool m_running = false;                         //!< Transfer active.
    bool m_cancelRequested = false;                 //!< Cancellation flag.
    bool m_finished = true;                         //!< finished() already emitted.
    int m_currentChunk = -1;                        //!< Chunk being fetched.
    qint64 m_chunkReceived = 0;                     //!< Bytes of the current chunk on disk.
    qint64 m_singleReceived = 0;                    //!< Bytes of the single stream on disk.
    OperationResult m_pendingError;                 //!< Failure detected before finished.
};

#include "chunkeddownloader.moc"
