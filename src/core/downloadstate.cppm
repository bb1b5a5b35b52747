/*!
 * @file        downloadstate.cppm
 * @brief       Persisted resume state of a chunked download.
 * @details     DownloadState records the chunk plan and completion bitmap of
 *              one transfer. It is written as an indented JSON sidecar named
 *              `<dest>.partial` beside the destination file after every chunk
 *              completion, so a crash or restart resumes without fetching
 *              completed ranges again.
 *
 *              The sidecar is written atomically through QSaveFile. It is
 *              deleted when the transfer completes.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kiln/blob/main/LICENSE.md
 */

module;
#include <QJsonObject>
#include <QString>
#include <QVector>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module kiln.core.downloadstate;
export import kiln.core.chunkplan;
#endif

#ifdef Q_MOC_RUN
#define KILN_MODULE_EXPORT
#else
#define KILN_MODULE_EXPORT export
#endif

/**
 * @brief Resume record for a single destination file.
 *
 * Owned by one ChunkedDownloader for the lifetime of a transfer.
 * downloadedBytes is a derived cache of the bytes credited to completed
 * chunks and is never double-counted.
 */
KILN_MODULE_EXPORT class DownloadState {
public:
    /**
     * @brief Result of reading a sidecar from disk.
     */
    enum class LoadResult {
        Ok,         //!< Sidecar parsed and passed validation.
        NotFound,   //!< No sidecar beside the destination.
        Corrupt,    //!< Sidecar exists but does not parse or is inconsistent.
        IoError     //!< Sidecar exists but cannot be read.
    };

    DownloadState() = default;

    /**
     * @brief Create a fresh state with a new chunk plan.
     *
     * @param url Source URL.
     * @param totalSize Total resource size in bytes.
     * @param destPath Destination file path.
     * @param chunkCount Number of chunks to plan.
     * @param out Receives the new state on success.
     * @return Completed, or InvalidArgument when the plan is rejected.
     */
    static OperationResult create(const QString& url,
                                  qint64 totalSize,
                                  const QString& destPath,
                                  int chunkCount,
                                  DownloadState& out);

    const QString& url() const { return m_url; }                        //!< @brief Source URL.
    qint64 totalSize() const { return m_totalSize; }                     //!< @brief Total size in bytes.
    const QString& destPath() const { return m_destPath; }              //!< @brief Destination path.
    const QVector<ChunkState>& chunks() const { return m_chunks; }     //!< @brief Chunk list.
    qint64 downloadedBytes() const { return m_downloadedBytes; }         //!< @brief Bytes credited to completed chunks.

    /**
     * @brief Mark a chunk as completed and credit its bytes.
     *
     * Idempotent: a chunk that is already completed is left untouched.
     * Out-of-range indices are ignored.
     *
     * @param index Chunk index.
     * @param bytes Bytes received for the chunk (normally its length).
     */
    void markComplete(int index, qint64 bytes);

    /**
     * @brief Indices of chunks that still need fetching.
     * @return Indices in ascending order.
     */
    QVector<int> incompleteChunkIndices() const;

    /**
     * @brief Progress as a percentage of totalSize.
     * @return 0.0 when totalSize is 0.
     */
    double completionPercentage() const;

    //!< @brief True when every chunk is completed.
    bool isComplete() const;

    //!< @brief Rebuild downloadedBytes from the chunk list.
    void recomputeDownloadedBytes();

    /**
     * @brief Whether this state describes the given request.
     *
     * Any mismatch in URL or size means the sidecar is stale.
     */
    bool matches(const QString& url, qint64 totalSize) const;

    //!< @brief True when the chunk list covers [0, totalSize) contiguously.
    bool isValid() const;

    //!< @brief Serialize to the sidecar JSON schema.
    QJsonObject toJson() const;

    /**
     * @brief Parse from the sidecar JSON schema.
     * @param obj JSON object.
     * @param out Receives the parsed state.
     * @return false when a field is missing, has the wrong type, or the
     *         chunk list violates the contiguity invariant.
     */
    static bool fromJson(const QJsonObject& obj, DownloadState& out);

    /**
     * @brief Persist to `<destPath>.partial` atomically.
     * @return Completed, or IoError when the sidecar cannot be written.
     */
    OperationResult save() const;

    /**
     * @brief Load the sidecar that belongs to a destination file.
     * @param destPath Destination file path.
     * @param out Receives the state on LoadResult::Ok.
     */
    static LoadResult load(const QString& destPath, DownloadState& out);

    //!< @brief Delete the sidecar of a destination file. Missing is not an error.
    static bool remove(const QString& destPath);

    //!< @brief Whether a sidecar exists for a destination file.
    static bool exists(const QString& destPath);

    //!< @brief Sidecar path for a destination file.
    static QString stateFilePath(const QString& destPath);

    bool operator==(const DownloadState& other) const = default;

private:
    QString m_url;                  //!< Source URL.
    qint64 m_totalSize = 0;         //!< Total size in bytes.
    QString m_destPath;             //!< Destination file path.
    QVector<ChunkState> m_chunks;   //!< Chunk plan with completion flags.
    qint64 m_downloadedBytes = 0;   //!< Bytes credited to completed chunks.
};
