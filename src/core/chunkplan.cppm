/*!
 * @file        chunkplan.cppm
 * @brief       Partitioning of a transfer into contiguous byte ranges.
 * @details     A chunk plan splits a known total size into N inclusive byte
 *              ranges that are sorted, contiguous and non-overlapping. Each
 *              chunk is tracked independently so a transfer can resume by
 *              fetching only the chunks that are not yet completed.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kiln/blob/main/LICENSE.md
 */

module;
#include <QVector>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module kiln.core.chunkplan;
export import kiln.core.operation;
#endif

#ifdef Q_MOC_RUN
#define KILN_MODULE_EXPORT
#else
#define KILN_MODULE_EXPORT export
#endif

/**
 * @brief One byte range of a chunked transfer.
 */
KILN_MODULE_EXPORT struct ChunkState {
    qint64 start = 0;           //!< First byte offset.
    qint64 end = 0;             //!< Last byte offset (inclusive).
    bool completed = false;     //!< Whether every byte of the range is on disk.

    //!< @brief Number of bytes covered by the range.
    qint64 length() const { return end - start + 1; }

    bool operator==(const ChunkState& other) const = default;
};

/**
 * @brief Builds and validates chunk plans.
 */
KILN_MODULE_EXPORT class ChunkPlan {
public:
    /**
     * @brief Split a total size into contiguous chunks.
     *
     * Chunk size is totalSize / chunkCount; the last chunk absorbs the
     * remainder. All chunks start out incomplete.
     *
     * @param totalSize Total number of bytes (must be >= chunkCount).
     * @param chunkCount Number of chunks (must be >= 1).
     * @param out Receives the plan on success.
     * @return Completed, or an InvalidArgument error.
     */
    static OperationResult plan(qint64 totalSize, int chunkCount, QVector<ChunkState>& out);

    /**
     * @brief Check the contiguity invariant of a plan against a total size.
     *
     * @return true if the chunks are sorted, contiguous, non-empty and
     *         cover exactly [0, totalSize).
     */
    static bool isContiguous(const QVector<ChunkState>& chunks, qint64 totalSize);
};
