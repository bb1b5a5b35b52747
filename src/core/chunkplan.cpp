module;
#include <QString>
#include <QVector>
#include <QtGlobal>

module kiln.core.chunkplan;

import kiln.core.operation;

OperationResult ChunkPlan::plan(qint64 totalSize, int chunkCount, QVector<ChunkState>& out)
{
    if (chunkCount <= 0) {
        return OperationResult::failure(ErrorKind::InvalidArgument,
                                        QStringLiteral("Chunk count must be at least 1 (got %1)").arg(chunkCount));
    }
    if (totalSize < chunkCount) {
        return OperationResult::failure(ErrorKind::InvalidArgument,
                                        QStringLiteral("Cannot split %1 bytes into %2 chunks")
                                            .arg(totalSize).arg(chunkCount));
    }

    const qint64 chunkSize = totalSize / chunkCount;
    QVector<ChunkState> chunks;
    chunks.reserve(chunkCount);
    for (int i = 0; i < chunkCount; ++i) {
        ChunkState c;
        c.start = i * chunkSize;
        c.end = (i == chunkCount - 1) ? (totalSize - 1) : ((i + 1) * chunkSize - 1);
        c.completed = false;
        chunks.push_back(c);
    }
    out = chunks;
    return OperationResult::success();
}

bool ChunkPlan::isContiguous(const QVector<ChunkState>& chunks, qint64 totalSize)
{
    if (chunks.isEmpty()) return totalSize == 0;
    qint64 expectedStart = 0;
    for (const ChunkState& c : chunks) {
        if (c.start != expectedStart) return false;
        if (c.end < c.start) return false;
        expectedStart = c.end + 1;
    }
    return expectedStart == totalSize;
}
