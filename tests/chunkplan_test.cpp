#include <QVector>

#include <gtest/gtest.h>

import kiln.core.chunkplan;

TEST(ChunkPlanTest, TenMiBInFourChunks)
{
    QVector<ChunkState> chunks;
    ASSERT_TRUE(ChunkPlan::plan(10485760, 4, chunks).ok());
    ASSERT_EQ(chunks.size(), 4);
    EXPECT_EQ(chunks[0], (ChunkState{0, 2621439, false}));
    EXPECT_EQ(chunks[1], (ChunkState{2621440, 5242879, false}));
    EXPECT_EQ(chunks[2], (ChunkState{5242880, 7864319, false}));
    EXPECT_EQ(chunks[3], (ChunkState{7864320, 10485759, false}));
}

TEST(ChunkPlanTest, LastChunkTakesRemainder)
{
    QVector<ChunkState> chunks;
    ASSERT_TRUE(ChunkPlan::plan(10, 3, chunks).ok());
    ASSERT_EQ(chunks.size(), 3);
    EXPECT_EQ(chunks[0].length(), 3);
    EXPECT_EQ(chunks[1].length(), 3);
    EXPECT_EQ(chunks[2].start, 6);
    EXPECT_EQ(chunks[2].end, 9);
}

TEST(ChunkPlanTest, PlansAreContiguousAndCoverTheFile)
{
    const qint64 sizes[] = {1, 7, 4096, 1000003, 10485761};
    for (qint64 total : sizes) {
        for (int n = 1; n <= 16 && n <= total; ++n) {
            QVector<ChunkState> chunks;
            ASSERT_TRUE(ChunkPlan::plan(total, n, chunks).ok()) << total << "/" << n;
            ASSERT_EQ(chunks.size(), n);
            EXPECT_EQ(chunks.first().start, 0);
            EXPECT_EQ(chunks.last().end, total - 1);
            EXPECT_TRUE(ChunkPlan::isContiguous(chunks, total));
            for (const ChunkState& c : chunks) EXPECT_FALSE(c.completed);
        }
    }
}

TEST(ChunkPlanTest, RejectsZeroChunks)
{
    QVector<ChunkState> chunks;
    const OperationResult r = ChunkPlan::plan(1024, 0, chunks);
    EXPECT_TRUE(r.isError());
    EXPECT_EQ(r.error, ErrorKind::InvalidArgument);
    EXPECT_TRUE(chunks.isEmpty());
}

TEST(ChunkPlanTest, RejectsMoreChunksThanBytes)
{
    QVector<ChunkState> chunks;
    EXPECT_EQ(ChunkPlan::plan(3, 4, chunks).error, ErrorKind::InvalidArgument);
}

TEST(ChunkPlanTest, GapIsNotContiguous)
{
    const QVector<ChunkState> chunks{{0, 9, false}, {11, 19, false}};
    EXPECT_FALSE(ChunkPlan::isContiguous(chunks, 20));
}
