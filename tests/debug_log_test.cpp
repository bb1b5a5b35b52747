#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <gtest/gtest.h>

import kiln.services.debug_log;

namespace {

QString readAll(const QString& path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) return QString();
    return QString::fromUtf8(f.readAll());
}

} // namespace

TEST(DebugLogTest, WritesHeaderSectionsAndLines)
{
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("debug.txt"));
    DebugLog log;
    ASSERT_TRUE(log.open(path));
    EXPECT_TRUE(log.isOpen());
    EXPECT_EQ(log.path(), path);

    log.section(QStringLiteral("FORMAT"));
    log.log(QStringLiteral("boot sector written"));

    const QString text = readAll(path);
    EXPECT_TRUE(text.startsWith(QStringLiteral("=== Kiln debug log ===")));
    EXPECT_TRUE(text.contains(QStringLiteral("Platform: ")));
    EXPECT_TRUE(text.contains(QStringLiteral("Arch: ")));
    EXPECT_TRUE(text.contains(QStringLiteral("\n=== FORMAT ===\n")));
    EXPECT_TRUE(text.contains(QStringLiteral("] boot sector written\n")));
}

TEST(DebugLogTest, LinesAreDroppedWhenNotOpen)
{
    DebugLog log;
    log.log(QStringLiteral("ignored"));
    EXPECT_FALSE(log.isOpen());
    EXPECT_TRUE(log.path().isEmpty());
}

TEST(DebugLogTest, SecondOpenKeepsFirstFile)
{
    QTemporaryDir dir;
    const QString first = dir.filePath(QStringLiteral("a.txt"));
    const QString second = dir.filePath(QStringLiteral("b.txt"));
    DebugLog log;
    ASSERT_TRUE(log.open(first));
    EXPECT_TRUE(log.open(second));
    EXPECT_EQ(log.path(), first);
    EXPECT_FALSE(QFile::exists(second));
}

TEST(DebugLogTest, CopyToPlacesLogOnTarget)
{
    QTemporaryDir dir;
    QTemporaryDir card;
    DebugLog log;
    ASSERT_TRUE(log.open(dir.filePath(QStringLiteral("debug.txt"))));
    log.log(QStringLiteral("burn completed"));

    ASSERT_TRUE(log.copyTo(card.path()));
    const QString copied = readAll(QDir(card.path()).filePath(QStringLiteral("installer_debug.txt")));
    EXPECT_TRUE(copied.contains(QStringLiteral("burn completed")));
}

TEST(DebugLogTest, CopyWithoutLogFails)
{
    QTemporaryDir card;
    DebugLog log;
    EXPECT_FALSE(log.copyTo(card.path()));
}
