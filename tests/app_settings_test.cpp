#include <QSettings>
#include <QTemporaryDir>

#include <gtest/gtest.h>

import kiln.services.app_settings;

namespace {

class AppSettingsTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        QSettings::setPath(QSettings::IniFormat, QSettings::UserScope, m_dir.path());
        QSettings::setPath(QSettings::NativeFormat, QSettings::UserScope, m_dir.path());
        QSettings settings;
        settings.remove(AppSettings::settingsGroup());
    }

    QTemporaryDir m_dir;
};

} // namespace

TEST_F(AppSettingsTest, DefaultsWhenNothingStored)
{
    AppSettings s;
    s.load();
    EXPECT_EQ(s.volumeLabel, QStringLiteral("KILN"));
    EXPECT_EQ(s.downloadChunks, 8);
    EXPECT_EQ(s.minChunkedSize, 10LL * 1024 * 1024);
    EXPECT_EQ(s.partitionStartSector, 2048);
    EXPECT_EQ(s.burnChunkBytes, 4LL * 1024 * 1024);
    EXPECT_EQ(s.unmountTimeoutMs, 5000);
}

TEST_F(AppSettingsTest, SavedValuesAreLoaded)
{
    AppSettings s;
    s.volumeLabel = QStringLiteral("FIELD");
    s.downloadChunks = 4;
    s.writePartitionTable = false;
    s.logPath = QStringLiteral("/var/log/kiln.txt");
    s.save();

    AppSettings loaded;
    loaded.load();
    EXPECT_EQ(loaded.volumeLabel, QStringLiteral("FIELD"));
    EXPECT_EQ(loaded.downloadChunks, 4);
    EXPECT_FALSE(loaded.writePartitionTable);
    EXPECT_EQ(loaded.logPath, QStringLiteral("/var/log/kiln.txt"));
}

TEST_F(AppSettingsTest, InvalidValuesFallBackToDefaults)
{
    {
        QSettings settings;
        settings.beginGroup(AppSettings::settingsGroup());
        settings.setValue(QStringLiteral("downloadChunks"), 0);
        settings.setValue(QStringLiteral("burnChunkBytes"), 1000);
        settings.endGroup();
    }
    AppSettings s;
    s.load();
    EXPECT_EQ(s.downloadChunks, 8);
    EXPECT_EQ(s.burnChunkBytes, 4LL * 1024 * 1024);
}
