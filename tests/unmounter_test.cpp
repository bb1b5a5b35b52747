#include <QFile>
#include <QTemporaryDir>

#include <gtest/gtest.h>

import kiln.device.unmounter;

namespace {

const QByteArray kMountTable =
    "/dev/sda1 / ext4 rw,relatime 0 0\n"
    "/dev/sdb1 /media/user/BOOT vfat rw,nosuid 0 0\n"
    "/dev/sdb2 /media/user/my\\040card ext4 rw 0 0\n"
    "/dev/sdbc1 /media/user/other vfat rw 0 0\n"
    "/dev/mmcblk0p1 /boot/firmware vfat rw 0 0\n"
    "tmpfs /run tmpfs rw 0 0\n";

} // namespace

TEST(UnmounterTest, FindsEveryPartitionOfDevice)
{
    const QStringList points = SystemUnmounter::mountPointsFor(QStringLiteral("/dev/sdb"), kMountTable);
    EXPECT_EQ(points, (QStringList{QStringLiteral("/media/user/BOOT"), QStringLiteral("/media/user/my card")}));
}

TEST(UnmounterTest, MatchesMmcPartitionSuffix)
{
    const QStringList points = SystemUnmounter::mountPointsFor(QStringLiteral("/dev/mmcblk0"), kMountTable);
    EXPECT_EQ(points, QStringList{QStringLiteral("/boot/firmware")});
}

TEST(UnmounterTest, UnmountedDeviceHasNoMountPoints)
{
    EXPECT_TRUE(SystemUnmounter::mountPointsFor(QStringLiteral("/dev/sdz"), kMountTable).isEmpty());
}

TEST(UnmounterTest, ResultNamesAreStable)
{
    EXPECT_EQ(Unmounter::resultName(UnmountResult::Timeout), QStringLiteral("Timeout"));
    EXPECT_EQ(Unmounter::resultName(UnmountResult::Denied), QStringLiteral("Denied"));
}

TEST(UnmounterTest, ParsesPhysicalDriveNumbers)
{
    EXPECT_EQ(SystemUnmounter::physicalDriveNumber(QStringLiteral("\\\\.\\PhysicalDrive2")), 2);
    EXPECT_EQ(SystemUnmounter::physicalDriveNumber(QStringLiteral("\\\\.\\physicaldrive13")), 13);
    EXPECT_EQ(SystemUnmounter::physicalDriveNumber(QStringLiteral("\\\\.\\PhysicalDrive")), -1);
    EXPECT_EQ(SystemUnmounter::physicalDriveNumber(QStringLiteral("\\\\.\\E:")), -1);
    EXPECT_EQ(SystemUnmounter::physicalDriveNumber(QStringLiteral("/dev/sdb")), -1);
}

TEST(UnmounterTest, ReleaseWithoutUnmountIsHarmless)
{
    SystemUnmounter unmounter;
    unmounter.release();
    unmounter.release();
}

TEST(UnmounterTest, ImageFileNeedsNoUnmount)
{
    QTemporaryDir dir;
    const QString image = dir.filePath(QStringLiteral("card.img"));
    QFile f(image);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    f.write(QByteArray(4096, '\0'));
    f.close();

    SystemUnmounter unmounter;
    EXPECT_EQ(unmounter.unmount(image, 1000), UnmountResult::Success);
    EXPECT_EQ(unmounter.unmount(image, 1000), UnmountResult::Success);
    unmounter.release();
}

TEST(UnmounterTest, MissingDeviceIsNotFound)
{
    QTemporaryDir dir;
    SystemUnmounter unmounter;
    EXPECT_EQ(unmounter.unmount(dir.filePath(QStringLiteral("nope")), 1000), UnmountResult::NotFound);
}

#if defined(Q_OS_LINUX)
TEST(UnmounterTest, DeviceWithNothingMountedSucceeds)
{
    QTemporaryDir dir;
    const QString table = dir.filePath(QStringLiteral("mounts"));
    QFile f(table);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    f.write("/dev/sda1 / ext4 rw 0 0\n");
    f.close();

    SystemUnmounter unmounter(table);
    EXPECT_EQ(unmounter.unmount(QStringLiteral("/dev/null"), 1000), UnmountResult::Success);
}
#endif
