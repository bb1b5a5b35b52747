#include <QString>

#include <gtest/gtest.h>

import kiln.core.operation;

TEST(OperationResultTest, SuccessIsCompletedWithoutError)
{
    const OperationResult r = OperationResult::success();
    EXPECT_TRUE(r.ok());
    EXPECT_FALSE(r.isError());
    EXPECT_EQ(r.error, ErrorKind::None);
    EXPECT_EQ(r.category(), ErrorCategory::None);
}

TEST(OperationResultTest, CancellationIsNotAnError)
{
    const OperationResult r = OperationResult::cancelled(QStringLiteral("stopped"));
    EXPECT_TRUE(r.isCancelled());
    EXPECT_FALSE(r.isError());
    EXPECT_EQ(r.category(), ErrorCategory::None);
}

TEST(OperationResultTest, KindsMapToCategories)
{
    EXPECT_EQ(OperationResult::categoryOf(ErrorKind::InvalidArgument), ErrorCategory::Configuration);
    EXPECT_EQ(OperationResult::categoryOf(ErrorKind::PermissionDenied), ErrorCategory::Permission);
    EXPECT_EQ(OperationResult::categoryOf(ErrorKind::Network), ErrorCategory::TransientIo);
    EXPECT_EQ(OperationResult::categoryOf(ErrorKind::SeekFailed), ErrorCategory::TransientIo);
    EXPECT_EQ(OperationResult::categoryOf(ErrorKind::ShortWrite), ErrorCategory::Integrity);
    EXPECT_EQ(OperationResult::categoryOf(ErrorKind::VerifyMismatch), ErrorCategory::Integrity);
    EXPECT_EQ(OperationResult::categoryOf(ErrorKind::CorruptState), ErrorCategory::Integrity);
    EXPECT_EQ(OperationResult::categoryOf(ErrorKind::CorruptImage), ErrorCategory::Integrity);
}

TEST(OperationResultTest, PermissionGuidanceMentionsElevation)
{
    EXPECT_TRUE(OperationResult::guidance(ErrorCategory::Permission).contains(QStringLiteral("sudo")));
    EXPECT_TRUE(OperationResult::guidance(ErrorCategory::None).isEmpty());
}

TEST(OperationResultTest, MismatchCarriesRange)
{
    const OperationResult r = OperationResult::mismatch(4096, 8192, QStringLiteral("differs"));
    EXPECT_TRUE(r.isError());
    EXPECT_EQ(r.error, ErrorKind::VerifyMismatch);
    EXPECT_TRUE(r.hasRange());
    EXPECT_EQ(r.toString(), QStringLiteral("Error[VerifyMismatch]: differs (bytes 4096-8192)"));
}
