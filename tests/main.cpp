#include <QCoreApplication>
#include <QMetaType>

#include <gtest/gtest.h>

import kiln.core.operation;
import kiln.core.fat32formatter;
import kiln.core.imageburner;

int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Genyleap"));
    QCoreApplication::setApplicationName(QStringLiteral("KilnTests"));

    qRegisterMetaType<OperationResult>("OperationResult");
    qRegisterMetaType<FormatProgress>("FormatProgress");
    qRegisterMetaType<BurnProgress>("BurnProgress");

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
