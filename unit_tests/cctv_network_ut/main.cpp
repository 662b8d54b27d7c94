#include <gtest/gtest.h>

#include <QtCore/QCoreApplication>

#include <cctv/utils/log/log.h>

int main(int argc, char** argv)
{
    QCoreApplication application(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);

    using namespace cctv::utils::log;
    Logger::instance()->setLevel(
        levelFromString(QString::fromLocal8Bit(qgetenv("CCTV_TEST_LOG_LEVEL")), Level::none));

    return RUN_ALL_TESTS();
}
