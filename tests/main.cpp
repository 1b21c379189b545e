#include <gtest/gtest.h>
#include <QCoreApplication>

// Queued connections and QSignalSpy::wait need a running application object.
int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
