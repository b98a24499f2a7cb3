#include <QCoreApplication>

#include <gtest/gtest.h>

// Timers and QSettings want an application object on the main thread
int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    QCoreApplication app(argc, argv);
    return RUN_ALL_TESTS();
}
