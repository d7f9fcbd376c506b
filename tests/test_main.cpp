#include <QtCore/QCoreApplication>

#include <gtest/gtest.h>

#include "engine/connection_instance.hpp"

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    qRegisterMetaType<nd::engine::LogEntry>();
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
