#include <gtest/gtest.h>
#include "core/Logger.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    crisisguard::Logger::InitializeConsoleOnly(crisisguard::LogLevel::ERROR);
    int rc = RUN_ALL_TESTS();
    crisisguard::Logger::Shutdown();
    return rc;
}
