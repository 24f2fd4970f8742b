#include <gtest/gtest.h>
#include "utils/Logger.h"

namespace {
// Keeps test runs from writing conduit.log or cluttering the console.
class QuietLogs : public ::testing::Environment {
public:
    void SetUp() override {
        Logger::getInstance().setLogFile("");
        Logger::getInstance().setConsoleEnabled(false);
    }
};

const auto* const quietLogs = ::testing::AddGlobalTestEnvironment(new QuietLogs);
} // namespace
