#include <gtest/gtest.h>
#include <csignal>
#include <regex>
#include "logging.hpp"
#include "signals.hpp"

namespace
{
    // Restores the global logging settings a test changes
    class LoggingSettings
    {
    public:
        LoggingSettings() : level_(logging::globalLogLevel), timestamps_(logging::showTimestamp) {}
        ~LoggingSettings()
        {
            logging::setLogLevel(level_);
            logging::setShowTimestamp(timestamps_);
        }

    private:
        logging::LogLevel level_;
        bool timestamps_;
    };

    string captureInfoLine(const string &message)
    {
        testing::internal::CaptureStdout();
        log_info(message);
        return testing::internal::GetCapturedStdout();
    }

    const std::regex kClockPattern("\\d{2}:\\d{2}:\\d{2}\\.\\d{3}");
}

TEST(Logging, TimestampsAreOptIn)
{
    LoggingSettings restore;
    logging::setLogLevel(logging::LogLevel::INFO);

    logging::setShowTimestamp(false);
    string plain = captureInfoLine("door closed");
    EXPECT_NE(plain.find("door closed"), string::npos);
    EXPECT_FALSE(std::regex_search(plain, kClockPattern));

    logging::setShowTimestamp(true);
    string stamped = captureInfoLine("door open");
    EXPECT_NE(stamped.find("door open"), string::npos);
    EXPECT_TRUE(std::regex_search(stamped, kClockPattern));
}

TEST(Logging, LevelFiltersMessages)
{
    LoggingSettings restore;
    logging::setLogLevel(logging::LogLevel::WARNING);

    EXPECT_TRUE(captureInfoLine("hidden").empty());
}

TEST(Signals, TerminationOnlyRequestsShutdown)
{
    signals::setupSignalHandlers();
    ASSERT_FALSE(signals::shutdownRequested());

    // Ignored, the process keeps running
    std::raise(SIGPIPE);
    EXPECT_FALSE(signals::shutdownRequested());

    std::raise(SIGTERM);
    EXPECT_TRUE(signals::shutdownRequested());
    EXPECT_EQ(signals::receivedSignal(), SIGTERM);

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
}
