#include <gtest/gtest.h>
#include <RMMesh/RMLog.h>
#include <RMMesh/RMSystem.h>
#include <RMPch/RMSpdlog.h>

TEST( RMPch, Spdlog )
{
    // check for correct type casts on macOS
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto sink = std::dynamic_pointer_cast<spdlog::sinks::sink>( consoleSink );
    auto castedSink = std::dynamic_pointer_cast<spdlog::sinks::stdout_color_sink_mt>( sink );
    EXPECT_TRUE( castedSink );
}

TEST( RMMesh, LoggerSinks )
{
    auto & logger = RM::Logger::instance();
    ASSERT_TRUE( logger.getSpdLogger() );
    EXPECT_EQ( spdlog::default_logger(), logger.getSpdLogger() );

    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    const auto numSinks = logger.getSpdLogger()->sinks().size();
    logger.addSink( sink );
    EXPECT_EQ( logger.getSpdLogger()->sinks().size(), numSinks + 1 );
    logger.removeSink( sink );
    EXPECT_EQ( logger.getSpdLogger()->sinks().size(), numSinks );

    // setupLoggerByDefault() in main adds the rotating file sink if temporary directory is available
    if ( RM::GetTempDirectory().empty() )
        return;
    const auto logFile = logger.getLogFileName();
    EXPECT_FALSE( logFile.empty() );
    EXPECT_EQ( logFile.filename().string().rfind( "RMLog_", 0 ), 0 );
}
