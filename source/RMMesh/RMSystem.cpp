#include "RMSystem.h"
#include "RMLog.h"
#include "RMPch/RMSpdlog.h"

#include <spdlog/fmt/chrono.h>

#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace
{

constexpr const char * cLogPrefix = "RMLog_";

void removeOldLogs( const std::filesystem::path& dir, int hours = 24 )
{
    std::error_code ec;
    if ( !std::filesystem::is_directory( dir, ec ) )
        return;

    auto now = std::chrono::system_clock::now();
    std::time_t nowSinceEpoch = std::chrono::system_clock::to_time_t( now );

    for ( const auto & entry : std::filesystem::directory_iterator( dir, ec ) )
    {
        auto fileName = entry.path().filename().string();
        auto prefixOffset = fileName.find( cLogPrefix );
        if ( prefixOffset == std::string::npos )
            continue; // not log file
        std::tm tm{};
        std::stringstream ss( fileName.substr( prefixOffset + std::strlen( cLogPrefix ), 19 ) );
        ss >> std::get_time( &tm, "%Y-%m-%d_%H-%M-%S" );
        if ( ss.fail() )
            continue; // cannot parse time
        std::time_t fileDateSinceEpoch = std::mktime( &tm );
        auto diffHours = ( nowSinceEpoch - fileDateSinceEpoch ) / 3600;
        if ( diffHours < hours )
            continue; // "young" file
        std::filesystem::remove( entry.path(), ec );
    }
}

} //anonymous namespace

namespace RM
{

std::filesystem::path GetTempDirectory()
{
    std::error_code ec;
    auto res = std::filesystem::temp_directory_path( ec );
    if ( ec )
        return {};
    res /= "RMMesh";

    if ( !std::filesystem::is_directory( res, ec ) )
    {
        ec.clear();
        if ( !std::filesystem::create_directories( res, ec ) )
            return {};
    }

    return res;
}

void setupLoggerByDefault()
{
    // write log to console
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level( spdlog::level::trace );
    console_sink->set_pattern( Logger::instance().getDefaultPattern() );
    Logger::instance().addSink( console_sink );

    // write log to file
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t( now );
    auto fileName = GetTempDirectory();
    if ( !fileName.empty() )
    {
        fileName /= "Logs";
        removeOldLogs( fileName );

        fileName /= fmt::format( "{}{:%Y-%m-%d_%H-%M-%S}_{}.txt", cLogPrefix, fmt::localtime( t ),
                    std::chrono::duration_cast<std::chrono::milliseconds>( now.time_since_epoch() ).count() % 1000 );

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>( fileName.string(), 1024 * 1024 * 5, 1, true );
        file_sink->set_level( spdlog::level::trace );
        file_sink->set_pattern( Logger::instance().getDefaultPattern() );
        Logger::instance().addSink( file_sink );
    }

    auto logger = Logger::instance().getSpdLogger();

    logger->set_level( spdlog::level::trace );

    // update file on each msg
    logger->flush_on( spdlog::level::trace );

    spdlog::info( "RMMesh logger is set up, log file: {}", Logger::instance().getLogFileName().string() );
}

} //namespace RM
