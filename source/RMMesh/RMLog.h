#pragma once

#include "RMMeshFwd.h"

#include <filesystem>
#include <memory>

namespace spdlog
{
class logger;
namespace sinks { class sink; }
using sink_ptr = std::shared_ptr<sinks::sink>;
}

namespace RM
{

/// \addtogroup BasicGroup
/// \{

/// Make default spd logger
class Logger
{
public:
    RMMESH_API static Logger& instance();

    /// store this pointer if need to prolong logger life time (necessary to log something from destructors)
    RMMESH_API const std::shared_ptr<spdlog::logger>& getSpdLogger() const;

    /// returns default logger pattern
    RMMESH_API std::string getDefaultPattern() const;

    /// adds custom sink to logger
    RMMESH_API void addSink( const spdlog::sink_ptr& sink );
    RMMESH_API void removeSink( const spdlog::sink_ptr& sink );

    /// return filename of first found file sink, if there is no one, returns {}
    RMMESH_API std::filesystem::path getLogFileName() const;
private:
    Logger();
    std::shared_ptr<spdlog::logger> logger_;
};

/// \}

} //namespace RM
