#pragma once

#include "RMMeshFwd.h"
#include <chrono>
#include <string>
#include <utility>

namespace RM
{

/// \addtogroup BasicGroup
/// \{

/// measures the time between its construction (or start) and destruction (or finish),
/// and reports it in the log at debug level
class Timer
{
public:
    Timer( std::string name ) { start( std::move( name ) ); }
    Timer( const Timer & ) = delete;
    Timer & operator =( const Timer & ) = delete;
    ~Timer() { finish(); }

    RMMESH_API void start( std::string name );
    RMMESH_API void finish();

    std::chrono::duration<double> secondsPassed() const { return std::chrono::steady_clock::now() - start_; }

private:
    std::string name_;
    std::chrono::time_point<std::chrono::steady_clock> start_;
    bool started_{ false };
};

/// \}

} // namespace RM

#define RM_TIMER RM::Timer _timer( __FUNCTION__ );
#define RM_NAMED_TIMER(name) RM::Timer _named_timer( name );
