#include "RMTimer.h"
#include "RMLog.h"
#include "RMPch/RMSpdlog.h"

namespace RM
{

void Timer::start( std::string name )
{
    name_ = std::move( name );
    start_ = std::chrono::steady_clock::now();
    started_ = true;
}

void Timer::finish()
{
    if ( !started_ )
        return;
    started_ = false;

    if ( const auto & logger = Logger::instance().getSpdLogger() )
        logger->debug( "{} finished in {:.3f} sec", name_, secondsPassed().count() );
}

} //namespace RM
