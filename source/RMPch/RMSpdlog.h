#pragma once

// we need to make default visibility of sinks for dynamic_cast
// to be able to find objects from other shared libraries
#ifndef _WIN32
namespace spdlog
{

namespace details
{

struct __attribute__((visibility("default"))) console_mutex;

struct __attribute__((visibility("default"))) console_nullmutex;

} // namespace details

namespace sinks
{

template<typename Mutex>
class __attribute__((visibility("default"))) rotating_file_sink;

template<typename ConsoleMutex>
class __attribute__((visibility("default"))) ansicolor_stdout_sink;

} //namespace sinks

} //namespace spdlog
#endif

#include "RMFmt.h"

#if __GNUC__ == 13
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Warray-bounds"
#pragma GCC diagnostic ignored "-Wstringop-overflow"
#endif

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#if __GNUC__ == 13
#pragma GCC diagnostic pop
#endif
