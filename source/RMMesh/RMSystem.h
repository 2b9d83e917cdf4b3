#pragma once

#include "RMMeshFwd.h"
#include <filesystem>

namespace RM
{

/// returns the directory for temporary files of this library, creating it if necessary; empty path on failure
[[nodiscard]] RMMESH_API std::filesystem::path GetTempDirectory();

/// Setups logger:
/// 1) makes stdout sink
/// 2) makes rotating file sink (RMLog_<date>.txt) in temporary directory, removing log files older than a day
/// log level - trace
RMMESH_API void setupLoggerByDefault();

} //namespace RM
