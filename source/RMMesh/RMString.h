#pragma once

#include "RMMeshFwd.h"
#include <string>
#include <string_view>

namespace RM
{

/// Returns a copy of \param str with all ASCII letters in lower case
[[nodiscard]] RMMESH_API std::string toLower( std::string str );

/// Removes all whitespace character (detected by std::isspace) at the beginning and the end of string view
[[nodiscard]] RMMESH_API std::string_view trim( std::string_view str );

/// Removes all whitespace character (detected by std::isspace) at the beginning of string view
[[nodiscard]] RMMESH_API std::string_view trimLeft( std::string_view str );

/// Removes all whitespace character (detected by std::isspace) at the end of string view
[[nodiscard]] RMMESH_API std::string_view trimRight( std::string_view str );

} //namespace RM
