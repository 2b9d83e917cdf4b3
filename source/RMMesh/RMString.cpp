#include "RMString.h"
#include <cctype>

namespace RM
{

namespace
{

bool isAscii( char c )
{
    return (unsigned char)c <= 127;
}

} //anonymous namespace

std::string toLower( std::string str )
{
    for ( auto& ch : str )
        if ( isAscii( ch ) )
            ch = (char)std::tolower( ch );
    return str;
}

std::string_view trim( std::string_view str )
{
    return trimRight( trimLeft( str ) );
}

std::string_view trimLeft( std::string_view str )
{
    size_t pos = 0;
    while ( pos < str.size() && isAscii( str[pos] ) && std::isspace( str[pos] ) )
        ++pos;
    return str.substr( pos );
}

std::string_view trimRight( std::string_view str )
{
    auto l = str.size();
    while ( l > 0 && isAscii( str[l - 1] ) && std::isspace( str[l - 1] ) )
        --l;
    return str.substr( 0, l );
}

} //namespace RM
