#pragma once

#include "RMMeshFwd.h"
#include "RMPch/RMExpected.h"
#include <string>

namespace RM
{

#if RM_USE_STD_EXPECTED

template<class T, class E = std::string>
using Expected = std::expected<T, E>;

template<class E = std::string>
using Unexpected = std::unexpected<E>;

template <class E>
inline auto unexpected( E &&e )
{
    return std::unexpected( std::forward<E>( e ) );
}

#else

template<class T, class E = std::string>
using Expected = tl::expected<T, E>;

template<class E = std::string>
using Unexpected = tl::unexpected<E>;

template <class E>
inline auto unexpected( E &&e )
{
    return tl::make_unexpected( std::forward<E>( e ) );
}

#endif

/// common message about unknown file extension
inline std::string stringUnsupportedFileExtension()
{
    return "Unsupported file extension";
}

/// Exits the current function with an error if the given expression contains an error.
#define RM_RETURN_IF_UNEXPECTED( expr ) \
    if ( auto&& res = ( expr ); !res ) \
        return unexpected( std::move( res.error() ) );

} //namespace RM
