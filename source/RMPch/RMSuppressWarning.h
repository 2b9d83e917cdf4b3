#pragma once

#include "RMMesh/RMMacros.h"

// Macros for disabling compiler warnings.
// `MESSAGE' is diagnostic message name used by Clang and GCC.
// `NUMBER` is warning number used by MSVC.
#if defined( __clang__ )
    #define RM_SUPPRESS_WARNING_PUSH \
        _Pragma( "clang diagnostic push" )
    #define RM_SUPPRESS_WARNING( MESSAGE, NUMBER ) \
        _Pragma( RM_STR(clang diagnostic ignored MESSAGE) )
    #define RM_SUPPRESS_WARNING_POP \
        _Pragma( "clang diagnostic pop" )
#elif defined( __GNUC__ )
    #define RM_SUPPRESS_WARNING_PUSH \
        _Pragma( "GCC diagnostic push" )
    #define RM_SUPPRESS_WARNING( MESSAGE, NUMBER ) \
        _Pragma( RM_STR(GCC diagnostic ignored MESSAGE) )
    #define RM_SUPPRESS_WARNING_POP \
        _Pragma( "GCC diagnostic pop" )
#elif defined( _MSC_VER )
    #define RM_SUPPRESS_WARNING_PUSH \
        __pragma( warning( push ) )
    #define RM_SUPPRESS_WARNING( MESSAGE, NUMBER ) \
        __pragma( warning( disable: NUMBER ) )
    #define RM_SUPPRESS_WARNING_POP \
        __pragma( warning( pop ) )
#else
    #define RM_SUPPRESS_WARNING_PUSH
    #define RM_SUPPRESS_WARNING( MESSAGE, NUMBER )
    #define RM_SUPPRESS_WARNING_POP
#endif
