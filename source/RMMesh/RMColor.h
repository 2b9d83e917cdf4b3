#pragma once

#include "RMMeshFwd.h"
#include <cstdint>

namespace RM
{

/// RGBA color with 8 bits per channel
struct Color
{
    uint8_t r, g, b, a;

    constexpr Color() noexcept : r{ 0 }, g{ 0 }, b{ 0 }, a{ 255 } {}
    constexpr Color( int r, int g, int b, int a ) noexcept : r{ uint8_t( r ) }, g{ uint8_t( g ) }, b{ uint8_t( b ) }, a{ uint8_t( a ) } {}
    constexpr Color( int r, int g, int b ) noexcept : r{ uint8_t( r ) }, g{ uint8_t( g ) }, b{ uint8_t( b ) }, a{ 255 } {}

    [[nodiscard]] friend constexpr bool operator ==( const Color & x, const Color & y ) noexcept { return x.r == y.r && x.g == y.g && x.b == y.b && x.a == y.a; }
    [[nodiscard]] friend constexpr bool operator !=( const Color & x, const Color & y ) noexcept { return !( x == y ); }
};

} //namespace RM
