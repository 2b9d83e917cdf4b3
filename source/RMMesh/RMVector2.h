#pragma once

#include "RMMeshFwd.h"

namespace RM
{

/// two-dimensional vector
/// \ingroup VectorGroup
template <typename T>
struct Vector2
{
    using ValueType = T;
    static constexpr int elements = 2;

    T x, y;

    constexpr Vector2() noexcept : x( 0 ), y( 0 ) { }
    constexpr Vector2( T x, T y ) noexcept : x( x ), y( y ) { }

    [[nodiscard]] friend constexpr bool operator ==( const Vector2<T> & a, const Vector2<T> & b ) { return a.x == b.x && a.y == b.y; }
    [[nodiscard]] friend constexpr bool operator !=( const Vector2<T> & a, const Vector2<T> & b ) { return !( a == b ); }
};

} // namespace RM
