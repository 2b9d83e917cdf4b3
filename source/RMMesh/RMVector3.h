#pragma once

#include "RMMeshFwd.h"
#include <cmath>
#include <type_traits>
#include <utility>

namespace RM
{

/// three-dimensional vector
/// \ingroup VectorGroup
template <typename T>
struct Vector3
{
    using ValueType = T;
    static constexpr int elements = 3;

    T x, y, z;

    constexpr Vector3() noexcept : x( 0 ), y( 0 ), z( 0 ) { }
    constexpr Vector3( T x, T y, T z ) noexcept : x( x ), y( y ), z( z ) { }

    static constexpr Vector3 diagonal( T a ) noexcept { return Vector3( a, a, a ); }

    constexpr const T & operator []( int e ) const noexcept { return *( &x + e ); }
    constexpr       T & operator []( int e )       noexcept { return *( &x + e ); }

    T lengthSq() const { return x * x + y * y + z * z; }
    auto length() const
    {
        using std::sqrt;
        return sqrt( lengthSq() );
    }

    [[nodiscard]] bool isFinite() const
    {
        return std::isfinite( x ) && std::isfinite( y ) && std::isfinite( z );
    }

    [[nodiscard]] friend constexpr bool operator ==( const Vector3<T> & a, const Vector3<T> & b ) { return a.x == b.x && a.y == b.y && a.z == b.z; }
    [[nodiscard]] friend constexpr bool operator !=( const Vector3<T> & a, const Vector3<T> & b ) { return !( a == b ); }

    [[nodiscard]] friend constexpr const Vector3<T> & operator +( const Vector3<T> & a ) { return a; }
    [[nodiscard]] friend constexpr Vector3<T> operator -( const Vector3<T> & a ) { return { -a.x, -a.y, -a.z }; }

    [[nodiscard]] friend constexpr Vector3<T> operator +( const Vector3<T> & a, const Vector3<T> & b ) { return { a.x + b.x, a.y + b.y, a.z + b.z }; }
    [[nodiscard]] friend constexpr Vector3<T> operator -( const Vector3<T> & a, const Vector3<T> & b ) { return { a.x - b.x, a.y - b.y, a.z - b.z }; }
    [[nodiscard]] friend constexpr Vector3<T> operator *(               T    a, const Vector3<T> & b ) { return { a * b.x, a * b.y, a * b.z }; }
    [[nodiscard]] friend constexpr Vector3<T> operator *( const Vector3<T> & b,               T    a ) { return { a * b.x, a * b.y, a * b.z }; }
    [[nodiscard]] friend constexpr Vector3<T> operator /(       Vector3<T>   b,               T    a )
    {
        if constexpr ( std::is_integral_v<T> )
            return { b.x / a, b.y / a, b.z / a };
        else
            return b * ( 1 / a );
    }

    friend constexpr Vector3<T> & operator +=( Vector3<T> & a, const Vector3<T> & b ) { a.x += b.x; a.y += b.y; a.z += b.z; return a; }
    friend constexpr Vector3<T> & operator -=( Vector3<T> & a, const Vector3<T> & b ) { a.x -= b.x; a.y -= b.y; a.z -= b.z; return a; }
    friend constexpr Vector3<T> & operator *=( Vector3<T> & a,               T    b ) { a.x *= b; a.y *= b; a.z *= b; return a; }
};

/// \related Vector3
/// \{

/// cross product
template <typename T>
inline Vector3<T> cross( const Vector3<T> & a, const Vector3<T> & b )
{
    return {
        a.y * b.z - a.z * b.y,
        a.z * b.x - a.x * b.z,
        a.x * b.y - a.y * b.x
    };
}

/// dot product
template <typename T>
inline T dot( const Vector3<T> & a, const Vector3<T> & b )
{
    return a.x * b.x + a.y * b.y + a.z * b.z;
}

/// vector divided on its length without special treatment of zero length, which gives NaN components
template <typename T>
inline Vector3<T> unitOrNaN( const Vector3<T> & a )
{
    return a / a.length();
}

/// computes minimal angle in [0,pi] between two vectors;
/// the function is symmetric: angle( a, b ) == angle( b, a )
template <typename T>
inline T angle( const Vector3<T> & a, const Vector3<T> & b )
{
    return std::atan2( cross( a, b ).length(), dot( a, b ) );
}

/// \}

} // namespace RM
