#pragma once

#include "RMMeshFwd.h"
#include "RMVector3.h"
#include <algorithm>
#include <array>
#include <cmath>

namespace RM
{

/// symmetric 4x4 matrix of an error quadric accumulated from planes a*x + b*y + c*z + d = 0;
/// only the upper triangle is stored:
///   [0]=aa [1]=ab [2]=ac [3]=ad
///          [4]=bb [5]=bc [6]=bd
///                 [7]=cc [8]=cd
///                        [9]=dd
/// \ingroup MathGroup
struct QuadricMatrix
{
    std::array<double, 10> m{};

    /// the determinant of the top-left 3x3 block at or below this value means the block cannot be inverted
    static constexpr double singularDet = 1e-15;

    /// the quadric of squared distance to the plane a*x + b*y + c*z + d = 0
    [[nodiscard]] static constexpr QuadricMatrix fromPlane( double a, double b, double c, double d ) noexcept
    {
        return { { a * a, a * b, a * c, a * d, b * b, b * c, b * d, c * c, c * d, d * d } };
    }

    constexpr const double & operator []( int i ) const noexcept { return m[i]; }
    constexpr       double & operator []( int i )       noexcept { return m[i]; }

    /// determinant of 3x3 matrix composed from the elements with given indices
    [[nodiscard]] double det( int a11, int a12, int a13,
                              int a21, int a22, int a23,
                              int a31, int a32, int a33 ) const noexcept
    {
        return m[a11] * m[a22] * m[a33] + m[a13] * m[a21] * m[a32] + m[a12] * m[a23] * m[a31]
             - m[a13] * m[a22] * m[a31] - m[a11] * m[a23] * m[a32] - m[a12] * m[a21] * m[a33];
    }

    /// determinant of the top-left 3x3 block
    [[nodiscard]] double det3() const noexcept { return det( 0, 1, 2, 1, 4, 5, 2, 5, 7 ); }

    [[nodiscard]] static bool isSingular( double det ) noexcept { return std::abs( det ) <= singularDet; }

    /// the point minimizing this quadric, given not singular det = det3()
    [[nodiscard]] Vector3d solve( double det ) const noexcept
    {
        return {
            -1 / det * this->det( 1, 2, 3, 4, 5, 6, 5, 7, 8 ),
             1 / det * this->det( 0, 2, 3, 1, 5, 6, 2, 7, 8 ),
            -1 / det * this->det( 0, 1, 3, 1, 4, 6, 2, 5, 8 )
        };
    }

    /// value of the quadratic form [x y z 1] * Q * [x y z 1]^T
    [[nodiscard]] double eval( const Vector3d & p ) const noexcept
    {
        const double x = p.x, y = p.y, z = p.z;
        return m[0] * x * x + 2 * m[1] * x * y + 2 * m[2] * x * z + 2 * m[3] * x
             + m[4] * y * y + 2 * m[5] * y * z + 2 * m[6] * y
             + m[7] * z * z + 2 * m[8] * z
             + m[9];
    }

    /// the position for the vertex replacing the edge (p1, p2):
    /// the minimum of this quadric if it exists and (border) is false,
    /// otherwise the best of p1, p2 and their middle, preferring them in that order on equal values;
    /// \param err receives the value of the quadric in returned point if not null
    [[nodiscard]] Vector3d bestPoint( const Vector3d & p1, const Vector3d & p2, bool border, double * err = nullptr ) const noexcept
    {
        const double d = det3();
        if ( !isSingular( d ) && !border )
        {
            const auto res = solve( d );
            if ( err )
                *err = eval( res );
            return res;
        }

        const auto p3 = ( p1 + p2 ) / 2.0;
        const double error1 = eval( p1 );
        const double error2 = eval( p2 );
        const double error3 = eval( p3 );
        const double minError = std::min( error1, std::min( error2, error3 ) );
        if ( err )
            *err = minError;
        if ( minError == error1 )
            return p1;
        if ( minError == error2 )
            return p2;
        return p3;
    }

    QuadricMatrix & operator +=( const QuadricMatrix & b ) noexcept
    {
        for ( int i = 0; i < 10; ++i )
            m[i] += b.m[i];
        return *this;
    }

    [[nodiscard]] friend QuadricMatrix operator +( QuadricMatrix a, const QuadricMatrix & b ) noexcept { return a += b; }

    [[nodiscard]] friend bool operator ==( const QuadricMatrix & a, const QuadricMatrix & b ) noexcept { return a.m == b.m; }
};

} //namespace RM
