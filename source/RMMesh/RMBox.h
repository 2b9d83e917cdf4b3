#pragma once

#include "RMMeshFwd.h"
#include <algorithm>
#include <cassert>
#include <limits>

namespace RM
{

/// \defgroup BoxGroup Box
/// \ingroup MathGroup
/// \{

/// Box given by its min- and max- corners
template <typename V>
struct Box
{
public:
    using T = typename V::ValueType;
    static constexpr int elements = V::elements;

    V min, max;

    /// create invalid box by default
    Box() : min{ V::diagonal( std::numeric_limits<T>::max() ) }, max{ V::diagonal( std::numeric_limits<T>::lowest() ) } { }
    Box( const V& min, const V& max ) : min{ min }, max{ max } { }

    /// true if the box contains at least one point
    bool valid() const
    {
        for ( int i = 0; i < elements; ++i )
            if ( min[i] > max[i] )
                return false;
        return true;
    }

    /// computes size of the box in all dimensions
    V size() const { assert( valid() ); return max - min; }

    /// minimally increases the box to include given point
    void include( const V & pt )
    {
        for ( int i = 0; i < elements; ++i )
        {
            min[i] = std::min( min[i], pt[i] );
            max[i] = std::max( max[i], pt[i] );
        }
    }

    bool operator == ( const Box & a ) const { return min == a.min && max == a.max; }
    bool operator != ( const Box & a ) const { return !( *this == a ); }
};

/// \}

} // namespace RM
