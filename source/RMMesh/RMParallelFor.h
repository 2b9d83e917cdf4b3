#pragma once

#include "RMVector.h"
#include "RMPch/RMTBB.h"

#include <vector>

namespace RM
{

/// \addtogroup BasicGroup
/// \{

/// executes given function f for each span element [begin, end) in parallel threads
template <typename I, typename F>
inline void ParallelFor( I begin, I end, F && f )
{
    tbb::parallel_for( tbb::blocked_range( begin, end ),
        [&] ( const tbb::blocked_range<I>& range )
    {
        for ( I i = range.begin(); i < range.end(); ++i )
            f( i );
    } );
}

/// executes given function f for each vector element in parallel threads
template <typename T, typename F>
inline void ParallelFor( const std::vector<T> & v, F && f )
{
    ParallelFor( size_t(0), v.size(), std::forward<F>( f ) );
}

/// executes given function f for each vector element in parallel threads
template <typename T, typename I, typename F>
inline void ParallelFor( const Vector<T, I> & v, F && f )
{
    ParallelFor( v.beginId(), v.endId(), std::forward<F>( f ) );
}

/// \}

} // namespace RM
