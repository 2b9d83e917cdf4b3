#include "RMSimplifyWorkingSet.h"
#include "RMPch/RMHashMap.h"
#include "RMPch/RMSpdlog.h"
#include <algorithm>
#include <cfloat>
#include <stdexcept>

namespace RM
{

SimplifyWorkingSet::SimplifyWorkingSet( const TriMesh & mesh )
{
    verts.resize( mesh.points.size() );
    for ( auto v = verts.beginId(); v < verts.endId(); ++v )
        verts[v].p = mesh.points[v];

    tris.resize( mesh.tris.size() );
    for ( auto f = tris.beginId(); f < tris.endId(); ++f )
    {
        const auto & t = mesh.tris[f];
        for ( int i = 0; i < 3; ++i )
        {
            if ( !t[i] || size_t( t[i] ) >= verts.size() )
            {
                auto msg = fmt::format( "Triangle {} references vertex {} while the mesh has {} vertices", int( f ), int( t[i] ), verts.size() );
                spdlog::critical( msg );
                throw std::out_of_range( msg );
            }
        }
        tris[f].v = t;
    }
}

void SimplifyWorkingSet::rebuild( bool initial )
{
    if ( !initial )
        std::erase_if( tris.vec_, []( const SimplifyTriangle & t ) { return t.deleted; } );

    buildRefs_();

    if ( initial )
    {
        findBorders_();
        initQuadrics_();
    }
}

void SimplifyWorkingSet::buildRefs_()
{
    for ( auto & v : verts )
    {
        v.tstart = 0;
        v.tcount = 0;
    }

    for ( const auto & t : tris )
    {
        if ( t.deleted )
            continue;
        for ( VertId v : t.v )
            ++verts[v].tcount;
    }

    size_t tstart = 0;
    for ( auto & v : verts )
    {
        v.tstart = tstart;
        tstart += v.tcount;
        v.tcount = 0;
    }

    refs.resize( tstart );
    for ( auto f = tris.beginId(); f < tris.endId(); ++f )
    {
        const auto & t = tris[f];
        if ( t.deleted )
            continue;
        for ( int i = 0; i < 3; ++i )
        {
            auto & v = verts[t.v[i]];
            refs[v.tstart + v.tcount] = { f, i };
            ++v.tcount;
        }
    }
}

void SimplifyWorkingSet::findBorders_()
{
    // neighbor vertex -> number of live triangles with the edge to it
    HashMap<VertId, int> edgeCount;
    for ( auto v = verts.beginId(); v < verts.endId(); ++v )
    {
        edgeCount.clear();
        const auto & vert = verts[v];
        for ( size_t k = 0; k < vert.tcount; ++k )
        {
            const auto & t = tris[refs[vert.tstart + k].face];
            if ( t.deleted )
                continue;
            for ( int j = 0; j < 3; ++j )
            {
                const VertId a = t.v[j];
                const VertId b = t.v[( j + 1 ) % 3];
                if ( a != v && b != v )
                    continue;
                const VertId neighbor = a == v ? b : a;
                if ( neighbor != v )
                    ++edgeCount[neighbor];
            }
        }
        for ( const auto & [neighbor, count] : edgeCount )
        {
            if ( count != 1 )
                continue;
            verts[v].border = true;
            verts[neighbor].border = true;
        }
    }
}

void SimplifyWorkingSet::initQuadrics_()
{
    for ( auto & v : verts )
        v.q = {};

    for ( auto & t : tris )
    {
        if ( t.deleted )
            continue;
        const auto & p0 = verts[t.v[0]].p;
        t.n = unitOrNaN( cross( verts[t.v[1]].p - p0, verts[t.v[2]].p - p0 ) );
        const auto plane = QuadricMatrix::fromPlane( t.n.x, t.n.y, t.n.z, -dot( t.n, p0 ) );
        for ( VertId v : t.v )
            verts[v].q += plane;
    }

    // seed errors only tell whether the exact solution exists
    for ( auto & t : tris )
    {
        if ( t.deleted )
            continue;
        for ( int j = 0; j < 3; ++j )
        {
            const auto & v0 = verts[t.v[j]];
            const auto & v1 = verts[t.v[( j + 1 ) % 3]];
            const bool bothBorder = v0.border && v1.border;
            const bool singular = QuadricMatrix::isSingular( ( v0.q + v1.q ).det3() );
            t.err[j] = ( singular || bothBorder ) ? DBL_MAX : 0;
        }
        t.err[3] = std::min( t.err[0], std::min( t.err[1], t.err[2] ) );
    }
}

TriMesh SimplifyWorkingSet::compact() const
{
    Vector<VertId, VertId> remap( verts.size() );
    VertCoords points;
    for ( const auto & t : tris )
    {
        if ( t.deleted )
            continue;
        for ( VertId v : t.v )
        {
            if ( !v || size_t( v ) >= verts.size() )
            {
                auto msg = fmt::format( "Compaction met vertex {} while the working set has {} vertices", int( v ), verts.size() );
                spdlog::critical( msg );
                throw std::logic_error( msg );
            }
            if ( remap[v] )
                continue;
            remap[v] = points.endId();
            points.push_back( verts[v].p );
        }
    }

    Triangulation newTris;
    newTris.reserve( liveTriangles() );
    for ( const auto & t : tris )
    {
        if ( t.deleted )
            continue;
        ThreeVertIds newT;
        for ( int i = 0; i < 3; ++i )
        {
            newT[i] = getAt( remap, t.v[i] );
            if ( !newT[i] )
            {
                auto msg = fmt::format( "Vertex {} of a live triangle is missing in compaction remap", int( t.v[i] ) );
                spdlog::critical( msg );
                throw std::logic_error( msg );
            }
        }
        newTris.push_back( newT );
    }

    return { std::move( newTris ), std::move( points ) };
}

size_t SimplifyWorkingSet::liveTriangles() const
{
    return size_t( std::count_if( begin( tris ), end( tris ), []( const SimplifyTriangle & t ) { return !t.deleted; } ) );
}

} //namespace RM
