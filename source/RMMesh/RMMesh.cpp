#include "RMMesh.h"
#include "RMPch/RMHashMap.h"
#include "RMMeshSimplify.h"
#include "RMParallelFor.h"
#include "RMTimer.h"
#include "RMPch/RMFmt.h"

namespace RM
{

namespace
{

Expected<void> checkTriples( size_t size, std::string_view what )
{
    if ( size % 3 != 0 )
        return unexpected( fmt::format( "{} array length {} is not a multiple of 3", what, size ) );
    return {};
}

} //anonymous namespace

std::string_view toString( BoundsError e )
{
    switch ( e )
    {
    case BoundsError::NoVertices:
        return "Mesh has no vertices";
    case BoundsError::Degenerate:
        return "All vertices are the same";
    }
    return "Unknown bounds error";
}

Mesh::Mesh( VertCoords points, Triangulation tris, MeshSource source )
    : points( std::move( points ) )
    , tris( std::move( tris ) )
    , source( std::move( source ) )
{
}

Expected<Mesh> Mesh::fromFlat( const std::vector<double> & coords, const std::vector<int> & indices )
{
    RM_RETURN_IF_UNEXPECTED( checkTriples( coords.size(), "Vertex coordinates" ) )
    RM_RETURN_IF_UNEXPECTED( checkTriples( indices.size(), "Face indices" ) )

    VertCoords points;
    points.reserve( coords.size() / 3 );
    for ( size_t i = 0; i < coords.size(); i += 3 )
        points.emplace_back( coords[i], coords[i + 1], coords[i + 2] );

    for ( size_t i = 0; i < indices.size(); ++i )
    {
        if ( indices[i] < 0 || size_t( indices[i] ) >= points.size() )
            return unexpected( fmt::format( "Face index {} at position {} is out of range for {} vertices", indices[i], i, points.size() ) );
    }

    Triangulation tris;
    tris.reserve( indices.size() / 3 );
    for ( size_t i = 0; i < indices.size(); i += 3 )
        tris.push_back( { VertId( indices[i] ), VertId( indices[i + 1] ), VertId( indices[i + 2] ) } );

    return Mesh( std::move( points ), std::move( tris ) );
}

const FaceVectors & Mesh::facesCross() const
{
    return cache_.getOrCreate( &MeshCache::facesCross_, [this]
    {
        FaceVectors res( tris.size() );
        ParallelFor( tris, [&]( FaceId f )
        {
            const auto & t = tris[f];
            const auto & p0 = points[t[0]];
            res[f] = cross( points[t[1]] - p0, points[t[2]] - p0 );
        } );
        return res;
    } );
}

const FaceVectors & Mesh::faceNormals() const
{
    return cache_.getOrCreate( &MeshCache::faceNormals_, [this]
    {
        const auto & crosses = facesCross();
        FaceVectors res( crosses.size() );
        ParallelFor( crosses, [&]( FaceId f )
        {
            res[f] = unitOrNaN( crosses[f] );
        } );
        return res;
    } );
}

const FaceScalars & Mesh::facesArea() const
{
    return cache_.getOrCreate( &MeshCache::facesArea_, [this]
    {
        const auto & crosses = facesCross();
        FaceScalars res( crosses.size() );
        ParallelFor( crosses, [&]( FaceId f )
        {
            res[f] = crosses[f].length() / 2;
        } );
        return res;
    } );
}

double Mesh::area() const
{
    return cache_.getOrCreate( &MeshCache::area_, [this]
    {
        double res = 0;
        for ( double a : facesArea() )
            res += a;
        return res;
    } );
}

const std::vector<VertPair> & Mesh::edges() const
{
    return cache_.getOrCreate( &MeshCache::edges_, [this]
    {
        std::vector<VertPair> res( 3 * tris.size() );
        ParallelFor( tris, [&]( FaceId f )
        {
            const auto & t = tris[f];
            const size_t i = 3 * size_t( f );
            res[i]     = { t[0], t[1] };
            res[i + 1] = { t[1], t[2] };
            res[i + 2] = { t[2], t[0] };
        } );
        return res;
    } );
}

const std::vector<FacePair> & Mesh::faceAdjacency() const
{
    return cache_.getOrCreate( &MeshCache::faceAdjacency_, [this]
    {
        RM_NAMED_TIMER( "faceAdjacency" )
        const auto & es = edges();
        std::vector<FacePair> res;
        res.reserve( es.size() / 2 );

        // undirected edge -> first face with it, invalidated after the second face is found
        HashMap<VertPair, FaceId> edgeToFace;
        edgeToFace.reserve( es.size() );
        for ( size_t i = 0; i < es.size(); ++i )
        {
            const FaceId f( i / 3 );
            auto [a, b] = es[i];
            if ( b < a )
                std::swap( a, b );
            auto [it, inserted] = edgeToFace.insert( { VertPair{ a, b }, f } );
            if ( inserted || !it->second )
                continue;
            res.emplace_back( it->second, f );
            it->second = FaceId();
        }
        return res;
    } );
}

const std::vector<double> & Mesh::faceAdjacencyAngles() const
{
    return cache_.getOrCreate( &MeshCache::faceAdjacencyAngles_, [this]
    {
        const auto & adjacency = faceAdjacency();
        const auto & normals = faceNormals();
        std::vector<double> res( adjacency.size() );
        ParallelFor( adjacency, [&]( size_t i )
        {
            res[i] = angle( normals[adjacency[i].first], normals[adjacency[i].second] );
        } );
        return res;
    } );
}

Expected<Box3d, BoundsError> Mesh::bounds() const
{
    if ( points.empty() )
        return unexpected( BoundsError::NoVertices );

    Box3d res;
    for ( const auto & p : points )
        res.include( p );

    if ( res.min == res.max )
        return unexpected( BoundsError::Degenerate );
    return res;
}

Mesh Mesh::simplify( size_t targetFaceCount, double aggressiveness ) const
{
    SimplifySettings settings;
    settings.targetFaceCount = targetFaceCount;
    settings.aggressiveness = aggressiveness;
    return simplify( settings );
}

Mesh Mesh::simplify( const SimplifySettings & settings, SimplifyResult * outRes ) const
{
    TriMesh triMesh{ tris, points };
    const auto res = simplifyTriMesh( triMesh, settings );
    if ( outRes )
        *outRes = res;
    return Mesh( std::move( triMesh.points ), std::move( triMesh.tris ) );
}

void Mesh::invalidateCaches()
{
    cache_.reset();
}

} //namespace RM
