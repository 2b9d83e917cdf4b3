#include "RMMeshSimplify.h"
#include "RMSimplifyWorkingSet.h"
#include "RMTimer.h"
#include "RMPch/RMSpdlog.h"
#include <algorithm>
#include <cmath>

namespace RM
{

namespace
{

constexpr int cMaxPasses = 100;
// the triangle array is compacted and the references are rebuilt every that many passes
constexpr int cRebuildPeriod = 5;
constexpr double cThresholdScale = 1e-9;
constexpr double cThresholdOffset = 3;
// directions from the collapse position to two other triangle corners shall not be almost parallel
constexpr double cColinearLimit = 0.999;
// minimal dot product of new triangle normal with its initial normal
constexpr double cFlipLimit = 0.2;

} //anonymous namespace

class MeshSimplifier
{
public:
    MeshSimplifier( TriMesh & mesh, const SimplifySettings & settings );
    SimplifyResult run();

private:
    TriMesh & mesh_;
    const SimplifySettings & settings_;
    SimplifyWorkingSet ws_;
    const size_t initialFaces_ = 0;
    SimplifyResult res_;
    // per-reference marks of the triangles to be deleted by current collapse, for both edge ends
    std::vector<bool> deleted0_, deleted1_;

    bool targetReached_() const { return initialFaces_ - size_t( res_.facesDeleted ) <= settings_.targetFaceCount; }

    /// computes the best position for the vertex replacing the edge (v1, v2), and returns the error in that position
    double calcError_( VertId v1, VertId v2, Vector3d & pos ) const;

    /// true if moving (i0) into (pos) makes some of its triangles (not incident to i1) almost degenerate or flipped;
    /// fills (deleted) for i0 references with the flags of triangles incident to edge (i0, i1)
    bool flipped_( const Vector3d & pos, VertId i0, VertId i1, std::vector<bool> & deleted ) const;

    /// deletes marked triangles of (v), re-points remaining ones to (i0) and appends their references to the table
    void updateTriangles_( VertId i0, VertId v, const std::vector<bool> & deleted );

    /// tries to collapse the edge removing i1 and keeping i0, returns false if the collapse is prohibited
    bool collapseEdge_( VertId i0, VertId i1 );
};

MeshSimplifier::MeshSimplifier( TriMesh & mesh, const SimplifySettings & settings )
    : mesh_( mesh )
    , settings_( settings )
    , ws_( mesh )
    , initialFaces_( mesh.tris.size() )
{
}

double MeshSimplifier::calcError_( VertId v1, VertId v2, Vector3d & pos ) const
{
    const auto & vert1 = ws_.verts[v1];
    const auto & vert2 = ws_.verts[v2];
    double error = 0;
    pos = ( vert1.q + vert2.q ).bestPoint( vert1.p, vert2.p, vert1.border && vert2.border, &error );
    return error;
}

bool MeshSimplifier::flipped_( const Vector3d & pos, VertId i0, VertId i1, std::vector<bool> & deleted ) const
{
    const auto & vert = ws_.verts[i0];
    for ( size_t k = 0; k < vert.tcount; ++k )
    {
        const auto & r = ws_.refs[vert.tstart + k];
        const auto & t = ws_.tris[r.face];
        if ( t.deleted )
            continue;

        const VertId id1 = t.v[( r.corner + 1 ) % 3];
        const VertId id2 = t.v[( r.corner + 2 ) % 3];
        if ( id1 == i1 || id2 == i1 )
        {
            deleted[k] = true;
            continue;
        }

        const auto d1 = unitOrNaN( ws_.verts[id1].p - pos );
        const auto d2 = unitOrNaN( ws_.verts[id2].p - pos );
        if ( std::abs( dot( d1, d2 ) ) > cColinearLimit )
            return true;

        const auto n = unitOrNaN( cross( d1, d2 ) );
        deleted[k] = false;
        if ( dot( n, t.n ) < cFlipLimit )
            return true;
    }
    return false;
}

void MeshSimplifier::updateTriangles_( VertId i0, VertId v, const std::vector<bool> & deleted )
{
    const size_t tstart = ws_.verts[v].tstart;
    const size_t tcount = ws_.verts[v].tcount;
    for ( size_t k = 0; k < tcount; ++k )
    {
        // copy, since the table grows below
        const auto r = ws_.refs[tstart + k];
        auto & t = ws_.tris[r.face];
        if ( t.deleted )
            continue;

        if ( deleted[k] )
        {
            t.deleted = true;
            ++res_.facesDeleted;
            continue;
        }

        t.v[r.corner] = i0;
        t.dirty = true;
        Vector3d pos;
        t.err[0] = calcError_( t.v[0], t.v[1], pos );
        t.err[1] = calcError_( t.v[1], t.v[2], pos );
        t.err[2] = calcError_( t.v[2], t.v[0], pos );
        t.err[3] = std::min( t.err[0], std::min( t.err[1], t.err[2] ) );
        ws_.refs.push_back( r );
    }
}

bool MeshSimplifier::collapseEdge_( VertId i0, VertId i1 )
{
    auto & vert0 = ws_.verts[i0];
    const auto & vert1 = ws_.verts[i1];
    if ( vert0.border != vert1.border )
        return false;

    Vector3d pos;
    calcError_( i0, i1, pos );

    deleted0_.assign( vert0.tcount, false );
    deleted1_.assign( vert1.tcount, false );
    if ( flipped_( pos, i0, i1, deleted0_ ) )
        return false;
    if ( flipped_( pos, i1, i0, deleted1_ ) )
        return false;

    if ( settings_.preCollapse && !settings_.preCollapse( i0, i1, pos ) )
        return false;

    vert0.p = pos;
    vert0.q += vert1.q;

    const size_t refsStart = ws_.refs.size();
    updateTriangles_( i0, i0, deleted0_ );
    updateTriangles_( i0, i1, deleted1_ );
    vert0.tstart = refsStart;
    vert0.tcount = ws_.refs.size() - refsStart;

    ++res_.collapses;
    return true;
}

SimplifyResult MeshSimplifier::run()
{
    const size_t initialVerts = mesh_.points.size();
    for ( int pass = 0; pass < cMaxPasses; ++pass )
    {
        if ( targetReached_() )
            break;

        if ( pass % cRebuildPeriod == 0 )
            ws_.rebuild( pass == 0 );

        for ( auto & t : ws_.tris )
            t.dirty = false;

        const double threshold = cThresholdScale * std::pow( pass + cThresholdOffset, settings_.aggressiveness );
        res_.passes = pass + 1;
        if ( settings_.verbose && pass % cRebuildPeriod == 0 )
            spdlog::info( "Simplification pass {}: {} triangles, threshold {:.1e}", pass, initialFaces_ - res_.facesDeleted, threshold );

        for ( auto f = ws_.tris.beginId(); f < ws_.tris.endId(); ++f )
        {
            const auto & t = ws_.tris[f];
            if ( t.err[3] > threshold || t.deleted || t.dirty )
                continue;

            for ( int j = 0; j < 3; ++j )
            {
                if ( t.err[j] < threshold && collapseEdge_( t.v[j], t.v[( j + 1 ) % 3] ) )
                    break;
            }

            if ( targetReached_() )
                break;
        }
    }

    mesh_ = ws_.compact();
    res_.vertsDeleted = int( initialVerts - mesh_.points.size() );
    return res_;
}

SimplifyResult simplifyTriMesh( TriMesh & mesh, const SimplifySettings & settings )
{
    RM_TIMER;
    const size_t numFaces = mesh.tris.size();
    if ( settings.targetFaceCount >= numFaces )
    {
        if ( settings.verbose )
            spdlog::info( "Target count {} is not less than current count {}, the mesh is unchanged", settings.targetFaceCount, numFaces );
        return {};
    }
    if ( mesh.tris.empty() || mesh.points.size() < 3 )
    {
        if ( settings.verbose )
            spdlog::info( "The mesh is empty or too small, it is unchanged" );
        return {};
    }
    if ( settings.targetFaceCount == 0 )
    {
        if ( settings.verbose )
            spdlog::info( "Target count is 0, the mesh is cleared" );
        SimplifyResult res;
        res.facesDeleted = int( numFaces );
        res.vertsDeleted = int( mesh.points.size() );
        mesh = {};
        return res;
    }

    if ( settings.verbose )
        spdlog::info( "Starting simplification: {} vertices, {} faces, target {} faces, aggressiveness {}",
            mesh.points.size(), numFaces, settings.targetFaceCount, settings.aggressiveness );

    MeshSimplifier simplifier( mesh, settings );
    const auto res = simplifier.run();

    if ( settings.verbose )
        spdlog::info( "Simplification finished: {} vertices, {} faces after {} collapses in {} passes",
            mesh.points.size(), mesh.tris.size(), res.collapses, res.passes );
    return res;
}

} //namespace RM
