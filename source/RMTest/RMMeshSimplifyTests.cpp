#include <gtest/gtest.h>
#include <RMMesh/RMMeshSimplify.h>
#include <RMMesh/RMMesh.h>
#include <RMMesh/RMMakeBox.h>
#include <RMMesh/RMVector.h>

#include <cmath>
#include <stdexcept>

namespace RM
{

namespace
{

TriMesh makeUnitCube()
{
    TriMesh res;
    res.points = { { 0, 0, 0 }, { 1, 0, 0 }, { 1, 1, 0 }, { 0, 1, 0 }, { 0, 0, 1 }, { 1, 0, 1 }, { 1, 1, 1 }, { 0, 1, 1 } };
    res.tris = {
        { 0_v, 1_v, 2_v }, { 0_v, 2_v, 3_v },
        { 4_v, 5_v, 6_v }, { 4_v, 6_v, 7_v },
        { 0_v, 1_v, 5_v }, { 0_v, 5_v, 4_v },
        { 1_v, 2_v, 6_v }, { 1_v, 6_v, 5_v },
        { 2_v, 3_v, 7_v }, { 2_v, 7_v, 6_v },
        { 3_v, 0_v, 4_v }, { 3_v, 4_v, 7_v }
    };
    return res;
}

// hexagonal border ring 0..5 around two interior vertices: 6 and given one
TriMesh makeFan( const Vector3d & secondInner )
{
    TriMesh res;
    res.points = { { 2, 0, 0 }, { 1, 1.7, 0 }, { 0, 0.2, 0 }, { -2, 0, 0 }, { -1, -1.7, 0 }, { 1, -1.7, 0 }, { 1, 0, 0.2 }, secondInner };
    res.tris = {
        { 6_v, 0_v, 1_v }, { 6_v, 1_v, 2_v }, { 6_v, 2_v, 7_v }, { 7_v, 2_v, 3_v },
        { 7_v, 3_v, 4_v }, { 7_v, 4_v, 5_v }, { 7_v, 5_v, 6_v }, { 6_v, 5_v, 0_v }
    };
    return res;
}

// open surface of n x n vertices with not-planar bumps
TriMesh makeBumpyGrid( int n )
{
    TriMesh res;
    for ( int j = 0; j < n; ++j )
        for ( int i = 0; i < n; ++i )
            res.points.emplace_back( i, j, 0.3 * std::sin( i * 1.3 ) * std::cos( j * 0.7 ) );
    for ( int j = 0; j + 1 < n; ++j )
    {
        for ( int i = 0; i + 1 < n; ++i )
        {
            const VertId a( j * n + i ), b = a + 1, c = a + n, d = c + 1;
            res.tris.push_back( { a, b, d } );
            res.tris.push_back( { a, d, c } );
        }
    }
    return res;
}

// every index is in range, every vertex is referenced, all coordinates are finite
void checkCompacted( const TriMesh & mesh )
{
    Vector<int, VertId> uses( mesh.points.size(), 0 );
    for ( const auto & t : mesh.tris )
    {
        for ( VertId v : t )
        {
            ASSERT_TRUE( v.valid() );
            ASSERT_LT( size_t( v ), mesh.points.size() );
            ++uses[v];
        }
    }
    for ( auto v = mesh.points.beginId(); v < mesh.points.endId(); ++v )
    {
        EXPECT_GT( uses[v], 0 );
        EXPECT_TRUE( mesh.points[v].isFinite() );
    }
}

} //anonymous namespace

TEST( RMMesh, SimplifyCube )
{
    auto mesh = makeUnitCube();
    SimplifySettings settings;
    settings.targetFaceCount = 6;
    const auto res = simplifyTriMesh( mesh, settings );

    EXPECT_EQ( mesh.tris.size(), 6 );
    EXPECT_EQ( mesh.points.size(), 5 );
    EXPECT_EQ( res.facesDeleted, 6 );
    EXPECT_EQ( res.vertsDeleted, 3 );
    EXPECT_EQ( res.collapses, 3 );
    EXPECT_EQ( res.passes, 1 );
    checkCompacted( mesh );
}

TEST( RMMesh, SimplifyCubeTargets )
{
    for ( size_t target = 1; target < 12; ++target )
    {
        auto mesh = makeUnitCube();
        SimplifySettings settings;
        settings.targetFaceCount = target;
        const auto res = simplifyTriMesh( mesh, settings );
        EXPECT_LE( mesh.tris.size(), target );
        EXPECT_LE( mesh.points.size(), 8 );
        EXPECT_EQ( mesh.tris.size() + res.facesDeleted, 12 );
        EXPECT_EQ( mesh.points.size() + res.vertsDeleted, 8 );
        checkCompacted( mesh );
    }
}

TEST( RMMesh, SimplifyNoop )
{
    const auto cube = makeUnitCube();
    for ( double aggressiveness : { 1.0, 5.0, 7.0, 10.0 } )
    {
        for ( size_t target : { 12, 13, 1000 } )
        {
            auto mesh = cube;
            SimplifySettings settings;
            settings.targetFaceCount = target;
            settings.aggressiveness = aggressiveness;
            const auto res = simplifyTriMesh( mesh, settings );
            EXPECT_EQ( mesh.points, cube.points );
            EXPECT_EQ( mesh.tris, cube.tris );
            EXPECT_EQ( res.passes, 0 );
        }
    }

    // too few vertices
    TriMesh small;
    small.points = { { 0, 0, 0 }, { 1, 0, 0 } };
    small.tris = { { 0_v, 1_v, 0_v }, { 1_v, 0_v, 1_v } };
    auto copy = small;
    SimplifySettings settings;
    settings.targetFaceCount = 1;
    simplifyTriMesh( copy, settings );
    EXPECT_EQ( copy.points, small.points );
    EXPECT_EQ( copy.tris, small.tris );
}

TEST( RMMesh, SimplifyToZero )
{
    auto mesh = makeUnitCube();
    SimplifySettings settings;
    settings.targetFaceCount = 0;
    const auto res = simplifyTriMesh( mesh, settings );
    EXPECT_TRUE( mesh.points.empty() );
    EXPECT_TRUE( mesh.tris.empty() );
    EXPECT_EQ( res.facesDeleted, 12 );
    EXPECT_EQ( res.vertsDeleted, 8 );
}

TEST( RMMesh, SimplifyFlipGuard )
{
    // collapsing the interior edge (6,7) would turn the triangles around raised vertex 7 upside down
    const auto spike = makeFan( { -1, 0, 1 } );
    auto mesh = spike;
    int numCalls = 0;
    SimplifySettings settings;
    settings.targetFaceCount = 7;
    settings.preCollapse = [&]( VertId, VertId, const Vector3d & )
    {
        ++numCalls;
        return true;
    };
    auto res = simplifyTriMesh( mesh, settings );
    EXPECT_EQ( numCalls, 0 );
    EXPECT_EQ( res.collapses, 0 );
    EXPECT_EQ( res.passes, 100 );
    EXPECT_EQ( mesh.tris.size(), 8 );
    ASSERT_EQ( mesh.points.size(), 8 );
    checkCompacted( mesh );

    // same triangles after renumbering of vertices in the order of appearance
    const std::array<int, 8> newToOld{ 6, 0, 1, 2, 7, 3, 4, 5 };
    for ( auto v = mesh.points.beginId(); v < mesh.points.endId(); ++v )
        EXPECT_EQ( mesh.points[v], spike.points[VertId( newToOld[v] )] );
    for ( auto f = mesh.tris.beginId(); f < mesh.tris.endId(); ++f )
        for ( int i = 0; i < 3; ++i )
            EXPECT_EQ( VertId( newToOld[mesh.tris[f][i]] ), spike.tris[f][i] );

    // the same configuration with low second vertex is simplified
    mesh = makeFan( { -1, 0, 0.2 } );
    res = simplifyTriMesh( mesh, settings );
    EXPECT_EQ( numCalls, 1 );
    EXPECT_EQ( res.collapses, 1 );
    EXPECT_EQ( mesh.tris.size(), 6 );
    EXPECT_EQ( mesh.points.size(), 7 );
    checkCompacted( mesh );
}

TEST( RMMesh, SimplifyBorder )
{
    const int n = 6;
    const auto grid = makeBumpyGrid( n );
    auto isRim = [n]( VertId v )
    {
        const int i = v % n, j = v / n;
        return i == 0 || j == 0 || i == n - 1 || j == n - 1;
    };

    for ( size_t target : { 30, 20, 10 } )
    {
        auto mesh = grid;
        int numCalls = 0;
        SimplifySettings settings;
        settings.targetFaceCount = target;
        settings.preCollapse = [&]( VertId kept, VertId removed, const Vector3d & newPos )
        {
            ++numCalls;
            EXPECT_EQ( isRim( kept ), isRim( removed ) );
            EXPECT_TRUE( newPos.isFinite() );
            return true;
        };
        const auto res = simplifyTriMesh( mesh, settings );
        EXPECT_EQ( numCalls, res.collapses );
        EXPECT_GT( res.collapses, 0 );
        EXPECT_LE( mesh.tris.size(), target );
        checkCompacted( mesh );
    }
}

TEST( RMMesh, SimplifyVeto )
{
    const auto cube = makeUnitCube();
    auto mesh = cube;
    SimplifySettings settings;
    settings.targetFaceCount = 6;
    settings.preCollapse = []( VertId, VertId, const Vector3d & ) { return false; };
    const auto res = simplifyTriMesh( mesh, settings );
    EXPECT_EQ( res.collapses, 0 );
    EXPECT_EQ( res.facesDeleted, 0 );
    EXPECT_EQ( res.vertsDeleted, 0 );
    // vertices appear in the triangles in their original order
    EXPECT_EQ( mesh.points, cube.points );
    EXPECT_EQ( mesh.tris, cube.tris );
}

TEST( RMMesh, SimplifyBadIndex )
{
    TriMesh mesh;
    mesh.points = { { 0, 0, 0 }, { 1, 0, 0 }, { 0, 1, 0 } };
    mesh.tris = { { 0_v, 1_v, 2_v }, { 2_v, 1_v, 10_v } };
    SimplifySettings settings;
    settings.targetFaceCount = 1;
    EXPECT_THROW( simplifyTriMesh( mesh, settings ), std::out_of_range );
}

TEST( RMMesh, MeshSimplify )
{
    auto box = makeBox();
    box.source.format = MeshFormat::STL;
    (void)box.faceNormals();
    ASSERT_GT( box.cachedQueries(), 0 );

    SimplifyResult res;
    SimplifySettings settings;
    settings.targetFaceCount = 8;
    settings.verbose = true;
    const auto simplified = box.simplify( settings, &res );
    EXPECT_EQ( simplified.cachedQueries(), 0 );
    EXPECT_FALSE( simplified.source.format.has_value() );
    EXPECT_EQ( simplified.tris.size(), 8 );
    EXPECT_EQ( simplified.points.size(), 6 );
    EXPECT_EQ( res.facesDeleted, 4 );
    EXPECT_EQ( res.collapses, 2 );

    // the source mesh is unchanged
    EXPECT_EQ( box.tris.size(), 12 );
    EXPECT_EQ( box.points.size(), 8 );

    const auto same = box.simplify( 12 );
    EXPECT_EQ( same.points, box.points );
    EXPECT_EQ( same.tris, box.tris );
    EXPECT_EQ( same.cachedQueries(), 0 );

    const auto empty = box.simplify( 0, 5 );
    EXPECT_TRUE( empty.points.empty() );
    EXPECT_TRUE( empty.tris.empty() );
}

} //namespace RM
