#include "RMMakeBox.h"

namespace RM
{

Mesh makeBox( const Vector3d & size )
{
    const auto h = size / 2.0;

    VertCoords points;
    points.reserve( 8 );
    points.emplace_back( -h.x, -h.y, -h.z ); // VertId{0}
    points.emplace_back(  h.x, -h.y, -h.z ); // VertId{1}
    points.emplace_back(  h.x,  h.y, -h.z ); // VertId{2}
    points.emplace_back( -h.x,  h.y, -h.z ); // VertId{3}
    points.emplace_back( -h.x, -h.y,  h.z ); // VertId{4}
    points.emplace_back(  h.x, -h.y,  h.z ); // VertId{5}
    points.emplace_back(  h.x,  h.y,  h.z ); // VertId{6}
    points.emplace_back( -h.x,  h.y,  h.z ); // VertId{7}

    // two triangles per side
    Triangulation t{
        { 0_v, 2_v, 1_v }, { 0_v, 3_v, 2_v }, // z=min
        { 4_v, 5_v, 6_v }, { 4_v, 6_v, 7_v }, // z=max
        { 0_v, 1_v, 5_v }, { 0_v, 5_v, 4_v }, // y=min
        { 2_v, 3_v, 7_v }, { 2_v, 7_v, 6_v }, // y=max
        { 1_v, 2_v, 6_v }, { 1_v, 6_v, 5_v }, // x=max
        { 3_v, 0_v, 4_v }, { 3_v, 4_v, 7_v }  // x=min
    };

    return Mesh( std::move( points ), std::move( t ) );
}

} //namespace RM
