#pragma once

#include "RMMeshFwd.h"
#include "RMMesh.h"
#include "RMVector3.h"

namespace RM
{

/// creates box mesh with the centroid in (0,0,0) and given size in every dimension,
/// having 8 vertices and 12 triangular faces oriented outside.
/// The order of vertices:
///   0_v: x=min, y=min, z=min
///   1_v: x=max, y=min, z=min
///   2_v: x=max, y=max, z=min
///   3_v: x=min, y=max, z=min
///   4_v: x=min, y=min, z=max
///   5_v: x=max, y=min, z=max
///   6_v: x=max, y=max, z=max
///   7_v: x=min, y=max, z=max
/// \ingroup MeshGroup
[[nodiscard]] RMMESH_API Mesh makeBox( const Vector3d & size = Vector3d::diagonal( 1 ) );

} //namespace RM
