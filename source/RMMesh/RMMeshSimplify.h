#pragma once

#include "RMMeshFwd.h"
#include "RMTriMesh.h"
#include <cstddef>

namespace RM
{

/**
 * \struct RM::SimplifySettings
 * \brief Parameters structure for RM::simplifyTriMesh
 * \ingroup SimplifyGroup
 *
 * \sa \ref simplifyTriMesh
 */
struct SimplifySettings
{
    /// the simplification stops as soon as the number of triangles is not more than this value
    size_t targetFaceCount = 0;

    /// the exponent of the error threshold growth from pass to pass: threshold = 1e-9 * (pass + 3)^aggressiveness;
    /// larger values collapse more edges per pass with worse quality, good values are in [5, 8]
    double aggressiveness = 7;

    /// log input and output statistics and the progress of every 5th pass at info level
    bool verbose = false;

    /// optional callback invoked immediately before each edge collapse;
    /// if it returns false then the collapse is prohibited
    PreCollapseCallback preCollapse;
};

/**
 * \struct RM::SimplifyResult
 * \ingroup SimplifyGroup
 *
 * \sa \ref simplifyTriMesh
 */
struct SimplifyResult
{
    int facesDeleted = 0; ///< Number deleted faces
    int vertsDeleted = 0; ///< Number of vertices removed from the mesh, including vertices left without triangles
    int collapses = 0;    ///< Number of performed edge collapses
    int passes = 0;       ///< Number of started passes over all triangles
};

/**
 * \brief Reduces the number of triangles in the mesh by iterative edge collapses ordered by quadric error;
 * \details Each pass scans the triangles and collapses their edges with the error below the threshold growing from pass to pass,
 * the collapses must not join border and not-border vertices, make remaining triangles almost degenerate or flip their normals;
 * the operation stops after 100 passes or when the number of triangles is not more than settings.targetFaceCount.
 * Then unreferenced vertices are removed and the remaining ones are numbered in the order of their appearance in triangles.
 * The mesh is left unchanged if targetFaceCount is not less than the number of triangles,
 * or the mesh has no triangles or less than 3 vertices; zero targetFaceCount makes the mesh empty.
 * Throws std::out_of_range if a triangle references a vertex not in the mesh.
 * \ingroup SimplifyGroup
 */
RMMESH_API SimplifyResult simplifyTriMesh( TriMesh & mesh, const SimplifySettings & settings );

} //namespace RM
