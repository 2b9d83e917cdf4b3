#pragma once

#include "RMMeshFwd.h"
#include "RMId.h"
#include "RMQuadricMatrix.h"
#include "RMTriMesh.h"
#include "RMVector.h"
#include "RMVector3.h"
#include <array>
#include <vector>

namespace RM
{

/// \defgroup SimplifyGroup Simplification
/// \{

/// vertex record of the simplification working set
struct SimplifyVertex
{
    Vector3d p;
    /// accumulated quadric of all planes of incident triangles, and of the vertices merged in this one
    QuadricMatrix q;
    /// window [tstart, tstart + tcount) in SimplifyWorkingSet::refs with all live triangles incident to this vertex;
    /// valid only after rebuild() or after the window reassignment during a collapse
    size_t tstart = 0;
    size_t tcount = 0;
    /// the vertex is an end of an edge with single incident triangle
    bool border = false;
};

/// triangle record of the simplification working set
struct SimplifyTriangle
{
    ThreeVertIds v;
    /// collapse errors of edges v[0]-v[1], v[1]-v[2], v[2]-v[0], and their minimum in err[3]
    std::array<double, 4> err{};
    bool deleted = false;
    /// the triangle was modified during current pass
    bool dirty = false;
    /// unit normal computed during initialization, never updated later
    Vector3d n;
};

/// a reference from a vertex to one of its incident triangles
struct SimplifyRef
{
    FaceId face;
    /// which corner of the triangle is the vertex: 0, 1 or 2
    int corner = 0;
};

/// mutable arrays of vertices, triangles and vertex-to-triangle references owned by one simplification call;
/// triangles are marked deleted and physically removed only by rebuild() and compact()
class SimplifyWorkingSet
{
public:
    /// copies vertices and triangles of given mesh;
    /// throws std::out_of_range if a triangle references a vertex not in the mesh
    RMMESH_API explicit SimplifyWorkingSet( const TriMesh & mesh );

    /// removes deleted triangles (if not initial), recomputes reference table and vertex windows;
    /// initial rebuild also classifies border vertices, computes triangle normals, vertex quadrics and edge errors
    RMMESH_API void rebuild( bool initial );

    /// returns dense mesh of not-deleted triangles and the vertices referenced by them,
    /// vertices are numbered in the order of their first appearance in the triangles;
    /// throws std::logic_error on broken bookkeeping
    [[nodiscard]] RMMESH_API TriMesh compact() const;

    /// the number of not deleted triangles
    [[nodiscard]] RMMESH_API size_t liveTriangles() const;

    Vector<SimplifyVertex, VertId> verts;
    Vector<SimplifyTriangle, FaceId> tris;
    std::vector<SimplifyRef> refs;

private:
    void buildRefs_();
    void findBorders_();
    void initQuadrics_();
};

/// \}

} //namespace RM
