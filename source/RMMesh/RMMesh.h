#pragma once

#include "RMMeshFwd.h"
#include "RMBox.h"
#include "RMExpected.h"
#include "RMMeshAttributes.h"
#include "RMMeshCache.h"
#include "RMMeshSource.h"
#include "RMTriMesh.h"
#include <string_view>
#include <vector>

namespace RM
{

/// \defgroup MeshGroup Mesh

/// the reasons why the bounding box of a mesh cannot be computed
enum class BoundsError
{
    NoVertices, ///< the mesh has no vertices
    Degenerate  ///< all vertices of the mesh have the same coordinates
};

/// human-readable description of the error
[[nodiscard]] RMMESH_API std::string_view toString( BoundsError e );

/// This class represents a mesh of triangles given by vertex coordinates and vertex triples,
/// as well as the cache of derived geometric queries;
/// the cache is never copied: a copy of the mesh starts with empty cache
/// \ingroup MeshGroup
struct [[nodiscard]] Mesh
{
    VertCoords points;
    Triangulation tris;

    /// optional per-vertex and per-face data, not used by geometric queries
    VertAttributes vertAttributes;
    FaceAttributes faceAttributes;

    /// where the mesh came from
    MeshSource source;

    Mesh() = default;
    RMMESH_API Mesh( VertCoords points, Triangulation tris, MeshSource source = {} );

    /// construct mesh from flat arrays: x,y,z for every vertex and three vertex indices for every face;
    /// fails if the length of any array is not a multiple of 3
    [[nodiscard]] RMMESH_API static Expected<Mesh> fromFlat( const std::vector<double> & coords, const std::vector<int> & indices );

    /// not-normalized cross product of two edges from the first vertex of each face; cached
    [[nodiscard]] RMMESH_API const FaceVectors & facesCross() const;

    /// unit normal of each face; cached; degenerate faces get NaN normals
    [[nodiscard]] RMMESH_API const FaceVectors & faceNormals() const;

    /// area of each face; cached
    [[nodiscard]] RMMESH_API const FaceScalars & facesArea() const;

    /// summed area of all faces; cached
    [[nodiscard]] RMMESH_API double area() const;

    /// three edges (a,b), (b,c), (c,a) of every face (a,b,c), in the order of faces; cached
    [[nodiscard]] RMMESH_API const std::vector<VertPair> & edges() const;

    /// pairs of faces sharing an edge, the first face of each pair is the one met first;
    /// an edge shared by more than two faces gives only the pair of its first two faces; cached
    [[nodiscard]] RMMESH_API const std::vector<FacePair> & faceAdjacency() const;

    /// angle in [0, pi] between the normals of two faces in each pair of faceAdjacency(); cached
    [[nodiscard]] RMMESH_API const std::vector<double> & faceAdjacencyAngles() const;

    /// axis-aligned bounding box of all vertices
    [[nodiscard]] RMMESH_API Expected<Box3d, BoundsError> bounds() const;

    /// the first set of texture coordinates of vertices, or nullptr if the mesh has none
    [[nodiscard]] const VertUVCoords * uv() const { return vertAttributes.uvs.empty() ? nullptr : &vertAttributes.uvs.front(); }

    /// returns new mesh with at most targetFaceCount triangles produced by quadric edge collapses,
    /// see simplifyTriMesh for details; the result has no attributes and no source
    [[nodiscard]] RMMESH_API Mesh simplify( size_t targetFaceCount, double aggressiveness = 7 ) const;
    [[nodiscard]] RMMESH_API Mesh simplify( const SimplifySettings & settings, SimplifyResult * outRes = nullptr ) const;

    /// empties the cache, must be called after modification of points or tris
    RMMESH_API void invalidateCaches();

    /// the number of derived queries currently stored in the cache
    [[nodiscard]] int cachedQueries() const { return cache_.size(); }

private:
    mutable MeshCache cache_;
};

} //namespace RM
