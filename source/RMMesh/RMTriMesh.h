#pragma once

#include "RMVector.h"
#include "RMId.h"
#include "RMVector3.h"

namespace RM
{

/// very simple structure for storing mesh of triangles only,
/// the form in which simplification receives and returns meshes
struct [[nodiscard]] TriMesh
{
    Triangulation tris;
    VertCoords points;
};

} //namespace RM
