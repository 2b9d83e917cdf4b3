#pragma once

#include "RMMeshFwd.h"
#include "RMColor.h"
#include "RMId.h"
#include "RMVector.h"
#include "RMVector2.h"
#include "RMVector3.h"
#include <vector>

namespace RM
{

/// \addtogroup MeshGroup
/// \{

/// optional per-element data of a mesh, where every element is a vertex (I = VertId) or a face (I = FaceId);
/// each kind may have several lists (e.g. several texture coordinate sets), and the application picks the one to use;
/// every list is expected to have one value per element
template <typename I>
struct Attributes
{
    /// texture coordinates, typically in [0,1]
    std::vector<Vector<Vector2d, I>> uvs;
    /// index of the material assigned to the element
    std::vector<Vector<int, I>> materials;
    /// index of the group the element belongs to
    std::vector<Vector<int, I>> groupings;
    std::vector<Vector<Color, I>> colors;
    std::vector<Vector<Vector3d, I>> normals;

    /// true if there are no lists of any kind
    [[nodiscard]] bool empty() const
    {
        return uvs.empty() && materials.empty() && groupings.empty() && colors.empty() && normals.empty();
    }
};

/// \}

} //namespace RM
