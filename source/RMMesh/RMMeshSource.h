#pragma once

#include "RMMeshFwd.h"
#include "RMExpected.h"
#include <optional>
#include <string>
#include <string_view>

namespace RM
{

/// file formats a mesh can be loaded from
enum class MeshFormat
{
    STL, ///< binary or ASCII triangle soup
    OBJ, ///< ASCII format with optional materials and groups
    PLY  ///< binary or ASCII format with ASCII header
};

/// finds the format by file extension or format name: case is ignored, as well as surrounding spaces and leading dot,
/// so "stl", ".STL" and " .StL " all give MeshFormat::STL
[[nodiscard]] RMMESH_API Expected<MeshFormat> meshFormatFromString( std::string_view s );

/// information about where the mesh came from, filled by format loaders
struct MeshSource
{
    std::optional<MeshFormat> format;

    /// many formats have a header which would otherwise be discarded
    std::optional<std::string> header;
};

} //namespace RM
