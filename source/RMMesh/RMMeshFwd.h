#pragma once

// Check C++ version.
#ifdef _MSC_VER
#define RM_CPP_STANDARD_DATE _MSVC_LANG
#else
#define RM_CPP_STANDARD_DATE __cplusplus
#endif
// Note `201709`: GCC 10 sets it on `-std=c++20`.
#if RM_CPP_STANDARD_DATE < 201709
#error Must enable C++20 or newer!
#endif

#include <array>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include <parallel_hashmap/phmap_fwd_decl.h>

#ifdef _WIN32
#   ifdef RMMesh_EXPORTS
#       define RMMESH_API __declspec(dllexport)
#   else
#       define RMMESH_API __declspec(dllimport)
#   endif
#   define RMMESH_CLASS
#else
#   define RMMESH_API   __attribute__((visibility("default")))
// to fix undefined reference to `typeinfo/vtable`
#   define RMMESH_CLASS __attribute__((visibility("default")))
#endif

namespace RM
{

class RMMESH_CLASS FaceTag;
class RMMESH_CLASS VertTag;

template <typename T> class RMMESH_CLASS Id;
using FaceId = Id<FaceTag>;
using VertId = Id<VertTag>;

template <typename T, typename I> class RMMESH_CLASS Vector;

template <typename T> struct RMMESH_CLASS Vector2;
using Vector2d = Vector2<double>;

template <typename T> struct RMMESH_CLASS Vector3;
using Vector3d = Vector3<double>;

struct Color;

template <typename V> struct RMMESH_CLASS Box;
using Box3d = Box<Vector3d>;

using ThreeVertIds = std::array<VertId, 3>;
/// two vertices of an edge
using VertPair = std::pair<VertId, VertId>;
/// two faces sharing an edge
using FacePair = std::pair<FaceId, FaceId>;

using Triangulation = Vector<ThreeVertIds, FaceId>;
using VertCoords = Vector<Vector3d, VertId>;
using FaceVectors = Vector<Vector3d, FaceId>;
using FaceScalars = Vector<double, FaceId>;
using VertUVCoords = Vector<Vector2d, VertId>;

template <typename I> struct Attributes;
using VertAttributes = Attributes<VertId>;
using FaceAttributes = Attributes<FaceId>;

template <typename K, typename V, typename Hash = phmap::priv::hash_default_hash<K>, typename Eq = phmap::priv::hash_default_eq<K>>
using HashMap = phmap::flat_hash_map<K, V, Hash, Eq>;

struct QuadricMatrix;
struct TriMesh;
struct MeshSource;
class MeshCache;
struct Mesh;

/// called before each edge collapse with the vertex that stays, the vertex that disappears and the new position of the first one;
/// returning false prohibits the collapse
using PreCollapseCallback = std::function<bool( VertId kept, VertId removed, const Vector3d & newPos )>;

struct SimplifySettings;
struct SimplifyResult;
class SimplifyWorkingSet;

class Logger;
class Timer;

} //namespace RM
