#pragma once

#include "RMMeshFwd.h"
#include "RMId.h"
#include "RMVector.h"
#include "RMVector3.h"
#include <mutex>
#include <optional>
#include <shared_mutex>

namespace RM
{

/// memoized derived queries of one Mesh;
/// each slot is computed at most once and then returned by reference until reset();
/// a copy of the cache is always empty, so every mesh instance owns an independent cache
class MeshCache
{
public:
    MeshCache() = default;
    MeshCache( const MeshCache & ) noexcept { }
    MeshCache & operator =( const MeshCache & ) { reset(); return *this; }

    /// returns the value stored in given slot; if the slot is empty,
    /// calls (creator) outside of the lock and stores its result unless another thread has stored its own value first
    template <typename T, typename F>
    const T & getOrCreate( std::optional<T> MeshCache::* slot, F && creator );

    /// empties all slots, invalidating previously returned references
    RMMESH_API void reset();

    /// the number of populated slots
    [[nodiscard]] RMMESH_API int size() const;

private:
    friend struct Mesh;

    std::optional<FaceVectors> facesCross_;
    std::optional<FaceVectors> faceNormals_;
    std::optional<FaceScalars> facesArea_;
    std::optional<double> area_;
    std::optional<std::vector<VertPair>> edges_;
    std::optional<std::vector<FacePair>> faceAdjacency_;
    std::optional<std::vector<double>> faceAdjacencyAngles_;

    mutable std::shared_mutex mutex_;
};

template <typename T, typename F>
const T & MeshCache::getOrCreate( std::optional<T> MeshCache::* slot, F && creator )
{
    {
        std::shared_lock readLock( mutex_ );
        if ( const auto & v = this->*slot )
            return *v;
    }

    T value = creator();

    std::unique_lock writeLock( mutex_ );
    auto & v = this->*slot;
    if ( !v )
        v = std::move( value );
    return *v;
}

} //namespace RM
