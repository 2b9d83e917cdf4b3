#include "RMMeshCache.h"

namespace RM
{

void MeshCache::reset()
{
    std::unique_lock lock( mutex_ );
    facesCross_.reset();
    faceNormals_.reset();
    facesArea_.reset();
    area_.reset();
    edges_.reset();
    faceAdjacency_.reset();
    faceAdjacencyAngles_.reset();
}

int MeshCache::size() const
{
    std::shared_lock lock( mutex_ );
    return int( facesCross_.has_value() ) + int( faceNormals_.has_value() ) + int( facesArea_.has_value() )
        + int( area_.has_value() ) + int( edges_.has_value() ) + int( faceAdjacency_.has_value() )
        + int( faceAdjacencyAngles_.has_value() );
}

} //namespace RM
