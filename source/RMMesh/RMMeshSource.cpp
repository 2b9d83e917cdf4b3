#include "RMMeshSource.h"
#include "RMString.h"

namespace RM
{

Expected<MeshFormat> meshFormatFromString( std::string_view s )
{
    const auto key = toLower( std::string( trim( s ) ) );
    std::string_view clean = key;
    while ( !clean.empty() && clean.front() == '.' )
        clean.remove_prefix( 1 );
    clean = trim( clean );

    if ( clean == "stl" )
        return MeshFormat::STL;
    if ( clean == "obj" )
        return MeshFormat::OBJ;
    if ( clean == "ply" )
        return MeshFormat::PLY;
    return unexpected( stringUnsupportedFileExtension() + ": `" + std::string( clean ) + "`" );
}

} //namespace RM
