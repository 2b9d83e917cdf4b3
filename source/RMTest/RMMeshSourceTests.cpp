#include <gtest/gtest.h>
#include <RMMesh/RMMeshSource.h>
#include <RMMesh/RMString.h>

namespace RM
{

TEST( RMMesh, MeshFormatFromString )
{
    for ( auto s : { "stl", ".STL", "  .StL ", "Stl\t" } )
    {
        auto format = meshFormatFromString( s );
        ASSERT_TRUE( format.has_value() ) << s;
        EXPECT_EQ( *format, MeshFormat::STL );
    }
    EXPECT_EQ( meshFormatFromString( "obj" ).value(), MeshFormat::OBJ );
    EXPECT_EQ( meshFormatFromString( ".OBJ" ).value(), MeshFormat::OBJ );
    EXPECT_EQ( meshFormatFromString( " ply" ).value(), MeshFormat::PLY );

    auto unknown = meshFormatFromString( " .OFF " );
    ASSERT_FALSE( unknown.has_value() );
    EXPECT_EQ( unknown.error(), stringUnsupportedFileExtension() + ": `off`" );

    EXPECT_FALSE( meshFormatFromString( "" ).has_value() );
    EXPECT_FALSE( meshFormatFromString( "st l" ).has_value() );
    EXPECT_FALSE( meshFormatFromString( "stl.obj" ).has_value() );
}

TEST( RMMesh, MeshSourceDefault )
{
    MeshSource source;
    EXPECT_FALSE( source.format.has_value() );
    EXPECT_FALSE( source.header.has_value() );

    source.format = MeshFormat::PLY;
    source.header = "ply\nformat ascii 1.0";
    auto copy = source;
    EXPECT_EQ( copy.format, MeshFormat::PLY );
    EXPECT_EQ( copy.header, source.header );
}

TEST( RMMesh, StringTrim )
{
    EXPECT_EQ( trim( "  a b \t\n" ), "a b" );
    EXPECT_EQ( trimLeft( "  a b " ), "a b " );
    EXPECT_EQ( trimRight( "  a b " ), "  a b" );
    EXPECT_EQ( trim( "   " ), "" );
    EXPECT_EQ( toLower( "MeSh.STL" ), "mesh.stl" );
}

} //namespace RM
