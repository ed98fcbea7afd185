#include "core/FileSystem.h"
#include "io/ApngFileSink.hpp"
#include "io/PngEncoder.hpp"
#include <cstring>
#include <filesystem>
#include <gtest/gtest.h>
#include <iterator>
#include <string>
#include <zlib.h>

using namespace CardioMorph;

namespace
{
    struct Chunk
    {
        std::string        type;
        HeapArray<uint8_t> data;
        bool               crcValid = false;
    };

    uint32_t ReadU32( const uint8_t* p ) { return ( uint32_t( p[ 0 ] ) << 24 ) | ( uint32_t( p[ 1 ] ) << 16 ) | ( uint32_t( p[ 2 ] ) << 8 ) | p[ 3 ]; }

    uint16_t ReadU16( const uint8_t* p ) { return static_cast<uint16_t>( ( p[ 0 ] << 8 ) | p[ 1 ] ); }

    // Splits a PNG stream into chunks, verifying each CRC
    HeapArray<Chunk> ParseChunks( const HeapArray<uint8_t>& png )
    {
        HeapArray<Chunk> chunks;
        size_t           offset = sizeof( PngEncoder::SIGNATURE );

        while( offset + 12 <= png.size() )
        {
            uint32_t length = ReadU32( &png[ offset ] );
            if( offset + 12 + length > png.size() )
                break;

            Chunk chunk;
            chunk.type.assign( reinterpret_cast<const char*>( &png[ offset + 4 ] ), 4 );
            chunk.data.assign( png.begin() + offset + 8, png.begin() + offset + 8 + length );

            uLong crc      = crc32( 0L, Z_NULL, 0 );
            crc            = crc32( crc, &png[ offset + 4 ], length + 4 );
            chunk.crcValid = static_cast<uint32_t>( crc ) == ReadU32( &png[ offset + 8 + length ] );

            chunks.push_back( std::move( chunk ) );
            offset += 12 + length;
        }

        return chunks;
    }

    Ref<const RasterFrame> MakeFrame( uint32_t width, uint32_t height, uint8_t seed )
    {
        HeapArray<uint8_t> pixels( static_cast<size_t>( width ) * height * 3 );
        for( size_t i = 0; i < pixels.size(); ++i )
            pixels[ i ] = static_cast<uint8_t>( i * 7 + seed );

        return CreateRef<const RasterFrame>( width, height, std::move( pixels ), 1.0, "test" );
    }

    AnimationArtifact MakeArtifact( uint32_t frameCount, uint32_t durationMs )
    {
        AnimationArtifact artifact;
        artifact.frameDurationMs = durationMs;
        for( uint32_t i = 0; i < frameCount; ++i )
            artifact.frames.push_back( MakeFrame( 6, 4, static_cast<uint8_t>( i ) ) );
        return artifact;
    }
} // namespace

TEST( PngEncoderTest, StillFrameLayout )
{
    auto               frame = MakeFrame( 5, 3, 11 );
    HeapArray<uint8_t> png;
    ASSERT_EQ( PngEncoder::EncodeFrame( *frame, png ), Result::SUCCESS );

    ASSERT_GT( png.size(), sizeof( PngEncoder::SIGNATURE ) );
    EXPECT_EQ( std::memcmp( png.data(), PngEncoder::SIGNATURE, sizeof( PngEncoder::SIGNATURE ) ), 0 );

    HeapArray<Chunk> chunks = ParseChunks( png );
    ASSERT_EQ( chunks.size(), 3u );
    EXPECT_EQ( chunks[ 0 ].type, "IHDR" );
    EXPECT_EQ( chunks[ 1 ].type, "IDAT" );
    EXPECT_EQ( chunks[ 2 ].type, "IEND" );
    for( const auto& chunk: chunks )
        EXPECT_TRUE( chunk.crcValid ) << chunk.type;

    const auto& ihdr = chunks[ 0 ].data;
    ASSERT_EQ( ihdr.size(), 13u );
    EXPECT_EQ( ReadU32( &ihdr[ 0 ] ), 5u );
    EXPECT_EQ( ReadU32( &ihdr[ 4 ] ), 3u );
    EXPECT_EQ( ihdr[ 8 ], 8 );
    EXPECT_EQ( ihdr[ 9 ], 2 );
}

TEST( PngEncoderTest, ImageDataRoundTripsThroughZlib )
{
    auto               frame = MakeFrame( 4, 3, 5 );
    HeapArray<uint8_t> png;
    ASSERT_EQ( PngEncoder::EncodeFrame( *frame, png ), Result::SUCCESS );

    HeapArray<Chunk> chunks = ParseChunks( png );
    ASSERT_GE( chunks.size(), 2u );

    const size_t       rowBytes = 4 * 3;
    HeapArray<uint8_t> raw( ( rowBytes + 1 ) * 3 );
    uLongf             rawSize = static_cast<uLongf>( raw.size() );
    ASSERT_EQ( uncompress( raw.data(), &rawSize, chunks[ 1 ].data.data(), static_cast<uLong>( chunks[ 1 ].data.size() ) ), Z_OK );
    ASSERT_EQ( rawSize, raw.size() );

    for( uint32_t y = 0; y < 3; ++y )
    {
        EXPECT_EQ( raw[ y * ( rowBytes + 1 ) ], 0 ); // filter: none
        for( size_t i = 0; i < rowBytes; ++i )
            EXPECT_EQ( raw[ y * ( rowBytes + 1 ) + 1 + i ], frame->GetPixels()[ y * rowBytes + i ] );
    }
}

TEST( PngEncoderTest, AnimationChunkOrder )
{
    HeapArray<uint8_t> png;
    ASSERT_EQ( PngEncoder::EncodeAnimation( MakeArtifact( 3, 250 ), png ), Result::SUCCESS );

    HeapArray<Chunk> chunks = ParseChunks( png );
    const char*      expected[] = { "IHDR", "acTL", "fcTL", "IDAT", "fcTL", "fdAT", "fcTL", "fdAT", "IEND" };

    ASSERT_EQ( chunks.size(), std::size( expected ) );
    for( size_t i = 0; i < chunks.size(); ++i )
    {
        EXPECT_EQ( chunks[ i ].type, expected[ i ] );
        EXPECT_TRUE( chunks[ i ].crcValid ) << chunks[ i ].type;
    }
}

TEST( PngEncoderTest, AnimationControlAndTiming )
{
    HeapArray<uint8_t> png;
    ASSERT_EQ( PngEncoder::EncodeAnimation( MakeArtifact( 4, 125 ), png ), Result::SUCCESS );

    HeapArray<Chunk> chunks = ParseChunks( png );

    uint32_t expectedSequence = 0;
    uint32_t frameControls    = 0;
    for( const auto& chunk: chunks )
    {
        if( chunk.type == "acTL" )
        {
            EXPECT_EQ( ReadU32( &chunk.data[ 0 ] ), 4u ); // num_frames
            EXPECT_EQ( ReadU32( &chunk.data[ 4 ] ), 0u ); // num_plays: loop forever
        }
        else if( chunk.type == "fcTL" )
        {
            ASSERT_EQ( chunk.data.size(), 26u );
            EXPECT_EQ( ReadU32( &chunk.data[ 0 ] ), expectedSequence++ );
            EXPECT_EQ( ReadU32( &chunk.data[ 4 ] ), 6u );
            EXPECT_EQ( ReadU32( &chunk.data[ 8 ] ), 4u );
            EXPECT_EQ( ReadU16( &chunk.data[ 20 ] ), 125 );
            EXPECT_EQ( ReadU16( &chunk.data[ 22 ] ), 1000 );
            frameControls++;
        }
        else if( chunk.type == "fdAT" )
        {
            EXPECT_EQ( ReadU32( &chunk.data[ 0 ] ), expectedSequence++ );
        }
    }

    EXPECT_EQ( frameControls, 4u );
}

TEST( PngEncoderTest, NonLoopingPlaysOnce )
{
    AnimationArtifact artifact = MakeArtifact( 2, 500 );
    artifact.loop              = false;

    HeapArray<uint8_t> png;
    ASSERT_EQ( PngEncoder::EncodeAnimation( artifact, png ), Result::SUCCESS );

    for( const auto& chunk: ParseChunks( png ) )
        if( chunk.type == "acTL" )
            EXPECT_EQ( ReadU32( &chunk.data[ 4 ] ), 1u );
}

TEST( PngEncoderTest, RejectsInvalidArtifacts )
{
    HeapArray<uint8_t> png;

    EXPECT_EQ( PngEncoder::EncodeAnimation( MakeArtifact( 0, 250 ), png ), Result::INVALID_ARGS );
    EXPECT_TRUE( png.empty() );

    AnimationArtifact mismatched = MakeArtifact( 2, 250 );
    mismatched.frames.push_back( MakeFrame( 7, 4, 0 ) );
    EXPECT_EQ( PngEncoder::EncodeAnimation( mismatched, png ), Result::INVALID_ARGS );

    AnimationArtifact withNull = MakeArtifact( 2, 250 );
    withNull.frames.push_back( nullptr );
    EXPECT_EQ( PngEncoder::EncodeAnimation( withNull, png ), Result::INVALID_ARGS );

    EXPECT_EQ( PngEncoder::EncodeAnimation( MakeArtifact( 2, 70000 ), png ), Result::INVALID_ARGS );
    EXPECT_TRUE( png.empty() );
}

class ApngFileSinkTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_root = std::filesystem::current_path() / "temp_sink_env";
        if( std::filesystem::exists( m_root ) )
            std::filesystem::remove_all( m_root );

        ASSERT_EQ( m_fileSystem.Initialize( m_root ), Result::SUCCESS );
    }

    void TearDown() override
    {
        m_fileSystem.Shutdown();
        std::filesystem::remove_all( m_root );
    }

    FileSystem            m_fileSystem;
    std::filesystem::path m_root;
};

TEST_F( ApngFileSinkTest, WritesEncodedAnimation )
{
    ApngFileSink sink( m_fileSystem, "out/animation.png" );
    ASSERT_EQ( sink.Write( MakeArtifact( 3, 250 ) ), Result::SUCCESS );

    HeapArray<uint8_t> data;
    ASSERT_EQ( m_fileSystem.ReadFile( "out/animation.png", data ), Result::SUCCESS );
    EXPECT_EQ( data.size(), sink.GetBytesWritten() );
    ASSERT_GT( data.size(), sizeof( PngEncoder::SIGNATURE ) );
    EXPECT_EQ( std::memcmp( data.data(), PngEncoder::SIGNATURE, sizeof( PngEncoder::SIGNATURE ) ), 0 );
}

TEST_F( ApngFileSinkTest, EmptyArtifactCreatesNoFile )
{
    ApngFileSink sink( m_fileSystem, "empty.png" );
    EXPECT_EQ( sink.Write( AnimationArtifact() ), Result::INVALID_ARGS );
    EXPECT_FALSE( m_fileSystem.FileExists( "empty.png" ) );
}
