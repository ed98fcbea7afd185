#include "io/PngEncoder.hpp"

#include "core/Log.h"
#include <cstring>
#include <limits>
#include <zlib.h>

namespace CardioMorph
{
    namespace
    {
        enum class DisposeOp : uint8_t
        {
            NONE       = 0,
            BACKGROUND = 1,
            PREVIOUS   = 2,
        };

        enum class BlendOp : uint8_t
        {
            SOURCE = 0,
            OVER   = 1,
        };

        /**
         * @brief Appends length-prefixed, CRC-terminated chunks to a byte stream.
         */
        class ChunkWriter
        {
        public:
            explicit ChunkWriter( HeapArray<uint8_t>& buffer )
                : m_buffer( buffer )
            {
            }

            void AppendBytes( const void* data, size_t size )
            {
                const uint8_t* bytes = static_cast<const uint8_t*>( data );
                m_buffer.insert( m_buffer.end(), bytes, bytes + size );
            }

            void AppendByte( uint8_t value ) { m_buffer.push_back( value ); }

            void AppendU16( uint16_t value )
            {
                AppendByte( static_cast<uint8_t>( value >> 8 ) );
                AppendByte( static_cast<uint8_t>( value ) );
            }

            void AppendU32( uint32_t value )
            {
                AppendByte( static_cast<uint8_t>( value >> 24 ) );
                AppendByte( static_cast<uint8_t>( value >> 16 ) );
                AppendByte( static_cast<uint8_t>( value >> 8 ) );
                AppendByte( static_cast<uint8_t>( value ) );
            }

            void BeginChunk( const char* type )
            {
                m_chunkOffset = m_buffer.size();
                AppendU32( 0 ); // space for length
                AppendBytes( type, 4 );
            }

            void EndChunk()
            {
                size_t   typeOffset = m_chunkOffset + 4;
                uint32_t length     = static_cast<uint32_t>( m_buffer.size() - typeOffset - 4 );

                m_buffer[ m_chunkOffset ]     = static_cast<uint8_t>( length >> 24 );
                m_buffer[ m_chunkOffset + 1 ] = static_cast<uint8_t>( length >> 16 );
                m_buffer[ m_chunkOffset + 2 ] = static_cast<uint8_t>( length >> 8 );
                m_buffer[ m_chunkOffset + 3 ] = static_cast<uint8_t>( length );

                // CRC covers type + data
                uLong crc = crc32( 0L, Z_NULL, 0 );
                crc       = crc32( crc, m_buffer.data() + typeOffset, static_cast<uInt>( length + 4 ) );
                AppendU32( static_cast<uint32_t>( crc ) );
            }

        private:
            HeapArray<uint8_t>& m_buffer;
            size_t              m_chunkOffset = 0;
        };

        void WriteHeader( ChunkWriter& writer, uint32_t width, uint32_t height )
        {
            writer.AppendBytes( PngEncoder::SIGNATURE, sizeof( PngEncoder::SIGNATURE ) );

            writer.BeginChunk( "IHDR" );
            writer.AppendU32( width );
            writer.AppendU32( height );
            writer.AppendByte( 8 ); // bit depth
            writer.AppendByte( 2 ); // colour type: truecolour
            writer.AppendByte( 0 ); // compression
            writer.AppendByte( 0 ); // filter
            writer.AppendByte( 0 ); // interlace
            writer.EndChunk();
        }

        void WriteEnd( ChunkWriter& writer )
        {
            writer.BeginChunk( "IEND" );
            writer.EndChunk();
        }
    } // namespace

    Result PngEncoder::Deflate( const RasterFrame& frame, HeapArray<uint8_t>& outData )
    {
        const size_t rowBytes = static_cast<size_t>( frame.GetWidth() ) * 3;
        const auto&  pixels   = frame.GetPixels();

        if( pixels.size() != rowBytes * frame.GetHeight() )
        {
            CM_ERROR( "[PngEncoder] Frame buffer holds {} bytes, expected {}", pixels.size(), rowBytes * frame.GetHeight() );
            return Result::INVALID_ARGS;
        }

        // Every scanline is prefixed with its filter type (0 = None)
        HeapArray<uint8_t> raw;
        raw.reserve( ( rowBytes + 1 ) * frame.GetHeight() );
        for( uint32_t y = 0; y < frame.GetHeight(); ++y )
        {
            raw.push_back( 0 );
            raw.insert( raw.end(), pixels.begin() + y * rowBytes, pixels.begin() + ( y + 1 ) * rowBytes );
        }

        uLongf compressedSize = compressBound( static_cast<uLong>( raw.size() ) );
        outData.resize( compressedSize );

        int status = compress2( outData.data(), &compressedSize, raw.data(), static_cast<uLong>( raw.size() ), Z_DEFAULT_COMPRESSION );
        if( status != Z_OK )
        {
            CM_ERROR( "[PngEncoder] zlib compress2 failed with status {}", status );
            outData.clear();
            return status == Z_MEM_ERROR ? Result::OUT_OF_MEMORY : Result::FAIL;
        }

        outData.resize( compressedSize );
        return Result::SUCCESS;
    }

    Result PngEncoder::EncodeFrame( const RasterFrame& frame, HeapArray<uint8_t>& outData )
    {
        if( frame.GetWidth() == 0 || frame.GetHeight() == 0 )
            return Result::INVALID_ARGS;

        HeapArray<uint8_t> compressed;
        Result             res = Deflate( frame, compressed );
        if( res != Result::SUCCESS )
            return res;

        HeapArray<uint8_t> buffer;
        ChunkWriter        writer( buffer );
        WriteHeader( writer, frame.GetWidth(), frame.GetHeight() );

        writer.BeginChunk( "IDAT" );
        writer.AppendBytes( compressed.data(), compressed.size() );
        writer.EndChunk();

        WriteEnd( writer );

        outData = std::move( buffer );
        return Result::SUCCESS;
    }

    Result PngEncoder::EncodeAnimation( const AnimationArtifact& artifact, HeapArray<uint8_t>& outData )
    {
        if( artifact.frames.empty() )
        {
            CM_ERROR( "[PngEncoder] Refusing to encode an animation without frames." );
            return Result::INVALID_ARGS;
        }

        if( artifact.frameDurationMs > std::numeric_limits<uint16_t>::max() )
        {
            CM_ERROR( "[PngEncoder] Frame duration {} ms exceeds the APNG delay range.", artifact.frameDurationMs );
            return Result::INVALID_ARGS;
        }

        const auto& first = artifact.frames.front();
        if( !first || first->GetWidth() == 0 || first->GetHeight() == 0 )
            return Result::INVALID_ARGS;

        const uint32_t width  = first->GetWidth();
        const uint32_t height = first->GetHeight();

        for( const auto& frame: artifact.frames )
        {
            if( !frame || frame->GetWidth() != width || frame->GetHeight() != height )
            {
                CM_ERROR( "[PngEncoder] All frames of an animation must be {}x{}.", width, height );
                return Result::INVALID_ARGS;
            }
        }

        HeapArray<uint8_t> buffer;
        ChunkWriter        writer( buffer );
        WriteHeader( writer, width, height );

        writer.BeginChunk( "acTL" );
        writer.AppendU32( static_cast<uint32_t>( artifact.frames.size() ) );
        writer.AppendU32( artifact.loop ? 0u : 1u ); // num_plays, 0 = infinite
        writer.EndChunk();

        // fcTL and fdAT share one sequence counter
        uint32_t sequence = 0;
        for( size_t i = 0; i < artifact.frames.size(); ++i )
        {
            HeapArray<uint8_t> compressed;
            Result             res = Deflate( *artifact.frames[ i ], compressed );
            if( res != Result::SUCCESS )
                return res;

            writer.BeginChunk( "fcTL" );
            writer.AppendU32( sequence++ );
            writer.AppendU32( width );
            writer.AppendU32( height );
            writer.AppendU32( 0 ); // x offset
            writer.AppendU32( 0 ); // y offset
            writer.AppendU16( static_cast<uint16_t>( artifact.frameDurationMs ) );
            writer.AppendU16( 1000 );
            writer.AppendByte( static_cast<uint8_t>( DisposeOp::NONE ) );
            writer.AppendByte( static_cast<uint8_t>( BlendOp::SOURCE ) );
            writer.EndChunk();

            if( i == 0 )
            {
                writer.BeginChunk( "IDAT" );
            }
            else
            {
                writer.BeginChunk( "fdAT" );
                writer.AppendU32( sequence++ );
            }
            writer.AppendBytes( compressed.data(), compressed.size() );
            writer.EndChunk();
        }

        WriteEnd( writer );

        CM_TRACE( "[PngEncoder] Encoded {} frames ({} bytes)", artifact.frames.size(), buffer.size() );
        outData = std::move( buffer );
        return Result::SUCCESS;
    }
} // namespace CardioMorph
