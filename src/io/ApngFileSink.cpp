#include "io/ApngFileSink.hpp"

#include "core/FileSystem.h"
#include "core/Log.h"
#include "io/PngEncoder.hpp"

namespace CardioMorph
{
    ApngFileSink::ApngFileSink( FileSystem& fileSystem, std::string path )
        : m_fileSystem( fileSystem )
        , m_path( std::move( path ) )
    {
    }

    Result ApngFileSink::Write( const AnimationArtifact& artifact )
    {
        if( m_path.empty() )
        {
            CM_ERROR( "[ApngFileSink] No output path given." );
            return Result::INVALID_ARGS;
        }

        // Encoded fully before the file is opened
        HeapArray<uint8_t> data;
        Result             res = PngEncoder::EncodeAnimation( artifact, data );
        if( res != Result::SUCCESS )
            return res;

        res = m_fileSystem.WriteFile( m_path, data.data(), data.size() );
        if( res != Result::SUCCESS )
            return res;

        m_bytesWritten = data.size();
        CM_INFO( "[ApngFileSink] Wrote {} frames ({} bytes) to {}", artifact.frames.size(), data.size(),
                 m_fileSystem.ResolvePath( m_path ).string() );
        return Result::SUCCESS;
    }
} // namespace CardioMorph
