#include "core/FileSystem.h"

#include "core/Log.h"
#include <fstream>
#include <system_error>

namespace CardioMorph
{
    FileSystem::FileSystem() = default;

    FileSystem::~FileSystem()
    {
        Shutdown();
    }

    Result FileSystem::Initialize( const std::filesystem::path& outputRoot )
    {
        if( m_initialized )
        {
            CM_WARN( "FileSystem: Already initialized with root '{}'", m_outputRoot.string() );
            return Result::SUCCESS;
        }

        if( outputRoot.empty() )
        {
            CM_ERROR( "FileSystem: Output root cannot be empty." );
            return Result::INVALID_ARGS;
        }

        std::error_code ec;
        if( !std::filesystem::exists( outputRoot, ec ) )
        {
            std::filesystem::create_directories( outputRoot, ec );
            if( ec )
            {
                CM_ERROR( "FileSystem: Failed to create output root '{}': {}", outputRoot.string(), ec.message() );
                return Result::FAIL;
            }
        }
        else if( !std::filesystem::is_directory( outputRoot, ec ) )
        {
            CM_ERROR( "FileSystem: Output root '{}' is not a directory.", outputRoot.string() );
            return Result::INVALID_ARGS;
        }

        m_outputRoot = std::filesystem::absolute( outputRoot, ec );
        if( ec )
            m_outputRoot = outputRoot;
        m_initialized = true;

        CM_INFO( "FileSystem: Output root '{}'", m_outputRoot.string() );
        return Result::SUCCESS;
    }

    void FileSystem::Shutdown()
    {
        m_outputRoot.clear();
        m_initialized = false;
    }

    std::filesystem::path FileSystem::ResolvePath( const std::string& relativePath ) const
    {
        std::filesystem::path path( relativePath );
        if( path.is_absolute() )
            return path;

        // Operator / in std::filesystem automatically handles separator slashes
        return m_outputRoot / path;
    }

    bool FileSystem::FileExists( const std::string& relativePath ) const
    {
        std::error_code ec;
        return std::filesystem::is_regular_file( ResolvePath( relativePath ), ec );
    }

    Result FileSystem::ReadFile( const std::string& relativePath, HeapArray<uint8_t>& outData ) const
    {
        std::filesystem::path fullPath = ResolvePath( relativePath );

        std::ifstream file( fullPath, std::ios::binary | std::ios::ate );
        if( !file.is_open() )
        {
            CM_ERROR( "FileSystem: Failed to open '{}' for reading.", fullPath.string() );
            return Result::FAIL;
        }

        std::streamsize size = file.tellg();
        if( size < 0 )
        {
            CM_ERROR( "FileSystem: Failed to query size of '{}'.", fullPath.string() );
            return Result::FAIL;
        }
        file.seekg( 0, std::ios::beg );

        outData.resize( static_cast<size_t>( size ) );
        if( size > 0 && !file.read( reinterpret_cast<char*>( outData.data() ), size ) )
        {
            outData.clear();
            CM_ERROR( "FileSystem: Short read on '{}'.", fullPath.string() );
            return Result::FAIL;
        }

        return Result::SUCCESS;
    }

    Result FileSystem::WriteFile( const std::string& relativePath, const void* pData, size_t size )
    {
        if( !m_initialized )
        {
            CM_ERROR( "FileSystem: WriteFile called before Initialize." );
            return Result::FAIL;
        }

        if( pData == nullptr && size > 0 )
            return Result::INVALID_ARGS;

        std::filesystem::path fullPath = ResolvePath( relativePath );

        // Create nested directories on demand
        std::error_code ec;
        if( fullPath.has_parent_path() )
        {
            std::filesystem::create_directories( fullPath.parent_path(), ec );
            if( ec )
            {
                CM_ERROR( "FileSystem: Failed to create '{}': {}", fullPath.parent_path().string(), ec.message() );
                return Result::FAIL;
            }
        }

        std::ofstream file( fullPath, std::ios::binary | std::ios::trunc );
        if( !file.is_open() )
        {
            CM_ERROR( "FileSystem: Failed to open '{}' for writing.", fullPath.string() );
            return Result::FAIL;
        }

        file.write( static_cast<const char*>( pData ), static_cast<std::streamsize>( size ) );
        if( !file.good() )
        {
            CM_ERROR( "FileSystem: Short write on '{}'.", fullPath.string() );
            return Result::FAIL;
        }

        CM_TRACE( "FileSystem: Wrote {} bytes to '{}'", size, fullPath.string() );
        return Result::SUCCESS;
    }

} // namespace CardioMorph
