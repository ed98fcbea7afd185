#pragma once
#include "core/Core.h"
#include <filesystem>
#include <string>

namespace CardioMorph
{

    class CM_API FileSystem
    {
    public:
        FileSystem();
        ~FileSystem();

        /**
         * @brief Initializes the output file system.
         * @param outputRoot Directory every relative path is resolved against (read/write).
         * Created if it does not exist yet.
         */
        Result Initialize( const std::filesystem::path& outputRoot );
        void   Shutdown();

        // --- PUBLIC API ---

        Result ReadFile( const std::string& relativePath, HeapArray<uint8_t>& outData ) const;
        Result WriteFile( const std::string& relativePath, const void* pData, size_t size );

        bool FileExists( const std::string& relativePath ) const;

        /**
         * @brief Resolves a path against the output root.
         * Absolute paths are returned unchanged.
         */
        std::filesystem::path ResolvePath( const std::string& relativePath ) const;

        const std::filesystem::path& GetRoot() const { return m_outputRoot; }
        bool                         IsInitialized() const { return m_initialized; }

    private:
        std::filesystem::path m_outputRoot;
        bool                  m_initialized = false;
    };

} // namespace CardioMorph
