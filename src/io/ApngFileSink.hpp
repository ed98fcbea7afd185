#pragma once
#include "io/AnimationSink.hpp"
#include <string>

namespace CardioMorph
{
    /**
     * @brief Encodes an artifact as Animated PNG and stores it through the FileSystem.
     */
    class ApngFileSink : public IAnimationSink
    {
    public:
        ApngFileSink( FileSystem& fileSystem, std::string path );

        Result Write( const AnimationArtifact& artifact ) override;

        const std::string& GetPath() const { return m_path; }
        size_t             GetBytesWritten() const { return m_bytesWritten; }

    private:
        FileSystem& m_fileSystem;
        std::string m_path;
        size_t      m_bytesWritten = 0;
    };
} // namespace CardioMorph
