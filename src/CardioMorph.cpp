#include "CardioMorph.h"

#include "animation/AnimationAssembler.hpp"
#include "animation/FrameCache.hpp"
#include "biology/CharacteristicInterpolator.hpp"
#include "core/Base.hpp"
#include "core/FileSystem.h"
#include "core/Log.h"
#include "core/Random.hpp"
#include "core/Timer.hpp"
#include "io/ApngFileSink.hpp"
#include "io/PngEncoder.hpp"
#include "renderer/FrameComposer.hpp"
#include "simulation/Timeline.hpp"
#include <cmath>

namespace CardioMorph
{

    // Impl
    struct CardioMorph::Impl
    {
        CardioMorphConfig                 m_config;
        bool                              m_initialized;
        Scope<FileSystem>                 m_fileSystem;
        Scope<Random>                     m_random;
        Scope<CharacteristicInterpolator> m_interpolator;
        Scope<FrameComposer>              m_composer;
        Scope<AnimationAssembler>         m_assembler;
        Scope<FrameCache>                 m_cache;

        Impl()
            : m_initialized( false )
        {
        }

        Result Initialize( const CardioMorphConfig& config )
        {
            if( m_initialized )
                return Result::SUCCESS;

            // 1. Config
            m_config = config;

            // 2. Logger
            // An application that configured logging keeps its level unless debug mode asks for trace
            if( !Log::IsInitialized() )
            {
                LogConfig logConfig;
                logConfig.level = m_config.debugMode ? spdlog::level::trace : spdlog::level::info;
                Log::Init( logConfig );
            }
            else if( m_config.debugMode )
            {
                Log::SetLevel( spdlog::level::trace );
            }
            CM_INFO( "Initializing CardioMorph {}...", VERSION_STRING );

            if( m_config.frameWidth == 0 || m_config.frameHeight == 0 )
            {
                CM_ERROR( "Invalid frame size {}x{}", m_config.frameWidth, m_config.frameHeight );
                return Result::INVALID_ARGS;
            }

            // 3. FileSystem
            std::filesystem::path outputRoot = std::filesystem::current_path();
            if( m_config.outputDirectory && m_config.outputDirectory[ 0 ] != '\0' )
                outputRoot = m_config.outputDirectory;

            m_fileSystem = CreateScope<FileSystem>();
            Result fsRes = m_fileSystem->Initialize( outputRoot );
            if( fsRes != Result::SUCCESS )
            {
                m_fileSystem.reset();
                CM_ERROR( "Critical: FileSystem could not be initialized." );
                return fsRes;
            }

            // 4. Random source
            if( m_config.seed != 0 )
                m_random = CreateScope<Random>( m_config.seed );
            else
                m_random = CreateScope<Random>();
            CM_INFO( "Random seed: {}", m_random->GetSeed() );

            // 5. Rendering pipeline
            FrameComposerConfig composerConfig;
            composerConfig.drawLabels = m_config.drawLabels;

            AnimationAssemblerConfig assemblerConfig;
            assemblerConfig.frameWidth  = m_config.frameWidth;
            assemblerConfig.frameHeight = m_config.frameHeight;

            m_interpolator = CreateScope<CharacteristicInterpolator>();
            m_composer     = CreateScope<FrameComposer>( composerConfig );
            m_assembler    = CreateScope<AnimationAssembler>( *m_interpolator, *m_composer, *m_random, assemblerConfig );
            m_cache        = CreateScope<FrameCache>();

            CM_INFO( "Frame size {}x{}, cache {}, labels {}", m_config.frameWidth, m_config.frameHeight,
                     m_config.enableCache ? "on" : "off", m_config.drawLabels ? "on" : "off" );

            m_initialized = true;
            return Result::SUCCESS;
        }

        void Shutdown()
        {
            if( !m_initialized )
                return;

            CM_INFO( "Shutting down..." );

            // Assembler references the interpolator, composer and random source
            m_assembler.reset();
            m_composer.reset();
            m_interpolator.reset();
            m_cache.reset();
            m_random.reset();

            if( m_fileSystem )
            {
                m_fileSystem->Shutdown();
                m_fileSystem.reset();
            }

            m_initialized = false;
        }

        Result RenderPreview( float64_t day, Ref<const RasterFrame>& outFrame )
        {
            if( !std::isfinite( day ) || day < 1.0 )
            {
                CM_ERROR( "Preview day {} is outside the supported axis.", day );
                return Result::INVALID_ARGS;
            }

            const float64_t previewDay = Timeline::RoundToHalfDay( day );

            if( m_config.enableCache )
            {
                auto cached = m_cache->GetPreview( previewDay, m_config.frameWidth, m_config.frameHeight );
                if( cached )
                {
                    CM_TRACE( "Preview day {:.1f} served from cache", previewDay );
                    outFrame = cached;
                    return Result::SUCCESS;
                }
            }

            CharacteristicRecord record;
            CM_RETURN_IF_FAILED( m_interpolator->Interpolate( previewDay, record ) );

            Timer                  timer;
            Ref<const RasterFrame> frame;
            CM_RETURN_IF_FAILED( m_composer->Compose( record, Timeline::TimePointForDay( previewDay ), m_config.frameWidth,
                                                      m_config.frameHeight, *m_random, frame ) );
            CM_TRACE( "Preview day {:.1f} rendered in {:.2f} ms", previewDay, timer.ElapsedMillis() );

            if( m_config.enableCache )
                m_cache->StorePreview( previewDay, m_config.frameWidth, m_config.frameHeight, frame );

            outFrame = frame;
            return Result::SUCCESS;
        }

        Result GenerateAnimation( DayRange range, AnimationSpeed speed, Ref<const AnimationArtifact>& outArtifact,
                                  const ProgressCallback& progress )
        {
            CM_RETURN_IF_FAILED( AnimationAssembler::ValidateRange( range ) );

            if( m_config.enableCache )
            {
                auto cached = m_cache->GetArtifact( range, speed, m_config.frameWidth, m_config.frameHeight );
                if( cached )
                {
                    CM_INFO( "Animation {:.2f}-{:.2f} ({}) served from cache", range.min, range.max, AnimationAssembler::ToString( speed ) );
                    if( progress )
                        progress( static_cast<uint32_t>( cached->frames.size() ), static_cast<uint32_t>( cached->frames.size() ) );
                    outArtifact = cached;
                    return Result::SUCCESS;
                }
            }

            Ref<const AnimationArtifact> artifact;
            CM_RETURN_IF_FAILED( m_assembler->Assemble( range, speed, artifact, progress ) );

            if( m_config.enableCache )
                m_cache->StoreArtifact( range, speed, m_config.frameWidth, m_config.frameHeight, artifact );

            outArtifact = artifact;
            return Result::SUCCESS;
        }

        Result ExportAnimation( const AnimationArtifact& artifact, const std::string& path )
        {
            if( artifact.frames.empty() )
            {
                CM_ERROR( "Cannot export an animation without frames." );
                return Result::INVALID_ARGS;
            }

            ApngFileSink sink( *m_fileSystem, path );
            return sink.Write( artifact );
        }

        Result ExportFrame( const RasterFrame& frame, const std::string& path )
        {
            HeapArray<uint8_t> data;
            CM_RETURN_IF_FAILED( PngEncoder::EncodeFrame( frame, data ) );
            CM_RETURN_IF_FAILED( m_fileSystem->WriteFile( path, data.data(), data.size() ) );

            CM_INFO( "Wrote frame (day {:.1f}) to {}", frame.GetDay(), m_fileSystem->ResolvePath( path ).string() );
            return Result::SUCCESS;
        }
    };

    // --- PUBLIC API ---

    CardioMorph::CardioMorph()
        : m_impl( CreateScope<Impl>() )
    {
    }

    CardioMorph::~CardioMorph() { m_impl->Shutdown(); }

    Result CardioMorph::Initialize( const CardioMorphConfig& config ) { return m_impl->Initialize( config ); }

    void CardioMorph::Shutdown() { m_impl->Shutdown(); }

    Result CardioMorph::GetCharacteristics( float64_t day, CharacteristicRecord& outRecord )
    {
        if( !m_impl->m_initialized )
            return Result::FAIL;

        return m_impl->m_interpolator->Interpolate( day, outRecord );
    }

    Result CardioMorph::RenderPreview( float64_t day, Ref<const RasterFrame>& outFrame )
    {
        if( !m_impl->m_initialized )
            return Result::FAIL;

        return m_impl->RenderPreview( day, outFrame );
    }

    Result CardioMorph::GenerateAnimation( const DayRange& range, AnimationSpeed speed, Ref<const AnimationArtifact>& outArtifact,
                                           const ProgressCallback& progress )
    {
        if( !m_impl->m_initialized )
            return Result::FAIL;

        return m_impl->GenerateAnimation( range, speed, outArtifact, progress );
    }

    Result CardioMorph::ExportAnimation( const AnimationArtifact& artifact, const std::string& path )
    {
        if( !m_impl->m_initialized )
            return Result::FAIL;

        return m_impl->ExportAnimation( artifact, path );
    }

    Result CardioMorph::ExportFrame( const RasterFrame& frame, const std::string& path )
    {
        if( !m_impl->m_initialized )
            return Result::FAIL;

        return m_impl->ExportFrame( frame, path );
    }

    bool CardioMorph::IsInitialized() const { return m_impl->m_initialized; }

    DayRange CardioMorph::GetPresetRange( DayRangePreset preset ) { return AnimationAssembler::PresetRange( preset ); }

    FileSystem* CardioMorph::GetFileSystem() const { return m_impl->m_fileSystem.get(); }

    const CardioMorphConfig& CardioMorph::GetConfig() const { return m_impl->m_config; }

} // namespace CardioMorph
