#include <CLI/CLI.hpp>
#include <CardioMorph.h>
#include <core/Log.h>
#include <exception>
#include <map>
#include <optional>
#include <spdlog/fmt/fmt.h>
#include <string>

namespace
{
    struct Options
    {
        CardioMorph::DayRangePreset    preset = CardioMorph::DayRangePreset::ALL_DAYS;
        std::optional<double>          minDay;
        std::optional<double>          maxDay;
        CardioMorph::AnimationSpeed    speed = CardioMorph::AnimationSpeed::MEDIUM;
        std::string                    output;
        std::optional<double>          previewDay;
        CardioMorph::CardioMorphConfig config;
        std::string                    outputDirectory;
        std::string                    logFile;
        bool                           noLabels = false;
        bool                           verbose  = false;
    };

    const std::map<std::string, CardioMorph::DayRangePreset> RANGE_NAMES = {
        { "all", CardioMorph::DayRangePreset::ALL_DAYS },
        { "early", CardioMorph::DayRangePreset::EARLY },
        { "middle", CardioMorph::DayRangePreset::MIDDLE },
        { "late", CardioMorph::DayRangePreset::LATE },
    };

    const std::map<std::string, CardioMorph::AnimationSpeed> SPEED_NAMES = {
        { "slow", CardioMorph::AnimationSpeed::SLOW },
        { "medium", CardioMorph::AnimationSpeed::MEDIUM },
        { "fast", CardioMorph::AnimationSpeed::FAST },
    };

    int RunPreview( CardioMorph::CardioMorph& engine, const Options& options )
    {
        CardioMorph::Ref<const CardioMorph::RasterFrame> frame;
        CardioMorph::Result                               res = engine.RenderPreview( *options.previewDay, frame );
        if( res != CardioMorph::Result::SUCCESS )
        {
            CM_ERROR( "Preview failed: {}", CardioMorph::toString( res ) );
            return 1;
        }

        std::string path = options.output.empty() ? fmt::format( "cardiomyocyte_day_{:.1f}.png", frame->GetDay() ) : options.output;
        res              = engine.ExportFrame( *frame, path );
        if( res != CardioMorph::Result::SUCCESS )
        {
            CM_ERROR( "Could not write {}: {}", path, CardioMorph::toString( res ) );
            return 1;
        }

        CM_INFO( "Day {:.1f}: {}", frame->GetDay(), frame->GetTitle() );
        return 0;
    }

    int RunAnimation( CardioMorph::CardioMorph& engine, const Options& options )
    {
        CardioMorph::DayRange range = CardioMorph::CardioMorph::GetPresetRange( options.preset );
        if( options.minDay )
            range.min = *options.minDay;
        if( options.maxDay )
            range.max = *options.maxDay;

        CardioMorph::Ref<const CardioMorph::AnimationArtifact> artifact;
        CardioMorph::Result                                     res = engine.GenerateAnimation(
            range, options.speed, artifact, []( uint32_t completed, uint32_t total ) { CM_INFO( "Rendered frame {}/{}", completed, total ); } );
        if( res != CardioMorph::Result::SUCCESS )
        {
            CM_ERROR( "Animation failed: {}", CardioMorph::toString( res ) );
            return 1;
        }

        std::string path = options.output.empty() ? "cardiomyocyte_animation.png" : options.output;
        res              = engine.ExportAnimation( *artifact, path );
        if( res != CardioMorph::Result::SUCCESS )
        {
            CM_ERROR( "Could not write {}: {}", path, CardioMorph::toString( res ) );
            return 1;
        }

        return 0;
    }
} // namespace

int main( int argc, char** argv )
{
    Options  options;
    CLI::App app{ "CardioMorph - cardiomyocyte development animation generator" };
    app.set_version_flag( "--version", std::string( CardioMorph::VERSION_STRING ) );

    app.add_option( "-r,--range", options.preset, "Day range preset: all, early, middle, late" )
        ->transform( CLI::CheckedTransformer( RANGE_NAMES, CLI::ignore_case ) );
    app.add_option( "--min", options.minDay, "First day (overrides the preset)" );
    app.add_option( "--max", options.maxDay, "Last day (overrides the preset, clamped to 8)" );
    app.add_option( "-s,--speed", options.speed, "Animation speed: slow, medium, fast" )
        ->transform( CLI::CheckedTransformer( SPEED_NAMES, CLI::ignore_case ) );
    app.add_option( "-o,--output", options.output, "Output file (APNG for animations, PNG for previews)" );
    app.add_option( "-p,--preview", options.previewDay, "Render a single still frame for this day instead of an animation" );
    app.add_option( "--width", options.config.frameWidth, "Frame width in pixels" )->check( CLI::PositiveNumber );
    app.add_option( "--height", options.config.frameHeight, "Frame height in pixels" )->check( CLI::PositiveNumber );
    app.add_option( "--seed", options.config.seed, "Random seed, 0 for a non-deterministic run" );
    app.add_flag( "--no-labels", options.noLabels, "Leave the label box empty" );
    app.add_option( "--output-dir", options.outputDirectory, "Directory relative output paths are resolved against" );
    app.add_flag( "-v,--verbose", options.verbose, "Trace logging" );
    app.add_option( "--log-file", options.logFile, "Also write the log to this file" );

    try
    {
        app.parse( argc, argv );
    }
    catch( const CLI::ParseError& e )
    {
        return app.exit( e );
    }

    CardioMorph::LogConfig logConfig;
    logConfig.level   = options.verbose ? spdlog::level::trace : spdlog::level::info;
    logConfig.logFile = options.logFile;
    CardioMorph::Log::Init( logConfig );

    options.config.drawLabels      = !options.noLabels;
    options.config.debugMode       = options.verbose;
    options.config.outputDirectory = options.outputDirectory.empty() ? nullptr : options.outputDirectory.c_str();

    int exitCode = 0;
    try
    {
        CardioMorph::CardioMorph engine;
        if( engine.Initialize( options.config ) == CardioMorph::Result::SUCCESS )
        {
            exitCode = options.previewDay ? RunPreview( engine, options ) : RunAnimation( engine, options );
            engine.Shutdown();
        }
        else
        {
            CM_CRITICAL( "CardioMorph failed to initialize." );
            exitCode = 1;
        }
    }
    catch( const std::exception& e )
    {
        CM_CRITICAL( "Unhandled exception: {}", e.what() );
        exitCode = 1;
    }

    CardioMorph::Log::Shutdown();
    return exitCode;
}
