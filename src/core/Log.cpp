#include "core/Log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace CardioMorph
{
    namespace
    {
        const char* CORE_LOGGER_NAME   = "CARDIO";
        const char* CLIENT_LOGGER_NAME = "APP";

        Ref<spdlog::logger> CreateLogger( const char* name, const HeapArray<spdlog::sink_ptr>& sinks, const LogConfig& config )
        {
            spdlog::drop( name );

            auto logger = CreateRef<spdlog::logger>( name, sinks.begin(), sinks.end() );
            logger->set_pattern( config.pattern );
            logger->set_level( config.level );
            spdlog::register_logger( logger );
            return logger;
        }
    } // namespace

    Ref<spdlog::logger> Log::s_CoreLogger   = nullptr;
    Ref<spdlog::logger> Log::s_ClientLogger = nullptr;

    void Log::Init()
    {
        if( IsInitialized() )
            return;

        Init( LogConfig() );
    }

    void Log::Init( const LogConfig& config )
    {
        HeapArray<spdlog::sink_ptr> sinks;
        sinks.push_back( CreateRef<spdlog::sinks::stdout_color_sink_mt>() );

        std::string fileError;
        if( !config.logFile.empty() )
        {
            try
            {
                sinks.push_back( CreateRef<spdlog::sinks::basic_file_sink_mt>( config.logFile, true ) );
            }
            catch( const spdlog::spdlog_ex& e )
            {
                fileError = e.what();
            }
        }

        s_CoreLogger   = CreateLogger( CORE_LOGGER_NAME, sinks, config );
        s_ClientLogger = CreateLogger( CLIENT_LOGGER_NAME, sinks, config );

        if( !fileError.empty() )
            s_CoreLogger->warn( "Log file '{}' unavailable: {}", config.logFile, fileError );

        s_CoreLogger->trace( "Logging system initialized ({} sinks).", sinks.size() );
    }

    void Log::Shutdown()
    {
        if( !IsInitialized() )
            return;

        s_CoreLogger->flush();
        s_ClientLogger->flush();
        spdlog::drop( CORE_LOGGER_NAME );
        spdlog::drop( CLIENT_LOGGER_NAME );
        s_CoreLogger.reset();
        s_ClientLogger.reset();
    }

    void Log::SetLevel( spdlog::level::level_enum level )
    {
        Init();

        s_CoreLogger->set_level( level );
        s_ClientLogger->set_level( level );
    }

} // namespace CardioMorph
