#pragma once

#include "core/Core.h"
#include <memory>
#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>
#include <string>

namespace CardioMorph
{

    struct LogConfig
    {
        spdlog::level::level_enum level   = spdlog::level::trace;
        std::string               pattern = "%^[%T] %n: %v%$";
        std::string               logFile; // empty = console only
    };

    /**
     * @brief Two named loggers sharing one set of sinks: "CARDIO" for the library and "APP" for
     * the command line tool and the tests.
     */
    class CM_API Log
    {
    public:
        // Console only, trace level. No-op once initialized
        static void Init();

        /**
         * @brief (Re)creates both loggers from the config.
         * A log file that cannot be opened is reported on the console and skipped.
         */
        static void Init( const LogConfig& config );
        static void Shutdown();

        static void SetLevel( spdlog::level::level_enum level );
        static bool IsInitialized() { return s_CoreLogger != nullptr; }

        inline static Ref<spdlog::logger>& GetCoreLogger() { return s_CoreLogger; }
        inline static Ref<spdlog::logger>& GetClientLogger() { return s_ClientLogger; }

    private:
        static Ref<spdlog::logger> s_CoreLogger;
        static Ref<spdlog::logger> s_ClientLogger;
    };

} // namespace CardioMorph

// CM_BUILD_LIBRARY is only defined while compiling the library itself
#ifdef CM_BUILD_LIBRARY
#    define CM_LOGGER ::CardioMorph::Log::GetCoreLogger()
#else
#    define CM_LOGGER ::CardioMorph::Log::GetClientLogger()
#endif

#define CM_TRACE( ... )    CM_LOGGER->trace( __VA_ARGS__ )
#define CM_INFO( ... )     CM_LOGGER->info( __VA_ARGS__ )
#define CM_WARN( ... )     CM_LOGGER->warn( __VA_ARGS__ )
#define CM_ERROR( ... )    CM_LOGGER->error( __VA_ARGS__ )
#define CM_CRITICAL( ... ) CM_LOGGER->critical( __VA_ARGS__ )
