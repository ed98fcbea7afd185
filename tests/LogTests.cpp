#include "core/Log.h"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

using namespace CardioMorph;

class LogTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_tempBase = std::filesystem::current_path() / "temp_log_env";
        std::filesystem::remove_all( m_tempBase );
        std::filesystem::create_directories( m_tempBase );
    }

    // Back to the quiet console-only setup from main.cpp
    void TearDown() override
    {
        LogConfig config;
        config.level = spdlog::level::warn;
        Log::Init( config );

        std::filesystem::remove_all( m_tempBase );
    }

    std::filesystem::path m_tempBase;
};

TEST_F( LogTest, FileSinkReceivesMessages )
{
    std::filesystem::path logFile = m_tempBase / "run.log";

    LogConfig config;
    config.level   = spdlog::level::info;
    config.logFile = logFile.string();
    Log::Init( config );

    CM_INFO( "rendering day {}", 3.5 );
    CM_TRACE( "below the configured level" );
    Log::GetClientLogger()->flush();

    std::ifstream     file( logFile );
    std::stringstream content;
    content << file.rdbuf();

    EXPECT_NE( content.str().find( "rendering day 3.5" ), std::string::npos );
    EXPECT_EQ( content.str().find( "below the configured level" ), std::string::npos );
}

TEST_F( LogTest, UnopenableFileKeepsConsoleLogging )
{
    // A regular file where a directory is expected
    std::filesystem::path blocker = m_tempBase / "blocker";
    std::ofstream( blocker ) << "x";

    LogConfig config;
    config.logFile = ( blocker / "run.log" ).string();
    Log::Init( config );

    ASSERT_TRUE( Log::IsInitialized() );
    EXPECT_NE( Log::GetCoreLogger(), nullptr );
    EXPECT_EQ( Log::GetClientLogger()->sinks().size(), 1u );
}

TEST_F( LogTest, ShutdownReleasesLoggers )
{
    Log::Shutdown();
    EXPECT_FALSE( Log::IsInitialized() );

    Log::Init();
    EXPECT_TRUE( Log::IsInitialized() );
    EXPECT_EQ( Log::GetCoreLogger()->name(), "CARDIO" );
    EXPECT_EQ( Log::GetClientLogger()->name(), "APP" );
}

TEST_F( LogTest, SetLevelAppliesToBothLoggers )
{
    Log::SetLevel( spdlog::level::err );

    EXPECT_EQ( Log::GetCoreLogger()->level(), spdlog::level::err );
    EXPECT_EQ( Log::GetClientLogger()->level(), spdlog::level::err );
}
