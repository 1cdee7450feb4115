#include "base/logger.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace
{
    void setGlobalPattern( spdlog::logger &logger )
    {
        logger.set_pattern( "[%Y-%m-%d %H:%M:%S][%l][%n] %v" );
    }

    void setDebugPattern( spdlog::logger &logger )
    {
        logger.set_pattern( "[%Y-%m-%d %H:%M:%S.%F][th:%t][%l][%n] %v" );
    }

    std::shared_ptr<spdlog::logger> createLogger( const std::string &tag,
                                                  bool               debug_mode,
                                                  const std::string &basepath )
    {
        std::shared_ptr<spdlog::logger> logger;
        if ( !basepath.empty() )
        {
            logger = spdlog::basic_logger_mt( tag, basepath );
        }
        else
        {
            logger = spdlog::stdout_color_mt( tag );
        }

        if ( debug_mode )
        {
            setDebugPattern( *logger );
        }
        else
        {
            setGlobalPattern( *logger );
        }
        return logger;
    }

    std::mutex &registryMutex()
    {
        static std::mutex mutex;
        return mutex;
    }
} // namespace

namespace safemath::base
{
    Logger createLogger( const std::string &tag, const std::string &basepath )
    {
        std::lock_guard<std::mutex> lock( registryMutex() );
        auto                        logger = spdlog::get( tag );
        if ( logger == nullptr )
        {
            logger = ::createLogger( tag, false, basepath );
        }
        return logger;
    }

    void setLogLevel( const std::string &tag, spdlog::level::level_enum level )
    {
        auto logger = createLogger( tag );
        logger->set_level( level );
        if ( level <= spdlog::level::debug )
        {
            setDebugPattern( *logger );
        }
        else
        {
            setGlobalPattern( *logger );
        }
    }
} // namespace safemath::base
