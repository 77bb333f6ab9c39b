#include "base/logger.hpp"

#include <atomic>
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace
{
    constexpr const char *GLOBAL_PATTERN = "[%Y-%m-%d %H:%M:%S][%l][%n] %v";
    constexpr const char *DEBUG_PATTERN  = "[%Y-%m-%d %H:%M:%S.%e][th:%t][%l][%n] %v";

    std::atomic<bool> debugPattern{ false };

    const char *currentPattern()
    {
        return debugPattern ? DEBUG_PATTERN : GLOBAL_PATTERN;
    }
} // namespace

namespace mailtask::base
{
    Logger createLogger( const std::string &tag, const std::string &basepath )
    {
        static std::mutex           mutex;
        std::lock_guard<std::mutex> lock( mutex );
        if ( auto existing = spdlog::get( tag ) )
        {
            return existing;
        }

        Logger logger = basepath.empty() ? spdlog::stdout_color_mt( tag ) : spdlog::basic_logger_mt( tag, basepath );
        logger->set_pattern( currentPattern() );
        return logger;
    }

    bool setLoggingLevel( const std::string &level )
    {
        auto parsed = spdlog::level::from_str( level );
        // from_str falls back to "off" for unknown names
        if ( parsed == spdlog::level::off && level != "off" )
        {
            return false;
        }
        spdlog::set_level( parsed );
        return true;
    }

    void setDebugPattern( bool enabled )
    {
        debugPattern = enabled;
        spdlog::apply_all( []( const Logger &logger ) { logger->set_pattern( currentPattern() ); } );
    }
} // namespace mailtask::base
