#include "application/config.hpp"

#include <cstdlib>

#include <boost/lexical_cast.hpp>
#include <spdlog/spdlog.h>

#include "application/app_error.hpp"
#include "base/logger.hpp"
#include "queue/impl/file_store_lock.hpp"

namespace mailtask::application
{
    namespace
    {
        /** Parses an integer variable
        * @return the value, nothing if unset or empty, ConfigError if not an integer
        */
        outcome::result<std::optional<int64_t>> ReadInteger( const EnvironmentLookup &lookup, const std::string &name )
        {
            auto text = lookup( name );
            if ( !text || text->empty() )
            {
                return std::optional<int64_t>();
            }
            int64_t value = 0;
            if ( !boost::conversion::try_lexical_convert( *text, value ) )
            {
                base::createLogger( "Config" )->error( "{} is not a valid number: '{}'", name, *text );
                return outcome::failure( std::error_code( ConfigError::INVALID_NUMBER ) );
            }
            return std::optional<int64_t>( value );
        }
    }

    std::optional<std::string> GetEnvironmentVariable( const std::string &name )
    {
        const char *value = std::getenv( name.c_str() );
        if ( value == nullptr )
        {
            return std::nullopt;
        }
        return std::string( value );
    }

    outcome::result<MailTaskConfig> LoadConfig( const EnvironmentLookup &lookup )
    {
        MailTaskConfig config;

        if ( auto path = lookup( "TASK_QUEUE_PATH" ); path && !path->empty() )
        {
            config.queuePath = *path;
        }

        auto maxRetries = ReadInteger( lookup, "TASK_MAX_RETRIES" );
        if ( maxRetries.has_error() )
        {
            return outcome::failure( maxRetries.error() );
        }
        if ( maxRetries.value() && *maxRetries.value() > 0 )
        {
            config.maxRetries = static_cast<int32_t>( *maxRetries.value() );
        }

        // Durations share the rule that non-positive values keep the default
        struct DurationSetting
        {
            const char                *name;
            std::chrono::milliseconds *field;
        };
        const DurationSetting durations[] = {
            { "TASK_LOCK_STALE_MS", &config.lockStaleAfter },
            { "SCHEDULER_POLL_INTERVAL", &config.scheduler.pollInterval },
            { "SCHEDULER_TASK_TIMEOUT", &config.scheduler.taskTimeout },
            { "SCHEDULER_SHUTDOWN_TIMEOUT", &config.scheduler.gracefulShutdownTimeout },
        };
        for ( const auto &setting : durations )
        {
            auto value = ReadInteger( lookup, setting.name );
            if ( value.has_error() )
            {
                return outcome::failure( value.error() );
            }
            if ( value.value() && *value.value() > 0 )
            {
                *setting.field = std::chrono::milliseconds( *value.value() );
            }
        }

        if ( config.lockStaleAfter < queue::FileStoreLock::MIN_STALE_AFTER )
        {
            base::createLogger( "Config" )->warn( "TASK_LOCK_STALE_MS below {}ms, using the minimum",
                                                  queue::FileStoreLock::MIN_STALE_AFTER.count() );
            config.lockStaleAfter = queue::FileStoreLock::MIN_STALE_AFTER;
        }

        auto recoverAfter = ReadInteger( lookup, "TASK_RECOVER_AFTER_MS" );
        if ( recoverAfter.has_error() )
        {
            return outcome::failure( recoverAfter.error() );
        }
        if ( recoverAfter.value() && *recoverAfter.value() > 0 )
        {
            config.recoverAfter = std::chrono::milliseconds( *recoverAfter.value() );
        }

        auto maxConcurrent = ReadInteger( lookup, "SCHEDULER_MAX_CONCURRENT" );
        if ( maxConcurrent.has_error() )
        {
            return outcome::failure( maxConcurrent.error() );
        }
        if ( maxConcurrent.value() && *maxConcurrent.value() > 0 )
        {
            config.scheduler.maxConcurrent = static_cast<size_t>( *maxConcurrent.value() );
        }

        config.scheduler.enabled = lookup( "SCHEDULER_ENABLED" ).value_or( "true" ) != "false";

        if ( auto level = lookup( "LOG_LEVEL" ); level && !level->empty() )
        {
            if ( spdlog::level::from_str( *level ) == spdlog::level::off && *level != "off" )
            {
                base::createLogger( "Config" )->error( "Unknown log level '{}'", *level );
                return outcome::failure( std::error_code( ConfigError::INVALID_LOG_LEVEL ) );
            }
            config.logLevel = *level;
        }

        return config;
    }
}
