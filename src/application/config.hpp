/**
* Header file for the environment driven configuration
*/
#ifndef MAILTASK_APPLICATION_CONFIG_HPP
#define MAILTASK_APPLICATION_CONFIG_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include "scheduler/scheduler.hpp"
#include "outcome/outcome.hpp"

namespace mailtask::application
{
    struct MailTaskConfig
    {
        std::string               queuePath  = "./data/tasks.json";
        int32_t                   maxRetries = 3;
        std::chrono::milliseconds lockStaleAfter{ 10000 };
        std::chrono::milliseconds recoverAfter{ 0 }; ///< 0 disables recovery of orphaned processing tasks
        scheduler::SchedulerConfig scheduler;
        std::string               logLevel = "info";
    };

    /** Returns the value of a variable, or nothing if unset
    */
    using EnvironmentLookup = std::function<std::optional<std::string>( const std::string &name )>;

    /** Reads the process environment
    */
    std::optional<std::string> GetEnvironmentVariable( const std::string &name );

    /** Builds the configuration from environment variables, falling back to defaults
    * @param lookup - variable source, the process environment by default
    * @return configuration or ConfigError
    */
    outcome::result<MailTaskConfig> LoadConfig( const EnvironmentLookup &lookup = GetEnvironmentVariable );
}

#endif // MAILTASK_APPLICATION_CONFIG_HPP
