#ifndef MAILTASK_LOGGER_HPP
#define MAILTASK_LOGGER_HPP

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace mailtask::base
{
    using Logger = std::shared_ptr<spdlog::logger>;

    /**
     * Provide logger object
     * @param tag - tagging name for identifying logger
     * @param basepath - optional file to log into instead of the console
     * @return logger object
     */
    Logger createLogger( const std::string &tag, const std::string &basepath = "" );

    /**
     * Set the level of every registered logger and of the ones created later
     * @param level - spdlog level name (trace, debug, info, warn, error, critical, off)
     * @return false if the name is not a known level
     */
    bool setLoggingLevel( const std::string &level );

    /**
     * Switch every logger to a pattern with milliseconds and thread ids, or back
     */
    void setDebugPattern( bool enabled );
} // namespace mailtask::base

#endif // MAILTASK_LOGGER_HPP
