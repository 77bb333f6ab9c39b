#ifndef MAILTASK_APPLICATION_APP_ERROR_HPP
#define MAILTASK_APPLICATION_APP_ERROR_HPP

#include "outcome/outcome.hpp"

namespace mailtask::application
{
    /**
     * @brief Invalid configuration values
     */
    enum class ConfigError
    {
        INVALID_NUMBER = 1, ///< a numeric setting is not an integer
        INVALID_LOG_LEVEL,  ///< the log level is not an spdlog level name
    };

    /**
     * @brief Application lifecycle failures
     */
    enum class AppError
    {
        AGENT_NOT_READY = 1,
        SCHEDULER_DISABLED,
    };
}

OUTCOME_HPP_DECLARE_ERROR_2( mailtask::application, ConfigError )
OUTCOME_HPP_DECLARE_ERROR_2( mailtask::application, AppError )

#endif // MAILTASK_APPLICATION_APP_ERROR_HPP
