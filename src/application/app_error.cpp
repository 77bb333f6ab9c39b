#include "application/app_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3( mailtask::application, ConfigError, e )
{
    using E = mailtask::application::ConfigError;
    switch ( e )
    {
        case E::INVALID_NUMBER:
            return "configuration value is not a valid number";
        case E::INVALID_LOG_LEVEL:
            return "unknown log level";
    }
    return "unknown error";
}

OUTCOME_CPP_DEFINE_CATEGORY_3( mailtask::application, AppError, e )
{
    using E = mailtask::application::AppError;
    switch ( e )
    {
        case E::AGENT_NOT_READY:
            return "agent is not ready";
        case E::SCHEDULER_DISABLED:
            return "scheduler is not enabled";
    }
    return "unknown error";
}
