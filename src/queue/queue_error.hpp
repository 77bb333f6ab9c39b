#ifndef MAILTASK_QUEUE_ERROR_HPP
#define MAILTASK_QUEUE_ERROR_HPP

#include "outcome/outcome.hpp"

namespace mailtask::queue
{
    /**
     * @brief Storage level failures of the task queue
     */
    enum class QueueError
    {
        LOCK_TIMEOUT = 1, ///< the store lock was not acquired within the retry budget
        LOCK_FAILED,      ///< the lock file could not be created or removed
        IO_ERROR,         ///< reading or writing the store file failed
        PARSE_ERROR,      ///< the store file is not a valid task store document
        SERIALIZE_ERROR,  ///< the in-memory store could not be converted to JSON
    };
}

OUTCOME_HPP_DECLARE_ERROR_2( mailtask::queue, QueueError )

#endif // MAILTASK_QUEUE_ERROR_HPP
