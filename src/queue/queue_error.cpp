#include "queue/queue_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3( mailtask::queue, QueueError, e )
{
    using E = mailtask::queue::QueueError;
    switch ( e )
    {
        case E::LOCK_TIMEOUT:
            return "failed to acquire the store lock after maximum attempts";
        case E::LOCK_FAILED:
            return "store lock file error";
        case E::IO_ERROR:
            return "store file IO error";
        case E::PARSE_ERROR:
            return "store file is corrupted";
        case E::SERIALIZE_ERROR:
            return "unable to serialize the task store";
    }
    return "unknown error";
}
