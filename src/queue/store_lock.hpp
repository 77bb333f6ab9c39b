/**
 * Header file for the cross-process lock guarding the task store
 */
#ifndef MAILTASK_QUEUE_STORE_LOCK_HPP
#define MAILTASK_QUEUE_STORE_LOCK_HPP

#include <memory>
#include <string>

#include "outcome/outcome.hpp"

namespace mailtask::queue
{
    /** Exclusive advisory lock over a store path, shared by every process using the store
    */
    class StoreLock
    {
    public:
        /** Held lock, released when destroyed
        */
        class Lease
        {
        public:
            virtual ~Lease() = default;
        };

        virtual ~StoreLock() = default;

        /** Blocks until the lock over the path is held or the retry budget is exhausted
        * @param path - path of the guarded store file
        * @return lease that releases the lock on destruction,
        * QueueError::LOCK_TIMEOUT when another holder kept it for the whole budget
        */
        virtual outcome::result<std::unique_ptr<Lease>> Acquire( const std::string &path ) = 0;
    };
}

#endif // MAILTASK_QUEUE_STORE_LOCK_HPP
