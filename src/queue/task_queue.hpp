/**
* Header file for the persistent task queue
*/

#ifndef MAILTASK_QUEUE_TASK_QUEUE_HPP
#define MAILTASK_QUEUE_TASK_QUEUE_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "proto/MailTask.pb.h"
#include "outcome/outcome.hpp"

namespace mailtask::queue
{
    struct TaskStats
    {
        size_t total      = 0;
        size_t pending    = 0;
        size_t processing = 0;
        size_t completed  = 0;
        size_t failed     = 0;
    };

    /** Persistent task queue interface.
    * Every operation is one atomic transaction over the whole store, including against other processes.
    * Failures are QueueError codes; an unknown task id is never an error.
    */
    class TaskQueue
    {
    public:
        virtual ~TaskQueue() = default;

        /** Creates the store with an empty task list if it does not exist yet
        */
        virtual outcome::result<void> Initialize() = 0;

        /** Enqueues a new pending task
        * @param prompt - producer payload
        * @param reporterEmail - producer identity used for reporting
        * @return created task
        */
        virtual outcome::result<MailTask::Task> AddTask( const google::protobuf::Struct &prompt,
                                                         const std::string             &reporterEmail ) = 0;

        /** Grabs the first pending task in stored order and marks it as processing
        * @return picked task, or nothing if no task is pending
        */
        virtual outcome::result<std::optional<MailTask::Task>> PickTask() = 0;

        /** Marks a specific pending task as processing
        * @param taskId - task id
        * @return claimed task, or nothing if the task is unknown or not pending
        */
        virtual outcome::result<std::optional<MailTask::Task>> ClaimTask( const std::string &taskId ) = 0;

        /** Handles task completion
        * @param taskId - task id
        * @param result - processing result
        */
        virtual outcome::result<void> CompleteTask( const std::string &taskId, const google::protobuf::Struct &result ) = 0;

        /** Handles a failed attempt. The task goes back to pending while it has retries left,
        * otherwise it is failed permanently.
        * @param taskId - task id
        * @param error - failure message
        * @return updated task, or nothing if the task is unknown
        */
        virtual outcome::result<std::optional<MailTask::Task>> FailTask( const std::string &taskId,
                                                                         const std::string &error ) = 0;

        virtual outcome::result<std::optional<MailTask::Task>> GetTask( const std::string &taskId ) = 0;

        /** Looks a task up by its full id, then by id prefix
        */
        virtual outcome::result<std::optional<MailTask::Task>> FindTask( const std::string &idOrPrefix ) = 0;

        virtual outcome::result<std::vector<MailTask::Task>> GetAllTasks() = 0;

        virtual outcome::result<std::vector<MailTask::Task>> GetTasksByStatus( MailTask::Task::Status status ) = 0;

        /** Appends an entry to the task log; no-op for unknown tasks
        */
        virtual outcome::result<void> AddTaskLog( const std::string        &taskId,
                                                  MailTask::TaskLog::Level  level,
                                                  const std::string        &message ) = 0;

        virtual outcome::result<TaskStats> GetStats() = 0;

        /** Removes completed and failed tasks finished at least maxAge ago
        * @return number of removed tasks
        */
        virtual outcome::result<size_t> Cleanup( std::chrono::milliseconds maxAge ) = 0;

        /** Fails processing tasks started at least maxAge ago, left behind by a crashed worker.
        * They follow the FailTask transition and may be retried.
        * @return number of recovered tasks
        */
        virtual outcome::result<size_t> RecoverExpiredTasks( std::chrono::milliseconds maxAge ) = 0;
    };

    const char *StatusName( MailTask::Task::Status status );

    bool IsTerminal( MailTask::Task::Status status );
}

#endif // MAILTASK_QUEUE_TASK_QUEUE_HPP
