#ifndef MAILTASK_QUEUE_FILE_TASK_QUEUE_HPP
#define MAILTASK_QUEUE_FILE_TASK_QUEUE_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

#include "queue/task_queue.hpp"
#include "queue/store_lock.hpp"
#include "base/logger.hpp"

namespace mailtask::queue
{
    /** Task queue persisted as a single JSON document.
    * Each operation locks the store, reads it entirely, applies its change in memory and rewrites it.
    */
    class FileTaskQueue : public TaskQueue
    {
    public:
        static constexpr uint32_t STORE_VERSION = 1;

        struct Options
        {
            std::string filePath     = "./data/tasks.json";
            int32_t     maxRetries   = 3;
            size_t      lockAttempts = 10; ///< Acquire() rounds before LOCK_TIMEOUT is surfaced
        };

        /** Create a queue over a store file
        * @param options - store location and task defaults
        * @param storeLock - lock shared with other processes, a FileStoreLock if null
        */
        explicit FileTaskQueue( Options options, std::shared_ptr<StoreLock> storeLock = nullptr );

        outcome::result<void>                          Initialize() override;
        outcome::result<MailTask::Task>                AddTask( const google::protobuf::Struct &prompt,
                                                                const std::string             &reporterEmail ) override;
        outcome::result<std::optional<MailTask::Task>> PickTask() override;
        outcome::result<std::optional<MailTask::Task>> ClaimTask( const std::string &taskId ) override;
        outcome::result<void> CompleteTask( const std::string &taskId, const google::protobuf::Struct &result ) override;
        outcome::result<std::optional<MailTask::Task>> FailTask( const std::string &taskId,
                                                                 const std::string &error ) override;
        outcome::result<std::optional<MailTask::Task>> GetTask( const std::string &taskId ) override;
        outcome::result<std::optional<MailTask::Task>> FindTask( const std::string &idOrPrefix ) override;
        outcome::result<std::vector<MailTask::Task>>   GetAllTasks() override;
        outcome::result<std::vector<MailTask::Task>>   GetTasksByStatus( MailTask::Task::Status status ) override;
        outcome::result<void>                          AddTaskLog( const std::string        &taskId,
                                                                   MailTask::TaskLog::Level  level,
                                                                   const std::string        &message ) override;
        outcome::result<TaskStats>                     GetStats() override;
        outcome::result<size_t> Cleanup( std::chrono::milliseconds maxAge ) override;
        outcome::result<size_t> RecoverExpiredTasks( std::chrono::milliseconds maxAge ) override;

        const std::string &GetFilePath() const
        {
            return m_options.filePath;
        }

    private:
        /** Mutates the store in memory
        * @return true if the store was changed and has to be written back
        */
        using Updater = std::function<bool( MailTask::TaskStore &store )>;

        outcome::result<void>                AtomicUpdate( const Updater &updater );
        outcome::result<MailTask::TaskStore> ReadStore() const;
        outcome::result<void>                WriteStore( MailTask::TaskStore &store ) const;

        /** Applies one failed attempt to a processing task
        */
        void ApplyFailure( MailTask::Task &task, const std::string &error ) const;

        Options                    m_options;
        std::shared_ptr<StoreLock> m_storeLock;
        std::atomic<bool>          m_initialized{ false };
        std::mutex                 m_initMutex;
        base::Logger               m_logger = base::createLogger( "TaskQueue" );
    };
}

#endif // MAILTASK_QUEUE_FILE_TASK_QUEUE_HPP
