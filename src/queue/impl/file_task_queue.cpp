#include "queue/impl/file_task_queue.hpp"

#include <fstream>
#include <sstream>
#include <thread>

#include <boost/filesystem/operations.hpp>
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/random_device.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>

#include "queue/impl/file_store_lock.hpp"
#include "queue/queue_error.hpp"

namespace mailtask::queue
{
    namespace fs = boost::filesystem;
    using google::protobuf::util::TimeUtil;

    namespace
    {
        std::chrono::milliseconds LockContentionPause()
        {
            thread_local boost::random::mt19937            generator{ boost::random::random_device{}() };
            boost::random::uniform_int_distribution<int64_t> distribution( 50, 150 );
            return std::chrono::milliseconds( distribution( generator ) );
        }

        void AppendLog( MailTask::Task                   &task,
                        MailTask::TaskLog::Level          level,
                        const std::string                &message,
                        const google::protobuf::Timestamp &now )
        {
            auto *entry                = task.add_logs();
            *entry->mutable_timestamp() = now;
            entry->set_level( level );
            entry->set_message( message );
        }

        MailTask::Task *FindById( MailTask::TaskStore &store, const std::string &taskId )
        {
            for ( auto &task : *store.mutable_tasks() )
            {
                if ( task.id() == taskId )
                {
                    return &task;
                }
            }
            return nullptr;
        }

        std::string SubjectOf( const MailTask::Task &task )
        {
            const auto &fields = task.prompt().fields();
            auto        it     = fields.find( "subject" );
            if ( it != fields.end() && it->second.kind_case() == google::protobuf::Value::kStringValue )
            {
                return it->second.string_value();
            }
            return {};
        }

        int64_t AgeMilliseconds( const google::protobuf::Timestamp &since, const google::protobuf::Timestamp &now )
        {
            return TimeUtil::TimestampToMilliseconds( now ) - TimeUtil::TimestampToMilliseconds( since );
        }
    }

    FileTaskQueue::FileTaskQueue( Options options, std::shared_ptr<StoreLock> storeLock ) :
        m_options( std::move( options ) ), m_storeLock( std::move( storeLock ) )
    {
        if ( !m_storeLock )
        {
            m_storeLock = std::make_shared<FileStoreLock>();
        }
    }

    outcome::result<void> FileTaskQueue::Initialize()
    {
        if ( m_initialized )
        {
            return outcome::success();
        }
        std::lock_guard<std::mutex> lock( m_initMutex );
        if ( m_initialized )
        {
            return outcome::success();
        }

        fs::path                  storePath( m_options.filePath );
        boost::system::error_code ec;
        if ( storePath.has_parent_path() )
        {
            fs::create_directories( storePath.parent_path(), ec );
            if ( ec )
            {
                m_logger->error( "Unable to create directory {}: {}", storePath.parent_path().string(), ec.message() );
                return outcome::failure( std::error_code( QueueError::IO_ERROR ) );
            }
        }

        auto lease = m_storeLock->Acquire( m_options.filePath );
        if ( lease.has_error() )
        {
            return outcome::failure( lease.error() );
        }

        if ( fs::exists( storePath, ec ) )
        {
            std::ofstream writable( m_options.filePath, std::ios::app );
            if ( !writable )
            {
                m_logger->error( "Task queue file {} is not writable", m_options.filePath );
                return outcome::failure( std::error_code( QueueError::IO_ERROR ) );
            }
        }
        else
        {
            MailTask::TaskStore initialStore;
            auto                written = WriteStore( initialStore );
            if ( written.has_error() )
            {
                return written;
            }
            m_logger->info( "Task queue file created: {}", m_options.filePath );
        }

        m_initialized = true;
        m_logger->info( "Task queue initialized." );
        return outcome::success();
    }

    outcome::result<void> FileTaskQueue::AtomicUpdate( const Updater &updater )
    {
        auto initialized = Initialize();
        if ( initialized.has_error() )
        {
            return initialized;
        }

        for ( size_t attempt = 0; attempt < m_options.lockAttempts; ++attempt )
        {
            auto lease = m_storeLock->Acquire( m_options.filePath );
            if ( lease.has_error() )
            {
                if ( lease.error() == QueueError::LOCK_TIMEOUT )
                {
                    m_logger->debug( "Store lock contention, attempt {}/{}", attempt + 1, m_options.lockAttempts );
                    std::this_thread::sleep_for( LockContentionPause() );
                    continue;
                }
                return outcome::failure( lease.error() );
            }

            auto store = ReadStore();
            if ( store.has_error() )
            {
                return outcome::failure( store.error() );
            }
            if ( updater( store.value() ) )
            {
                return WriteStore( store.value() );
            }
            return outcome::success();
        }

        m_logger->error( "Failed to acquire lock on {} after {} attempts", m_options.filePath, m_options.lockAttempts );
        return outcome::failure( std::error_code( QueueError::LOCK_TIMEOUT ) );
    }

    outcome::result<MailTask::TaskStore> FileTaskQueue::ReadStore() const
    {
        std::ifstream input( m_options.filePath, std::ios::binary );
        if ( !input )
        {
            m_logger->error( "Unable to open task queue file {}", m_options.filePath );
            return outcome::failure( std::error_code( QueueError::IO_ERROR ) );
        }
        std::stringstream content;
        content << input.rdbuf();
        if ( input.bad() )
        {
            m_logger->error( "Unable to read task queue file {}", m_options.filePath );
            return outcome::failure( std::error_code( QueueError::IO_ERROR ) );
        }

        MailTask::TaskStore                       store;
        google::protobuf::util::JsonParseOptions parseOptions;
        parseOptions.ignore_unknown_fields = true;
        auto status = google::protobuf::util::JsonStringToMessage( content.str(), &store, parseOptions );
        if ( !status.ok() )
        {
            m_logger->error( "Task queue file {} is corrupted: {}", m_options.filePath, status.ToString() );
            return outcome::failure( std::error_code( QueueError::PARSE_ERROR ) );
        }
        return store;
    }

    outcome::result<void> FileTaskQueue::WriteStore( MailTask::TaskStore &store ) const
    {
        store.set_version( STORE_VERSION );
        *store.mutable_last_updated() = TimeUtil::GetCurrentTime();

        std::string                              json;
        google::protobuf::util::JsonPrintOptions printOptions;
        printOptions.add_whitespace                = true;
        printOptions.always_print_primitive_fields = true;
        auto status = google::protobuf::util::MessageToJsonString( store, &json, printOptions );
        if ( !status.ok() )
        {
            m_logger->error( "Unable to serialize task store: {}", status.ToString() );
            return outcome::failure( std::error_code( QueueError::SERIALIZE_ERROR ) );
        }

        // Readers never see a half written store: write aside, then rename over
        auto tempPath = fs::path( m_options.filePath + "." + fs::unique_path( "%%%%%%%%" ).string() + ".tmp" );
        {
            std::ofstream output( tempPath.string(), std::ios::binary | std::ios::trunc );
            output << json;
            output.flush();
            if ( !output )
            {
                m_logger->error( "Unable to write {}", tempPath.string() );
                boost::system::error_code ignored;
                fs::remove( tempPath, ignored );
                return outcome::failure( std::error_code( QueueError::IO_ERROR ) );
            }
        }

        boost::system::error_code ec;
        fs::rename( tempPath, m_options.filePath, ec );
        if ( ec )
        {
            m_logger->error( "Unable to replace {}: {}", m_options.filePath, ec.message() );
            boost::system::error_code ignored;
            fs::remove( tempPath, ignored );
            return outcome::failure( std::error_code( QueueError::IO_ERROR ) );
        }
        return outcome::success();
    }

    outcome::result<MailTask::Task> FileTaskQueue::AddTask( const google::protobuf::Struct &prompt,
                                                            const std::string             &reporterEmail )
    {
        auto now = TimeUtil::GetCurrentTime();

        MailTask::Task task;
        task.set_id( boost::uuids::to_string( boost::uuids::random_generator()() ) );
        task.set_status( MailTask::Task::pending );
        *task.mutable_prompt() = prompt;
        task.set_reporter_email( reporterEmail );
        task.set_retries( 0 );
        task.set_max_retries( m_options.maxRetries );
        *task.mutable_created_at() = now;
        *task.mutable_updated_at() = now;
        AppendLog( task, MailTask::TaskLog::info, "Task created", now );

        auto added = AtomicUpdate(
            [&task]( MailTask::TaskStore &store )
            {
                *store.add_tasks() = task;
                return true;
            } );
        if ( added.has_error() )
        {
            return outcome::failure( added.error() );
        }

        m_logger->info( "New task added: {} (subject: {})", task.id(), SubjectOf( task ) );
        return task;
    }

    outcome::result<std::optional<MailTask::Task>> FileTaskQueue::PickTask()
    {
        std::optional<MailTask::Task> picked;
        auto                          updated = AtomicUpdate(
            [this, &picked]( MailTask::TaskStore &store )
            {
                for ( auto &task : *store.mutable_tasks() )
                {
                    if ( task.status() != MailTask::Task::pending )
                    {
                        continue;
                    }
                    auto now = TimeUtil::GetCurrentTime();
                    task.set_status( MailTask::Task::processing );
                    *task.mutable_started_at() = now;
                    *task.mutable_updated_at() = now;
                    AppendLog( task, MailTask::TaskLog::info, "Task processing started", now );
                    picked = task;
                    m_logger->info( "Task picked: {}", task.id() );
                    return true;
                }
                return false;
            } );
        if ( updated.has_error() )
        {
            return outcome::failure( updated.error() );
        }
        return picked;
    }

    outcome::result<std::optional<MailTask::Task>> FileTaskQueue::ClaimTask( const std::string &taskId )
    {
        std::optional<MailTask::Task> claimed;
        auto                          updated = AtomicUpdate(
            [this, &taskId, &claimed]( MailTask::TaskStore &store )
            {
                auto *task = FindById( store, taskId );
                if ( task == nullptr )
                {
                    m_logger->warn( "Task not found: {}", taskId );
                    return false;
                }
                if ( task->status() != MailTask::Task::pending )
                {
                    m_logger->warn( "Task {} is {}, only pending tasks can be claimed", taskId, StatusName( task->status() ) );
                    return false;
                }
                auto now = TimeUtil::GetCurrentTime();
                task->set_status( MailTask::Task::processing );
                *task->mutable_started_at() = now;
                *task->mutable_updated_at() = now;
                AppendLog( *task, MailTask::TaskLog::info, "Task processing started", now );
                claimed = *task;
                m_logger->info( "Task claimed: {}", taskId );
                return true;
            } );
        if ( updated.has_error() )
        {
            return outcome::failure( updated.error() );
        }
        return claimed;
    }

    outcome::result<void> FileTaskQueue::CompleteTask( const std::string &taskId, const google::protobuf::Struct &result )
    {
        return AtomicUpdate(
            [this, &taskId, &result]( MailTask::TaskStore &store )
            {
                auto *task = FindById( store, taskId );
                if ( task == nullptr )
                {
                    m_logger->warn( "Task not found: {}", taskId );
                    return false;
                }
                if ( task->status() != MailTask::Task::processing )
                {
                    m_logger->warn( "Task {} is {}, completion ignored", taskId, StatusName( task->status() ) );
                    return false;
                }
                auto now = TimeUtil::GetCurrentTime();
                task->set_status( MailTask::Task::completed );
                *task->mutable_result()       = result;
                *task->mutable_completed_at() = now;
                *task->mutable_updated_at()   = now;
                AppendLog( *task, MailTask::TaskLog::info, "Task processing completed", now );
                m_logger->info( "Task completed: {}", taskId );
                return true;
            } );
    }

    void FileTaskQueue::ApplyFailure( MailTask::Task &task, const std::string &error ) const
    {
        auto now = TimeUtil::GetCurrentTime();
        task.set_retries( task.retries() + 1 );
        *task.mutable_updated_at() = now;
        AppendLog( task, MailTask::TaskLog::error, "Task processing failed: " + error, now );

        if ( task.retries() < task.max_retries() )
        {
            task.set_status( MailTask::Task::pending );
            task.clear_started_at();
            AppendLog( task,
                       MailTask::TaskLog::info,
                       "Task will retry (" + std::to_string( task.retries() ) + "/" +
                           std::to_string( task.max_retries() ) + ")",
                       now );
            m_logger->warn( "Task will retry: {} ({}/{})", task.id(), task.retries(), task.max_retries() );
        }
        else
        {
            task.set_status( MailTask::Task::failed );
            task.set_error( error );
            *task.mutable_completed_at() = now;
            m_logger->error( "Task failed permanently: {}", task.id() );
        }
    }

    outcome::result<std::optional<MailTask::Task>> FileTaskQueue::FailTask( const std::string &taskId,
                                                                            const std::string &error )
    {
        std::optional<MailTask::Task> failed;
        auto                          updated = AtomicUpdate(
            [this, &taskId, &error, &failed]( MailTask::TaskStore &store )
            {
                auto *task = FindById( store, taskId );
                if ( task == nullptr )
                {
                    m_logger->warn( "Task not found: {}", taskId );
                    return false;
                }
                if ( task->status() != MailTask::Task::processing )
                {
                    m_logger->warn( "Task {} is {}, failure ignored", taskId, StatusName( task->status() ) );
                    failed = *task;
                    return false;
                }
                ApplyFailure( *task, error );
                failed = *task;
                return true;
            } );
        if ( updated.has_error() )
        {
            return outcome::failure( updated.error() );
        }
        return failed;
    }

    outcome::result<std::optional<MailTask::Task>> FileTaskQueue::GetTask( const std::string &taskId )
    {
        std::optional<MailTask::Task> found;
        auto                          read = AtomicUpdate(
            [&taskId, &found]( MailTask::TaskStore &store )
            {
                if ( auto *task = FindById( store, taskId ) )
                {
                    found = *task;
                }
                return false;
            } );
        if ( read.has_error() )
        {
            return outcome::failure( read.error() );
        }
        return found;
    }

    outcome::result<std::optional<MailTask::Task>> FileTaskQueue::FindTask( const std::string &idOrPrefix )
    {
        std::optional<MailTask::Task> found;
        auto                          read = AtomicUpdate(
            [&idOrPrefix, &found]( MailTask::TaskStore &store )
            {
                if ( idOrPrefix.empty() )
                {
                    return false;
                }
                if ( auto *task = FindById( store, idOrPrefix ) )
                {
                    found = *task;
                    return false;
                }
                for ( const auto &task : store.tasks() )
                {
                    if ( task.id().compare( 0, idOrPrefix.size(), idOrPrefix ) == 0 )
                    {
                        found = task;
                        break;
                    }
                }
                return false;
            } );
        if ( read.has_error() )
        {
            return outcome::failure( read.error() );
        }
        return found;
    }

    outcome::result<std::vector<MailTask::Task>> FileTaskQueue::GetAllTasks()
    {
        std::vector<MailTask::Task> tasks;
        auto                        read = AtomicUpdate(
            [&tasks]( MailTask::TaskStore &store )
            {
                tasks.assign( store.tasks().begin(), store.tasks().end() );
                return false;
            } );
        if ( read.has_error() )
        {
            return outcome::failure( read.error() );
        }
        return tasks;
    }

    outcome::result<std::vector<MailTask::Task>> FileTaskQueue::GetTasksByStatus( MailTask::Task::Status status )
    {
        std::vector<MailTask::Task> tasks;
        auto                        read = AtomicUpdate(
            [&tasks, status]( MailTask::TaskStore &store )
            {
                for ( const auto &task : store.tasks() )
                {
                    if ( task.status() == status )
                    {
                        tasks.push_back( task );
                    }
                }
                return false;
            } );
        if ( read.has_error() )
        {
            return outcome::failure( read.error() );
        }
        return tasks;
    }

    outcome::result<void> FileTaskQueue::AddTaskLog( const std::string       &taskId,
                                                     MailTask::TaskLog::Level level,
                                                     const std::string       &message )
    {
        return AtomicUpdate(
            [&taskId, level, &message]( MailTask::TaskStore &store )
            {
                auto *task = FindById( store, taskId );
                if ( task == nullptr )
                {
                    return false;
                }
                auto now = TimeUtil::GetCurrentTime();
                AppendLog( *task, level, message, now );
                *task->mutable_updated_at() = now;
                return true;
            } );
    }

    outcome::result<TaskStats> FileTaskQueue::GetStats()
    {
        TaskStats stats;
        auto      read = AtomicUpdate(
            [&stats]( MailTask::TaskStore &store )
            {
                stats.total = static_cast<size_t>( store.tasks_size() );
                for ( const auto &task : store.tasks() )
                {
                    switch ( task.status() )
                    {
                        case MailTask::Task::pending:
                            ++stats.pending;
                            break;
                        case MailTask::Task::processing:
                            ++stats.processing;
                            break;
                        case MailTask::Task::completed:
                            ++stats.completed;
                            break;
                        case MailTask::Task::failed:
                            ++stats.failed;
                            break;
                        default:
                            break;
                    }
                }
                return false;
            } );
        if ( read.has_error() )
        {
            return outcome::failure( read.error() );
        }
        return stats;
    }

    outcome::result<size_t> FileTaskQueue::Cleanup( std::chrono::milliseconds maxAge )
    {
        size_t removed = 0;
        auto   cleaned = AtomicUpdate(
            [this, maxAge, &removed]( MailTask::TaskStore &store )
            {
                auto now = TimeUtil::GetCurrentTime();

                google::protobuf::RepeatedPtrField<MailTask::Task> kept;
                for ( auto &task : *store.mutable_tasks() )
                {
                    bool expired = false;
                    if ( IsTerminal( task.status() ) )
                    {
                        // A finished task without completion time counts as finished now
                        auto age = task.has_completed_at() ? AgeMilliseconds( task.completed_at(), now ) : 0;
                        expired  = age >= maxAge.count();
                    }
                    if ( !expired )
                    {
                        kept.Add( std::move( task ) );
                    }
                }

                removed = static_cast<size_t>( store.tasks_size() - kept.size() );
                if ( removed == 0 )
                {
                    return false;
                }
                store.mutable_tasks()->Swap( &kept );
                m_logger->info( "Cleaned up {} old tasks", removed );
                return true;
            } );
        if ( cleaned.has_error() )
        {
            return outcome::failure( cleaned.error() );
        }
        return removed;
    }

    outcome::result<size_t> FileTaskQueue::RecoverExpiredTasks( std::chrono::milliseconds maxAge )
    {
        size_t recovered = 0;
        auto   updated   = AtomicUpdate(
            [this, maxAge, &recovered]( MailTask::TaskStore &store )
            {
                auto now = TimeUtil::GetCurrentTime();
                for ( auto &task : *store.mutable_tasks() )
                {
                    if ( task.status() != MailTask::Task::processing )
                    {
                        continue;
                    }
                    auto age = task.has_started_at() ? AgeMilliseconds( task.started_at(), now ) : maxAge.count();
                    if ( age < maxAge.count() )
                    {
                        continue;
                    }
                    m_logger->warn( "Task {} has been processing for {}ms, recovering it", task.id(), age );
                    ApplyFailure( task, "Task processing lease expired" );
                    ++recovered;
                }
                return recovered > 0;
            } );
        if ( updated.has_error() )
        {
            return outcome::failure( updated.error() );
        }
        return recovered;
    }
}
