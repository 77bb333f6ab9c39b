#include "scheduler/scheduler.hpp"

#include <thread>

#include <boost/asio/post.hpp>

namespace mailtask::scheduler
{
    namespace
    {
        constexpr auto DRAIN_CHECK_INTERVAL = std::chrono::milliseconds( 100 );

        SchedulerConfig Normalize( SchedulerConfig config )
        {
            SchedulerConfig defaults;
            if ( config.pollInterval.count() <= 0 )
            {
                config.pollInterval = defaults.pollInterval;
            }
            if ( config.maxConcurrent == 0 )
            {
                config.maxConcurrent = defaults.maxConcurrent;
            }
            if ( config.taskTimeout.count() <= 0 )
            {
                config.taskTimeout = defaults.taskTimeout;
            }
            if ( config.gracefulShutdownTimeout.count() < 0 )
            {
                config.gracefulShutdownTimeout = defaults.gracefulShutdownTimeout;
            }
            return config;
        }

        std::string SubjectOf( const MailTask::Task &task )
        {
            auto field = task.prompt().fields().find( "subject" );
            return field != task.prompt().fields().end() ? field->second.string_value() : std::string();
        }
    }

    Scheduler::Scheduler( std::shared_ptr<boost::asio::io_context>      context,
                          std::shared_ptr<queue::TaskQueue>             queue,
                          std::shared_ptr<processing::ProcessingAgent> agent,
                          std::shared_ptr<processing::TaskReporter>    reporter,
                          SchedulerConfig                               config ) :
        m_context( std::move( context ) ),
        m_queue( std::move( queue ) ),
        m_agent( std::move( agent ) ),
        m_reporter( std::move( reporter ) ),
        m_config( Normalize( config ) ),
        m_pollTimer( *m_context ),
        m_pool( m_config.maxConcurrent )
    {
    }

    Scheduler::~Scheduler()
    {
        {
            std::lock_guard<std::mutex> lock( m_inFlightMutex );
            for ( auto &[taskId, token] : m_inFlight )
            {
                token->Cancel();
            }
        }
        m_pool.join();
    }

    bool Scheduler::Start()
    {
        if ( !m_config.enabled )
        {
            m_logger->warn( "Scheduler is disabled." );
            return false;
        }

        auto expected = State::STOPPED;
        if ( !m_state.compare_exchange_strong( expected, State::RUNNING ) )
        {
            m_logger->warn( "Scheduler is already running." );
            return false;
        }

        if ( !m_agent->IsReady() )
        {
            m_logger->error( "Agent {} is not ready, scheduler not started", m_agent->Name() );
            m_state = State::STOPPED;
            return false;
        }

        m_logger->info( "Scheduler started (pollInterval: {}ms, maxConcurrent: {}, taskTimeout: {}ms, agent: {})",
                        m_config.pollInterval.count(),
                        m_config.maxConcurrent,
                        m_config.taskTimeout.count(),
                        m_agent->Name() );

        auto generation = ++m_generation;
        boost::asio::post( *m_context,
                           [weakSelf = weak_from_this(), generation]
                           {
                               if ( auto self = weakSelf.lock() )
                               {
                                   self->OnPollTick( generation );
                               }
                           } );
        return true;
    }

    void Scheduler::OnPollTick( uint64_t generation )
    {
        if ( generation != m_generation || m_state != State::RUNNING )
        {
            return;
        }
        if ( ReserveSlot() )
        {
            boost::asio::post( m_pool, [this] { PickAndDispatch(); } );
        }
        SchedulePoll( generation );
    }

    void Scheduler::SchedulePoll( uint64_t generation )
    {
        m_pollTimer.expires_from_now( boost::posix_time::milliseconds( m_config.pollInterval.count() ) );
        m_pollTimer.async_wait(
            [weakSelf = weak_from_this(), generation]( const boost::system::error_code &ec )
            {
                if ( ec )
                {
                    return;
                }
                if ( auto self = weakSelf.lock() )
                {
                    self->OnPollTick( generation );
                }
            } );
    }

    void Scheduler::TriggerPoll()
    {
        if ( m_state != State::RUNNING )
        {
            m_logger->warn( "Scheduler is not running; cannot trigger poll." );
            return;
        }
        if ( ReserveSlot() )
        {
            PickAndDispatch();
        }
    }

    bool Scheduler::ReserveSlot()
    {
        if ( m_state != State::RUNNING )
        {
            return false;
        }

        std::lock_guard<std::mutex> lock( m_inFlightMutex );
        if ( m_inFlight.size() + m_reserved >= m_config.maxConcurrent )
        {
            m_logger->debug( "Max concurrency reached ({}); skipping poll.", m_config.maxConcurrent );
            return false;
        }
        ++m_reserved;
        return true;
    }

    void Scheduler::PickAndDispatch()
    {
        if ( m_state != State::RUNNING )
        {
            std::lock_guard<std::mutex> lock( m_inFlightMutex );
            --m_reserved;
            return;
        }

        auto picked = m_queue->PickTask();

        std::shared_ptr<processing::CancellationToken> token;
        {
            std::lock_guard<std::mutex> lock( m_inFlightMutex );
            --m_reserved;
            if ( picked.has_error() )
            {
                m_logger->error( "Error while polling tasks: {}", picked.error().message() );
                return;
            }
            if ( !picked.value() )
            {
                return;
            }
            token = std::make_shared<processing::CancellationToken>();
            m_inFlight.emplace( picked.value()->id(), token );
            m_logger->debug( "Current concurrency: {}/{}", m_inFlight.size(), m_config.maxConcurrent );
        }

        Dispatch( *picked.value(), token );
    }

    void Scheduler::Dispatch( const MailTask::Task &task, std::shared_ptr<processing::CancellationToken> token )
    {
        auto timeoutTimer = std::make_shared<boost::asio::deadline_timer>(
            *m_context, boost::posix_time::milliseconds( m_config.taskTimeout.count() ) );
        timeoutTimer->async_wait(
            [token, taskId = task.id(), timeout = m_config.taskTimeout, logger = m_logger](
                const boost::system::error_code &ec )
            {
                if ( ec )
                {
                    return;
                }
                logger->warn( "Task timed out: {} after {}ms", taskId, timeout.count() );
                token->Cancel();
            } );

        // The pool is joined in the destructor, so jobs never outlive this object
        boost::asio::post( m_pool,
                           [this, task, token, timeoutTimer] { ProcessTask( task, token, timeoutTimer ); } );
    }

    void Scheduler::ProcessTask( const MailTask::Task                                 &task,
                                 const std::shared_ptr<processing::CancellationToken> &token,
                                 const std::shared_ptr<boost::asio::deadline_timer>   &timeoutTimer )
    {
        const auto &taskId    = task.id();
        auto        startTime = std::chrono::steady_clock::now();
        m_logger->info( "Start processing task: {} (subject: {})", taskId, SubjectOf( task ) );

        auto logged = m_queue->AddTaskLog( taskId, MailTask::TaskLog::info, "Invoking agent (" + m_agent->Name() + ")..." );
        if ( logged.has_error() )
        {
            m_logger->warn( "Unable to log agent invocation for {}: {}", taskId, logged.error().message() );
        }

        processing::ProcessOptions options;
        options.cancellationToken = token;
        options.timeout           = m_config.taskTimeout;
        options.onProgress        = [this, taskId]( const processing::AgentProgress &progress )
        {
            auto message = fmt::format( "[{}%] {}: {}", progress.percentage, progress.step, progress.message );
            auto added   = m_queue->AddTaskLog( taskId, MailTask::TaskLog::debug, message );
            if ( added.has_error() )
            {
                m_logger->debug( "Unable to log progress for {}: {}", taskId, added.error().message() );
            }
        };

        bool                     failed = false;
        std::string              failure;
        google::protobuf::Struct result;
        try
        {
            result = m_agent->ProcessTask( task, options );
            if ( token->IsCancelled() )
            {
                failed  = true;
                failure = "Task was cancelled (timeout or shutdown).";
            }
        }
        catch ( const std::exception &e )
        {
            failed  = true;
            failure = e.what();
        }
        catch ( ... )
        {
            failed  = true;
            failure = "Unknown processing error";
        }

        if ( !failed )
        {
            auto completed = m_queue->CompleteTask( taskId, result );
            if ( completed.has_error() )
            {
                m_logger->error( "Unable to store result of {}: {}", taskId, completed.error().message() );
                failed  = true;
                failure = "Unable to store result: " + completed.error().message();
            }
            else
            {
                auto finished = m_queue->GetTask( taskId );
                if ( finished.has_error() )
                {
                    m_logger->warn( "Unable to reload task {}: {}", taskId, finished.error().message() );
                }
                else if ( finished.value() )
                {
                    Report( *finished.value() );
                }
                auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - startTime );
                m_logger->info( "Task processed successfully: {} in {}ms", taskId, duration.count() );
            }
        }

        if ( failed )
        {
            auto updated = m_queue->FailTask( taskId, failure );
            if ( updated.has_error() )
            {
                m_logger->error( "Unable to record failure of {}: {}", taskId, updated.error().message() );
            }
            else if ( updated.value() && updated.value()->status() == MailTask::Task::failed )
            {
                Report( *updated.value() );
            }
            m_logger->error( "Task processing failed: {}: {}", taskId, failure );
        }

        boost::asio::post( *m_context, [timeoutTimer] { timeoutTimer->cancel(); } );

        std::lock_guard<std::mutex> lock( m_inFlightMutex );
        m_inFlight.erase( taskId );
    }

    void Scheduler::Report( const MailTask::Task &task )
    {
        if ( !m_reporter )
        {
            return;
        }
        try
        {
            m_reporter->ReportTask( task );
        }
        catch ( const std::exception &e )
        {
            m_logger->warn( "Failed to report task {}: {}", task.id(), e.what() );
        }
    }

    void Scheduler::Stop()
    {
        auto expected = State::RUNNING;
        if ( !m_state.compare_exchange_strong( expected, State::DRAINING ) )
        {
            return;
        }

        boost::asio::post( *m_context,
                           [weakSelf = weak_from_this()]
                           {
                               if ( auto self = weakSelf.lock() )
                               {
                                   self->m_pollTimer.cancel();
                               }
                           } );

        auto deadline = std::chrono::steady_clock::now() + m_config.gracefulShutdownTimeout;
        while ( true )
        {
            {
                std::lock_guard<std::mutex> lock( m_inFlightMutex );
                if ( m_inFlight.empty() && m_reserved == 0 )
                {
                    break;
                }
                if ( std::chrono::steady_clock::now() >= deadline )
                {
                    m_logger->warn( "Graceful shutdown timed out; cancelling remaining tasks." );
                    for ( auto &[taskId, token] : m_inFlight )
                    {
                        m_logger->warn( "Force-cancelling task: {}", taskId );
                        token->Cancel();
                    }
                    break;
                }
                m_logger->debug( "Waiting for {} tasks to finish...", m_inFlight.size() + m_reserved );
            }
            std::this_thread::sleep_for( DRAIN_CHECK_INTERVAL );
        }

        m_agent->Destroy();
        m_state = State::STOPPED;
        m_logger->info( "Scheduler stopped." );
    }

    SchedulerStatus Scheduler::GetStatus() const
    {
        SchedulerStatus status;
        auto            state = m_state.load();
        status.isRunning      = state == State::RUNNING;
        status.isDraining     = state == State::DRAINING;
        status.config         = m_config;
        status.agentName      = m_agent->Name();

        std::lock_guard<std::mutex> lock( m_inFlightMutex );
        status.activeTasks = m_inFlight.size();
        for ( const auto &[taskId, token] : m_inFlight )
        {
            status.activeTaskIds.push_back( taskId );
        }
        return status;
    }
}
