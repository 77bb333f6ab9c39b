#include "application/mailtask_app.hpp"

#include <google/protobuf/util/time_util.h>

#include "application/app_error.hpp"
#include "queue/impl/file_store_lock.hpp"
#include "queue/impl/file_task_queue.hpp"

namespace mailtask::application
{
    namespace
    {
        google::protobuf::Value StringValue( const std::string &text )
        {
            google::protobuf::Value value;
            value.set_string_value( text );
            return value;
        }
    }

    MailTaskApp::MailTaskApp( MailTaskConfig                                config,
                              std::shared_ptr<processing::ProcessingAgent> agent,
                              std::shared_ptr<processing::TaskReporter>    reporter ) :
        m_config( std::move( config ) ),
        m_context( std::make_shared<boost::asio::io_context>() ),
        m_agent( std::move( agent ) ),
        m_reporter( std::move( reporter ) )
    {
        queue::FileStoreLock::Options lockOptions;
        lockOptions.staleAfter = m_config.lockStaleAfter;

        queue::FileTaskQueue::Options queueOptions;
        queueOptions.filePath   = m_config.queuePath;
        queueOptions.maxRetries = m_config.maxRetries;

        m_queue = std::make_shared<queue::FileTaskQueue>( queueOptions,
                                                          std::make_shared<queue::FileStoreLock>( lockOptions ) );
    }

    MailTaskApp::~MailTaskApp()
    {
        Stop();
    }

    outcome::result<void> MailTaskApp::Start()
    {
        if ( m_started )
        {
            m_logger->warn( "MailTask is already running." );
            return outcome::success();
        }

        m_logger->info( "Starting MailTask with agent {}", m_agent->Name() );

        auto initialized = m_queue->Initialize();
        if ( initialized.has_error() )
        {
            m_logger->error( "Task queue initialization failed: {}", initialized.error().message() );
            return initialized;
        }

        if ( m_config.recoverAfter.count() > 0 )
        {
            auto recovered = m_queue->RecoverExpiredTasks( m_config.recoverAfter );
            if ( recovered.has_error() )
            {
                m_logger->warn( "Unable to recover expired tasks: {}", recovered.error().message() );
            }
            else if ( recovered.value() > 0 )
            {
                m_logger->info( "Recovered {} expired tasks", recovered.value() );
            }
        }

        if ( m_config.scheduler.enabled )
        {
            m_context->restart();
            m_workGuard.emplace( m_context->get_executor() );
            m_contextThread = std::thread( [context = m_context] { context->run(); } );

            m_scheduler =
                std::make_shared<scheduler::Scheduler>( m_context, m_queue, m_agent, m_reporter, m_config.scheduler );
            if ( !m_scheduler->Start() )
            {
                m_logger->error( "MailTask failed to start: agent {} is not ready", m_agent->Name() );
                m_scheduler.reset();
                StopContext();
                return outcome::failure( std::error_code( AppError::AGENT_NOT_READY ) );
            }
        }
        else
        {
            m_logger->info( "Scheduler disabled, tasks will only be queued" );
        }

        m_started = true;
        m_logger->info( "MailTask started successfully." );
        return outcome::success();
    }

    void MailTaskApp::Stop()
    {
        if ( !m_started.exchange( false ) )
        {
            return;
        }
        m_logger->info( "Stopping MailTask..." );

        if ( m_scheduler )
        {
            // The scheduler tears the agent down once drained
            m_scheduler->Stop();
            m_scheduler.reset();
        }
        else
        {
            m_agent->Destroy();
        }
        StopContext();
        m_logger->info( "MailTask stopped." );
    }

    void MailTaskApp::StopContext()
    {
        m_workGuard.reset();
        m_context->stop();
        if ( m_contextThread.joinable() )
        {
            m_contextThread.join();
        }
    }

    outcome::result<MailTask::Task> MailTaskApp::AddTask( const std::string &subject,
                                                          const std::string &from,
                                                          const std::string &text )
    {
        auto now = google::protobuf::util::TimeUtil::GetCurrentTime();

        google::protobuf::Struct prompt;
        auto                    &fields = *prompt.mutable_fields();
        fields["messageId"] =
            StringValue( "manual-" + std::to_string( google::protobuf::util::TimeUtil::TimestampToMilliseconds( now ) ) );
        fields["subject"] = StringValue( subject );

        auto &sender     = *fields["from"].mutable_struct_value()->mutable_fields();
        sender["address"] = StringValue( from );
        sender["name"]    = StringValue( from.substr( 0, from.find( '@' ) ) );
        fields["to"].mutable_list_value();
        fields["date"] = StringValue( google::protobuf::util::TimeUtil::ToString( now ) );
        fields["text"] = StringValue( text );

        return m_queue->AddTask( prompt, from );
    }

    outcome::result<queue::TaskStats> MailTaskApp::GetQueueStats()
    {
        return m_queue->GetStats();
    }

    outcome::result<void> MailTaskApp::TriggerProcess()
    {
        if ( !m_scheduler )
        {
            return outcome::failure( std::error_code( AppError::SCHEDULER_DISABLED ) );
        }
        m_scheduler->TriggerPoll();
        return outcome::success();
    }

    void MailTaskApp::PrintStatus() const
    {
        m_logger->info( "Agent: {}", m_agent->Name() );
        if ( !m_scheduler )
        {
            m_logger->info( "Scheduler: disabled" );
            return;
        }
        auto status = m_scheduler->GetStatus();
        m_logger->info( "Scheduler: {}", status.isRunning ? "running" : ( status.isDraining ? "draining" : "stopped" ) );
        m_logger->info( "  Poll interval: {}ms", status.config.pollInterval.count() );
        m_logger->info( "  Max concurrency: {}", status.config.maxConcurrent );
        m_logger->info( "  Task timeout: {}ms", status.config.taskTimeout.count() );
        m_logger->info( "  In flight: {} task(s)", status.activeTasks );
    }
}
