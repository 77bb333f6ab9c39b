/**
* Header file for the application wiring the queue, the scheduler and the agent together
*/
#ifndef MAILTASK_APPLICATION_MAILTASK_APP_HPP
#define MAILTASK_APPLICATION_MAILTASK_APP_HPP

#include <atomic>
#include <memory>
#include <optional>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "application/config.hpp"
#include "queue/task_queue.hpp"
#include "scheduler/scheduler.hpp"
#include "processing/processing_agent.hpp"
#include "processing/task_reporter.hpp"
#include "base/logger.hpp"

namespace mailtask::application
{
    class MailTaskApp
    {
    public:
        /** Create the application
        * @param config - queue and scheduler settings
        * @param agent - processing agent
        * @param reporter - consumer of finished tasks, may be null
        */
        MailTaskApp( MailTaskConfig                                config,
                     std::shared_ptr<processing::ProcessingAgent> agent,
                     std::shared_ptr<processing::TaskReporter>    reporter = nullptr );

        ~MailTaskApp();

        /** Initializes the queue, recovers orphaned tasks if configured and starts the scheduler
        */
        outcome::result<void> Start();

        /** Drains the scheduler and releases the agent
        */
        void Stop();

        /** Enqueues a manually entered email
        * @param subject - mail subject
        * @param from - sender address, also used for reporting
        * @param text - mail body
        */
        outcome::result<MailTask::Task> AddTask( const std::string &subject,
                                                 const std::string &from,
                                                 const std::string &text );

        outcome::result<queue::TaskStats> GetQueueStats();

        /** Runs one scheduler poll right away
        */
        outcome::result<void> TriggerProcess();

        /** Logs agent and scheduler status
        */
        void PrintStatus() const;

        std::shared_ptr<queue::TaskQueue> GetTaskQueue() const
        {
            return m_queue;
        }

        std::shared_ptr<scheduler::Scheduler> GetScheduler() const
        {
            return m_scheduler;
        }

        bool IsStarted() const
        {
            return m_started;
        }

    private:
        using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

        void StopContext();

        MailTaskConfig                               m_config;
        std::shared_ptr<boost::asio::io_context>     m_context;
        std::optional<WorkGuard>                     m_workGuard;
        std::thread                                  m_contextThread;
        std::shared_ptr<queue::TaskQueue>            m_queue;
        std::shared_ptr<processing::ProcessingAgent> m_agent;
        std::shared_ptr<processing::TaskReporter>    m_reporter;
        std::shared_ptr<scheduler::Scheduler>        m_scheduler;
        std::atomic<bool>                            m_started{ false };
        base::Logger                                 m_logger = base::createLogger( "MailTaskApp" );
    };
}

#endif // MAILTASK_APPLICATION_MAILTASK_APP_HPP
