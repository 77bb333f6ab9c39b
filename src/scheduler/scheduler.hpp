/**
* Header file for the task scheduler
*/
#ifndef MAILTASK_SCHEDULER_SCHEDULER_HPP
#define MAILTASK_SCHEDULER_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/deadline_timer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include "queue/task_queue.hpp"
#include "processing/processing_agent.hpp"
#include "processing/task_reporter.hpp"
#include "base/logger.hpp"

namespace mailtask::scheduler
{
    struct SchedulerConfig
    {
        std::chrono::milliseconds pollInterval{ 5000 };
        size_t                    maxConcurrent = 1;
        std::chrono::milliseconds taskTimeout{ 300000 };
        std::chrono::milliseconds gracefulShutdownTimeout{ 30000 };
        bool                      enabled = true;
    };

    struct SchedulerStatus
    {
        bool                     isRunning  = false;
        bool                     isDraining = false;
        size_t                   activeTasks = 0;
        std::vector<std::string> activeTaskIds;
        SchedulerConfig          config;
        std::string              agentName;
    };

    /**
    * Pulls pending tasks from the queue and hands them to the processing agent.
    * Poll and timeout timers run on the supplied io_context. Picks and agent calls
    * run on an internal thread pool bounded by maxConcurrent, so a pick waiting on the
    * store lock never delays a timeout.
    */
    class Scheduler : public std::enable_shared_from_this<Scheduler>
    {
    public:
        enum class State
        {
            STOPPED,
            RUNNING,
            DRAINING,
        };

        /** Create a scheduler
        * @param context - io context driving the poll and timeout timers
        * @param queue - task queue to pull from
        * @param agent - processing agent
        * @param reporter - consumer of finished tasks, may be null
        * @param config - scheduling parameters
        */
        Scheduler( std::shared_ptr<boost::asio::io_context>      context,
                   std::shared_ptr<queue::TaskQueue>             queue,
                   std::shared_ptr<processing::ProcessingAgent> agent,
                   std::shared_ptr<processing::TaskReporter>    reporter,
                   SchedulerConfig                               config );

        ~Scheduler();

        /** Starts polling; an immediate tick is queued on the io context
        * @return false if disabled, already started or the agent is not ready
        */
        bool Start();

        /** Stops taking new tasks and waits for the in-flight ones up to gracefulShutdownTimeout.
        * Tasks still running afterwards get their cancellation token set.
        */
        void Stop();

        /** Runs one poll on the calling thread
        */
        void TriggerPoll();

        SchedulerStatus GetStatus() const;

        State GetState() const
        {
            return m_state;
        }

    private:
        void OnPollTick( uint64_t generation );
        void SchedulePoll( uint64_t generation );
        /** Takes a concurrency slot for one pick
        * @return false if the scheduler is not running or every slot is taken
        */
        bool ReserveSlot();
        void PickAndDispatch();
        void Dispatch( const MailTask::Task &task, std::shared_ptr<processing::CancellationToken> token );
        void ProcessTask( const MailTask::Task                           &task,
                          const std::shared_ptr<processing::CancellationToken> &token,
                          const std::shared_ptr<boost::asio::deadline_timer>   &timeoutTimer );
        void Report( const MailTask::Task &task );

        std::shared_ptr<boost::asio::io_context>      m_context;
        std::shared_ptr<queue::TaskQueue>             m_queue;
        std::shared_ptr<processing::ProcessingAgent> m_agent;
        std::shared_ptr<processing::TaskReporter>    m_reporter;
        SchedulerConfig                               m_config;

        std::atomic<State>          m_state{ State::STOPPED };
        std::atomic<uint64_t>       m_generation{ 0 };
        boost::asio::deadline_timer m_pollTimer;

        mutable std::mutex                                               m_inFlightMutex;
        std::map<std::string, std::shared_ptr<processing::CancellationToken>> m_inFlight;
        size_t                                                           m_reserved = 0; ///< slots taken by picks in progress

        boost::asio::thread_pool m_pool;
        base::Logger             m_logger = base::createLogger( "Scheduler" );
    };
}

#endif // MAILTASK_SCHEDULER_SCHEDULER_HPP
