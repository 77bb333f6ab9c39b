#include "scheduler/scheduler.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "queue/impl/file_task_queue.hpp"
#include "queue/queue_error.hpp"
#include "testutil/mail_prompt.hpp"
#include "testutil/storage/base_fs_test.hpp"
#include "testutil/wait_condition.hpp"

using namespace mailtask;
using namespace mailtask::scheduler;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace
{
    class ProcessingAgentMock : public processing::ProcessingAgent
    {
    public:
        MOCK_METHOD( std::string, Name, (), ( const, override ) );
        MOCK_METHOD( google::protobuf::Struct,
                     ProcessTask,
                     ( const MailTask::Task &, const processing::ProcessOptions & ),
                     ( override ) );
        MOCK_METHOD( bool, IsReady, (), ( override ) );
        MOCK_METHOD( void, Destroy, (), ( override ) );
    };

    class TaskReporterMock : public processing::TaskReporter
    {
    public:
        MOCK_METHOD( void, ReportTask, ( const MailTask::Task & ), ( override ) );
    };

    class TaskQueueMock : public queue::TaskQueue
    {
    public:
        MOCK_METHOD( outcome::result<void>, Initialize, (), ( override ) );
        MOCK_METHOD( outcome::result<MailTask::Task>,
                     AddTask,
                     ( const google::protobuf::Struct &, const std::string & ),
                     ( override ) );
        MOCK_METHOD( outcome::result<std::optional<MailTask::Task>>, PickTask, (), ( override ) );
        MOCK_METHOD( outcome::result<std::optional<MailTask::Task>>, ClaimTask, ( const std::string & ), ( override ) );
        MOCK_METHOD( outcome::result<void>,
                     CompleteTask,
                     ( const std::string &, const google::protobuf::Struct & ),
                     ( override ) );
        MOCK_METHOD( outcome::result<std::optional<MailTask::Task>>,
                     FailTask,
                     ( const std::string &, const std::string & ),
                     ( override ) );
        MOCK_METHOD( outcome::result<std::optional<MailTask::Task>>, GetTask, ( const std::string & ), ( override ) );
        MOCK_METHOD( outcome::result<std::optional<MailTask::Task>>, FindTask, ( const std::string & ), ( override ) );
        MOCK_METHOD( outcome::result<std::vector<MailTask::Task>>, GetAllTasks, (), ( override ) );
        MOCK_METHOD( outcome::result<std::vector<MailTask::Task>>,
                     GetTasksByStatus,
                     ( MailTask::Task::Status ),
                     ( override ) );
        MOCK_METHOD( outcome::result<void>,
                     AddTaskLog,
                     ( const std::string &, MailTask::TaskLog::Level, const std::string & ),
                     ( override ) );
        MOCK_METHOD( outcome::result<queue::TaskStats>, GetStats, (), ( override ) );
        MOCK_METHOD( outcome::result<size_t>, Cleanup, ( std::chrono::milliseconds ), ( override ) );
        MOCK_METHOD( outcome::result<size_t>, RecoverExpiredTasks, ( std::chrono::milliseconds ), ( override ) );
    };

    constexpr auto WAIT_TIMEOUT = std::chrono::milliseconds( 5000 );
}

class SchedulerTest : public test::FSFixture
{
public:
    SchedulerTest() : FSFixture( "mailtask-scheduler-test" )
    {
    }

    void SetUp() override
    {
        FSFixture::SetUp();

        context = std::make_shared<boost::asio::io_context>();
        workGuard.emplace( context->get_executor() );
        contextThread = std::thread( [this] { context->run(); } );

        agent    = std::make_shared<NiceMock<ProcessingAgentMock>>();
        reporter = std::make_shared<NiceMock<TaskReporterMock>>();
        ON_CALL( *agent, Name() ).WillByDefault( Return( "TestAgent" ) );
        ON_CALL( *agent, IsReady() ).WillByDefault( Return( true ) );

        config.pollInterval            = std::chrono::milliseconds( 20 );
        config.maxConcurrent           = 1;
        config.taskTimeout             = std::chrono::milliseconds( 5000 );
        config.gracefulShutdownTimeout = std::chrono::milliseconds( 5000 );

        CreateQueue( 3 );
    }

    void TearDown() override
    {
        if ( scheduler )
        {
            scheduler->Stop();
            scheduler.reset();
        }
        workGuard.reset();
        context->stop();
        if ( contextThread.joinable() )
        {
            contextThread.join();
        }
        FSFixture::TearDown();
    }

    void CreateQueue( int32_t maxRetries )
    {
        queue::FileTaskQueue::Options options;
        options.filePath   = pathFor( "tasks.json" );
        options.maxRetries = maxRetries;
        taskQueue          = std::make_shared<queue::FileTaskQueue>( options );
        ASSERT_FALSE( taskQueue->Initialize().has_error() );
    }

    void CreateScheduler()
    {
        scheduler = std::make_shared<Scheduler>( context, taskQueue, agent, reporter, config );
    }

    std::string AddTask( const std::string &subject )
    {
        auto added = taskQueue->AddTask( test::makePrompt( subject ), "r@x.com" );
        EXPECT_FALSE( added.has_error() );
        return added.value().id();
    }

    /** @return task status, -1 if the task cannot be read */
    int StatusOf( const std::string &id )
    {
        auto task = taskQueue->GetTask( id );
        if ( task.has_error() || !task.value() )
        {
            return -1;
        }
        return task.value()->status();
    }

    std::shared_ptr<boost::asio::io_context>                                                 context;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> workGuard;
    std::thread                                                                              contextThread;

    std::shared_ptr<NiceMock<ProcessingAgentMock>> agent;
    std::shared_ptr<NiceMock<TaskReporterMock>>    reporter;
    std::shared_ptr<queue::FileTaskQueue>          taskQueue;
    SchedulerConfig                                config;
    std::shared_ptr<Scheduler>                     scheduler;
};

TEST_F( SchedulerTest, DisabledSchedulerDoesNotStart )
{
    config.enabled = false;
    CreateScheduler();

    EXPECT_CALL( *agent, IsReady() ).Times( 0 );
    EXPECT_FALSE( scheduler->Start() );
    EXPECT_EQ( scheduler->GetState(), Scheduler::State::STOPPED );
}

TEST_F( SchedulerTest, AgentNotReadyPreventsStart )
{
    CreateScheduler();
    EXPECT_CALL( *agent, IsReady() ).WillOnce( Return( false ) );

    EXPECT_FALSE( scheduler->Start() );
    EXPECT_EQ( scheduler->GetState(), Scheduler::State::STOPPED );
}

TEST_F( SchedulerTest, StartTwiceIsNoop )
{
    CreateScheduler();
    EXPECT_CALL( *agent, IsReady() ).Times( 1 );

    EXPECT_TRUE( scheduler->Start() );
    EXPECT_FALSE( scheduler->Start() );
    EXPECT_TRUE( scheduler->GetStatus().isRunning );
}

/**
 * @given a pending task and an agent that succeeds
 * @when the scheduler runs
 * @then the task is completed with the agent result and reported
 */
TEST_F( SchedulerTest, ProcessesTaskToCompletion )
{
    auto id = AddTask( "Hello" );

    EXPECT_CALL( *agent, ProcessTask( _, _ ) )
        .WillOnce( Invoke(
            []( const MailTask::Task &task, const processing::ProcessOptions &options )
            {
                EXPECT_EQ( task.status(), MailTask::Task::processing );
                EXPECT_TRUE( options.cancellationToken );
                EXPECT_FALSE( options.cancellationToken->IsCancelled() );
                EXPECT_EQ( options.timeout, std::chrono::milliseconds( 5000 ) );
                return test::makePrompt( "result", "ok" );
            } ) );
    EXPECT_CALL( *reporter, ReportTask( _ ) )
        .WillOnce( Invoke( []( const MailTask::Task &task )
                           { EXPECT_EQ( task.status(), MailTask::Task::completed ); } ) );

    CreateScheduler();
    ASSERT_TRUE( scheduler->Start() );
    ASSERT_WAIT_FOR_CONDITION( [&] { return StatusOf( id ) == MailTask::Task::completed; }, WAIT_TIMEOUT,
                               "task completed" );
    ASSERT_WAIT_FOR_CONDITION( [&] { return scheduler->GetStatus().activeTasks == 0; }, WAIT_TIMEOUT,
                               "in-flight set drained" );

    auto task = taskQueue->GetTask( id );
    ASSERT_TRUE( task.value() );
    EXPECT_EQ( test::fieldOf( task.value()->result(), "text" ), "ok" );

    bool invocationLogged = std::any_of( task.value()->logs().begin(),
                                         task.value()->logs().end(),
                                         []( const MailTask::TaskLog &entry )
                                         { return entry.message() == "Invoking agent (TestAgent)..."; } );
    EXPECT_TRUE( invocationLogged );
}

TEST_F( SchedulerTest, AgentFailureExhaustsRetries )
{
    CreateQueue( 1 );
    auto id = AddTask( "Boom" );

    EXPECT_CALL( *agent, ProcessTask( _, _ ) ).WillOnce( Throw( std::runtime_error( "boom" ) ) );
    EXPECT_CALL( *reporter, ReportTask( _ ) )
        .WillOnce( Invoke( []( const MailTask::Task &task )
                           { EXPECT_EQ( task.status(), MailTask::Task::failed ); } ) );

    CreateScheduler();
    ASSERT_TRUE( scheduler->Start() );
    ASSERT_WAIT_FOR_CONDITION( [&] { return StatusOf( id ) == MailTask::Task::failed; }, WAIT_TIMEOUT, "task failed" );
    ASSERT_WAIT_FOR_CONDITION( [&] { return scheduler->GetStatus().activeTasks == 0; }, WAIT_TIMEOUT,
                               "in-flight set drained" );

    auto task = taskQueue->GetTask( id );
    ASSERT_TRUE( task.value() );
    EXPECT_EQ( task.value()->retries(), 1 );
    EXPECT_EQ( task.value()->error(), "boom" );
}

/**
 * @given an agent that ignores its deadline but returns once cancelled
 * @when the task timeout elapses
 * @then the attempt counts as a cancellation failure
 */
TEST_F( SchedulerTest, TimeoutCancelsTask )
{
    CreateQueue( 1 );
    config.taskTimeout = std::chrono::milliseconds( 100 );
    auto id            = AddTask( "Slow" );

    EXPECT_CALL( *agent, ProcessTask( _, _ ) )
        .WillOnce( Invoke(
            []( const MailTask::Task &, const processing::ProcessOptions &options )
            {
                options.cancellationToken->WaitFor( std::chrono::milliseconds( 3000 ) );
                return test::makePrompt( "late" );
            } ) );

    CreateScheduler();
    ASSERT_TRUE( scheduler->Start() );
    ASSERT_WAIT_FOR_CONDITION( [&] { return StatusOf( id ) == MailTask::Task::failed; }, WAIT_TIMEOUT, "task failed" );

    auto task = taskQueue->GetTask( id );
    ASSERT_TRUE( task.value() );
    EXPECT_EQ( task.value()->error(), "Task was cancelled (timeout or shutdown)." );
}

/**
 * @given a store whose lock is contended during the first pick
 * @when the scheduler polls
 * @then the failed pick is skipped and the next tick processes the task
 */
TEST_F( SchedulerTest, PickFailureIsSkippedUntilNextTick )
{
    auto id = AddTask( "Contended" );

    auto queueMock = std::make_shared<NiceMock<TaskQueueMock>>();
    ON_CALL( *queueMock, CompleteTask( _, _ ) )
        .WillByDefault( Invoke( taskQueue.get(), &queue::FileTaskQueue::CompleteTask ) );
    ON_CALL( *queueMock, FailTask( _, _ ) ).WillByDefault( Invoke( taskQueue.get(), &queue::FileTaskQueue::FailTask ) );
    ON_CALL( *queueMock, GetTask( _ ) ).WillByDefault( Invoke( taskQueue.get(), &queue::FileTaskQueue::GetTask ) );
    ON_CALL( *queueMock, AddTaskLog( _, _, _ ) )
        .WillByDefault( Invoke( taskQueue.get(), &queue::FileTaskQueue::AddTaskLog ) );

    outcome::result<std::optional<MailTask::Task>> contended =
        outcome::failure( std::error_code( queue::QueueError::LOCK_TIMEOUT ) );
    EXPECT_CALL( *queueMock, PickTask() )
        .WillOnce( Return( contended ) )
        .WillRepeatedly( Invoke( [this] { return taskQueue->PickTask(); } ) );
    EXPECT_CALL( *agent, ProcessTask( _, _ ) ).WillOnce( Return( test::makePrompt( "done" ) ) );

    scheduler = std::make_shared<Scheduler>( context, queueMock, agent, reporter, config );
    ASSERT_TRUE( scheduler->Start() );
    ASSERT_WAIT_FOR_CONDITION( [&] { return StatusOf( id ) == MailTask::Task::completed; }, WAIT_TIMEOUT,
                               "task completed after a failed pick" );
    EXPECT_TRUE( scheduler->GetStatus().isRunning );
}

/**
 * @given a running task with a short timeout and a later pick stuck on the store lock
 * @when the timeout elapses while the pick is still waiting
 * @then the running task is cancelled on time
 */
TEST_F( SchedulerTest, SlowPickDoesNotDelayTimeouts )
{
    CreateQueue( 1 );
    config.maxConcurrent = 2;
    config.taskTimeout   = std::chrono::milliseconds( 100 );
    auto id              = AddTask( "Slow" );

    auto queueMock = std::make_shared<NiceMock<TaskQueueMock>>();
    ON_CALL( *queueMock, CompleteTask( _, _ ) )
        .WillByDefault( Invoke( taskQueue.get(), &queue::FileTaskQueue::CompleteTask ) );
    ON_CALL( *queueMock, FailTask( _, _ ) ).WillByDefault( Invoke( taskQueue.get(), &queue::FileTaskQueue::FailTask ) );
    ON_CALL( *queueMock, GetTask( _ ) ).WillByDefault( Invoke( taskQueue.get(), &queue::FileTaskQueue::GetTask ) );
    ON_CALL( *queueMock, AddTaskLog( _, _, _ ) )
        .WillByDefault( Invoke( taskQueue.get(), &queue::FileTaskQueue::AddTaskLog ) );
    EXPECT_CALL( *queueMock, PickTask() )
        .WillOnce( Invoke( [this] { return taskQueue->PickTask(); } ) )
        .WillRepeatedly( Invoke(
            []() -> outcome::result<std::optional<MailTask::Task>>
            {
                std::this_thread::sleep_for( std::chrono::milliseconds( 2000 ) );
                return std::optional<MailTask::Task>();
            } ) );

    EXPECT_CALL( *agent, ProcessTask( _, _ ) )
        .WillOnce( Invoke(
            []( const MailTask::Task &, const processing::ProcessOptions &options )
            {
                options.cancellationToken->WaitFor( std::chrono::milliseconds( 3000 ) );
                return test::makePrompt( "late" );
            } ) );

    scheduler = std::make_shared<Scheduler>( context, queueMock, agent, reporter, config );
    ASSERT_TRUE( scheduler->Start() );
    ASSERT_WAIT_FOR_CONDITION( [&] { return StatusOf( id ) == MailTask::Task::failed; },
                               std::chrono::milliseconds( 1000 ),
                               "task cancelled while another pick waits" );
}

TEST_F( SchedulerTest, ConcurrencyIsBounded )
{
    config.maxConcurrent = 2;
    std::vector<std::string> ids;
    for ( int i = 0; i < 5; ++i )
    {
        ids.push_back( AddTask( "task " + std::to_string( i ) ) );
    }

    std::atomic<int> running{ 0 };
    std::atomic<int> maxRunning{ 0 };
    EXPECT_CALL( *agent, ProcessTask( _, _ ) )
        .Times( 5 )
        .WillRepeatedly( Invoke(
            [&running, &maxRunning]( const MailTask::Task &, const processing::ProcessOptions & )
            {
                int now  = ++running;
                int seen = maxRunning.load();
                while ( now > seen && !maxRunning.compare_exchange_weak( seen, now ) )
                {
                }
                std::this_thread::sleep_for( std::chrono::milliseconds( 100 ) );
                --running;
                return test::makePrompt( "done" );
            } ) );

    CreateScheduler();
    ASSERT_TRUE( scheduler->Start() );
    ASSERT_WAIT_FOR_CONDITION(
        [&]
        {
            auto stats = taskQueue->GetStats();
            return !stats.has_error() && stats.value().completed == 5;
        },
        std::chrono::milliseconds( 10000 ),
        "all tasks completed" );

    EXPECT_LE( maxRunning.load(), 2 );
    EXPECT_GE( maxRunning.load(), 1 );
}

TEST_F( SchedulerTest, StopWaitsForInFlightTask )
{
    auto id = AddTask( "Draining" );

    std::atomic<bool> started{ false };
    EXPECT_CALL( *agent, ProcessTask( _, _ ) )
        .WillOnce( Invoke(
            [&started]( const MailTask::Task &, const processing::ProcessOptions & )
            {
                started = true;
                std::this_thread::sleep_for( std::chrono::milliseconds( 300 ) );
                return test::makePrompt( "done" );
            } ) );
    EXPECT_CALL( *agent, Destroy() ).Times( 1 );

    CreateScheduler();
    ASSERT_TRUE( scheduler->Start() );
    ASSERT_WAIT_FOR_CONDITION( [&] { return started.load(); }, WAIT_TIMEOUT, "agent invoked" );

    auto status = scheduler->GetStatus();
    EXPECT_EQ( status.activeTasks, 1 );
    ASSERT_EQ( status.activeTaskIds.size(), 1 );
    EXPECT_EQ( status.activeTaskIds[0], id );
    EXPECT_EQ( status.agentName, "TestAgent" );

    scheduler->Stop();
    EXPECT_EQ( scheduler->GetState(), Scheduler::State::STOPPED );
    EXPECT_EQ( StatusOf( id ), MailTask::Task::completed );
}

TEST_F( SchedulerTest, ShutdownTimeoutCancelsRemainingTasks )
{
    CreateQueue( 1 );
    config.gracefulShutdownTimeout = std::chrono::milliseconds( 200 );
    auto id                        = AddTask( "Stubborn" );

    std::atomic<bool> started{ false };
    EXPECT_CALL( *agent, ProcessTask( _, _ ) )
        .WillOnce( Invoke(
            [&started]( const MailTask::Task &, const processing::ProcessOptions &options )
            {
                started = true;
                options.cancellationToken->WaitFor( std::chrono::milliseconds( 3000 ) );
                return test::makePrompt( "late" );
            } ) );

    CreateScheduler();
    ASSERT_TRUE( scheduler->Start() );
    ASSERT_WAIT_FOR_CONDITION( [&] { return started.load(); }, WAIT_TIMEOUT, "agent invoked" );

    scheduler->Stop();
    ASSERT_WAIT_FOR_CONDITION( [&] { return StatusOf( id ) == MailTask::Task::failed; }, WAIT_TIMEOUT, "task failed" );
    auto task = taskQueue->GetTask( id );
    EXPECT_EQ( task.value()->error(), "Task was cancelled (timeout or shutdown)." );
}

TEST_F( SchedulerTest, TriggerPollRequiresRunningScheduler )
{
    auto id = AddTask( "Manual" );
    CreateScheduler();

    EXPECT_CALL( *agent, ProcessTask( _, _ ) ).Times( 0 );
    scheduler->TriggerPoll();
    EXPECT_EQ( StatusOf( id ), MailTask::Task::pending );
}

TEST_F( SchedulerTest, ProgressIsLoggedToTask )
{
    auto id = AddTask( "Progress" );

    EXPECT_CALL( *agent, ProcessTask( _, _ ) )
        .WillOnce( Invoke(
            []( const MailTask::Task &, const processing::ProcessOptions &options )
            {
                options.onProgress( processing::AgentProgress{ 50, "analyze", "halfway" } );
                return test::makePrompt( "done" );
            } ) );

    CreateScheduler();
    ASSERT_TRUE( scheduler->Start() );
    ASSERT_WAIT_FOR_CONDITION( [&] { return StatusOf( id ) == MailTask::Task::completed; }, WAIT_TIMEOUT,
                               "task completed" );

    auto task             = taskQueue->GetTask( id );
    bool progressRecorded = std::any_of( task.value()->logs().begin(),
                                         task.value()->logs().end(),
                                         []( const MailTask::TaskLog &entry )
                                         {
                                             return entry.level() == MailTask::TaskLog::debug &&
                                                    entry.message() == "[50%] analyze: halfway";
                                         } );
    EXPECT_TRUE( progressRecorded );
}

TEST_F( SchedulerTest, ReporterFailureDoesNotAffectTask )
{
    auto first  = AddTask( "first" );
    auto second = AddTask( "second" );

    ON_CALL( *agent, ProcessTask( _, _ ) ).WillByDefault( Return( test::makePrompt( "done" ) ) );
    EXPECT_CALL( *reporter, ReportTask( _ ) ).Times( 2 ).WillRepeatedly( Throw( std::runtime_error( "smtp down" ) ) );

    CreateScheduler();
    ASSERT_TRUE( scheduler->Start() );
    ASSERT_WAIT_FOR_CONDITION(
        [&] { return StatusOf( first ) == MailTask::Task::completed && StatusOf( second ) == MailTask::Task::completed; },
        WAIT_TIMEOUT,
        "both tasks completed" );
    ASSERT_WAIT_FOR_CONDITION( [&] { return scheduler->GetStatus().activeTasks == 0; }, WAIT_TIMEOUT,
                               "in-flight set drained" );
}
