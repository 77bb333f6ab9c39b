#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <iostream>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>

#include "application/config.hpp"
#include "application/mailtask_app.hpp"
#include "processing/impl/log_task_reporter.hpp"
#include "processing/impl/mock_agent.hpp"
#include "queue/impl/file_store_lock.hpp"
#include "queue/impl/file_task_queue.hpp"

using namespace mailtask;
using google::protobuf::util::TimeUtil;

namespace
{
    // cmd line options
    struct Options
    {
        std::string                command;
        std::string                taskId;
        std::optional<std::string> queuePath;
        bool                       verbose     = false;
        bool                       noScheduler = false;
        int64_t                    mockDelay   = 1000;
        double                     failRate    = 0.0;
        std::optional<std::string> status;
        size_t                     limit = 10;
        std::string                subject;
        std::string                from;
        std::string                text;
        int64_t                    days = 7;
    };

    boost::optional<Options> parseCommandLine( int argc, char **argv )
    {
        namespace po = boost::program_options;
        try
        {
            Options     o;
            std::string queuePath;
            std::string status;

            po::options_description desc( "mailtask options" );
            desc.add_options()( "help,h", "print usage message" )                                             //
                ( "command", po::value( &o.command ), "start | status | list | add | process | cleanup" ) //
                ( "task", po::value( &o.taskId ), "task id or id prefix for process" )                       //
                ( "queue,q", po::value( &queuePath ), "task queue file, overrides TASK_QUEUE_PATH" )         //
                ( "verbose,v", po::bool_switch( &o.verbose ), "debug logging" )                              //
                ( "no-scheduler", po::bool_switch( &o.noScheduler ), "start: only queue tasks" )             //
                ( "mock-delay", po::value( &o.mockDelay ), "start/process: mock agent delay in ms" )         //
                ( "fail-rate", po::value( &o.failRate ), "start/process: mock agent failure probability" )   //
                ( "status,s", po::value( &status ), "list: only tasks with this status" )                    //
                ( "limit,n", po::value( &o.limit ), "list: number of tasks to show" )                        //
                ( "subject", po::value( &o.subject ), "add: mail subject" )                                  //
                ( "from", po::value( &o.from ), "add: sender address" )                                      //
                ( "text", po::value( &o.text ), "add: mail body" )                                           //
                ( "days,d", po::value( &o.days ), "cleanup: age in days of the tasks to remove" );

            po::positional_options_description positional;
            positional.add( "command", 1 ).add( "task", 1 );

            po::variables_map vm;
            po::store( po::command_line_parser( argc, argv ).options( desc ).positional( positional ).run(), vm );
            po::notify( vm );

            if ( vm.count( "help" ) != 0 || o.command.empty() )
            {
                std::cerr << "Usage: mailtask <command> [options]\n" << desc << "\n";
                return boost::none;
            }

            if ( !queuePath.empty() )
            {
                o.queuePath = queuePath;
            }
            if ( !status.empty() )
            {
                o.status = status;
            }
            return o;
        }
        catch ( const std::exception &e )
        {
            std::cerr << e.what() << std::endl;
        }
        return boost::none;
    }

    std::string SubjectOf( const MailTask::Task &task )
    {
        auto field = task.prompt().fields().find( "subject" );
        return field != task.prompt().fields().end() ? field->second.string_value() : std::string();
    }

    std::shared_ptr<processing::MockAgent> CreateMockAgent( const Options &options )
    {
        processing::MockAgent::Options agentOptions;
        agentOptions.delay    = std::chrono::milliseconds( options.mockDelay );
        agentOptions.failRate = options.failRate;
        return std::make_shared<processing::MockAgent>( agentOptions );
    }

    std::shared_ptr<queue::FileTaskQueue> CreateQueue( const application::MailTaskConfig &config )
    {
        queue::FileStoreLock::Options lockOptions;
        lockOptions.staleAfter = config.lockStaleAfter;

        queue::FileTaskQueue::Options queueOptions;
        queueOptions.filePath   = config.queuePath;
        queueOptions.maxRetries = config.maxRetries;
        return std::make_shared<queue::FileTaskQueue>( queueOptions, std::make_shared<queue::FileStoreLock>( lockOptions ) );
    }

    int RunStart( application::MailTaskConfig config, const Options &options )
    {
        if ( options.noScheduler )
        {
            config.scheduler.enabled = false;
        }
        application::MailTaskApp app( config, CreateMockAgent( options ), std::make_shared<processing::LogTaskReporter>() );

        auto started = app.Start();
        if ( started.has_error() )
        {
            std::cerr << "Failed to start: " << started.error().message() << std::endl;
            return 1;
        }
        app.PrintStatus();

        boost::asio::io_context   signals;
        boost::asio::signal_set   signalSet( signals, SIGINT, SIGTERM );
        signalSet.async_wait( []( const boost::system::error_code &, int signal )
                              { std::cout << "Received signal " << signal << ", shutting down" << std::endl; } );
        signals.run();

        app.Stop();
        return 0;
    }

    int RunStatus( queue::TaskQueue &taskQueue )
    {
        auto stats = taskQueue.GetStats();
        if ( stats.has_error() )
        {
            std::cerr << "Unable to read the task queue: " << stats.error().message() << std::endl;
            return 1;
        }
        std::cout << "Task queue" << std::endl;
        std::cout << boost::format( "  total:      %d\n" ) % stats.value().total;
        std::cout << boost::format( "  pending:    %d\n" ) % stats.value().pending;
        std::cout << boost::format( "  processing: %d\n" ) % stats.value().processing;
        std::cout << boost::format( "  completed:  %d\n" ) % stats.value().completed;
        std::cout << boost::format( "  failed:     %d\n" ) % stats.value().failed;
        return 0;
    }

    int RunList( queue::TaskQueue &taskQueue, const Options &options )
    {
        outcome::result<std::vector<MailTask::Task>> tasks = outcome::success( std::vector<MailTask::Task>() );
        if ( options.status )
        {
            MailTask::Task::Status status;
            if ( !MailTask::Task::Status_Parse( *options.status, &status ) )
            {
                std::cerr << "Unknown status: " << *options.status << std::endl;
                return 1;
            }
            tasks = taskQueue.GetTasksByStatus( status );
        }
        else
        {
            tasks = taskQueue.GetAllTasks();
        }
        if ( tasks.has_error() )
        {
            std::cerr << "Unable to read the task queue: " << tasks.error().message() << std::endl;
            return 1;
        }

        auto &list = tasks.value();
        std::stable_sort( list.begin(),
                          list.end(),
                          []( const MailTask::Task &lhs, const MailTask::Task &rhs )
                          { return lhs.created_at() > rhs.created_at(); } );
        if ( list.size() > options.limit )
        {
            list.resize( options.limit );
        }

        if ( list.empty() )
        {
            std::cout << "No tasks" << std::endl;
            return 0;
        }
        for ( const auto &task : list )
        {
            std::cout << boost::format( "%.8s  %-10s  %d/%d  %s  %s\n" ) % task.id() % queue::StatusName( task.status() ) %
                             task.retries() % task.max_retries() % TimeUtil::ToString( task.created_at() ) %
                             SubjectOf( task );
        }
        return 0;
    }

    int RunAdd( application::MailTaskConfig config, const Options &options )
    {
        if ( options.subject.empty() || options.from.empty() )
        {
            std::cerr << "add requires --subject and --from" << std::endl;
            return 1;
        }
        config.scheduler.enabled = false;
        application::MailTaskApp app( config, CreateMockAgent( options ) );

        auto added = app.AddTask( options.subject, options.from, options.text );
        if ( added.has_error() )
        {
            std::cerr << "Unable to add the task: " << added.error().message() << std::endl;
            return 1;
        }
        std::cout << "Task added: " << added.value().id() << std::endl;
        return 0;
    }

    int RunProcess( queue::TaskQueue &taskQueue, const Options &options )
    {
        if ( options.taskId.empty() )
        {
            std::cerr << "process requires a task id" << std::endl;
            return 1;
        }
        auto found = taskQueue.FindTask( options.taskId );
        if ( found.has_error() )
        {
            std::cerr << "Unable to read the task queue: " << found.error().message() << std::endl;
            return 1;
        }
        if ( !found.value() )
        {
            std::cerr << "Task not found: " << options.taskId << std::endl;
            return 1;
        }

        auto claimed = taskQueue.ClaimTask( found.value()->id() );
        if ( claimed.has_error() )
        {
            std::cerr << "Unable to claim the task: " << claimed.error().message() << std::endl;
            return 1;
        }
        if ( !claimed.value() )
        {
            std::cerr << "Task " << found.value()->id() << " is " << queue::StatusName( found.value()->status() )
                      << ", only pending tasks can be processed" << std::endl;
            return 1;
        }

        const auto &task  = *claimed.value();
        auto        agent = CreateMockAgent( options );
        std::cout << "Processing " << task.id() << " (" << SubjectOf( task ) << ")" << std::endl;
        try
        {
            auto result    = agent->ProcessTask( task, processing::ProcessOptions{} );
            auto completed = taskQueue.CompleteTask( task.id(), result );
            if ( completed.has_error() )
            {
                std::cerr << "Unable to store the result: " << completed.error().message() << std::endl;
                return 1;
            }
            std::string json;
            google::protobuf::util::JsonPrintOptions printOptions;
            printOptions.add_whitespace = true;
            if ( google::protobuf::util::MessageToJsonString( result, &json, printOptions ).ok() )
            {
                std::cout << json << std::endl;
            }
            std::cout << "Task completed" << std::endl;
            return 0;
        }
        catch ( const std::exception &e )
        {
            auto failed = taskQueue.FailTask( task.id(), e.what() );
            if ( failed.has_error() )
            {
                std::cerr << "Unable to record the failure: " << failed.error().message() << std::endl;
                return 1;
            }
            std::cerr << "Task failed: " << e.what() << std::endl;
            if ( failed.value() )
            {
                std::cerr << "Task is now " << queue::StatusName( failed.value()->status() ) << std::endl;
            }
            return 1;
        }
    }

    int RunCleanup( queue::TaskQueue &taskQueue, const Options &options )
    {
        auto removed = taskQueue.Cleanup( std::chrono::hours( 24 * options.days ) );
        if ( removed.has_error() )
        {
            std::cerr << "Cleanup failed: " << removed.error().message() << std::endl;
            return 1;
        }
        std::cout << "Removed " << removed.value() << " tasks" << std::endl;
        return 0;
    }
}

int main( int argc, char **argv )
{
    auto options = parseCommandLine( argc, argv );
    if ( !options )
    {
        return EXIT_FAILURE;
    }

    auto config = application::LoadConfig();
    if ( config.has_error() )
    {
        std::cerr << "Invalid configuration: " << config.error().message() << std::endl;
        return EXIT_FAILURE;
    }
    if ( options->queuePath )
    {
        config.value().queuePath = *options->queuePath;
    }
    base::setLoggingLevel( options->verbose ? "debug" : config.value().logLevel );
    base::setDebugPattern( options->verbose );

    const auto &command = options->command;
    if ( command == "start" )
    {
        return RunStart( config.value(), *options );
    }
    if ( command == "add" )
    {
        return RunAdd( config.value(), *options );
    }

    auto taskQueue = CreateQueue( config.value() );
    if ( command == "status" )
    {
        return RunStatus( *taskQueue );
    }
    if ( command == "list" )
    {
        return RunList( *taskQueue, *options );
    }
    if ( command == "process" )
    {
        return RunProcess( *taskQueue, *options );
    }
    if ( command == "cleanup" )
    {
        return RunCleanup( *taskQueue, *options );
    }

    std::cerr << "Unknown command: " << command << std::endl;
    return EXIT_FAILURE;
}
