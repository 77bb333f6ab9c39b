#include "processing/impl/mock_agent.hpp"

#include <stdexcept>
#include <thread>

#include <boost/random/mersenne_twister.hpp>
#include <boost/random/random_device.hpp>
#include <boost/random/uniform_real_distribution.hpp>

namespace mailtask::processing
{
    namespace
    {
        google::protobuf::Value StringValue( const std::string &text )
        {
            google::protobuf::Value value;
            value.set_string_value( text );
            return value;
        }

        void ReportProgress( const ProcessOptions &options, int percentage, const std::string &step )
        {
            if ( options.onProgress )
            {
                options.onProgress( AgentProgress{ percentage, step, step } );
            }
        }
    }

    MockAgent::MockAgent() : MockAgent( Options{} )
    {
    }

    MockAgent::MockAgent( Options options ) : m_options( options )
    {
    }

    std::string MockAgent::Name() const
    {
        return "MockAgent";
    }

    bool MockAgent::RollFailure() const
    {
        if ( m_options.shouldFail )
        {
            return true;
        }
        if ( m_options.failRate <= 0.0 )
        {
            return false;
        }
        thread_local boost::random::mt19937              generator{ boost::random::random_device{}() };
        boost::random::uniform_real_distribution<double> distribution( 0.0, 1.0 );
        return distribution( generator ) < m_options.failRate;
    }

    google::protobuf::Struct MockAgent::ProcessTask( const MailTask::Task &task, const ProcessOptions &options )
    {
        m_logger->debug( "Processing task {}", task.id() );
        ReportProgress( options, 0, "Start processing" );

        if ( options.cancellationToken )
        {
            if ( options.cancellationToken->WaitFor( m_options.delay ) )
            {
                throw std::runtime_error( "Processing cancelled" );
            }
        }
        else
        {
            std::this_thread::sleep_for( m_options.delay );
        }

        if ( RollFailure() )
        {
            throw std::runtime_error( "Simulated processing failure" );
        }

        std::string subject;
        auto        subjectField = task.prompt().fields().find( "subject" );
        if ( subjectField != task.prompt().fields().end() )
        {
            subject = subjectField->second.string_value();
        }
        ReportProgress( options, 100, "Complete processing" );

        google::protobuf::Struct result;
        auto                    &fields = *result.mutable_fields();
        fields["summary"]               = StringValue( "Processed email: " + subject );
        fields["response"]              = StringValue( "Mock Agent processed task " + task.id() );

        google::protobuf::Value todo;
        auto                   &todoFields = *todo.mutable_struct_value()->mutable_fields();
        todoFields["id"]                   = StringValue( "1" );
        todoFields["title"]                = StringValue( "Process: " + subject );
        todoFields["status"]               = StringValue( "pending" );
        todoFields["priority"]             = StringValue( "medium" );
        *fields["todos"].mutable_list_value()->add_values() = todo;

        auto *agentLogs = fields["agentLogs"].mutable_list_value();
        for ( const char *entry : { "Start processing", "Analyze email content", "Generate todos", "Complete processing" } )
        {
            *agentLogs->add_values() = StringValue( entry );
        }
        return result;
    }
}
