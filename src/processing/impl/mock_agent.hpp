#ifndef MAILTASK_PROCESSING_MOCK_AGENT_HPP
#define MAILTASK_PROCESSING_MOCK_AGENT_HPP

#include "processing/processing_agent.hpp"
#include "base/logger.hpp"

namespace mailtask::processing
{
    /** Agent producing canned results after a delay, for local runs and tests
    */
    class MockAgent : public ProcessingAgent
    {
    public:
        struct Options
        {
            std::chrono::milliseconds delay{ 1000 };
            bool                      shouldFail = false;
            double                    failRate   = 0.0; ///< probability in [0, 1] of a simulated failure
        };

        MockAgent();
        explicit MockAgent( Options options );

        std::string              Name() const override;
        google::protobuf::Struct ProcessTask( const MailTask::Task &task, const ProcessOptions &options ) override;

    private:
        bool RollFailure() const;

        Options      m_options;
        base::Logger m_logger = base::createLogger( "MockAgent" );
    };
}

#endif // MAILTASK_PROCESSING_MOCK_AGENT_HPP
