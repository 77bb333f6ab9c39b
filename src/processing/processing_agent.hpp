/**
* Header file for the processing agent interface
*/
#ifndef MAILTASK_PROCESSING_PROCESSING_AGENT_HPP
#define MAILTASK_PROCESSING_PROCESSING_AGENT_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "proto/MailTask.pb.h"
#include "processing/cancellation_token.hpp"

namespace mailtask::processing
{
    struct AgentProgress
    {
        int         percentage = 0;
        std::string step;
        std::string message;
    };

    struct ProcessOptions
    {
        std::shared_ptr<CancellationToken>         cancellationToken;
        std::chrono::milliseconds                  timeout{ 0 };
        std::function<void( const AgentProgress &)> onProgress;
    };

    /**
    * Processing agent interface.
    * An implementation turns a task prompt into a result, the scheduler owns everything else.
    */
    class ProcessingAgent
    {
    public:
        virtual ~ProcessingAgent() = default;

        virtual std::string Name() const
        {
            return "Unknown";
        }

        /** Process a single task
        * @param task - task in processing state
        * @param options - cancellation token, deadline and progress sink
        * @return task result
        * @throws std::exception on processing failure
        */
        virtual google::protobuf::Struct ProcessTask( const MailTask::Task &task, const ProcessOptions &options ) = 0;

        /** Called once before the scheduler starts dispatching
        */
        virtual bool IsReady()
        {
            return true;
        }

        /** Called once when the scheduler stops
        */
        virtual void Destroy()
        {
        }
    };
}

#endif // MAILTASK_PROCESSING_PROCESSING_AGENT_HPP
