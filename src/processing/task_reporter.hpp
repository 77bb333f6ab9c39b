/**
* Header file for the consumer of finished tasks
*/
#ifndef MAILTASK_PROCESSING_TASK_REPORTER_HPP
#define MAILTASK_PROCESSING_TASK_REPORTER_HPP

#include "proto/MailTask.pb.h"

namespace mailtask::processing
{
    /** Receives every task that reached a terminal state (completed or failed)
    */
    class TaskReporter
    {
    public:
        virtual ~TaskReporter() = default;

        /** Report a finished task
        * @param task - terminal task snapshot
        * @throws std::exception on delivery failure, the caller logs it and moves on
        */
        virtual void ReportTask( const MailTask::Task &task ) = 0;
    };
}

#endif // MAILTASK_PROCESSING_TASK_REPORTER_HPP
