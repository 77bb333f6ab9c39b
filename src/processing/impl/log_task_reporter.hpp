#ifndef MAILTASK_PROCESSING_LOG_TASK_REPORTER_HPP
#define MAILTASK_PROCESSING_LOG_TASK_REPORTER_HPP

#include <atomic>

#include "processing/task_reporter.hpp"
#include "base/logger.hpp"

namespace mailtask::processing
{
    /** Writes a one line report of each finished task to the log
    */
    class LogTaskReporter : public TaskReporter
    {
    public:
        void ReportTask( const MailTask::Task &task ) override;

        size_t GetReportedCount() const
        {
            return m_reported;
        }

    private:
        std::atomic<size_t> m_reported{ 0 };
        base::Logger        m_logger = base::createLogger( "LogTaskReporter" );
    };
}

#endif // MAILTASK_PROCESSING_LOG_TASK_REPORTER_HPP
