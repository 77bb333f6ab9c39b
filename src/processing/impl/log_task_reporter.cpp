#include "processing/impl/log_task_reporter.hpp"

#include "queue/task_queue.hpp"

namespace mailtask::processing
{
    void LogTaskReporter::ReportTask( const MailTask::Task &task )
    {
        std::string summary;
        auto        summaryField = task.result().fields().find( "summary" );
        if ( summaryField != task.result().fields().end() )
        {
            summary = summaryField->second.string_value();
        }

        if ( task.status() == MailTask::Task::completed )
        {
            m_logger->info( "Report for {} -> {}: completed, {}", task.id(), task.reporter_email(), summary );
        }
        else
        {
            m_logger->info( "Report for {} -> {}: {} after {} attempts, {}",
                            task.id(),
                            task.reporter_email(),
                            queue::StatusName( task.status() ),
                            task.retries(),
                            task.error() );
        }
        ++m_reported;
    }
}
