#include "queue/task_queue.hpp"

namespace mailtask::queue
{
    const char *StatusName( MailTask::Task::Status status )
    {
        switch ( status )
        {
            case MailTask::Task::pending:
                return "pending";
            case MailTask::Task::processing:
                return "processing";
            case MailTask::Task::completed:
                return "completed";
            case MailTask::Task::failed:
                return "failed";
            default:
                break;
        }
        return "unknown";
    }

    bool IsTerminal( MailTask::Task::Status status )
    {
        return status == MailTask::Task::completed || status == MailTask::Task::failed;
    }
}
