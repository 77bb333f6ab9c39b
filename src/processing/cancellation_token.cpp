#include "processing/cancellation_token.hpp"

namespace mailtask::processing
{
    void CancellationToken::Cancel()
    {
        {
            std::lock_guard<std::mutex> lock( m_mutex );
            m_cancelled = true;
        }
        m_cv.notify_all();
    }

    bool CancellationToken::IsCancelled() const
    {
        return m_cancelled;
    }

    bool CancellationToken::WaitFor( std::chrono::milliseconds duration )
    {
        std::unique_lock<std::mutex> lock( m_mutex );
        return m_cv.wait_for( lock, duration, [this] { return m_cancelled.load(); } );
    }
}
