/**
* Header file for the cooperative cancellation flag handed to processing agents
*/
#ifndef MAILTASK_PROCESSING_CANCELLATION_TOKEN_HPP
#define MAILTASK_PROCESSING_CANCELLATION_TOKEN_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace mailtask::processing
{
    /** One-shot cancellation flag.
    * Setting it never interrupts the holder; agents are expected to poll it or wait on it.
    */
    class CancellationToken
    {
    public:
        void Cancel();

        bool IsCancelled() const;

        /** Sleeps until the token is cancelled or the duration elapses
        * @param duration - maximum time to wait
        * @return true if the token was cancelled
        */
        bool WaitFor( std::chrono::milliseconds duration );

    private:
        std::atomic<bool>       m_cancelled{ false };
        std::mutex              m_mutex;
        std::condition_variable m_cv;
    };
}

#endif // MAILTASK_PROCESSING_CANCELLATION_TOKEN_HPP
