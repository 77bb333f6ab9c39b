#ifndef MAILTASK_QUEUE_FILE_STORE_LOCK_HPP
#define MAILTASK_QUEUE_FILE_STORE_LOCK_HPP

#include <chrono>

#include <boost/filesystem/path.hpp>

#include "queue/store_lock.hpp"
#include "base/logger.hpp"

namespace mailtask::queue
{
    /** Lock backed by a "<store>.lock" directory next to the store file.
    * The directory creation is the atomic test-and-set. The holder then records a token and
    * its acquisition time in millisecond precision inside the directory; a lock whose record
    * is older than staleAfter belongs to a crashed holder and is reclaimed.
    */
    class FileStoreLock : public StoreLock
    {
    public:
        struct Options
        {
            std::chrono::milliseconds staleAfter{ 10000 };
            size_t                    retries = 15;
            double                    factor  = 1.5;
            std::chrono::milliseconds minTimeout{ 50 };
            std::chrono::milliseconds maxTimeout{ 500 };
            bool                      randomize = true;
        };

        /// Lower bound of staleAfter, well above the one second resolution of directory mtimes
        static constexpr std::chrono::milliseconds MIN_STALE_AFTER{ 2000 };
        /// Name of the owner record inside the lock directory
        static constexpr const char *OWNER_RECORD = "owner";

        FileStoreLock();
        explicit FileStoreLock( Options options );

        outcome::result<std::unique_ptr<Lease>> Acquire( const std::string &path ) override;

        const Options &GetOptions() const
        {
            return m_options;
        }

        static boost::filesystem::path LockPathFor( const std::string &path );

    private:
        class DirectoryLease;

        /** Single test-and-set attempt, reclaiming a stale lock once
        * @return true if the lock is now held by the caller
        */
        outcome::result<bool> TryAcquire( const boost::filesystem::path &lockPath, const std::string &token );

        /** Writes the owner record of a freshly created lock directory
        */
        outcome::result<void> WriteOwner( const boost::filesystem::path &lockPath, const std::string &token );

        /** @param observedToken - receives the owner token the decision was based on, empty without a record
        */
        bool IsStale( const boost::filesystem::path &lockPath, std::string &observedToken ) const;
        std::chrono::milliseconds BackoffDelay( size_t attempt ) const;

        Options      m_options;
        base::Logger m_logger = base::createLogger( "FileStoreLock" );
    };
}

#endif // MAILTASK_QUEUE_FILE_STORE_LOCK_HPP
