#include "queue/impl/file_store_lock.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <thread>

#include <boost/filesystem/operations.hpp>
#include <boost/optional.hpp>
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/random_device.hpp>
#include <boost/random/uniform_real_distribution.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "queue/queue_error.hpp"

namespace mailtask::queue
{
    namespace fs = boost::filesystem;

    namespace
    {
        struct OwnerRecord
        {
            std::string token;
            int64_t     acquiredAtMs = 0;
        };

        int64_t NowMilliseconds()
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch() )
                .count();
        }

        boost::optional<OwnerRecord> ReadOwner( const fs::path &lockPath )
        {
            std::ifstream input( ( lockPath / FileStoreLock::OWNER_RECORD ).string() );
            OwnerRecord   record;
            if ( !( input >> record.token >> record.acquiredAtMs ) )
            {
                return boost::none;
            }
            return record;
        }
    }

    class FileStoreLock::DirectoryLease : public StoreLock::Lease
    {
    public:
        DirectoryLease( fs::path lockPath, std::string token, base::Logger logger ) :
            m_lockPath( std::move( lockPath ) ), m_token( std::move( token ) ), m_logger( std::move( logger ) )
        {
        }

        ~DirectoryLease() override
        {
            auto owner = ReadOwner( m_lockPath );
            if ( !owner || owner->token != m_token )
            {
                // Another process considered us stale and took the lock over
                m_logger->warn( "Lock {} was reclaimed while held, leaving it in place", m_lockPath.string() );
                return;
            }
            boost::system::error_code ec;
            fs::remove_all( m_lockPath, ec );
            if ( ec )
            {
                m_logger->warn( "Unable to release lock {}: {}", m_lockPath.string(), ec.message() );
            }
        }

    private:
        fs::path     m_lockPath;
        std::string  m_token;
        base::Logger m_logger;
    };

    FileStoreLock::FileStoreLock() : FileStoreLock( Options{} )
    {
    }

    FileStoreLock::FileStoreLock( Options options ) : m_options( options )
    {
        if ( m_options.staleAfter < MIN_STALE_AFTER )
        {
            m_logger->warn( "Lock staleness {}ms is below the minimum, using {}ms",
                            m_options.staleAfter.count(),
                            MIN_STALE_AFTER.count() );
            m_options.staleAfter = MIN_STALE_AFTER;
        }
    }

    fs::path FileStoreLock::LockPathFor( const std::string &path )
    {
        return fs::path( path + ".lock" );
    }

    outcome::result<std::unique_ptr<StoreLock::Lease>> FileStoreLock::Acquire( const std::string &path )
    {
        auto lockPath = LockPathFor( path );
        auto token    = boost::uuids::to_string( boost::uuids::random_generator()() );

        for ( size_t attempt = 0; attempt <= m_options.retries; ++attempt )
        {
            auto acquired = TryAcquire( lockPath, token );
            if ( acquired.has_error() )
            {
                return outcome::failure( acquired.error() );
            }
            if ( acquired.value() )
            {
                m_logger->trace( "LOCK_ACQUIRED {} (attempt {})", lockPath.string(), attempt );
                return std::unique_ptr<Lease>( std::make_unique<DirectoryLease>( lockPath, token, m_logger ) );
            }
            if ( attempt < m_options.retries )
            {
                std::this_thread::sleep_for( BackoffDelay( attempt ) );
            }
        }

        m_logger->debug( "Lock {} is already being held", lockPath.string() );
        return outcome::failure( std::error_code( QueueError::LOCK_TIMEOUT ) );
    }

    outcome::result<bool> FileStoreLock::TryAcquire( const fs::path &lockPath, const std::string &token )
    {
        boost::system::error_code ec;
        if ( fs::create_directory( lockPath, ec ) )
        {
            auto written = WriteOwner( lockPath, token );
            if ( written.has_error() )
            {
                return outcome::failure( written.error() );
            }
            return true;
        }
        if ( ec )
        {
            m_logger->error( "Unable to create lock {}: {}", lockPath.string(), ec.message() );
            return outcome::failure( std::error_code( QueueError::LOCK_FAILED ) );
        }

        std::string observedToken;
        if ( !IsStale( lockPath, observedToken ) )
        {
            return false;
        }

        // The holder may have released it and a new one taken it since the check
        auto current = ReadOwner( lockPath );
        if ( ( current ? current->token : std::string() ) != observedToken )
        {
            return false;
        }

        m_logger->warn( "Reclaiming stale lock {}", lockPath.string() );
        fs::remove_all( lockPath, ec );
        if ( ec )
        {
            m_logger->error( "Unable to remove stale lock {}: {}", lockPath.string(), ec.message() );
            return outcome::failure( std::error_code( QueueError::LOCK_FAILED ) );
        }
        if ( fs::create_directory( lockPath, ec ) )
        {
            auto written = WriteOwner( lockPath, token );
            if ( written.has_error() )
            {
                return outcome::failure( written.error() );
            }
            return true;
        }
        if ( ec )
        {
            m_logger->error( "Unable to create lock {}: {}", lockPath.string(), ec.message() );
            return outcome::failure( std::error_code( QueueError::LOCK_FAILED ) );
        }
        // Somebody else reclaimed it first
        return false;
    }

    outcome::result<void> FileStoreLock::WriteOwner( const fs::path &lockPath, const std::string &token )
    {
        // Written aside and renamed so a contender never reads a partial record
        auto tempPath = lockPath / ( std::string( OWNER_RECORD ) + ".tmp" );
        {
            std::ofstream output( tempPath.string(), std::ios::trunc );
            output << token << ' ' << NowMilliseconds() << '\n';
            output.flush();
            if ( !output )
            {
                m_logger->error( "Unable to write owner record of lock {}", lockPath.string() );
                boost::system::error_code ignored;
                fs::remove_all( lockPath, ignored );
                return outcome::failure( std::error_code( QueueError::LOCK_FAILED ) );
            }
        }

        boost::system::error_code ec;
        fs::rename( tempPath, lockPath / OWNER_RECORD, ec );
        if ( ec )
        {
            m_logger->error( "Unable to record ownership of lock {}: {}", lockPath.string(), ec.message() );
            boost::system::error_code ignored;
            fs::remove_all( lockPath, ignored );
            return outcome::failure( std::error_code( QueueError::LOCK_FAILED ) );
        }
        return outcome::success();
    }

    bool FileStoreLock::IsStale( const fs::path &lockPath, std::string &observedToken ) const
    {
        observedToken.clear();
        if ( auto owner = ReadOwner( lockPath ) )
        {
            observedToken = owner->token;
            return NowMilliseconds() - owner->acquiredAtMs > m_options.staleAfter.count();
        }

        // No record yet: either the holder is between creating the directory and writing it,
        // or it crashed in between. Fall back to the directory mtime, rounded up to the next second.
        boost::system::error_code ec;
        auto                      modified = fs::last_write_time( lockPath, ec );
        if ( ec )
        {
            // Released between our create attempt and now, the next attempt will take it
            return false;
        }
        auto age = std::chrono::system_clock::now() - std::chrono::system_clock::from_time_t( modified ) -
                   std::chrono::seconds( 1 );
        return age > m_options.staleAfter;
    }

    std::chrono::milliseconds FileStoreLock::BackoffDelay( size_t attempt ) const
    {
        thread_local boost::random::mt19937 generator{ boost::random::random_device{}() };

        double jitter = 1.0;
        if ( m_options.randomize )
        {
            boost::random::uniform_real_distribution<double> distribution( 1.0, 2.0 );
            jitter = distribution( generator );
        }
        auto delay = static_cast<double>( m_options.minTimeout.count() ) * jitter *
                     std::pow( m_options.factor, static_cast<double>( attempt ) );
        delay      = std::min( delay, static_cast<double>( m_options.maxTimeout.count() ) );
        return std::chrono::milliseconds( static_cast<int64_t>( delay ) );
    }
}
