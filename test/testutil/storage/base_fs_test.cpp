#include "testutil/storage/base_fs_test.hpp"

namespace mailtask::test
{
    FSFixture::FSFixture( const std::string &prefix ) :
        base_path( fs::temp_directory_path() / fs::unique_path( prefix + "-%%%%-%%%%-%%%%" ) )
    {
        logger = base::createLogger( "FSFixture" );
    }

    void FSFixture::clear()
    {
        boost::system::error_code ec;
        fs::remove_all( base_path, ec );
        if ( ec )
        {
            logger->warn( "Unable to remove {}: {}", base_path.string(), ec.message() );
        }
    }

    void FSFixture::SetUp()
    {
        clear();
        fs::create_directories( base_path );
    }

    void FSFixture::TearDown()
    {
        clear();
    }
}
