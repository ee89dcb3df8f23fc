#include "random.hpp"
#include <boost/random/random_device.hpp>

namespace dnssec
{
    RandomGenerator::RandomGenerator()
    {
        boost::random::random_device device;
        mGenerator.seed( device() );
    }

    uint32_t RandomGenerator::rand( uint32_t base )
    {
        if ( base == 0 )
            return 0;

        boost::mutex::scoped_lock          lock( mMutex );
        boost::random::uniform_int_distribution<uint32_t> dst( 0, base );
        return dst( mGenerator );
    }
}
