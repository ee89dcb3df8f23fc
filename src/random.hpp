#ifndef DNSSEC_RANDOM_HPP
#define DNSSEC_RANDOM_HPP

#include <boost/cstdint.hpp>
#include <boost/noncopyable.hpp>
#include <boost/random.hpp>
#include <boost/thread.hpp>

namespace dnssec
{
    /*!
     * thread safe pseudo random number source for DNS message IDs
     */
    class RandomGenerator : private boost::noncopyable
    {
    public:
        RandomGenerator();

        /*!
         * @return random value in [0, base]
         */
        uint32_t rand( uint32_t base = 0xffffffff );

    private:
        boost::mt19937 mGenerator;
        boost::mutex   mMutex;
    };
}

#endif
