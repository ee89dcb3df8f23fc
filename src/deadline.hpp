#ifndef DNSSEC_DEADLINE_HPP
#define DNSSEC_DEADLINE_HPP

#include <chrono>

namespace dnssec
{
    /*!
     * wall clock budget of one validation request
     */
    class Deadline
    {
    public:
        typedef std::chrono::steady_clock Clock;

        explicit Deadline( unsigned int budget_msec )
            : mExpiration( Clock::now() + std::chrono::milliseconds( budget_msec ) )
        {
        }

        bool isExpired() const
        {
            return Clock::now() >= mExpiration;
        }

        unsigned int getRemainingMSec() const
        {
            Clock::time_point now = Clock::now();
            if ( now >= mExpiration )
                return 0;
            return std::chrono::duration_cast<std::chrono::milliseconds>( mExpiration - now ).count();
        }

    private:
        Clock::time_point mExpiration;
    };
}

#endif
