#ifndef DNSSEC_RESULTAGGREGATOR_HPP
#define DNSSEC_RESULTAGGREGATOR_HPP

#include "result.hpp"
#include "zonewalker.hpp"
#include <ctime>

namespace dnssec
{
    class Clock
    {
    public:
        virtual ~Clock()
        {
        }

        virtual time_t now() const = 0;
    };

    class SystemClock : public Clock
    {
    public:
        virtual time_t now() const
        {
            return std::time( nullptr );
        }
    };

    /*!
     * ISO 8601 UTC timestamp (YYYY-MM-DDTHH:MM:SSZ)
     */
    std::string formatValidationTime( time_t t );

    /*!
     * DNSSEC status corresponding to a DANE outcome
     */
    Status daneStatusToStatus( const TLSASummary &tlsa );

    /*!
     * fold the chain of trust, the collected records, the TLSA summary and errors into the final result
     */
    ValidationResult aggregate( const std::string &                 domain,
                                const WalkResult &                  walk,
                                const boost::optional<TLSASummary> &tlsa,
                                const std::vector<std::string> &    errors,
                                time_t                              validation_time );
}

#endif
