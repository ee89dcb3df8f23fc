#include "resultaggregator.hpp"

namespace dnssec
{
    std::string formatValidationTime( time_t t )
    {
        struct tm tm;
        char      buf[ 32 ];
        gmtime_r( &t, &tm );
        strftime( buf, sizeof( buf ), "%Y-%m-%dT%H:%M:%SZ", &tm );
        return buf;
    }

    Status daneStatusToStatus( const TLSASummary &tlsa )
    {
        switch ( tlsa.mDANEStatus ) {
        case DANE_VALID:
            return STATUS_VALID;
        case DANE_INVALID:
            return STATUS_BOGUS;
        case DANE_NO_TLSA:
            return STATUS_INSECURE;
        case DANE_DNSSEC_REQUIRED:
            return worseStatus( STATUS_INSECURE, tlsa.mStatus );
        case DANE_CERT_UNAVAILABLE:
            return STATUS_INDETERMINATE;
        }
        return STATUS_INDETERMINATE;
    }

    ValidationResult aggregate( const std::string &                 domain,
                                const WalkResult &                  walk,
                                const boost::optional<TLSASummary> &tlsa,
                                const std::vector<std::string> &    errors,
                                time_t                              validation_time )
    {
        ValidationResult result;
        result.mDomain         = domain;
        result.mValidationTime = formatValidationTime( validation_time );
        result.mChainOfTrust   = walk.mChain;
        result.mRecords        = walk.mRecords;
        result.mTLSASummary    = tlsa;
        result.mErrors         = walk.mErrors;
        result.mErrors.insert( result.mErrors.end(), errors.begin(), errors.end() );

        result.mStatus = walk.getStatus();
        if ( result.mStatus != STATUS_ERROR && tlsa )
            result.mStatus = worseStatus( result.mStatus, daneStatusToStatus( *tlsa ) );
        return result;
    }
}
