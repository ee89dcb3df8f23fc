#ifndef DNSSEC_RECORDFETCHER_HPP
#define DNSSEC_RECORDFETCHER_HPP

#include "deadline.hpp"
#include "rrset.hpp"
#include "transport.hpp"
#include <boost/optional.hpp>
#include <string>
#include <vector>

namespace dnssec
{
    enum FetchStatus {
        FETCH_OK,
        FETCH_NODATA,
        FETCH_NXDOMAIN,
        FETCH_TIMEOUT,
        FETCH_UNREACHABLE,
        FETCH_SERVFAIL,
        FETCH_MALFORMED,
        FETCH_DEADLINE_EXCEEDED,
    };

    std::string fetchStatusToString( FetchStatus status );

    struct FetchResult {
        FetchStatus                               mStatus;
        RRSet                                     mRRSet;
        std::vector<std::shared_ptr<RecordRRSIG>> mRRSIGs;
        boost::optional<Domainname>               mSOAOwner;
        std::string                               mError;
        unsigned int                              mAttempts;

        FetchResult() : mStatus( FETCH_OK ), mAttempts( 0 )
        {
        }

        bool isOK() const
        {
            return mStatus == FETCH_OK;
        }

        /*!
         * NXDOMAIN or NODATA
         */
        bool isNotFound() const
        {
            return mStatus == FETCH_NODATA || mStatus == FETCH_NXDOMAIN;
        }

        /*!
         * network or protocol failure, the answer is unknown
         */
        bool isFailure() const
        {
            return !isOK() && !isNotFound();
        }
    };

    /*!
     * fetch one RRset and its RRSIGs through a DNSTransport.
     * Only timeouts are retried. Failures are returned, never thrown.
     */
    class RecordFetcher
    {
    public:
        RecordFetcher( DNSTransport &transport, unsigned int retries, const Deadline &deadline )
            : mTransport( transport ), mRetries( retries ), mDeadline( deadline )
        {
        }

        FetchResult fetch( const Domainname &qname, Type qtype );

    private:
        DNSTransport &  mTransport;
        unsigned int    mRetries;
        const Deadline &mDeadline;

        void classifyResponse( const MessageInfo &response, const Domainname &qname, Type qtype, FetchResult &result ) const;
    };
}

#endif
