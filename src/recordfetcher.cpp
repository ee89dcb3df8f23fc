#include "recordfetcher.hpp"
#include <boost/log/trivial.hpp>

namespace dnssec
{
    std::string fetchStatusToString( FetchStatus status )
    {
        switch ( status ) {
        case FETCH_OK:
            return "ok";
        case FETCH_NODATA:
            return "nodata";
        case FETCH_NXDOMAIN:
            return "nxdomain";
        case FETCH_TIMEOUT:
            return "timeout";
        case FETCH_UNREACHABLE:
            return "unreachable";
        case FETCH_SERVFAIL:
            return "servfail";
        case FETCH_MALFORMED:
            return "malformed";
        case FETCH_DEADLINE_EXCEEDED:
            return "deadline exceeded";
        }
        return "unknown";
    }

    FetchResult RecordFetcher::fetch( const Domainname &qname, Type qtype )
    {
        FetchResult result;
        result.mRRSet = RRSet( qname, CLASS_IN, qtype, 0 );

        for ( unsigned int attempt = 0; attempt <= mRetries; attempt++ ) {
            if ( mDeadline.isExpired() ) {
                result.mStatus = FETCH_DEADLINE_EXCEEDED;
                result.mError  = "deadline exceeded before querying " + qname.toString() + " " + typeCodeToString( qtype );
                BOOST_LOG_TRIVIAL( debug ) << "dnssec.fetcher: " << result.mError;
                return result;
            }

            result.mAttempts++;
            try {
                MessageInfo response = mTransport.query( qname, qtype, mDeadline.getRemainingMSec() );
                classifyResponse( response, qname, qtype, result );
                BOOST_LOG_TRIVIAL( debug ) << "dnssec.fetcher: " << qname << " " << typeCodeToString( qtype ) << " -> "
                                           << fetchStatusToString( result.mStatus ) << " (" << result.mRRSet.count()
                                           << " records, " << result.mRRSIGs.size() << " rrsigs)";
                return result;
            }
            catch ( TimeoutError &e ) {
                result.mStatus = FETCH_TIMEOUT;
                result.mError  = e.what();
                BOOST_LOG_TRIVIAL( debug ) << "dnssec.fetcher: " << qname << " " << typeCodeToString( qtype )
                                           << " timeout (attempt " << result.mAttempts << "): " << e.what();
            }
            catch ( SocketError &e ) {
                result.mStatus = FETCH_UNREACHABLE;
                result.mError  = e.what();
                break;
            }
            catch ( InvalidAddressFormatError &e ) {
                result.mStatus = FETCH_UNREACHABLE;
                result.mError  = e.what();
                break;
            }
            catch ( FormatError &e ) {
                result.mStatus = FETCH_MALFORMED;
                result.mError  = e.what();
                break;
            }
            catch ( DomainnameError &e ) {
                result.mStatus = FETCH_MALFORMED;
                result.mError  = e.what();
                break;
            }
        }

        BOOST_LOG_TRIVIAL( debug ) << "dnssec.fetcher: " << qname << " " << typeCodeToString( qtype ) << " failed: "
                                   << fetchStatusToString( result.mStatus ) << ": " << result.mError;
        return result;
    }

    void RecordFetcher::classifyResponse( const MessageInfo &response,
                                          const Domainname & qname,
                                          Type               qtype,
                                          FetchResult &      result ) const
    {
        result.mError.clear();
        result.mSOAOwner = boost::none;
        for ( auto &rr : response.getAuthoritySection() ) {
            if ( rr.mType == TYPE_SOA ) {
                result.mSOAOwner = rr.mDomainname;
                break;
            }
        }

        if ( response.mResponseCode == NXDOMAIN ) {
            result.mStatus = FETCH_NXDOMAIN;
            result.mError  = qname.toString() + " does not exist";
            return;
        }
        if ( response.mResponseCode != NO_ERROR ) {
            result.mStatus = FETCH_SERVFAIL;
            result.mError  = "resolver answered " + responseCodeToString( response.mResponseCode ) + " for " +
                            qname.toString() + " " + typeCodeToString( qtype );
            return;
        }

        result.mRRSet  = RRSet::fromSection( response.getAnswerSection(), qname, qtype );
        result.mRRSIGs = findCoveringRRSIGs( response.getAnswerSection(), qname, qtype );
        if ( result.mRRSet.empty() ) {
            result.mStatus = FETCH_NODATA;
            result.mError  = "no " + typeCodeToString( qtype ) + " records for " + qname.toString();
            return;
        }
        result.mStatus = FETCH_OK;
    }
}
