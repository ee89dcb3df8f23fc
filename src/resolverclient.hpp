#ifndef DNSSEC_RESOLVERCLIENT_HPP
#define DNSSEC_RESOLVERCLIENT_HPP

#include "deadline.hpp"
#include "random.hpp"
#include "transport.hpp"
#include <string>

namespace dnssec
{
    struct ResolverParameters {
        std::string  mAddress;
        uint16_t     mPort;
        unsigned int mTimeoutMSec;
        unsigned int mRetries;
        bool         mTCPFallback;

        ResolverParameters()
            : mAddress( "8.8.8.8" ), mPort( 53 ), mTimeoutMSec( 2000 ), mRetries( 2 ), mTCPFallback( true )
        {
        }
    };

    /*!
     * DNSTransport to a recursive resolver.
     * Queries are sent over UDP with EDNS0, DO=1 and CD=1.
     * A truncated response is retried over TCP.
     * UDP and TCP share one timeout: the smaller of mTimeoutMSec and the caller's budget.
     * Every query uses its own socket, so one instance can be shared by threads.
     */
    class ResolverClient : public DNSTransport
    {
    public:
        ResolverClient( const ResolverParameters &param ) : mParameters( param )
        {
        }

        virtual MessageInfo query( const Domainname &qname, Type qtype, unsigned int timeout_msec );

        const ResolverParameters &getParameters() const
        {
            return mParameters;
        }

        MessageInfo generateQuery( const Domainname &qname, Type qtype );

    private:
        ResolverParameters mParameters;
        RandomGenerator    mRandom;

        MessageInfo queryUDP( const MessageInfo &query, const Deadline &deadline );
        MessageInfo queryTCP( const MessageInfo &query, const Deadline &deadline );
        void        checkResponse( const MessageInfo &query, const MessageInfo &response ) const;
    };
}

#endif
