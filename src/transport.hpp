#ifndef DNSSEC_TRANSPORT_HPP
#define DNSSEC_TRANSPORT_HPP

#include "dns.hpp"

namespace dnssec
{
    /*!
     * sends one DNS query with DNSSEC OK and returns the parsed response.
     * implementations throw TimeoutError, SocketError or FormatError.
     * The whole query, fallbacks included, ends within timeout_msec.
     */
    class DNSTransport
    {
    public:
        virtual ~DNSTransport()
        {
        }

        virtual MessageInfo query( const Domainname &qname, Type qtype, unsigned int timeout_msec ) = 0;
    };
}

#endif
