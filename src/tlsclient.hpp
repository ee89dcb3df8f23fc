#ifndef DNSSEC_TLSCLIENT_HPP
#define DNSSEC_TLSCLIENT_HPP

#include "certificatesource.hpp"

namespace dnssec
{
    /*!
     * CertificateSource over an OpenSSL handshake (TLS 1.2 or later, SNI).
     * The handshake does not abort on PKIX errors, the verdict is reported instead.
     * timeout_msec covers host address lookup, connect and handshake together.
     */
    class TLSClient : public CertificateSource
    {
    public:
        TLSClient( unsigned int timeout_msec ) : mTimeoutMSec( timeout_msec )
        {
        }

        virtual PeerCertificates fetchCertificate( const Domainname &domain, uint16_t port );

    private:
        unsigned int mTimeoutMSec;
    };
}

#endif
