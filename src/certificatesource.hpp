#ifndef DNSSEC_CERTIFICATESOURCE_HPP
#define DNSSEC_CERTIFICATESOURCE_HPP

#include "domainname.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace dnssec
{
    /*!
     * TLS handshake failed or no certificate was presented
     */
    class TLSError : public std::runtime_error
    {
    public:
        TLSError( const std::string &msg ) : std::runtime_error( msg )
        {
        }
    };

    struct PeerCertificates {
        std::vector<PacketData> mChain; // DER, end entity first
        bool                    mPKIXValid;
        std::string             mPKIXError;

        PeerCertificates() : mPKIXValid( false )
        {
        }
    };

    /*!
     * retrieves the certificate chain a server presents.
     * implementations throw TLSError, SocketError or TimeoutError.
     */
    class CertificateSource
    {
    public:
        virtual ~CertificateSource()
        {
        }

        virtual PeerCertificates fetchCertificate( const Domainname &domain, uint16_t port ) = 0;
    };
}

#endif
