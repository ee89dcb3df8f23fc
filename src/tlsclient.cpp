#include "tlsclient.hpp"
#include "deadline.hpp"
#include "tcpv4client.hpp"
#include <boost/log/trivial.hpp>
#include <cstring>
#include <memory>
#include <netdb.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <poll.h>

namespace dnssec
{
    typedef std::unique_ptr<SSL_CTX, decltype( &SSL_CTX_free )> SSLCTXPtr;
    typedef std::unique_ptr<SSL, decltype( &SSL_free )>         SSLPtr;

    static std::string getOpenSSLError()
    {
        char openssl_error[ 1024 ];
        std::memset( openssl_error, 0, sizeof( openssl_error ) );
        ERR_error_string_n( ERR_get_error(), openssl_error, sizeof( openssl_error ) );
        ERR_clear_error();
        return openssl_error;
    }

    static std::string resolveIPv4Address( const std::string &host )
    {
        addrinfo hints;
        std::memset( &hints, 0, sizeof( hints ) );
        hints.ai_family   = AF_INET;
        hints.ai_socktype = SOCK_STREAM;

        addrinfo *addresses = nullptr;
        int       error     = getaddrinfo( host.c_str(), nullptr, &hints, &addresses );
        if ( error != 0 || addresses == nullptr )
            throw TLSError( "cannot resolve " + host + ": " + gai_strerror( error ) );

        std::string address =
            convertAddressBinaryToString( reinterpret_cast<const sockaddr_in *>( addresses->ai_addr )->sin_addr );
        freeaddrinfo( addresses );
        return address;
    }

    static PacketData encodeCertificate( X509 *cert )
    {
        int length = i2d_X509( cert, nullptr );
        if ( length <= 0 )
            throw TLSError( "cannot encode peer certificate: " + getOpenSSLError() );

        PacketData der( length );
        uint8_t *  p = der.data();
        i2d_X509( cert, &p );
        return der;
    }

    PeerCertificates TLSClient::fetchCertificate( const Domainname &domain, uint16_t port )
    {
        std::string host = domain.toString();
        if ( host.size() > 1 && host.back() == '.' )
            host.pop_back();

        // getaddrinfo cannot be interrupted, its time is charged to the deadline afterwards
        Deadline    deadline( mTimeoutMSec );
        std::string address = resolveIPv4Address( host );
        if ( deadline.isExpired() )
            throw TimeoutError( "resolving " + host + " used up the TLS timeout" );

        tcpv4::Client tcp( tcpv4::ClientParameters( address, port, deadline.getRemainingMSec() ) );
        tcp.openSocket();

        SSLCTXPtr ctx( SSL_CTX_new( TLS_client_method() ), SSL_CTX_free );
        if ( !ctx )
            throw TLSError( "cannot create SSL_CTX: " + getOpenSSLError() );
        SSL_CTX_set_min_proto_version( ctx.get(), TLS1_2_VERSION );
        SSL_CTX_set_default_verify_paths( ctx.get() );
        SSL_CTX_set_verify( ctx.get(), SSL_VERIFY_NONE, nullptr );

        SSLPtr ssl( SSL_new( ctx.get() ), SSL_free );
        if ( !ssl )
            throw TLSError( "cannot create SSL: " + getOpenSSLError() );
        SSL_set_tlsext_host_name( ssl.get(), host.c_str() );
        SSL_set1_host( ssl.get(), host.c_str() );
        SSL_set_fd( ssl.get(), tcp.getSocket() );

        while ( true ) {
            int ret = SSL_connect( ssl.get() );
            if ( ret == 1 )
                break;

            short events;
            int   error = SSL_get_error( ssl.get(), ret );
            if ( error == SSL_ERROR_WANT_READ )
                events = POLLIN;
            else if ( error == SSL_ERROR_WANT_WRITE )
                events = POLLOUT;
            else
                throw TLSError( "TLS handshake with " + host + " failed: " + getOpenSSLError() );

            if ( deadline.isExpired() || tcp.wait( deadline.getRemainingMSec(), events ) == FD::NONE )
                throw TimeoutError( "TLS handshake with " + host + " timed out" );
        }

        PeerCertificates certificates;
        STACK_OF( X509 ) *chain = SSL_get_peer_cert_chain( ssl.get() );
        if ( chain == nullptr || sk_X509_num( chain ) == 0 )
            throw TLSError( host + " presented no certificate" );
        for ( int i = 0; i < sk_X509_num( chain ); i++ )
            certificates.mChain.push_back( encodeCertificate( sk_X509_value( chain, i ) ) );

        long verify_result        = SSL_get_verify_result( ssl.get() );
        certificates.mPKIXValid = ( verify_result == X509_V_OK );
        if ( !certificates.mPKIXValid )
            certificates.mPKIXError = X509_verify_cert_error_string( verify_result );

        BOOST_LOG_TRIVIAL( debug ) << "dnssec.tls: " << host << ":" << port << " presented " << certificates.mChain.size()
                                   << " certificates, PKIX " << ( certificates.mPKIXValid ? "ok" : certificates.mPKIXError );

        return certificates;
    }
}
