#ifndef DNSSEC_UTILS_HPP
#define DNSSEC_UTILS_HPP

#include <arpa/inet.h>
#include <boost/cstdint.hpp>
#include <cerrno>
#include <stdexcept>
#include <string>
#include <vector>

namespace dnssec
{
    namespace FD
    {
        typedef unsigned int Event;
        const Event NONE     = 0;
        const Event READABLE = 1;
        const Event WRITABLE = 1 << 1;
        const Event ERROR    = 1 << 2;
    }

    typedef std::vector<uint8_t> PacketData;

    /*!
     * IP address text cannot be converted to in_addr
     */
    class InvalidAddressFormatError : public std::runtime_error
    {
    public:
        InvalidAddressFormatError( const std::string &msg ) : std::runtime_error( msg )
        {
        }
    };

    /*!
     * socket operation failed
     */
    class SocketError : public std::runtime_error
    {
    public:
        SocketError( const std::string &msg ) : std::runtime_error( msg )
        {
        }
    };

    /*!
     * peer did not answer within the configured time
     */
    class TimeoutError : public std::runtime_error
    {
    public:
        TimeoutError( const std::string &msg ) : std::runtime_error( msg )
        {
        }
    };

    /*!
     * base64 / hex text is broken
     */
    class EncodingError : public std::runtime_error
    {
    public:
        EncodingError( const std::string &msg ) : std::runtime_error( msg )
        {
        }
    };

    std::string getErrorMessage( const std::string &msg, int error_number );

    in_addr convertAddressStringToBinary( const std::string &str, int address_family = AF_INET );
    std::string convertAddressBinaryToString( in_addr bin, int address_family = AF_INET );

    void encodeToBase64( const std::vector<uint8_t> &, std::string & );
    void decodeFromBase64( const std::string &, std::vector<uint8_t> & );

    void encodeToHex( const std::vector<uint8_t> &src, std::string &dst );
    void decodeFromHex( const std::string &src, std::vector<uint8_t> &dst );

    std::string printPacketData( const PacketData &p );

    /*!
     * case-insensitive comparison of two hex strings
     */
    bool equalHexString( const std::string &lhs, const std::string &rhs );
}

#endif
