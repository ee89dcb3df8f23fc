#ifndef DNSSEC_TCPV4CLIENT_HPP
#define DNSSEC_TCPV4CLIENT_HPP

#include "deadline.hpp"
#include "wireformat.hpp"
#include <boost/cstdint.hpp>
#include <boost/noncopyable.hpp>
#include <string>
#include <vector>

namespace dnssec
{
    namespace tcpv4
    {
        struct ConnectionInfo {
            std::vector<uint8_t> mStream;

            /*!
             * @return TCP Stream length(bytes)
             */
            uint32_t getLength() const
            {
                return mStream.size();
            }

            const uint8_t *begin() const
            {
                return mStream.data();
            }

            const uint8_t *end() const
            {
                return begin() + getLength();
            }
        };

        /*!
         * mTimeoutMSec bounds connect, send and receive of one Client together,
         * counted from its construction
         */
        struct ClientParameters {
            std::string  mAddress;
            uint16_t     mPort;
            unsigned int mTimeoutMSec;

            ClientParameters( const std::string &address = "127.0.0.1", uint16_t port = 53, unsigned int timeout = 2000 )
                : mAddress( address ), mPort( port ), mTimeoutMSec( timeout )
            {
            }
        };

        class Client : private boost::noncopyable
        {
        private:
            ClientParameters mParameters;
            Deadline         mDeadline;
            int              mTCPSocket;

            void      shutdown( int );
            FD::Event waitInTime( short events );

        public:
            Client( const ClientParameters &param )
                : mParameters( param ), mDeadline( param.mTimeoutMSec ), mTCPSocket( -1 )
            {
            }

            ~Client();

            /*!
             * connect to the server within the timeout.
             * @throw TimeoutError, SocketError
             */
            void openSocket();
            void closeSocket();
            void shutdown_write();
            bool isEnableSocket() const;
            int  getSocket() const
            {
                return mTCPSocket;
            }

            uint32_t send( const uint8_t *data, uint32_t size );
            uint32_t send( const std::vector<uint8_t> &packet )
            {
                return send( packet.data(), packet.size() );
            }
            uint32_t send( const WireFormat & );

            /*!
             * read exactly size bytes.
             * @throw TimeoutError the bytes did not arrive in time
             * @throw SocketError  the peer closed the connection before size bytes
             */
            ConnectionInfo receive_data( uint32_t size );

            FD::Event wait( unsigned int timeout_msec, short events );
        };
    }
}

#endif
