#ifndef DNSSEC_UDPV4CLIENT_HPP
#define DNSSEC_UDPV4CLIENT_HPP

#include "deadline.hpp"
#include "wireformat.hpp"
#include <boost/cstdint.hpp>
#include <boost/noncopyable.hpp>
#include <string>
#include <vector>

namespace dnssec
{
    namespace udpv4
    {
        /*!
         * mTimeoutMSec bounds every wait of one Client together, counted from its construction
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

        struct PacketInfo {
            std::string          mSourceAddress;
            uint16_t             mSourcePort;
            std::vector<uint8_t> mPayload;

            PacketInfo() : mSourcePort( 0 )
            {
            }

            /*!
             * @return payload length of UDP packet(bytes)
             */
            uint16_t getPayloadLength() const
            {
                return mPayload.size();
            }

            const uint8_t *begin() const
            {
                return mPayload.data();
            }

            const uint8_t *end() const
            {
                return begin() + mPayload.size();
            }
        };

        /*!
         * connected UDP socket to one server.
         * The socket is opened lazily and closed in the destructor.
         */
        class Client : private boost::noncopyable
        {
        private:
            ClientParameters mParameters;
            Deadline         mDeadline;
            int              mUDPSocket;

            void openSocket();
            void closeSocket();
            bool isEnableSocket() const;

        public:
            Client( const ClientParameters &param )
                : mParameters( param ), mDeadline( param.mTimeoutMSec ), mUDPSocket( -1 )
            {
            }

            ~Client();

            uint16_t sendPacket( const uint8_t *data, uint16_t size );
            uint16_t sendPacket( const std::vector<uint8_t> &packet )
            {
                return sendPacket( packet.data(), packet.size() );
            }
            uint16_t sendPacket( const WireFormat & );

            /*!
             * wait for one datagram until the timeout of the client expires.
             * @throw TimeoutError no datagram arrived in time
             */
            PacketInfo receivePacket();

            FD::Event wait( unsigned int timeout_msec );
        };
    }
}

#endif
