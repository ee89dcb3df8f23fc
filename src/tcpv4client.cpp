#include "tcpv4client.hpp"
#include "utils.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace dnssec
{
    namespace tcpv4
    {
        Client::~Client()
        {
            closeSocket();
        }

        bool Client::isEnableSocket() const
        {
            return mTCPSocket >= 0;
        }

        void Client::openSocket()
        {
            if ( isEnableSocket() ) {
                closeSocket();
            }

            mTCPSocket = socket( AF_INET, SOCK_STREAM, IPPROTO_TCP );
            if ( mTCPSocket < 0 ) {
                std::string msg = getErrorMessage( "cannot create socket", errno );
                throw SocketError( msg );
            }
            fcntl( mTCPSocket, F_SETFL, O_NONBLOCK );

            sockaddr_in socket_address;
            std::memset( &socket_address, 0, sizeof( socket_address ) );
            socket_address.sin_family = AF_INET;
            socket_address.sin_addr   = convertAddressStringToBinary( mParameters.mAddress );
            socket_address.sin_port   = htons( mParameters.mPort );
            if ( connect( mTCPSocket, reinterpret_cast<const sockaddr *>( &socket_address ), sizeof( socket_address ) ) <
                 0 ) {
                int error_num = errno;
                if ( error_num != EINPROGRESS ) {
                    closeSocket();
                    throw SocketError( getErrorMessage( "cannot connect to " + mParameters.mAddress, error_num ) );
                }

                FD::Event event = waitInTime( POLLOUT );
                if ( event == FD::NONE ) {
                    closeSocket();
                    throw TimeoutError( "cannot connect to " + mParameters.mAddress + " in time" );
                }

                int       socket_error = 0;
                socklen_t length       = sizeof( socket_error );
                getsockopt( mTCPSocket, SOL_SOCKET, SO_ERROR, &socket_error, &length );
                if ( socket_error != 0 ) {
                    closeSocket();
                    throw SocketError( getErrorMessage( "cannot connect to " + mParameters.mAddress, socket_error ) );
                }
            }
        }

        void Client::closeSocket()
        {
            if ( isEnableSocket() ) {
                close( mTCPSocket );
                mTCPSocket = -1;
            }
        }

        void Client::shutdown( int how )
        {
            if ( isEnableSocket() ) {
                ::shutdown( mTCPSocket, how );
            }
        }

        void Client::shutdown_write()
        {
            shutdown( SHUT_WR );
        }

        uint32_t Client::send( const uint8_t *data, uint32_t size )
        {
            if ( !isEnableSocket() ) {
                throw SocketError( "not enabled socket" );
            }

            uint32_t sent_total = 0;
            while ( sent_total < size ) {
                if ( waitInTime( POLLOUT ) == FD::NONE )
                    throw TimeoutError( "cannot send data to " + mParameters.mAddress + " in time" );

                ssize_t sent_size = write( mTCPSocket, data + sent_total, size - sent_total );
                if ( sent_size < 0 ) {
                    if ( errno == EAGAIN || errno == EINTR )
                        continue;
                    std::string msg = getErrorMessage( "cannot send data to " + mParameters.mAddress, errno );
                    throw SocketError( msg );
                }
                sent_total += sent_size;
            }
            return sent_total;
        }

        uint32_t Client::send( const WireFormat &data )
        {
            return send( data.get() );
        }

        ConnectionInfo Client::receive_data( uint32_t size )
        {
            if ( !isEnableSocket() ) {
                throw SocketError( "not enabled socket" );
            }

            PacketData receive_buffer( size );
            uint32_t   received = 0;
            while ( received < size ) {
                FD::Event event = waitInTime( POLLIN );
                if ( event == FD::NONE )
                    throw TimeoutError( "no response from " + mParameters.mAddress );

                ssize_t recv_size = read( mTCPSocket, receive_buffer.data() + received, size - received );
                if ( recv_size < 0 ) {
                    if ( errno == EAGAIN || errno == EINTR )
                        continue;
                    throw SocketError( getErrorMessage( "cannot recv data", errno ) );
                }
                if ( recv_size == 0 )
                    throw SocketError( "connection closed by " + mParameters.mAddress );
                received += recv_size;
            }

            ConnectionInfo info;
            info.mStream = receive_buffer;
            return info;
        }

        FD::Event Client::waitInTime( short events )
        {
            if ( mDeadline.isExpired() )
                return FD::NONE;
            return wait( mDeadline.getRemainingMSec(), events );
        }

        FD::Event Client::wait( unsigned int timeout_msec, short events )
        {
            pollfd fds[ 1 ];
            std::memset( fds, 0, sizeof( fds ) );
            fds[ 0 ].fd     = mTCPSocket;
            fds[ 0 ].events = events;

            int fd_count;
            do {
                fd_count = poll( fds, 1, timeout_msec );
            } while ( fd_count < 0 && errno == EINTR );
            if ( fd_count < 0 ) {
                throw SocketError( getErrorMessage( "poll error", errno ) );
            }

            if ( fd_count == 0 )
                return FD::NONE;

            FD::Event event_flag = FD::NONE;
            if ( fds[ 0 ].revents & POLLIN )
                event_flag |= FD::READABLE;
            if ( fds[ 0 ].revents & POLLOUT )
                event_flag |= FD::WRITABLE;
            if ( fds[ 0 ].revents & ( POLLERR | POLLHUP | POLLNVAL ) )
                event_flag |= FD::ERROR;
            return event_flag;
        }
    }
}
