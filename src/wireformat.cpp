#include "wireformat.hpp"
#include <cstring>

namespace dnssec
{
    WireFormat::WireFormat( uint32_t buffer_size ) : mBufferSize( buffer_size ), mEnd( 0 )
    {
    }

    WireFormat::WireFormat( const std::vector<uint8_t> &data, uint32_t buffer_size ) : mBufferSize( buffer_size ), mEnd( 0 )
    {
        pushBuffer( data );
    }

    WireFormat::WireFormat( const uint8_t *begin, const uint8_t *end, uint32_t buffer_size )
        : mBufferSize( buffer_size ), mEnd( 0 )
    {
        pushBuffer( begin, end );
    }

    WireFormat::WireFormat( const WireFormat &src ) : mBufferSize( src.getBufferSize() ), mEnd( 0 )
    {
        pushBuffer( src );
    }

    WireFormat &WireFormat::operator=( const WireFormat &src )
    {
        if ( this == &src )
            return *this;

        clear();
        mBufferSize = src.getBufferSize();
        pushBuffer( src );

        return *this;
    }

    WireFormat::~WireFormat()
    {
        clear();
    }

    void WireFormat::clear()
    {
        for ( auto i = mBuffers.begin(); i != mBuffers.end(); ++i ) {
            delete[] * i;
        }
        mBuffers.clear();
        mEnd = 0;
    }

    uint32_t WireFormat::send( int fd, const sockaddr *dest, socklen_t dest_length, int flags ) const
    {
        if ( mEnd == 0 )
            return 0;

        MessageHeader msg;
        msg.setDestination( dest, dest_length );
        msg.setBuffers( mEnd, mBuffers, mBufferSize );

        ssize_t sent_size;
        do {
            sent_size = sendmsg( fd, &msg.header, flags );
        } while ( sent_size < 0 && errno == EINTR );

        if ( sent_size < 0 ) {
            throw SocketError( getErrorMessage( "cannot write data to peer", errno ) );
        }

        return sent_size;
    }

    std::vector<uint8_t> WireFormat::get() const
    {
        std::vector<uint8_t> ret;
        ret.reserve( size() );

        foreachBuffers( [&ret]( const uint8_t *begin, const uint8_t *end ) { ret.insert( ret.end(), begin, end ); } );

        return ret;
    }

    // byte-wise comparison treating absent bytes as smaller (RFC 4034 6.3)
    bool WireFormat::operator<( const WireFormat &rhs ) const
    {
        uint32_t common_size = size() < rhs.size() ? size() : rhs.size();
        for ( uint32_t i = 0; i < common_size; i++ ) {
            if ( at( i ) < rhs.at( i ) )
                return true;
            else if ( at( i ) > rhs.at( i ) )
                return false;
        }
        return size() < rhs.size();
    }

    bool WireFormat::operator==( const WireFormat &rhs ) const
    {
        if ( size() != rhs.size() )
            return false;
        for ( uint32_t i = 0; i < size(); i++ ) {
            if ( at( i ) != rhs.at( i ) )
                return false;
        }
        return true;
    }

    WireFormat::MessageHeader::MessageHeader()
    {
        std::memset( &header, 0, sizeof( header ) );
    }

    WireFormat::MessageHeader::~MessageHeader()
    {
        delete[] header.msg_iov;
    }

    void WireFormat::MessageHeader::setBuffers( uint32_t size, const std::vector<uint8_t *> &buffers, uint32_t buffer_size )
    {
        unsigned int buffer_count = ( size - 1 ) / buffer_size + 1;
        unsigned int last_buffer  = ( size - 1 ) / buffer_size;

        header.msg_iov    = new iovec[ buffer_count ];
        header.msg_iovlen = buffer_count;

        for ( unsigned int i = 0; i < last_buffer; i++ ) {
            header.msg_iov[ i ].iov_base = const_cast<uint8_t *>( buffers[ i ] );
            header.msg_iov[ i ].iov_len  = buffer_size;
        }
        header.msg_iov[ last_buffer ].iov_base = const_cast<uint8_t *>( buffers[ last_buffer ] );
        if ( size % buffer_size == 0 )
            header.msg_iov[ last_buffer ].iov_len = buffer_size;
        else
            header.msg_iov[ last_buffer ].iov_len = size % buffer_size;
    }

    void WireFormat::MessageHeader::setDestination( const sockaddr *dest, socklen_t len )
    {
        if ( dest != nullptr ) {
            header.msg_name    = const_cast<sockaddr *>( dest );
            header.msg_namelen = len;
        } else {
            header.msg_name    = nullptr;
            header.msg_namelen = 0;
        }

        header.msg_control    = nullptr;
        header.msg_controllen = 0;
        header.msg_flags      = 0;
    }
}
