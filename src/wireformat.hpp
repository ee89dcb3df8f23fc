#ifndef DNSSEC_WIREFORMAT_HPP
#define DNSSEC_WIREFORMAT_HPP

#include "utils.hpp"
#include <arpa/inet.h>
#include <boost/cstdint.hpp>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <vector>

namespace dnssec
{
    /*!
     * growable byte buffer split into fixed size chunks.
     * DNS messages, canonical RDATA and signed data are built into it.
     */
    class WireFormat
    {
    private:
        uint32_t               mBufferSize;
        uint32_t               mEnd;
        std::vector<uint8_t *> mBuffers;

        void checkIndex( uint32_t i ) const
        {
            if ( i >= mEnd )
                throw std::out_of_range( "WireFormat: range error" );
        }

    public:
        WireFormat( uint32_t buffer_size = 512 );
        WireFormat( const std::vector<uint8_t> &data, uint32_t buffer_size = 512 );
        WireFormat( const uint8_t *begin, const uint8_t *end, uint32_t buffer_size = 512 );
        WireFormat( const WireFormat & );
        WireFormat &operator=( const WireFormat & );

        ~WireFormat();

        void push_back( uint8_t v )
        {
            if ( mEnd % mBufferSize == 0 )
                mBuffers.push_back( new uint8_t[ mBufferSize ] );

            *( mBuffers.back() + mEnd % mBufferSize ) = v;
            mEnd++;
        }

        uint8_t pop_back()
        {
            if ( mEnd == 0 )
                throw std::out_of_range( "cannot pop_back because buffer is empty." );
            uint8_t ret = ( *this )[ mEnd - 1 ];
            mEnd--;
            if ( mEnd % mBufferSize == 0 ) {
                delete[] mBuffers.back();
                mBuffers.pop_back();
            }
            return ret;
        }

        void clear();

        void pushUInt8( uint8_t v )
        {
            push_back( v );
        }

        void pushUInt16HtoN( uint16_t v )
        {
            push_back( ( uint8_t )( 0xff & ( v >> 8 ) ) );
            push_back( ( uint8_t )( 0xff & ( v >> 0 ) ) );
        }

        void pushUInt32HtoN( uint32_t v )
        {
            push_back( ( uint8_t )( 0xff & ( v >> 24 ) ) );
            push_back( ( uint8_t )( 0xff & ( v >> 16 ) ) );
            push_back( ( uint8_t )( 0xff & ( v >> 8 ) ) );
            push_back( ( uint8_t )( 0xff & ( v >> 0 ) ) );
        }

        void pushBuffer( const uint8_t *begin, const uint8_t *end )
        {
            for ( ; begin != end; begin++ )
                push_back( *begin );
        }

        void pushBuffer( const PacketData &data )
        {
            pushBuffer( data.data(), data.data() + data.size() );
        }

        void pushBuffer( const std::string &data )
        {
            for ( char c : data )
                push_back( static_cast<uint8_t>( c ) );
        }

        void pushBuffer( const WireFormat &data )
        {
            data.foreachBuffers( [this]( const uint8_t *b, const uint8_t *e ) { pushBuffer( b, e ); } );
        }

        const uint8_t &operator[]( uint32_t i ) const
        {
            checkIndex( i );

            return mBuffers[ i / mBufferSize ][ i % mBufferSize ];
        }

        uint8_t &operator[]( uint32_t i )
        {
            checkIndex( i );

            return mBuffers[ i / mBufferSize ][ i % mBufferSize ];
        }

        const uint8_t &at( uint32_t i ) const
        {
            return ( *this )[ i ];
        }

        uint32_t size() const
        {
            return mEnd;
        }

        uint32_t getBufferSize() const
        {
            return mBufferSize;
        }

        bool operator<( const WireFormat &rhs ) const;
        bool operator==( const WireFormat &rhs ) const;

        /*!
         * call func( begin, end ) for each filled chunk
         */
        template <class BinaryFunction>
        void foreachBuffers( BinaryFunction func ) const
        {
            if ( mEnd == 0 )
                return;
            unsigned int last_buffer_index = ( mEnd - 1 ) / mBufferSize;
            for ( unsigned int i = 0; i < last_buffer_index; i++ ) {
                func( mBuffers[ i ], mBuffers[ i ] + mBufferSize );
            }
            uint32_t last_size = mEnd - last_buffer_index * mBufferSize;
            func( mBuffers[ last_buffer_index ], mBuffers[ last_buffer_index ] + last_size );
        }

        uint32_t send( int fd, const sockaddr *dest, socklen_t dest_length, int flags = 0 ) const;
        std::vector<uint8_t> get() const;

        struct MessageHeader {
            msghdr header;

            MessageHeader();
            ~MessageHeader();

            void setBuffers( uint32_t size, const std::vector<uint8_t *> &, uint32_t buffer_size );
            void setDestination( const sockaddr *dest, socklen_t len );
        };
    };
}

#endif
