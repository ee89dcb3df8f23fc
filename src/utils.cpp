#include "utils.hpp"
#include <cctype>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace dnssec
{
    const int ERROR_BUFFER_SIZE = 256;

    std::string getErrorMessage( const std::string &msg, int error_number )
    {
        char  buff[ ERROR_BUFFER_SIZE ];
        char *err = strerror_r( error_number, buff, sizeof( buff ) );
        return msg + "(" + err + ")";
    }

    in_addr convertAddressStringToBinary( const std::string &str, int address_family )
    {
        in_addr address;
        if ( inet_pton( address_family, str.c_str(), &address ) > 0 )
            return address;
        else
            throw InvalidAddressFormatError( str + " is invalid IPv4 address" );
    }

    std::string convertAddressBinaryToString( in_addr bin, int address_family )
    {
        char address[ INET_ADDRSTRLEN ];
        if ( NULL == inet_ntop( address_family, &bin, address, sizeof( address ) ) ) {
            throw InvalidAddressFormatError( "cannot convert address from bin to text" );
        }
        return std::string( address );
    }

    //   +--first octet--+-second octet--+--third octet--+
    //   |7 6 5 4 3 2 1 0|7 6 5 4 3 2 1 0|7 6 5 4 3 2 1 0|
    //   +-----------+---+-------+-------+---+-----------+
    //   |5 4 3 2 1 0|5 4 3 2 1 0|5 4 3 2 1 0|5 4 3 2 1 0|
    //   +--1.index--+--2.index--+--3.index--+--4.index--+

    static const char *to_base64 = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    static uint8_t convertFromBase64( char c )
    {
        if ( 'A' <= c && c <= 'Z' )
            return c - 'A';
        if ( 'a' <= c && c <= 'z' )
            return c - 'a' + 26;
        if ( '0' <= c && c <= '9' )
            return c - '0' + 52;
        if ( c == '+' )
            return 62;
        if ( c == '/' )
            return 63;

        std::ostringstream os;
        os << "invalid base64 data \"" << c << "\"";
        throw EncodingError( os.str() );
    }

    void encodeToBase64( const std::vector<uint8_t> &data, std::string &output )
    {
        output.clear();
        output.reserve( ( data.size() + 2 ) / 3 * 4 );

        unsigned int i = 0;
        for ( ; i + 2 < data.size(); i += 3 ) {
            uint32_t block = ( data[ i ] << 16 ) + ( data[ i + 1 ] << 8 ) + data[ i + 2 ];
            output.push_back( to_base64[ 0x3f & ( block >> 18 ) ] );
            output.push_back( to_base64[ 0x3f & ( block >> 12 ) ] );
            output.push_back( to_base64[ 0x3f & ( block >> 6 ) ] );
            output.push_back( to_base64[ 0x3f & ( block >> 0 ) ] );
        }
        if ( i + 1 == data.size() ) {
            uint32_t block = data[ i ] << 16;
            output.push_back( to_base64[ 0x3f & ( block >> 18 ) ] );
            output.push_back( to_base64[ 0x3f & ( block >> 12 ) ] );
            output.push_back( '=' );
            output.push_back( '=' );
        } else if ( i + 2 == data.size() ) {
            uint32_t block = ( data[ i ] << 16 ) + ( data[ i + 1 ] << 8 );
            output.push_back( to_base64[ 0x3f & ( block >> 18 ) ] );
            output.push_back( to_base64[ 0x3f & ( block >> 12 ) ] );
            output.push_back( to_base64[ 0x3f & ( block >> 6 ) ] );
            output.push_back( '=' );
        }
    }

    void decodeFromBase64( const std::string &input, std::vector<uint8_t> &output )
    {
        output.clear();

        // zone file presentation may split base64 text with white spaces
        std::string data;
        for ( char c : input ) {
            if ( !std::isspace( static_cast<unsigned char>( c ) ) )
                data.push_back( c );
        }

        if ( data.size() % 4 != 0 )
            throw EncodingError( "invalid base64 string length" );

        output.reserve( data.size() / 4 * 3 );
        for ( unsigned int i = 0; i < data.size(); i += 4 ) {
            bool last = ( i + 4 == data.size() );
            if ( data[ i ] == '=' || data[ i + 1 ] == '=' )
                throw EncodingError( "invalid base64 padding" );

            uint32_t block = ( convertFromBase64( data[ i ] ) << 18 ) + ( convertFromBase64( data[ i + 1 ] ) << 12 );
            if ( data[ i + 2 ] == '=' ) {
                if ( !last || data[ i + 3 ] != '=' )
                    throw EncodingError( "invalid base64 padding" );
                output.push_back( 0xff & ( block >> 16 ) );
                break;
            }
            block += convertFromBase64( data[ i + 2 ] ) << 6;
            if ( data[ i + 3 ] == '=' ) {
                if ( !last )
                    throw EncodingError( "invalid base64 padding" );
                output.push_back( 0xff & ( block >> 16 ) );
                output.push_back( 0xff & ( block >> 8 ) );
                break;
            }
            block += convertFromBase64( data[ i + 3 ] );
            output.push_back( 0xff & ( block >> 16 ) );
            output.push_back( 0xff & ( block >> 8 ) );
            output.push_back( 0xff & ( block >> 0 ) );
        }
    }

    void encodeToHex( const std::vector<uint8_t> &src, std::string &dst )
    {
        std::ostringstream os;
        for ( uint8_t v : src ) {
            os << std::setw( 2 ) << std::setfill( '0' ) << std::hex << std::noshowbase << std::uppercase;
            os << (unsigned int)v;
        }
        dst = os.str();
    }

    static uint8_t convertFromHexDigit( char digit, const std::string &src )
    {
        if ( '0' <= digit && digit <= '9' )
            return digit - '0';
        if ( 'a' <= digit && digit <= 'f' )
            return digit - 'a' + 10;
        if ( 'A' <= digit && digit <= 'F' )
            return digit - 'A' + 10;

        std::ostringstream os;
        os << "bad character \"" << digit << "\" in \"" << src << "\".";
        throw EncodingError( os.str() );
    }

    void decodeFromHex( const std::string &src, std::vector<uint8_t> &dst )
    {
        dst.clear();

        std::string digits;
        for ( char c : src ) {
            if ( !std::isspace( static_cast<unsigned char>( c ) ) )
                digits.push_back( c );
        }
        if ( digits.size() % 2 == 1 ) {
            std::ostringstream os;
            os << "string length of \"" << src << "\" must be even.";
            throw EncodingError( os.str() );
        }

        dst.reserve( digits.size() / 2 );
        for ( unsigned int i = 0; i < digits.size(); i += 2 ) {
            dst.push_back( ( convertFromHexDigit( digits[ i ], src ) << 4 ) + convertFromHexDigit( digits[ i + 1 ], src ) );
        }
    }

    std::string printPacketData( const PacketData &p )
    {
        std::ostringstream os;
        os << std::hex;
        for ( unsigned int i = 0; i < p.size(); i++ ) {
            os << std::setw( 2 ) << std::setfill( '0' ) << (unsigned int)p[ i ] << ",";
        }

        return os.str();
    }

    bool equalHexString( const std::string &lhs, const std::string &rhs )
    {
        if ( lhs.size() != rhs.size() )
            return false;
        for ( unsigned int i = 0; i < lhs.size(); i++ ) {
            if ( std::tolower( static_cast<unsigned char>( lhs[ i ] ) ) !=
                 std::tolower( static_cast<unsigned char>( rhs[ i ] ) ) )
                return false;
        }
        return true;
    }
}
