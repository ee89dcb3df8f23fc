#include "domainname.hpp"
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace dnssec
{
    static uint8_t toLower( uint8_t c )
    {
        if ( 'A' <= c && c <= 'Z' ) {
            return 'a' + c - 'A';
        }
        return c;
    }

    static std::string toLowerLabel( const std::string &label )
    {
        std::string lower_label;
        for ( unsigned int i = 0; i < label.size(); i++ )
            lower_label.push_back( toLower( label[ i ] ) );
        return lower_label;
    }

    static void throwInvalidDomainnameString( const char *name )
    {
        std::ostringstream os;
        os << "invalid domainname string: \"" << name << "\"";
        throw DomainnameError( os.str() );
    }

    static void stringToLabels( const char *name, std::deque<std::string> &labels )
    {
        labels.clear();

        if ( name == NULL || name[ 0 ] == 0 )
            return;
        if ( std::strcmp( name, "." ) == 0 )
            return;

        unsigned int name_length = std::strlen( name );
        std::string  label;
        for ( unsigned int i = 0; i < name_length; i++ ) {
            if ( name[ i ] == '\\' ) {
                if ( name_length <= i + 1 )
                    throwInvalidDomainnameString( name );
                if ( std::isdigit( name[ i + 1 ] ) ) {
                    if ( name_length <= i + 3 || !std::isdigit( name[ i + 2 ] ) || !std::isdigit( name[ i + 3 ] ) ) {
                        throwInvalidDomainnameString( name );
                    }
                    char dec[ 4 ] = { name[ i + 1 ], name[ i + 2 ], name[ i + 3 ], 0 };
                    long v        = std::strtol( dec, nullptr, 10 );
                    if ( v > 255 )
                        throwInvalidDomainnameString( name );
                    label.push_back( static_cast<char>( v ) );
                    i += 3;
                } else {
                    label.push_back( name[ i + 1 ] );
                    i++;
                }
            } else if ( name[ i ] == '.' ) {
                // empty label is only allowed as the trailing root label
                if ( label.empty() )
                    throwInvalidDomainnameString( name );
                labels.push_back( label );
                label = "";
            } else {
                label.push_back( name[ i ] );
            }
        }
        if ( label != "" )
            labels.push_back( label );
    }

    static void canonicalizeLabels( const std::deque<std::string> &from, std::deque<std::string> &to )
    {
        to.clear();
        for ( unsigned int i = 0; i < from.size(); i++ ) {
            to.push_back( toLowerLabel( from[ i ] ) );
        }
    }

    static void outputLabels( const std::deque<std::string> &labels, WireFormat &message )
    {
        for ( unsigned int i = 0; i < labels.size(); i++ ) {
            message.pushUInt8( labels[ i ].size() );
            message.pushBuffer( labels[ i ] );
        }
        message.pushUInt8( 0 );
    }

    Domainname::Domainname( const std::deque<std::string> &l ) : mLabels( l )
    {
        canonicalizeLabels( mLabels, mCanonicalLabels );
        validate();
    }

    Domainname::Domainname( const char *name )
    {
        stringToLabels( name, mLabels );
        canonicalizeLabels( mLabels, mCanonicalLabels );
        validate();
    }

    Domainname::Domainname( const std::string &name )
    {
        stringToLabels( name.c_str(), mLabels );
        canonicalizeLabels( mLabels, mCanonicalLabels );
        validate();
    }

    void Domainname::validate() const
    {
        for ( auto &label : mLabels ) {
            if ( label.empty() )
                throw DomainnameError( "empty label in domainname" );
            if ( label.size() > MAX_LABEL_LENGTH )
                throw DomainnameError( "too long label \"" + label + "\"" );
        }
        if ( size() > MAX_DOMAINNAME_LENGTH )
            throw DomainnameError( "too long domainname" );
    }

    std::string Domainname::toString() const
    {
        if ( mLabels.empty() )
            return ".";

        std::ostringstream result;
        for ( auto &label : mLabels ) {
            for ( auto c : label ) {
                if ( c == '\\' || c == '.' ) {
                    result << '\\' << c;
                } else if ( std::isprint( static_cast<unsigned char>( c ) ) && c != ' ' ) {
                    result << c;
                } else {
                    result << '\\' << std::dec << std::setw( 3 ) << std::setfill( '0' )
                           << (unsigned int)static_cast<uint8_t>( c );
                }
            }
            result << '.';
        }

        return result.str();
    }

    PacketData Domainname::getWireFormat() const
    {
        WireFormat bin;
        outputWireFormat( bin );
        return bin.get();
    }

    void Domainname::outputWireFormat( WireFormat &message ) const
    {
        outputLabels( mLabels, message );
    }

    PacketData Domainname::getCanonicalWireFormat() const
    {
        WireFormat bin;
        outputCanonicalWireFormat( bin );
        return bin.get();
    }

    void Domainname::outputCanonicalWireFormat( WireFormat &message ) const
    {
        outputLabels( mCanonicalLabels, message );
    }

    const uint8_t *Domainname::parsePacket( Domainname &   ref_domainname,
                                            const uint8_t *packet_begin,
                                            const uint8_t *packet_end,
                                            const uint8_t *begin,
                                            int            recur )
    {
        if ( recur > 100 ) {
            throw FormatError( "detected domainname decompress loop" );
        }
        if ( begin >= packet_end ) {
            throw FormatError( "cannot parse empty data as a domainname" );
        }

        const uint8_t *p = begin;
        while ( *p != 0 ) {
            // message compression
            if ( ( *p & 0xC0 ) == 0xC0 ) {
                if ( packet_end - p < 2 ) {
                    throw FormatError( "domainname size is too short for decompression" );
                }
                int offset = ( ( p[ 0 ] << 8 ) + p[ 1 ] ) & 0x3fff;
                if ( packet_begin + offset >= p ) {
                    throw FormatError( "detected forward reference of domainname decompression" );
                }

                parsePacket( ref_domainname, packet_begin, packet_end, packet_begin + offset, recur + 1 );
                return p + 2;
            }
            if ( *p & 0xC0 )
                throw FormatError( "unknown label type" );

            uint8_t label_length = *p;
            p++;

            if ( packet_end - p < label_length + 1 )
                throw FormatError( "domainname size is too short(truncated ?)" );
            std::string label( reinterpret_cast<const char *>( p ), label_length );
            p += label_length;
            ref_domainname.addSuffix( label );
        }

        p++;
        return p;
    }

    unsigned int Domainname::size() const
    {
        unsigned int size = 0;
        for ( auto &label : mLabels ) {
            size += ( 1 + label.size() );
        }
        return size + 1;
    }

    Domainname Domainname::getCanonicalDomainname() const
    {
        return Domainname( getCanonicalLabels() );
    }

    void Domainname::addSubdomain( const std::string &label )
    {
        if ( label.empty() || label.size() > MAX_LABEL_LENGTH )
            throw DomainnameError( "invalid label \"" + label + "\"" );
        mLabels.push_front( label );
        mCanonicalLabels.push_front( toLowerLabel( label ) );
        if ( size() > MAX_DOMAINNAME_LENGTH )
            throw DomainnameError( "too long domainname" );
    }

    void Domainname::addSuffix( const std::string &label )
    {
        if ( label.empty() || label.size() > MAX_LABEL_LENGTH )
            throw FormatError( "invalid label length in domainname" );
        mLabels.push_back( label );
        mCanonicalLabels.push_back( toLowerLabel( label ) );
        if ( size() > MAX_DOMAINNAME_LENGTH )
            throw FormatError( "too long domainname" );
    }

    void Domainname::popSubdomain()
    {
        if ( mLabels.empty() )
            throw DomainnameError( "cannot pop label from root domainname" );
        mLabels.pop_front();
        mCanonicalLabels.pop_front();
    }

    bool Domainname::isSubDomain( const Domainname &child ) const
    {
        auto &parent_labels = getCanonicalLabels();
        auto &child_labels  = child.getCanonicalLabels();
        if ( child_labels.size() < parent_labels.size() )
            return false;

        auto parent_label = parent_labels.rbegin();
        auto child_label  = child_labels.rbegin();
        for ( ; parent_label != parent_labels.rend(); parent_label++, child_label++ ) {
            if ( *parent_label != *child_label )
                return false;
        }
        return true;
    }

    Domainname Domainname::getParent() const
    {
        Domainname parent = *this;
        parent.popSubdomain();
        return parent;
    }

    Domainname Domainname::getSuffix( unsigned int label_count ) const
    {
        if ( label_count > mLabels.size() )
            throw DomainnameError( "suffix label count is larger than label count of " + toString() );

        std::deque<std::string> labels( mLabels.end() - label_count, mLabels.end() );
        return Domainname( labels );
    }

    std::vector<Domainname> Domainname::getAncestors() const
    {
        std::vector<Domainname> names;
        for ( unsigned int i = 0; i <= mLabels.size(); i++ ) {
            names.push_back( getSuffix( i ) );
        }
        return names;
    }

    std::ostream &operator<<( std::ostream &os, const Domainname &name )
    {
        return os << name.toString();
    }

    bool Domainname::operator==( const Domainname &rhs ) const
    {
        return getCanonicalLabels() == rhs.getCanonicalLabels();
    }

    bool Domainname::operator!=( const Domainname &rhs ) const
    {
        return !( *this == rhs );
    }

    // canonical DNS name order (RFC 4034 6.1)
    bool Domainname::operator<( const Domainname &rhs ) const
    {
        auto llabel = getCanonicalLabels().rbegin();
        auto rlabel = rhs.getCanonicalLabels().rbegin();

        for ( ;; llabel++, rlabel++ ) {
            if ( rlabel == rhs.getCanonicalLabels().rend() )
                return false;
            if ( llabel == getCanonicalLabels().rend() )
                return true;
            if ( *llabel == *rlabel )
                continue;
            return *llabel < *rlabel;
        }
    }
}
