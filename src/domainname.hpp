#ifndef DNSSEC_DOMAINNAME_HPP
#define DNSSEC_DOMAINNAME_HPP

#include "wireformat.hpp"
#include <boost/operators.hpp>
#include <deque>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace dnssec
{
    /*!
     * DNS message format error
     */
    class FormatError : public std::runtime_error
    {
    public:
        FormatError( const std::string &msg ) : std::runtime_error( msg )
        {
        }
    };

    /*!
     * malformed domainname ( label too long, bad escape ... )
     */
    class DomainnameError : public std::runtime_error
    {
    public:
        DomainnameError( const std::string &msg ) : std::runtime_error( msg )
        {
        }
    };

    const unsigned int MAX_LABEL_LENGTH      = 63;
    const unsigned int MAX_DOMAINNAME_LENGTH = 255;

    class Domainname : public boost::less_than_comparable<Domainname>
    {
    private:
        std::deque<std::string> mLabels;
        std::deque<std::string> mCanonicalLabels;

        void validate() const;

    public:
        Domainname( const std::deque<std::string> &l = std::deque<std::string>() );
        Domainname( const std::string &name );
        Domainname( const char *name );

        std::string toString() const;

        PacketData getWireFormat() const;
        void       outputWireFormat( WireFormat & ) const;

        PacketData getCanonicalWireFormat() const;
        void       outputCanonicalWireFormat( WireFormat & ) const;

        /*!
         * @return size of uncompressed wire format (bytes)
         */
        unsigned int size() const;

        const std::deque<std::string> &getLabels() const
        {
            return mLabels;
        }
        const std::deque<std::string> &getCanonicalLabels() const
        {
            return mCanonicalLabels;
        }
        uint32_t getLabelCount() const
        {
            return mLabels.size();
        }
        bool isRoot() const
        {
            return mLabels.empty();
        }
        bool isWildcard() const
        {
            return !mLabels.empty() && mLabels.front() == "*";
        }

        void addSubdomain( const std::string & );
        void addSuffix( const std::string & );
        void popSubdomain();

        /*!
         * @return true if child is equal to or below this name
         */
        bool isSubDomain( const Domainname &child ) const;

        Domainname getParent() const;

        /*!
         * @return name made of the rightmost label_count labels
         */
        Domainname getSuffix( unsigned int label_count ) const;

        /*!
         * @return every ancestor of this name and the name itself, root first.
         *         "www.example.com." -> ".", "com.", "example.com.", "www.example.com."
         */
        std::vector<Domainname> getAncestors() const;

        Domainname getCanonicalDomainname() const;

        static const uint8_t *parsePacket( Domainname &   ref_domainname,
                                           const uint8_t *packet_begin,
                                           const uint8_t *packet_end,
                                           const uint8_t *begin,
                                           int            recur = 0 );

        bool operator==( const Domainname &rhs ) const;
        bool operator!=( const Domainname &rhs ) const;
        bool operator<( const Domainname &rhs ) const;
    };

    std::ostream &operator<<( std::ostream &os, const Domainname &name );
}

#endif
