#ifndef DNSSEC_RRSET_HPP
#define DNSSEC_RRSET_HPP

#include "dns.hpp"
#include <vector>

namespace dnssec
{
    class RRSet
    {
    public:
        typedef std::vector<RDATAPtr> RDATAContainer;

    private:
        Domainname     mOwner;
        Class          mClass;
        Type           mType;
        TTL            mTTL;
        RDATAContainer mResourceData;

    public:
        RRSet( const Domainname &name = Domainname(), Class c = CLASS_IN, Type t = 0, TTL tt = 0 )
            : mOwner( name ), mClass( c ), mType( t ), mTTL( tt )
        {
        }

        const Domainname &getOwner() const { return mOwner; }
        Domainname getCanonicalOwner() const { return mOwner.getCanonicalDomainname(); }

        Class    getClass() const { return mClass; }
        Type     getType() const { return mType; }
        TTL      getTTL() const { return mTTL; }
        uint16_t count() const { return mResourceData.size(); }
        bool     empty() const { return mResourceData.empty(); }
        std::string toString() const;

        RDATAContainer::const_iterator begin() const { return mResourceData.begin(); }
        RDATAContainer::const_iterator end() const { return mResourceData.end(); }

        RDATAPtr      operator[]( int index ) { return mResourceData[ index ]; }
        ConstRDATAPtr operator[]( int index ) const { return mResourceData[ index ]; }
        const RDATAContainer &getRRSet() const { return mResourceData; }

        RRSet &add( RDATAPtr data )
        {
            mResourceData.push_back( data );
            return *this;
        }

        /*!
         * canonical RDATA of each record, sorted in canonical order and
         * without duplicates (RFC 4034 6.3)
         */
        std::vector<WireFormat> getCanonicalRDATA() const;

        void addResourceRecords( std::vector<ResourceRecord> &section ) const;

        /*!
         * collect records of owner/type from a message section.
         * TTL of the RRSet is the TTL of the first matched record.
         */
        static RRSet fromSection( const std::vector<ResourceRecord> &section, const Domainname &owner, Type type );
    };

    std::ostream &operator<<( std::ostream &os, const RRSet &rrset );

    /*!
     * RRSIG records in section which cover type and are owned by owner
     */
    std::vector<std::shared_ptr<RecordRRSIG>>
    findCoveringRRSIGs( const std::vector<ResourceRecord> &section, const Domainname &owner, Type type );

    template <class RecordType>
    std::vector<std::shared_ptr<RecordType>> castRRSet( const RRSet &rrset )
    {
        std::vector<std::shared_ptr<RecordType>> records;
        for ( auto rdata : rrset ) {
            std::shared_ptr<RecordType> record = std::dynamic_pointer_cast<RecordType>( rdata );
            if ( record )
                records.push_back( record );
        }
        return records;
    }
}

#endif
