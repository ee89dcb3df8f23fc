#include "rrset.hpp"
#include <algorithm>
#include <sstream>

namespace dnssec
{
    std::string RRSet::toString() const
    {
        std::ostringstream os;

        os << getOwner().toString() << " "
           << getTTL() << " "
           << typeCodeToString( getType() ) << std::endl;

        for ( auto rr : mResourceData )
            os << "  " << rr->toZone() << std::endl;

        return os.str();
    }

    std::vector<WireFormat> RRSet::getCanonicalRDATA() const
    {
        std::vector<WireFormat> rdatas;
        for ( auto rr : mResourceData ) {
            WireFormat data;
            rr->outputCanonicalWireFormat( data );
            rdatas.push_back( data );
        }

        std::sort( rdatas.begin(), rdatas.end() );
        rdatas.erase( std::unique( rdatas.begin(), rdatas.end() ), rdatas.end() );
        return rdatas;
    }

    void RRSet::addResourceRecords( std::vector<ResourceRecord> &section ) const
    {
        for ( auto rdata : mResourceData ) {
            ResourceRecord rr;
            rr.mDomainname = mOwner;
            rr.mClass      = mClass;
            rr.mType       = mType;
            rr.mTTL        = mTTL;
            rr.mRData      = rdata;

            section.push_back( rr );
        }
    }

    RRSet RRSet::fromSection( const std::vector<ResourceRecord> &section, const Domainname &owner, Type type )
    {
        RRSet rrset( owner, CLASS_IN, type, 0 );
        bool  first = true;
        for ( auto &rr : section ) {
            if ( rr.mType != type || rr.mDomainname != owner || !rr.mRData )
                continue;
            if ( first ) {
                rrset = RRSet( rr.mDomainname, rr.mClass, type, rr.mTTL );
                first = false;
            }
            rrset.add( rr.mRData );
        }
        return rrset;
    }

    std::ostream &operator<<( std::ostream &os, const RRSet &rrset )
    {
        os << rrset.toString();
        return os;
    }

    std::vector<std::shared_ptr<RecordRRSIG>>
    findCoveringRRSIGs( const std::vector<ResourceRecord> &section, const Domainname &owner, Type type )
    {
        std::vector<std::shared_ptr<RecordRRSIG>> rrsigs;
        for ( auto &rr : section ) {
            if ( rr.mType != TYPE_RRSIG || rr.mDomainname != owner )
                continue;
            std::shared_ptr<RecordRRSIG> rrsig = std::dynamic_pointer_cast<RecordRRSIG>( rr.mRData );
            if ( rrsig && rrsig->getTypeCovered() == type )
                rrsigs.push_back( rrsig );
        }
        return rrsigs;
    }
}
