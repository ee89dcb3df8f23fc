#include "zonewalker.hpp"
#include "dsmatcher.hpp"
#include <boost/log/trivial.hpp>

namespace dnssec
{
    Status WalkResult::getStatus() const
    {
        if ( mChain.empty() )
            return STATUS_ERROR;

        Status status = STATUS_VALID;
        for ( auto &link : mChain )
            status = worseStatus( status, link.mStatus );
        // non-existence proofs are not verified
        if ( !mDomainExists )
            status = worseStatus( status, STATUS_INDETERMINATE );
        return status;
    }

    const DNSKEYSet *WalkResult::findValidatedKeys( const Domainname &zone ) const
    {
        auto keys = mValidatedKeys.find( zone );
        if ( keys == mValidatedKeys.end() )
            return nullptr;
        return &keys->second;
    }

    static void setLinkStatus( ChainLink &link, Status status, const std::string &message )
    {
        link.mStatus = status;
        link.mError  = message;
        BOOST_LOG_TRIVIAL( info ) << "dnssec.walker: " << link.mZone << " " << statusToString( status ) << ": " << message;
    }

    static std::string describeFailure( const FetchResult &fetched, const Domainname &zone, Type type )
    {
        std::string kind;
        switch ( fetched.mStatus ) {
        case FETCH_TIMEOUT:
        case FETCH_UNREACHABLE:
            kind = "NetworkError";
            break;
        case FETCH_DEADLINE_EXCEEDED:
            return "deadline exceeded while querying " + typeCodeToString( type ) + " of " + zone.toString();
        default:
            kind = "ProtocolError";
            break;
        }
        return kind + ": " + typeCodeToString( type ) + " query for " + zone.toString() + " failed (" +
               fetchStatusToString( fetched.mStatus ) + "): " + fetched.mError;
    }

    WalkResult ZoneWalker::walk( const Domainname &domain )
    {
        WalkResult result;
        mParentZone = Domainname();
        mParentKeys.clear();

        for ( auto &zone : domain.getAncestors() ) {
            ChainLink link;
            link.mZone = zone;

            ZoneStep step = validateZone( zone, result, link );
            if ( step == ZONE_SKIPPED ) {
                BOOST_LOG_TRIVIAL( debug ) << "dnssec.walker: " << zone << " is not a zone cut";
                continue;
            }
            if ( step == ZONE_NONEXISTENT ) {
                result.mDomainExists = false;
                std::string error    = domain.toString() + ": domain does not exist";
                if ( zone != domain )
                    error += " (NXDOMAIN for " + zone.toString() + ")";
                result.mErrors.push_back( error );
                BOOST_LOG_TRIVIAL( info ) << "dnssec.walker: " << error;
                break;
            }

            result.mChain.push_back( link );
            if ( link.mStatus == STATUS_BOGUS || link.mStatus == STATUS_INDETERMINATE )
                result.mErrors.push_back( zone.toString() + ": " + *link.mError );
            if ( link.mStatus != STATUS_VALID )
                break;
        }

        return result;
    }

    ZoneWalker::ZoneStep ZoneWalker::validateZone( const Domainname &zone, WalkResult &result, ChainLink &link )
    {
        FetchResult dnskey = mFetcher.fetch( zone, TYPE_DNSKEY );
        if ( dnskey.isFailure() ) {
            setLinkStatus( link, STATUS_INDETERMINATE, describeFailure( dnskey, zone, TYPE_DNSKEY ) );
            return ZONE_LINKED;
        }
        collectRecords( zone, dnskey, result );

        if ( zone.isRoot() ) {
            if ( !dnskey.isOK() ) {
                setLinkStatus( link, STATUS_BOGUS, "no DNSKEY records for the root zone" );
                return ZONE_LINKED;
            }
            validateWithAnchors( zone, dnskey, result, link );
            return ZONE_LINKED;
        }

        FetchResult ds = mFetcher.fetch( zone, TYPE_DS );
        if ( ds.isFailure() ) {
            setLinkStatus( link, STATUS_INDETERMINATE, describeFailure( ds, zone, TYPE_DS ) );
            return ZONE_LINKED;
        }
        collectRecords( zone, ds, result );

        if ( !dnskey.isOK() ) {
            if ( ds.isOK() ) {
                setLinkStatus( link, STATUS_BOGUS, "DS records exist in " + mParentZone.toString() + " but " +
                                                       zone.toString() + " has no DNSKEY records" );
                return ZONE_LINKED;
            }
            if ( mAnchors->hasAnchor( zone ) ) {
                setLinkStatus( link, STATUS_BOGUS, "no DNSKEY records for trust anchor " + zone.toString() );
                return ZONE_LINKED;
            }
            if ( dnskey.mStatus == FETCH_NXDOMAIN )
                return ZONE_NONEXISTENT;
            // the name belongs to an enclosing zone
            if ( dnskey.mSOAOwner && *dnskey.mSOAOwner != zone )
                return ZONE_SKIPPED;

            setLinkStatus( link, STATUS_INSECURE, "no DS records for " + zone.toString() + " in " +
                                                      mParentZone.toString() + ", unsigned delegation" );
            return ZONE_LINKED;
        }

        if ( mAnchors->hasAnchor( zone ) ) {
            validateWithAnchors( zone, dnskey, result, link );
            return ZONE_LINKED;
        }

        if ( !ds.isOK() ) {
            setLinkStatus( link, STATUS_INSECURE, "no DS records for " + zone.toString() + " in " +
                                                      mParentZone.toString() + ", unsigned delegation" );
            return ZONE_LINKED;
        }

        VerifyResult ds_verify = mVerifier.verify( ds.mRRSet, ds.mRRSIGs, mParentKeys, mParentZone, mNow );
        if ( !ds_verify.isValid() ) {
            setLinkStatus( link,
                           ds_verify.isIndeterminate() ? STATUS_INDETERMINATE : STATUS_BOGUS,
                           "DS RRset is not validated by " + mParentZone.toString() + ": " + ds_verify.mMessage );
            return ZONE_LINKED;
        }

        DSMatchResult match = matchDS( zone, castRRSet<RecordDNSKEY>( dnskey.mRRSet ), castRRSet<RecordDS>( ds.mRRSet ) );
        if ( match.mStatus == DS_NO_SUPPORTED_DIGEST ) {
            setLinkStatus( link, STATUS_INSECURE, match.mMessage );
            return ZONE_LINKED;
        }
        if ( !match.isMatched() ) {
            setLinkStatus( link, STATUS_BOGUS, match.mMessage );
            return ZONE_LINKED;
        }

        verifyKeySet( zone, dnskey, match.getMatchedKeys(), result, link );
        return ZONE_LINKED;
    }

    static bool isSameKey( const RecordDNSKEY &lhs, const RecordDNSKEY &rhs )
    {
        WireFormat lhs_data, rhs_data;
        lhs.outputCanonicalWireFormat( lhs_data );
        rhs.outputCanonicalWireFormat( rhs_data );
        return lhs_data == rhs_data;
    }

    void ZoneWalker::validateWithAnchors( const Domainname &zone, const FetchResult &dnskey, WalkResult &result, ChainLink &link )
    {
        if ( !mAnchors->hasAnchor( zone ) ) {
            setLinkStatus( link, STATUS_INDETERMINATE, "no trust anchor for " + zone.toString() );
            return;
        }

        DNSKEYSet keys = castRRSet<RecordDNSKEY>( dnskey.mRRSet );
        DNSKEYSet trusted_keys;

        std::vector<std::shared_ptr<RecordDS>> anchor_ds = mAnchors->getDSRecords( zone );
        if ( !anchor_ds.empty() ) {
            DSMatchResult match = matchDS( zone, keys, anchor_ds );
            trusted_keys        = match.getMatchedKeys();
        }
        for ( auto anchor_key : mAnchors->getDNSKEYs( zone ) ) {
            for ( auto key : keys ) {
                if ( isSameKey( *anchor_key, *key ) )
                    trusted_keys.push_back( key );
            }
        }

        if ( trusted_keys.empty() ) {
            setLinkStatus( link, STATUS_BOGUS, "no DNSKEY of " + zone.toString() + " matches trust anchors (" +
                                                   mAnchors->getVersion() + ")" );
            return;
        }
        verifyKeySet( zone, dnskey, trusted_keys, result, link );
    }

    void ZoneWalker::verifyKeySet( const Domainname & zone,
                                   const FetchResult &dnskey,
                                   const DNSKEYSet &  trusted_keys,
                                   WalkResult &       result,
                                   ChainLink &        link )
    {
        VerifyResult verified = mVerifier.verify( dnskey.mRRSet, dnskey.mRRSIGs, trusted_keys, zone, mNow );
        if ( verified.mRRSIG ) {
            link.mAlgorithm = verified.mRRSIG->getAlgorithm();
            link.mKeyTag    = verified.mRRSIG->getKeyTag();
        }

        if ( !verified.isValid() ) {
            setLinkStatus( link,
                           verified.isIndeterminate() ? STATUS_INDETERMINATE : STATUS_BOGUS,
                           "DNSKEY RRset of " + zone.toString() + " is not validated: " + verified.mMessage );
            return;
        }

        link.mStatus = STATUS_VALID;
        link.mError  = boost::none;
        BOOST_LOG_TRIVIAL( info ) << "dnssec.walker: " << zone << " valid (key tag " << verified.mKey->getKeyTag() << ")";

        DNSKEYSet keys               = castRRSet<RecordDNSKEY>( dnskey.mRRSet );
        result.mValidatedKeys[ zone ] = keys;
        mParentZone                   = zone;
        mParentKeys                   = keys;
    }

    void ZoneWalker::collectRecords( const Domainname &zone, const FetchResult &fetched, WalkResult &result ) const
    {
        if ( !fetched.isOK() )
            return;

        for ( auto dnskey : castRRSet<RecordDNSKEY>( fetched.mRRSet ) )
            result.mRecords.mDNSKEY.push_back( summarize( zone, *dnskey ) );
        for ( auto ds : castRRSet<RecordDS>( fetched.mRRSet ) )
            result.mRecords.mDS.push_back( summarize( zone, *ds ) );
        for ( auto rrsig : fetched.mRRSIGs )
            result.mRecords.mRRSIG.push_back( summarize( zone, *rrsig ) );
    }
}
