#include "trustanchor.hpp"

namespace dnssec
{
    struct BuiltinRootAnchor {
        uint16_t    mKeyTag;
        uint8_t     mAlgorithm;
        uint8_t     mDigestType;
        const char *mDigest;
    };

    // https://data.iana.org/root-anchors/root-anchors.xml
    const BuiltinRootAnchor ROOT_ANCHORS[] = {
        { 20326, 8, 2, "E06D44B80B8F1D39A95C0B0D7C65D08458E880409BBC683457104237C7F8EC8D" },
        { 38696, 8, 2, "683D2D0ACB8C9B712A1948B27F741219298D0A450D612C483AF444A4C0FB2B16" },
    };
    const char *ROOT_ANCHORS_VERSION = "iana-root-anchors-2024";

    TrustAnchorSet::TrustAnchorSet( const std::string &version, const std::vector<TrustAnchor> &anchors )
        : mVersion( version ), mAnchors( anchors )
    {
    }

    bool TrustAnchorSet::hasAnchor( const Domainname &zone ) const
    {
        for ( auto &anchor : mAnchors ) {
            if ( anchor.mZone == zone )
                return true;
        }
        return false;
    }

    std::vector<std::shared_ptr<RecordDS>> TrustAnchorSet::getDSRecords( const Domainname &zone ) const
    {
        std::vector<std::shared_ptr<RecordDS>> ds_records;
        for ( auto &anchor : mAnchors ) {
            if ( anchor.mZone == zone && anchor.isDS() )
                ds_records.push_back( anchor.mDS );
        }
        return ds_records;
    }

    std::vector<std::shared_ptr<RecordDNSKEY>> TrustAnchorSet::getDNSKEYs( const Domainname &zone ) const
    {
        std::vector<std::shared_ptr<RecordDNSKEY>> keys;
        for ( auto &anchor : mAnchors ) {
            if ( anchor.mZone == zone && !anchor.isDS() )
                keys.push_back( anchor.mDNSKEY );
        }
        return keys;
    }

    std::shared_ptr<const TrustAnchorSet> TrustAnchorSet::createDefault()
    {
        std::vector<TrustAnchor> anchors;
        for ( auto &root : ROOT_ANCHORS ) {
            PacketData digest;
            decodeFromHex( root.mDigest, digest );

            TrustAnchor anchor;
            anchor.mZone = Domainname( "." );
            anchor.mDS   = std::make_shared<RecordDS>( root.mKeyTag, root.mAlgorithm, root.mDigestType, digest );
            anchors.push_back( anchor );
        }
        return std::make_shared<const TrustAnchorSet>( ROOT_ANCHORS_VERSION, anchors );
    }
}
