#ifndef DNSSEC_ZONEWALKER_HPP
#define DNSSEC_ZONEWALKER_HPP

#include "recordfetcher.hpp"
#include "result.hpp"
#include "signatureverifier.hpp"
#include "trustanchor.hpp"
#include <map>

namespace dnssec
{
    typedef std::vector<std::shared_ptr<RecordDNSKEY>> DNSKEYSet;

    struct WalkResult {
        std::vector<ChainLink>          mChain;
        RecordSummaries                 mRecords;
        std::vector<std::string>        mErrors;
        std::map<Domainname, DNSKEYSet> mValidatedKeys;
        bool                            mDomainExists;

        WalkResult() : mDomainExists( true )
        {
        }

        /*!
         * worst status of the links. STATUS_ERROR when the chain is empty.
         * at least STATUS_INDETERMINATE when the domain does not exist.
         */
        Status getStatus() const;

        /*!
         * DNSKEY set of zone if zone is in the valid part of the chain
         */
        const DNSKEYSet *findValidatedKeys( const Domainname &zone ) const;
    };

    /*!
     * walk zone cuts from the root to the domain and validate every DS/DNSKEY binding.
     * The walk stops at the first link which is not valid, or at a name answered with NXDOMAIN.
     */
    class ZoneWalker
    {
    public:
        /*!
         * @param now current time (seconds since epoch, truncated to 32 bits)
         */
        ZoneWalker( RecordFetcher &fetcher, TrustAnchorSetPtr anchors, uint32_t now )
            : mFetcher( fetcher ), mAnchors( anchors ), mNow( now )
        {
        }

        WalkResult walk( const Domainname &domain );

    private:
        RecordFetcher &   mFetcher;
        TrustAnchorSetPtr mAnchors;
        uint32_t          mNow;
        SignatureVerifier mVerifier;

        Domainname mParentZone;
        DNSKEYSet  mParentKeys;

        enum ZoneStep {
            ZONE_LINKED,
            ZONE_SKIPPED,
            ZONE_NONEXISTENT,
        };

        ZoneStep validateZone( const Domainname &zone, WalkResult &result, ChainLink &link );
        void     validateWithAnchors( const Domainname &zone, const FetchResult &dnskey, WalkResult &result, ChainLink &link );
        void     verifyKeySet( const Domainname & zone,
                               const FetchResult &dnskey,
                               const DNSKEYSet &  trusted_keys,
                               WalkResult &       result,
                               ChainLink &        link );

        void collectRecords( const Domainname &zone, const FetchResult &fetched, WalkResult &result ) const;
    };
}

#endif
