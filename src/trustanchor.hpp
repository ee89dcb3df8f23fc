#ifndef DNSSEC_TRUSTANCHOR_HPP
#define DNSSEC_TRUSTANCHOR_HPP

#include "dns.hpp"
#include <memory>
#include <string>
#include <vector>

namespace dnssec
{
    /*!
     * one configured anchor, either a DS digest or a full DNSKEY
     */
    struct TrustAnchor {
        Domainname                    mZone;
        std::shared_ptr<RecordDS>     mDS;
        std::shared_ptr<RecordDNSKEY> mDNSKEY;

        bool isDS() const
        {
            return mDS != nullptr;
        }
    };

    /*!
     * immutable set of trust anchors.
     * Several anchors of the same zone are accepted at the same time for key rollover.
     */
    class TrustAnchorSet
    {
    public:
        TrustAnchorSet( const std::string &version, const std::vector<TrustAnchor> &anchors );

        const std::string &getVersion() const
        {
            return mVersion;
        }
        const std::vector<TrustAnchor> &getAnchors() const
        {
            return mAnchors;
        }

        bool hasAnchor( const Domainname &zone ) const;
        std::vector<std::shared_ptr<RecordDS>>     getDSRecords( const Domainname &zone ) const;
        std::vector<std::shared_ptr<RecordDNSKEY>> getDNSKEYs( const Domainname &zone ) const;

        /*!
         * IANA root KSK-2017 and KSK-2024 DS records
         */
        static std::shared_ptr<const TrustAnchorSet> createDefault();

    private:
        std::string              mVersion;
        std::vector<TrustAnchor> mAnchors;
    };

    typedef std::shared_ptr<const TrustAnchorSet> TrustAnchorSetPtr;
}

#endif
