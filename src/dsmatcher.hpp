#ifndef DNSSEC_DSMATCHER_HPP
#define DNSSEC_DSMATCHER_HPP

#include "dns.hpp"
#include <memory>
#include <string>
#include <vector>

namespace dnssec
{
    typedef uint8_t    DigestType;
    const DigestType DIGEST_SHA1   = 1;
    const DigestType DIGEST_SHA256 = 2;
    const DigestType DIGEST_GOST   = 3;
    const DigestType DIGEST_SHA384 = 4;

    bool isSupportedDigestType( DigestType type );

    /*!
     * digest of canonical owner | DNSKEY RDATA (RFC 4034 5.1.4)
     * @throw CryptoError unsupported digest type or OpenSSL failure
     */
    PacketData computeDSDigest( const Domainname &owner, const RecordDNSKEY &key, DigestType type );

    /*!
     * DS record of key with digest type
     */
    std::shared_ptr<RecordDS> generateDSRecord( const Domainname &owner, const RecordDNSKEY &key, DigestType type );

    struct DSMatch {
        std::shared_ptr<RecordDS>     mDS;
        std::shared_ptr<RecordDNSKEY> mDNSKEY;
    };

    enum DSMatchStatus {
        DS_MATCHED,
        DS_NO_SUPPORTED_DIGEST,
        DS_DIGEST_MISMATCH,
        DS_NO_CANDIDATE,
    };

    struct DSMatchResult {
        DSMatchStatus        mStatus;
        std::vector<DSMatch> mMatches;
        std::string          mMessage;

        DSMatchResult() : mStatus( DS_NO_CANDIDATE )
        {
        }

        bool isMatched() const
        {
            return mStatus == DS_MATCHED;
        }

        /*!
         * DNSKEYs matched by any DS, without duplicates
         */
        std::vector<std::shared_ptr<RecordDNSKEY>> getMatchedKeys() const;
    };

    /*!
     * compare every DS with every zone key of owner.
     * a match requires the same key tag, algorithm and digest.
     */
    DSMatchResult matchDS( const Domainname &                               owner,
                           const std::vector<std::shared_ptr<RecordDNSKEY>> &keys,
                           const std::vector<std::shared_ptr<RecordDS>> &    ds_records );
}

#endif
