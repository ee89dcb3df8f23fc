#include "dsmatcher.hpp"
#include "signatureverifier.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include <openssl/evp.h>
#include <sstream>

namespace dnssec
{
    bool isSupportedDigestType( DigestType type )
    {
        return type == DIGEST_SHA1 || type == DIGEST_SHA256 || type == DIGEST_SHA384;
    }

    static const EVP_MD *digestTypeToMD( DigestType type )
    {
        switch ( type ) {
        case DIGEST_SHA1:
            return EVP_sha1();
        case DIGEST_SHA256:
            return EVP_sha256();
        case DIGEST_SHA384:
            return EVP_sha384();
        default:
            std::ostringstream os;
            os << "unsupported digest type " << (unsigned int)type;
            throw CryptoError( os.str() );
        }
    }

    PacketData computeDSDigest( const Domainname &owner, const RecordDNSKEY &key, DigestType type )
    {
        const EVP_MD *md = digestTypeToMD( type );

        WireFormat hash_target;
        owner.outputCanonicalWireFormat( hash_target );
        key.outputCanonicalWireFormat( hash_target );
        PacketData data = hash_target.get();

        EVP_MD_CTX *md_ctx = EVP_MD_CTX_new();
        if ( md_ctx == nullptr )
            throwCryptoError( "cannot create MD_CTX" );

        PacketData   digest( EVP_MAX_MD_SIZE );
        unsigned int digest_length = 0;
        if ( EVP_DigestInit_ex( md_ctx, md, nullptr ) != 1 ||
             EVP_DigestUpdate( md_ctx, data.data(), data.size() ) != 1 ||
             EVP_DigestFinal_ex( md_ctx, digest.data(), &digest_length ) != 1 ) {
            EVP_MD_CTX_free( md_ctx );
            throwCryptoError( "cannot calculate DS digest" );
        }
        EVP_MD_CTX_free( md_ctx );
        digest.resize( digest_length );
        return digest;
    }

    std::shared_ptr<RecordDS> generateDSRecord( const Domainname &owner, const RecordDNSKEY &key, DigestType type )
    {
        return std::make_shared<RecordDS>( key.getKeyTag(), key.getAlgorithm(), type, computeDSDigest( owner, key, type ) );
    }

    std::vector<std::shared_ptr<RecordDNSKEY>> DSMatchResult::getMatchedKeys() const
    {
        std::vector<std::shared_ptr<RecordDNSKEY>> keys;
        for ( auto &match : mMatches ) {
            if ( std::find( keys.begin(), keys.end(), match.mDNSKEY ) == keys.end() )
                keys.push_back( match.mDNSKEY );
        }
        return keys;
    }

    DSMatchResult matchDS( const Domainname &                               owner,
                           const std::vector<std::shared_ptr<RecordDNSKEY>> &keys,
                           const std::vector<std::shared_ptr<RecordDS>> &    ds_records )
    {
        DSMatchResult result;
        bool          has_supported_digest = false;
        bool          has_tag_collision    = false;

        for ( auto ds : ds_records ) {
            if ( !isSupportedDigestType( ds->getDigestType() ) ) {
                BOOST_LOG_TRIVIAL( debug ) << "dnssec.dsmatcher: " << owner << " skip DS " << ds->getKeyTag()
                                           << " with unsupported digest type " << (unsigned int)ds->getDigestType();
                continue;
            }
            has_supported_digest = true;

            for ( auto key : keys ) {
                if ( !key->isZoneKey() || key->getProtocol() != RecordDNSKEY::PROTOCOL )
                    continue;
                if ( key->getKeyTag() != ds->getKeyTag() || key->getAlgorithm() != ds->getAlgorithm() )
                    continue;

                if ( computeDSDigest( owner, *key, ds->getDigestType() ) == ds->getDigest() ) {
                    DSMatch match;
                    match.mDS     = ds;
                    match.mDNSKEY = key;
                    result.mMatches.push_back( match );
                } else {
                    has_tag_collision = true;
                }
            }
        }

        std::ostringstream os;
        if ( !result.mMatches.empty() ) {
            result.mStatus = DS_MATCHED;
        } else if ( ds_records.empty() ) {
            result.mStatus = DS_NO_CANDIDATE;
            os << "no DS records for " << owner;
        } else if ( !has_supported_digest ) {
            result.mStatus = DS_NO_SUPPORTED_DIGEST;
            os << "DS records of " << owner << " use only unsupported digest types";
        } else if ( has_tag_collision ) {
            result.mStatus = DS_DIGEST_MISMATCH;
            os << "DS digest does not match DNSKEY of " << owner;
        } else {
            result.mStatus = DS_NO_CANDIDATE;
            os << "no DNSKEY of " << owner << " matches key tag and algorithm of DS";
        }
        result.mMessage = os.str();
        return result;
    }
}
