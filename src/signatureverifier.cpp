#include "signatureverifier.hpp"
#include <boost/log/trivial.hpp>
#include <cstring>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <sstream>

namespace dnssec
{
    void throwCryptoError( const std::string &message )
    {
        unsigned long code = ERR_get_error();
        char          openssl_error[ 1024 ];
        std::memset( openssl_error, 0, sizeof( openssl_error ) );
        ERR_error_string_n( code, openssl_error, sizeof( openssl_error ) );

        std::ostringstream err;
        err << message << "(" << openssl_error << ")";
        throw CryptoError( err.str() );
    }

    std::string signAlgorithmToString( SignAlgorithm algo )
    {
        switch ( algo ) {
        case DNSSEC_RSAMD5:
            return "RSAMD5";
        case DNSSEC_DSA:
            return "DSA";
        case DNSSEC_RSASHA1:
            return "RSASHA1";
        case DNSSEC_RSASHA1_NSEC3_SHA1:
            return "RSASHA1-NSEC3-SHA1";
        case DNSSEC_RSASHA256:
            return "RSASHA256";
        case DNSSEC_RSASHA512:
            return "RSASHA512";
        case DNSSEC_ECC_GOST:
            return "ECC-GOST";
        case DNSSEC_ECDSAP256SHA256:
            return "ECDSAP256SHA256";
        case DNSSEC_ECDSAP384SHA384:
            return "ECDSAP384SHA384";
        case DNSSEC_ED25519:
            return "ED25519";
        case DNSSEC_ED448:
            return "ED448";
        default:
            std::ostringstream os;
            os << "ALGORITHM" << (unsigned int)algo;
            return os.str();
        }
    }

    typedef std::unique_ptr<EVP_PKEY, decltype( &EVP_PKEY_free )>     EVPPKEYPtr;
    typedef std::unique_ptr<EVP_MD_CTX, decltype( &EVP_MD_CTX_free )> EVPMDCTXPtr;

    static bool verifyDigestSignature( EVP_PKEY *key, const EVP_MD *md, const PacketData &data, const PacketData &signature )
    {
        EVPMDCTXPtr ctx( EVP_MD_CTX_new(), EVP_MD_CTX_free );
        if ( !ctx )
            throwCryptoError( "cannot create MD_CTX" );

        bool result = EVP_DigestVerifyInit( ctx.get(), nullptr, md, nullptr, key ) == 1 &&
                      EVP_DigestVerifyUpdate( ctx.get(), data.data(), data.size() ) == 1 &&
                      EVP_DigestVerifyFinal( ctx.get(), signature.data(), signature.size() ) == 1;
        ERR_clear_error();
        return result;
    }

    /*******************************************************************************************
     * RSAVerifier
     *******************************************************************************************/
    template <SignAlgorithm ALGO>
    class RSAVerifier : public AlgorithmVerifier
    {
    public:
        virtual SignAlgorithm getAlgorithm() const { return ALGO; }
        virtual bool          isSupported() const { return true; }

        virtual bool verify( const PacketData &public_key, const PacketData &signed_data, const PacketData &signature ) const
        {
            EVPPKEYPtr key( createPublicKey( public_key ), EVP_PKEY_free );
            if ( !key )
                return false;
            return verifyDigestSignature( key.get(), getMD(), signed_data, signature );
        }

    private:
        static const EVP_MD *getMD()
        {
            switch ( ALGO ) {
            case DNSSEC_RSASHA256:
                return EVP_sha256();
            case DNSSEC_RSASHA512:
                return EVP_sha512();
            default:
                return EVP_sha1();
            }
        }

        /*!
         * RFC 3110 2: exponent length ( 1 or 3 bytes ), exponent, modulus
         */
        static EVP_PKEY *createPublicKey( const PacketData &key )
        {
            if ( key.size() < 1 )
                return nullptr;

            size_t exponent_length = key[ 0 ];
            size_t offset          = 1;
            if ( exponent_length == 0 ) {
                if ( key.size() < 3 )
                    return nullptr;
                exponent_length = ( key[ 1 ] << 8 ) + key[ 2 ];
                offset          = 3;
            }
            if ( exponent_length == 0 || key.size() <= offset + exponent_length )
                return nullptr;

            BIGNUM *exponent = BN_bin2bn( &key[ offset ], exponent_length, nullptr );
            BIGNUM *modulus  = BN_bin2bn( &key[ offset + exponent_length ], key.size() - offset - exponent_length, nullptr );
            RSA *   rsa      = RSA_new();
            if ( exponent == nullptr || modulus == nullptr || rsa == nullptr ||
                 RSA_set0_key( rsa, modulus, exponent, nullptr ) != 1 ) {
                BN_free( exponent );
                BN_free( modulus );
                RSA_free( rsa );
                throwCryptoError( "cannot create RSA public key" );
            }

            EVP_PKEY *pkey = EVP_PKEY_new();
            if ( pkey == nullptr || EVP_PKEY_assign_RSA( pkey, rsa ) != 1 ) {
                RSA_free( rsa );
                EVP_PKEY_free( pkey );
                throwCryptoError( "cannot create EVP_PKEY for RSA public key" );
            }
            return pkey;
        }
    };

    /*******************************************************************************************
     * ECDSAVerifier
     *******************************************************************************************/
    template <SignAlgorithm ALGO>
    class ECDSAVerifier : public AlgorithmVerifier
    {
    public:
        virtual SignAlgorithm getAlgorithm() const { return ALGO; }
        virtual bool          isSupported() const { return true; }

        virtual bool verify( const PacketData &public_key, const PacketData &signed_data, const PacketData &signature ) const
        {
            if ( public_key.size() != getKeySize() || signature.size() != getKeySize() )
                return false;

            EVPPKEYPtr key( createPublicKey( public_key ), EVP_PKEY_free );
            if ( !key )
                return false;

            PacketData der_signature;
            convertSignatureToDER( signature, der_signature );
            return verifyDigestSignature( key.get(), getMD(), signed_data, der_signature );
        }

    private:
        static size_t getKeySize()
        {
            return ALGO == DNSSEC_ECDSAP256SHA256 ? 64 : 96;
        }

        static int getCurve()
        {
            return ALGO == DNSSEC_ECDSAP256SHA256 ? NID_X9_62_prime256v1 : NID_secp384r1;
        }

        static const EVP_MD *getMD()
        {
            return ALGO == DNSSEC_ECDSAP256SHA256 ? EVP_sha256() : EVP_sha384();
        }

        /*!
         * DNSKEY holds Q as x | y (RFC 6605 4), OpenSSL wants the uncompressed point 0x04 | x | y
         */
        static EVP_PKEY *createPublicKey( const PacketData &key )
        {
            EC_KEY *ec = EC_KEY_new_by_curve_name( getCurve() );
            if ( ec == nullptr )
                throwCryptoError( "cannot create EC_KEY" );

            PacketData point;
            point.push_back( 0x04 );
            point.insert( point.end(), key.begin(), key.end() );
            const uint8_t *p = point.data();
            if ( o2i_ECPublicKey( &ec, &p, point.size() ) == nullptr ) {
                EC_KEY_free( ec );
                ERR_clear_error();
                return nullptr;
            }

            EVP_PKEY *pkey = EVP_PKEY_new();
            if ( pkey == nullptr || EVP_PKEY_assign_EC_KEY( pkey, ec ) != 1 ) {
                EC_KEY_free( ec );
                EVP_PKEY_free( pkey );
                throwCryptoError( "cannot create EVP_PKEY for EC public key" );
            }
            return pkey;
        }

        /*!
         * RRSIG holds r | s, OpenSSL wants ECDSA-Sig-Value
         */
        static void convertSignatureToDER( const PacketData &signature, PacketData &der )
        {
            size_t  half = signature.size() / 2;
            BIGNUM *r    = BN_bin2bn( &signature[ 0 ], half, nullptr );
            BIGNUM *s    = BN_bin2bn( &signature[ half ], half, nullptr );

            ECDSA_SIG *sig = ECDSA_SIG_new();
            if ( r == nullptr || s == nullptr || sig == nullptr || ECDSA_SIG_set0( sig, r, s ) != 1 ) {
                BN_free( r );
                BN_free( s );
                ECDSA_SIG_free( sig );
                throwCryptoError( "cannot create ECDSA_SIG" );
            }

            int length = i2d_ECDSA_SIG( sig, nullptr );
            if ( length <= 0 ) {
                ECDSA_SIG_free( sig );
                throwCryptoError( "cannot encode ECDSA_SIG" );
            }
            der.resize( length );
            uint8_t *p = der.data();
            i2d_ECDSA_SIG( sig, &p );
            ECDSA_SIG_free( sig );
        }
    };

    /*******************************************************************************************
     * EdDSAVerifier
     *******************************************************************************************/
    template <SignAlgorithm ALGO>
    class EdDSAVerifier : public AlgorithmVerifier
    {
    public:
        virtual SignAlgorithm getAlgorithm() const { return ALGO; }
        virtual bool          isSupported() const { return true; }

        virtual bool verify( const PacketData &public_key, const PacketData &signed_data, const PacketData &signature ) const
        {
            if ( public_key.size() != getKeySize() || signature.size() != getKeySize() * 2 )
                return false;

            EVPPKEYPtr key( EVP_PKEY_new_raw_public_key( getType(), nullptr, public_key.data(), public_key.size() ),
                            EVP_PKEY_free );
            if ( !key ) {
                ERR_clear_error();
                return false;
            }

            EVPMDCTXPtr ctx( EVP_MD_CTX_new(), EVP_MD_CTX_free );
            if ( !ctx )
                throwCryptoError( "cannot create MD_CTX" );

            bool result = EVP_DigestVerifyInit( ctx.get(), nullptr, nullptr, nullptr, key.get() ) == 1 &&
                          EVP_DigestVerify( ctx.get(), signature.data(), signature.size(), signed_data.data(),
                                            signed_data.size() ) == 1;
            ERR_clear_error();
            return result;
        }

    private:
        static size_t getKeySize()
        {
            return ALGO == DNSSEC_ED25519 ? 32 : 57;
        }

        static int getType()
        {
            return ALGO == DNSSEC_ED25519 ? EVP_PKEY_ED25519 : EVP_PKEY_ED448;
        }
    };

    /*******************************************************************************************
     * UnsupportedVerifier
     *******************************************************************************************/
    class UnsupportedVerifier : public AlgorithmVerifier
    {
    public:
        UnsupportedVerifier( SignAlgorithm algo ) : mAlgorithm( algo )
        {
        }

        virtual SignAlgorithm getAlgorithm() const { return mAlgorithm; }
        virtual bool          isSupported() const { return false; }

        virtual bool verify( const PacketData &, const PacketData &, const PacketData & ) const
        {
            return false;
        }

    private:
        SignAlgorithm mAlgorithm;
    };

    AlgorithmVerifierPtr createAlgorithmVerifier( SignAlgorithm algo )
    {
        switch ( algo ) {
        case DNSSEC_RSASHA1:
            return std::make_shared<RSAVerifier<DNSSEC_RSASHA1>>();
        case DNSSEC_RSASHA1_NSEC3_SHA1:
            return std::make_shared<RSAVerifier<DNSSEC_RSASHA1_NSEC3_SHA1>>();
        case DNSSEC_RSASHA256:
            return std::make_shared<RSAVerifier<DNSSEC_RSASHA256>>();
        case DNSSEC_RSASHA512:
            return std::make_shared<RSAVerifier<DNSSEC_RSASHA512>>();
        case DNSSEC_ECDSAP256SHA256:
            return std::make_shared<ECDSAVerifier<DNSSEC_ECDSAP256SHA256>>();
        case DNSSEC_ECDSAP384SHA384:
            return std::make_shared<ECDSAVerifier<DNSSEC_ECDSAP384SHA384>>();
        case DNSSEC_ED25519:
            return std::make_shared<EdDSAVerifier<DNSSEC_ED25519>>();
        case DNSSEC_ED448:
            return std::make_shared<EdDSAVerifier<DNSSEC_ED448>>();
        default:
            return std::make_shared<UnsupportedVerifier>( algo );
        }
    }

    bool serialLessThan( uint32_t s1, uint32_t s2 )
    {
        uint32_t diff = s2 - s1;
        return diff != 0 && diff < 0x80000000;
    }

    bool isInValidityPeriod( const RecordRRSIG &rrsig, uint32_t now )
    {
        return !serialLessThan( now, rrsig.getInception() ) && !serialLessThan( rrsig.getExpiration(), now );
    }

    static uint32_t countOwnerLabels( const Domainname &owner )
    {
        // leftmost "*" label is not counted (RFC 4034 3.1.3)
        return owner.isWildcard() ? owner.getLabelCount() - 1 : owner.getLabelCount();
    }

    void buildSignedData( const RRSet &rrset, const RecordRRSIG &rrsig, WireFormat &signed_data )
    {
        signed_data.clear();
        rrsig.outputSignedFields( signed_data );

        Domainname owner = rrset.getCanonicalOwner();
        if ( rrsig.getLabelCount() < countOwnerLabels( owner ) ) {
            owner = owner.getSuffix( rrsig.getLabelCount() );
            owner.addSubdomain( "*" );
        }

        for ( auto &rdata : rrset.getCanonicalRDATA() ) {
            owner.outputCanonicalWireFormat( signed_data );
            signed_data.pushUInt16HtoN( rrset.getType() );
            signed_data.pushUInt16HtoN( rrset.getClass() );
            signed_data.pushUInt32HtoN( rrsig.getOriginalTTL() );
            signed_data.pushUInt16HtoN( rdata.size() );
            signed_data.pushBuffer( rdata );
        }
    }

    bool isCandidateKey( const RecordDNSKEY &key )
    {
        return key.isZoneKey() && !key.isRevoked() && key.getProtocol() == RecordDNSKEY::PROTOCOL;
    }

    std::string verifyStatusToString( VerifyStatus status )
    {
        switch ( status ) {
        case VERIFY_VALID:
            return "valid";
        case VERIFY_NO_SIGNATURE:
            return "no signature";
        case VERIFY_NO_KEY:
            return "no matching key";
        case VERIFY_OUTSIDE_VALIDITY_PERIOD:
            return "signature is outside its validity period";
        case VERIFY_INVALID_RRSIG:
            return "invalid RRSIG";
        case VERIFY_CRYPTO_FAILURE:
            return "signature verification failed";
        case VERIFY_UNSUPPORTED_ALGORITHM:
            return "unsupported algorithm";
        }
        return "unknown";
    }

    static VerifyResult makeResult( VerifyStatus status, std::shared_ptr<RecordRRSIG> rrsig, const std::string &message )
    {
        VerifyResult result;
        result.mStatus  = status;
        result.mRRSIG   = rrsig;
        result.mMessage = message;
        return result;
    }

    VerifyResult SignatureVerifier::verifyOne( const RRSet &                                    rrset,
                                               std::shared_ptr<RecordRRSIG>                     rrsig,
                                               const std::vector<std::shared_ptr<RecordDNSKEY>> &keys,
                                               const Domainname &                               zone,
                                               uint32_t                                         now ) const
    {
        std::ostringstream prefix;
        prefix << "RRSIG(" << typeCodeToString( rrset.getType() ) << ", " << rrset.getOwner() << ", key tag "
               << rrsig->getKeyTag() << ", " << signAlgorithmToString( rrsig->getAlgorithm() ) << "): ";

        if ( rrsig->getTypeCovered() != rrset.getType() )
            return makeResult( VERIFY_INVALID_RRSIG, rrsig, prefix.str() + "covers another type" );
        if ( rrsig->getSigner() != zone )
            return makeResult( VERIFY_INVALID_RRSIG, rrsig,
                               prefix.str() + "signer " + rrsig->getSigner().toString() + " is not " + zone.toString() );
        if ( rrsig->getLabelCount() > countOwnerLabels( rrset.getOwner() ) )
            return makeResult( VERIFY_INVALID_RRSIG, rrsig, prefix.str() + "labels field exceeds owner label count" );
        if ( !isInValidityPeriod( *rrsig, now ) )
            return makeResult( VERIFY_OUTSIDE_VALIDITY_PERIOD, rrsig, prefix.str() + "signature expired or not yet valid" );

        AlgorithmVerifierPtr algorithm = createAlgorithmVerifier( rrsig->getAlgorithm() );
        if ( !algorithm->isSupported() )
            return makeResult( VERIFY_UNSUPPORTED_ALGORITHM, rrsig, prefix.str() + "unsupported algorithm" );

        std::vector<std::shared_ptr<RecordDNSKEY>> candidates;
        for ( auto key : keys ) {
            if ( isCandidateKey( *key ) && key->getAlgorithm() == rrsig->getAlgorithm() &&
                 key->getKeyTag() == rrsig->getKeyTag() )
                candidates.push_back( key );
        }
        if ( candidates.empty() )
            return makeResult( VERIFY_NO_KEY, rrsig, prefix.str() + "no DNSKEY matches key tag and algorithm" );

        WireFormat signed_data;
        buildSignedData( rrset, *rrsig, signed_data );
        PacketData data = signed_data.get();

        for ( auto key : candidates ) {
            if ( algorithm->verify( key->getPublicKey(), data, rrsig->getSignature() ) ) {
                VerifyResult result = makeResult( VERIFY_VALID, rrsig, "" );
                result.mKey         = key;
                return result;
            }
        }
        return makeResult( VERIFY_CRYPTO_FAILURE, rrsig, prefix.str() + "signature does not verify" );
    }

    VerifyResult SignatureVerifier::verify( const RRSet &                                    rrset,
                                            const std::vector<std::shared_ptr<RecordRRSIG>> & rrsigs,
                                            const std::vector<std::shared_ptr<RecordDNSKEY>> &keys,
                                            const Domainname &                               zone,
                                            uint32_t                                         now ) const
    {
        VerifyResult worst;
        worst.mStatus  = VERIFY_NO_SIGNATURE;
        worst.mMessage = "no RRSIG covers " + typeCodeToString( rrset.getType() ) + " of " + rrset.getOwner().toString();

        for ( auto rrsig : rrsigs ) {
            VerifyResult result = verifyOne( rrset, rrsig, keys, zone, now );
            BOOST_LOG_TRIVIAL( debug ) << "dnssec.verifier: " << rrset.getOwner() << " "
                                       << typeCodeToString( rrset.getType() ) << " key tag " << rrsig->getKeyTag()
                                       << ": " << verifyStatusToString( result.mStatus );
            if ( result.isValid() )
                return result;
            if ( result.mStatus > worst.mStatus )
                worst = result;
        }
        return worst;
    }
}
