#ifndef DNSSEC_SIGNATUREVERIFIER_HPP
#define DNSSEC_SIGNATUREVERIFIER_HPP

#include "rrset.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace dnssec
{
    /*!
     * OpenSSL operation failed
     */
    class CryptoError : public std::runtime_error
    {
    public:
        CryptoError( const std::string &msg ) : std::runtime_error( msg )
        {
        }
    };

    /*!
     * throw CryptoError with the last OpenSSL error string appended
     */
    void throwCryptoError( const std::string &message );

    typedef uint8_t SignAlgorithm;
    const SignAlgorithm DNSSEC_RSAMD5             = 1;
    const SignAlgorithm DNSSEC_DSA                = 3;
    const SignAlgorithm DNSSEC_RSASHA1            = 5;
    const SignAlgorithm DNSSEC_RSASHA1_NSEC3_SHA1 = 7;
    const SignAlgorithm DNSSEC_RSASHA256          = 8;
    const SignAlgorithm DNSSEC_RSASHA512          = 10;
    const SignAlgorithm DNSSEC_ECC_GOST           = 12;
    const SignAlgorithm DNSSEC_ECDSAP256SHA256    = 13;
    const SignAlgorithm DNSSEC_ECDSAP384SHA384    = 14;
    const SignAlgorithm DNSSEC_ED25519            = 15;
    const SignAlgorithm DNSSEC_ED448              = 16;

    std::string signAlgorithmToString( SignAlgorithm algo );

    /*!
     * signature primitive of one DNSSEC algorithm number
     */
    class AlgorithmVerifier
    {
    public:
        virtual ~AlgorithmVerifier()
        {
        }

        virtual SignAlgorithm getAlgorithm() const = 0;
        virtual bool          isSupported() const  = 0;

        /*!
         * @param public_key  public key field of DNSKEY RDATA
         * @param signed_data RRSIG RDATA without signature + canonical RRset
         * @param signature   signature field of RRSIG RDATA
         * @return true if signature is valid. broken keys or signatures are just invalid.
         */
        virtual bool verify( const PacketData &public_key,
                             const PacketData &signed_data,
                             const PacketData &signature ) const = 0;
    };

    typedef std::shared_ptr<AlgorithmVerifier> AlgorithmVerifierPtr;

    /*!
     * @return verifier for algorithm. unknown numbers get an unsupported verifier.
     */
    AlgorithmVerifierPtr createAlgorithmVerifier( SignAlgorithm algo );

    /*!
     * RFC 1982 serial number comparison ( s1 < s2 )
     */
    bool serialLessThan( uint32_t s1, uint32_t s2 );

    /*!
     * @return true if now is within [inception, expiration] in serial number arithmetic
     */
    bool isInValidityPeriod( const RecordRRSIG &rrsig, uint32_t now );

    /*!
     * build the data covered by rrsig (RFC 4034 3.1.8.1).
     * The owner is replaced by a wildcard name when RRSIG labels is less than the owner labels.
     */
    void buildSignedData( const RRSet &rrset, const RecordRRSIG &rrsig, WireFormat &signed_data );

    /*!
     * DNSKEY usable for RRSIG verification: Zone Key, not revoked, protocol 3
     */
    bool isCandidateKey( const RecordDNSKEY &key );

    /*!
     * ordered from success to the most serious failure.
     * a failed signature outranks one that could not be checked.
     */
    enum VerifyStatus {
        VERIFY_VALID,
        VERIFY_NO_SIGNATURE,
        VERIFY_UNSUPPORTED_ALGORITHM,
        VERIFY_NO_KEY,
        VERIFY_OUTSIDE_VALIDITY_PERIOD,
        VERIFY_INVALID_RRSIG,
        VERIFY_CRYPTO_FAILURE,
    };

    std::string verifyStatusToString( VerifyStatus status );

    struct VerifyResult {
        VerifyStatus                  mStatus;
        std::shared_ptr<RecordDNSKEY> mKey;
        std::shared_ptr<RecordRRSIG>  mRRSIG;
        std::string                   mMessage;

        VerifyResult() : mStatus( VERIFY_NO_SIGNATURE )
        {
        }

        bool isValid() const
        {
            return mStatus == VERIFY_VALID;
        }

        /*!
         * signature verification could not be performed at all:
         * every RRSIG uses an unsupported algorithm
         */
        bool isIndeterminate() const
        {
            return mStatus == VERIFY_UNSUPPORTED_ALGORITHM;
        }
    };

    /*!
     * validate rrset with any of rrsigs signed by one of keys.
     * @param zone signer name required for the RRSIGs
     * @param now  current time (seconds since epoch, truncated to 32 bits)
     */
    class SignatureVerifier
    {
    public:
        VerifyResult verify( const RRSet &                                    rrset,
                             const std::vector<std::shared_ptr<RecordRRSIG>> & rrsigs,
                             const std::vector<std::shared_ptr<RecordDNSKEY>> &keys,
                             const Domainname &                               zone,
                             uint32_t                                         now ) const;

        VerifyResult verifyOne( const RRSet &                                    rrset,
                                std::shared_ptr<RecordRRSIG>                     rrsig,
                                const std::vector<std::shared_ptr<RecordDNSKEY>> &keys,
                                const Domainname &                               zone,
                                uint32_t                                         now ) const;
    };
}

#endif
