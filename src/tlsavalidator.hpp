#ifndef DNSSEC_TLSAVALIDATOR_HPP
#define DNSSEC_TLSAVALIDATOR_HPP

#include "certificatesource.hpp"
#include "recordfetcher.hpp"
#include "result.hpp"
#include "signatureverifier.hpp"
#include "zonewalker.hpp"

namespace dnssec
{
    typedef uint8_t    TLSAUsage;
    const TLSAUsage TLSA_PKIX_TA = 0;
    const TLSAUsage TLSA_PKIX_EE = 1;
    const TLSAUsage TLSA_DANE_TA = 2;
    const TLSAUsage TLSA_DANE_EE = 3;

    typedef uint8_t       TLSASelector;
    const TLSASelector TLSA_FULL_CERTIFICATE = 0;
    const TLSASelector TLSA_SPKI             = 1;

    typedef uint8_t           TLSAMatchingType;
    const TLSAMatchingType TLSA_EXACT  = 0;
    const TLSAMatchingType TLSA_SHA256 = 1;
    const TLSAMatchingType TLSA_SHA512 = 2;

    /*!
     * _<port>._<protocol>.<domain>
     */
    Domainname getTLSAName( const Domainname &domain, uint16_t port, const std::string &protocol );

    /*!
     * certificate or its SubjectPublicKeyInfo in DER
     * @throw CryptoError certificate cannot be parsed or selector is unknown
     */
    PacketData selectCertificateData( const PacketData &certificate, TLSASelector selector );

    /*!
     * @throw CryptoError matching type is unknown
     */
    PacketData computeAssociationData( const PacketData &selected, TLSAMatchingType matching_type );

    /*!
     * check tlsa against the certificate its usage selects: the end entity for usages 1 and 3,
     * a presented issuer for usages 0 and 2. For 0 and 2 the end entity must chain to the
     * matching issuer. Usages 0 and 1 also require a valid PKIX chain.
     */
    TLSAAssociation checkAssociation( const RecordTLSA &tlsa, const PeerCertificates &certificates );

    /*!
     * @return true if tlsa matches a certificate of certificates required by its usage
     */
    bool matchTLSA( const RecordTLSA &tlsa, const PeerCertificates &certificates );

    /*!
     * subject, validity, SAN and fingerprints of the end entity certificate
     * @throw CryptoError certificate cannot be parsed
     */
    CertificateInfo describeCertificate( const PeerCertificates &certificates );

    class TLSAValidator
    {
    public:
        TLSAValidator( RecordFetcher &fetcher, CertificateSource &source, uint32_t now )
            : mFetcher( fetcher ), mCertificateSource( source ), mNow( now )
        {
        }

        /*!
         * @param walk chain of trust of domain, its validated DNSKEY sets verify the TLSA RRset
         * @param with_details fill TLSASummary::mDetails
         */
        TLSASummary validate( const Domainname & domain,
                              const WalkResult & walk,
                              uint16_t           port,
                              const std::string &protocol,
                              bool               with_details = false );

    private:
        RecordFetcher &    mFetcher;
        CertificateSource &mCertificateSource;
        uint32_t           mNow;
        SignatureVerifier  mVerifier;

        Status validateTLSARRSet( const FetchResult &tlsa, const WalkResult &walk, std::string &message ) const;
        void   runValidation( const Domainname & domain,
                              const WalkResult & walk,
                              uint16_t           port,
                              const std::string &protocol,
                              bool               with_details,
                              TLSASummary &      summary,
                              TLSADetails &      details );
    };
}

#endif
