#ifndef DNSSEC_ZONEFIXTURE_HPP
#define DNSSEC_ZONEFIXTURE_HPP

#include "certificatesource.hpp"
#include "resultaggregator.hpp"
#include "rrset.hpp"
#include "signatureverifier.hpp"
#include "transport.hpp"
#include "trustanchor.hpp"
#include <boost/thread.hpp>
#include <map>
#include <openssl/evp.h>

namespace dnssec
{
    /*!
     * throwaway DNSSEC signing key
     */
    class ZoneKey
    {
    public:
        ZoneKey( SignAlgorithm algo, uint16_t flags );
        ~ZoneKey();

        SignAlgorithm getAlgorithm() const
        {
            return mAlgorithm;
        }
        std::shared_ptr<RecordDNSKEY> getDNSKEY() const
        {
            return mDNSKEY;
        }
        uint16_t getKeyTag() const
        {
            return mDNSKEY->getKeyTag();
        }

        /*!
         * signature in the RRSIG format of the algorithm
         */
        PacketData sign( const PacketData &data ) const;

    private:
        SignAlgorithm                 mAlgorithm;
        EVP_PKEY *                    mPrivateKey;
        std::shared_ptr<RecordDNSKEY> mDNSKEY;

        ZoneKey( const ZoneKey & );
        ZoneKey &operator=( const ZoneKey & );
    };

    typedef std::shared_ptr<ZoneKey> ZoneKeyPtr;

    std::shared_ptr<RecordRRSIG>
    signRRSet( const RRSet &rrset, const ZoneKey &key, const Domainname &signer, uint32_t inception, uint32_t expiration );

    /*!
     * copy of rrsig with one bit of the signature inverted
     */
    std::shared_ptr<RecordRRSIG> corruptRRSIG( const RecordRRSIG &rrsig );

    /*!
     * self-signed EC P-256 certificate (DER) with common_name as DNS subjectAltName
     */
    PacketData createCertificate( const std::string &common_name );

    /*!
     * self-signed CA (basicConstraints CA:TRUE) which issues end entity certificates
     */
    class CertificateAuthority
    {
    public:
        CertificateAuthority( const std::string &common_name );

        const PacketData &getCertificate() const
        {
            return mCertificate;
        }

        /*!
         * end entity certificate for common_name signed by this CA
         */
        PacketData issue( const std::string &common_name, long serial = 2 ) const;

    private:
        std::shared_ptr<EVP_PKEY> mKey;
        std::string               mCommonName;
        PacketData                mCertificate;
    };

    /*!
     * DNS responses served by MockTransport
     */
    struct MockAnswer {
        enum Mode {
            ANSWER,
            NXDOMAIN_ANSWER,
            SERVFAIL_ANSWER,
            TIMEOUT,
            UNREACHABLE,
        };

        Mode                                      mMode;
        RRSet                                     mRRSet;
        std::vector<std::shared_ptr<RecordRRSIG>> mRRSIGs;
        unsigned int                              mTimeouts; // TIMEOUT is thrown this many times, then the answer is returned

        MockAnswer() : mMode( ANSWER ), mTimeouts( 0 )
        {
        }
    };

    /*!
     * DNSTransport over frozen answers.
     * Queries without an answer get NODATA with the SOA of the closest enclosing zone.
     * A delay longer than the timeout of a query ends in TimeoutError after the timeout.
     */
    class MockTransport : public DNSTransport
    {
    public:
        MockTransport() : mDelayMSec( 0 ), mQueryCount( 0 ), mLastTimeoutMSec( 0 )
        {
        }

        virtual MessageInfo query( const Domainname &qname, Type qtype, unsigned int timeout_msec );

        void addZone( const Domainname &apex );
        void setAnswer( const RRSet &rrset, const std::vector<std::shared_ptr<RecordRRSIG>> &rrsigs );
        void setMode( const Domainname &qname, Type qtype, MockAnswer::Mode mode, unsigned int count = 0 );
        void removeAnswer( const Domainname &qname, Type qtype );

        MockAnswer &getAnswer( const Domainname &qname, Type qtype );

        void setDelay( unsigned int msec )
        {
            mDelayMSec = msec;
        }

        unsigned int getQueryCount() const;
        unsigned int getQueryCount( const Domainname &qname, Type qtype ) const;
        unsigned int getLastTimeout() const;

    private:
        typedef std::pair<Domainname, Type> Key;

        std::vector<Domainname>      mZones;
        std::map<Key, MockAnswer>    mAnswers;
        std::map<Key, unsigned int>  mQueryCounts;
        unsigned int                 mDelayMSec;
        unsigned int                 mQueryCount;
        unsigned int                 mLastTimeoutMSec;
        mutable boost::mutex         mMutex;

        Domainname findEnclosingZone( const Domainname &qname ) const;
    };

    class MockCertificateSource : public CertificateSource
    {
    public:
        MockCertificateSource() : mFetchCount( 0 )
        {
        }

        virtual PeerCertificates fetchCertificate( const Domainname &domain, uint16_t port );

        void setCertificates( const PeerCertificates &certificates )
        {
            mCertificates = certificates;
            mError.clear();
        }

        void setError( const std::string &error )
        {
            mError = error;
        }

        unsigned int getFetchCount() const
        {
            return mFetchCount;
        }

    private:
        PeerCertificates mCertificates;
        std::string      mError;
        unsigned int     mFetchCount;
    };

    class FixedClock : public Clock
    {
    public:
        FixedClock( time_t t ) : mTime( t )
        {
        }

        virtual time_t now() const
        {
            return mTime;
        }

    private:
        time_t mTime;
    };

    /*!
     * zone hierarchy signed with fresh keys and published through a MockTransport
     */
    class SignedHierarchy
    {
    public:
        struct Zone {
            Domainname mApex;
            ZoneKeyPtr mKSK;
            ZoneKeyPtr mZSK;
            bool       mSigned;
        };

        /*!
         * @param now signatures are valid from now - 1 day to now + 30 days
         */
        SignedHierarchy( uint32_t now, SignAlgorithm algo = DNSSEC_ECDSAP256SHA256 );

        /*!
         * signed zone with a KSK and a ZSK, a DS record in the parent zone and signed DNSKEY/DS RRsets
         */
        Zone &addSignedZone( const Domainname &apex, SignAlgorithm algo );
        Zone &addSignedZone( const Domainname &apex )
        {
            return addSignedZone( apex, mAlgorithm );
        }

        /*!
         * delegation without DS records
         */
        Zone &addUnsignedZone( const Domainname &apex );

        /*!
         * publish rrset signed by the ZSK of its zone
         */
        void addRRSet( const RRSet &rrset );

        /*!
         * re-sign the DNSKEY RRset of apex with the KSK and the given window
         */
        void resignDNSKEY( const Domainname &apex, uint32_t inception, uint32_t expiration );

        Zone &getZone( const Domainname &apex );

        TrustAnchorSetPtr getTrustAnchors() const;

        MockTransport &getTransport()
        {
            return mTransport;
        }

        uint32_t getInception() const
        {
            return mInception;
        }
        uint32_t getExpiration() const
        {
            return mExpiration;
        }

    private:
        SignAlgorithm              mAlgorithm;
        uint32_t                   mInception;
        uint32_t                   mExpiration;
        std::map<Domainname, Zone> mZones;
        MockTransport              mTransport;

        Zone &findEnclosingZone( const Domainname &name );
    };
}

#endif
