#ifndef DNSSEC_RESULT_HPP
#define DNSSEC_RESULT_HPP

#include "dns.hpp"
#include <boost/optional.hpp>
#include <string>
#include <vector>

namespace dnssec
{
    /*!
     * validation status, ordered from the best to the worst
     */
    enum Status {
        STATUS_VALID,
        STATUS_INSECURE,
        STATUS_INDETERMINATE,
        STATUS_BOGUS,
        STATUS_ERROR,
    };

    std::string statusToString( Status status );

    /*!
     * @throw std::runtime_error unknown status name
     */
    Status stringToStatus( const std::string &status );

    /*!
     * worst of lhs and rhs (bogus > indeterminate > insecure > valid)
     */
    Status worseStatus( Status lhs, Status rhs );

    enum DANEStatus {
        DANE_VALID,
        DANE_INVALID,
        DANE_NO_TLSA,
        DANE_DNSSEC_REQUIRED,
        DANE_CERT_UNAVAILABLE,
    };

    std::string daneStatusToString( DANEStatus status );
    DANEStatus  stringToDANEStatus( const std::string &status );

    struct ChainLink {
        Domainname                   mZone;
        Status                       mStatus;
        boost::optional<uint8_t>     mAlgorithm;
        boost::optional<uint16_t>    mKeyTag;
        boost::optional<std::string> mError;

        ChainLink() : mStatus( STATUS_INDETERMINATE )
        {
        }

        bool operator==( const ChainLink &rhs ) const;
    };

    struct DNSKEYSummary {
        std::string mZone;
        uint16_t    mFlags;
        uint8_t     mProtocol;
        uint8_t     mAlgorithm;
        uint16_t    mKeyTag;
        std::string mPublicKey;

        DNSKEYSummary() : mFlags( 0 ), mProtocol( 0 ), mAlgorithm( 0 ), mKeyTag( 0 )
        {
        }

        bool operator==( const DNSKEYSummary &rhs ) const;
    };

    struct DSSummary {
        std::string mZone;
        uint16_t    mKeyTag;
        uint8_t     mAlgorithm;
        uint8_t     mDigestType;
        std::string mDigest;

        DSSummary() : mKeyTag( 0 ), mAlgorithm( 0 ), mDigestType( 0 )
        {
        }

        bool operator==( const DSSummary &rhs ) const;
    };

    struct RRSIGSummary {
        std::string mZone;
        std::string mTypeCovered;
        uint8_t     mAlgorithm;
        uint8_t     mLabels;
        uint32_t    mOriginalTTL;
        uint32_t    mExpiration;
        uint32_t    mInception;
        uint16_t    mKeyTag;
        std::string mSigner;

        RRSIGSummary()
            : mAlgorithm( 0 ), mLabels( 0 ), mOriginalTTL( 0 ), mExpiration( 0 ), mInception( 0 ), mKeyTag( 0 )
        {
        }

        bool operator==( const RRSIGSummary &rhs ) const;
    };

    DNSKEYSummary summarize( const Domainname &zone, const RecordDNSKEY &dnskey );
    DSSummary     summarize( const Domainname &zone, const RecordDS &ds );
    RRSIGSummary  summarize( const Domainname &zone, const RecordRRSIG &rrsig );

    struct RecordSummaries {
        std::vector<DNSKEYSummary> mDNSKEY;
        std::vector<DSSummary>     mDS;
        std::vector<RRSIGSummary>  mRRSIG;

        bool operator==( const RecordSummaries &rhs ) const;
    };

    /*!
     * outcome of one TLSA record against the presented certificates
     */
    struct TLSAAssociation {
        uint8_t     mUsage;
        uint8_t     mSelector;
        uint8_t     mMatchingType;
        std::string mExpectedHash; // association data of the record, hex
        std::string mComputedHash; // empty when nothing could be computed
        bool        mValid;
        std::string mReason;

        TLSAAssociation() : mUsage( 0 ), mSelector( 0 ), mMatchingType( 0 ), mValid( false )
        {
        }

        bool operator==( const TLSAAssociation &rhs ) const;
    };

    /*!
     * server certificate (end entity)
     */
    struct CertificateInfo {
        std::string              mSubject; // RFC 2253
        std::string              mIssuer;
        std::string              mSerialNumber; // decimal
        std::string              mNotBefore;    // ISO 8601, UTC
        std::string              mNotAfter;
        std::vector<std::string> mSubjectAltNames;
        std::string              mSHA256;
        std::string              mSHA512;
        std::string              mSPKISHA256;
        std::string              mSPKISHA512;
        unsigned int             mChainLength;

        CertificateInfo() : mChainLength( 0 )
        {
        }

        bool operator==( const CertificateInfo &rhs ) const;
    };

    struct TLSADetails {
        std::vector<TLSAAssociation>     mValidAssociations;
        std::vector<TLSAAssociation>     mInvalidAssociations;
        boost::optional<CertificateInfo> mCertificate;
        double                           mQueryTimeMSec;
        double                           mConnectTimeMSec;

        TLSADetails() : mQueryTimeMSec( 0 ), mConnectTimeMSec( 0 )
        {
        }

        bool operator==( const TLSADetails &rhs ) const;
    };

    struct TLSASummary {
        Status                       mStatus;
        unsigned int                 mRecordsFound;
        DANEStatus                   mDANEStatus;
        std::string                  mMessage;
        boost::optional<TLSADetails> mDetails;

        TLSASummary() : mStatus( STATUS_INSECURE ), mRecordsFound( 0 ), mDANEStatus( DANE_NO_TLSA )
        {
        }

        bool operator==( const TLSASummary &rhs ) const;
    };

    struct ValidationResult {
        std::string                  mDomain;
        Status                       mStatus;
        std::string                  mValidationTime;
        std::vector<ChainLink>       mChainOfTrust;
        RecordSummaries              mRecords;
        boost::optional<TLSASummary> mTLSASummary;
        std::vector<std::string>     mErrors;

        ValidationResult() : mStatus( STATUS_ERROR )
        {
        }

        bool operator==( const ValidationResult &rhs ) const;
    };

    struct BulkSummary {
        unsigned int mTotal;
        unsigned int mValid;
        unsigned int mInsecure;
        unsigned int mBogus;
        unsigned int mIndeterminate;
        unsigned int mError;
        double       mProcessingTime; // seconds

        BulkSummary()
            : mTotal( 0 ), mValid( 0 ), mInsecure( 0 ), mBogus( 0 ), mIndeterminate( 0 ), mError( 0 ), mProcessingTime( 0 )
        {
        }

        void count( Status status );
    };

    struct BulkResult {
        std::vector<ValidationResult> mResults;
        BulkSummary                   mSummary;
    };
}

#endif
