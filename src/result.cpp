#include "result.hpp"
#include "utils.hpp"
#include <stdexcept>

namespace dnssec
{
    std::string statusToString( Status status )
    {
        switch ( status ) {
        case STATUS_VALID:
            return "valid";
        case STATUS_INSECURE:
            return "insecure";
        case STATUS_INDETERMINATE:
            return "indeterminate";
        case STATUS_BOGUS:
            return "bogus";
        case STATUS_ERROR:
            return "error";
        }
        return "error";
    }

    Status stringToStatus( const std::string &status )
    {
        if ( status == "valid" )
            return STATUS_VALID;
        if ( status == "insecure" )
            return STATUS_INSECURE;
        if ( status == "indeterminate" )
            return STATUS_INDETERMINATE;
        if ( status == "bogus" )
            return STATUS_BOGUS;
        if ( status == "error" )
            return STATUS_ERROR;
        throw std::runtime_error( "unknown status \"" + status + "\"" );
    }

    Status worseStatus( Status lhs, Status rhs )
    {
        return lhs > rhs ? lhs : rhs;
    }

    std::string daneStatusToString( DANEStatus status )
    {
        switch ( status ) {
        case DANE_VALID:
            return "valid";
        case DANE_INVALID:
            return "invalid";
        case DANE_NO_TLSA:
            return "no-tlsa";
        case DANE_DNSSEC_REQUIRED:
            return "dnssec-required";
        case DANE_CERT_UNAVAILABLE:
            return "cert-unavailable";
        }
        return "invalid";
    }

    DANEStatus stringToDANEStatus( const std::string &status )
    {
        if ( status == "valid" )
            return DANE_VALID;
        if ( status == "invalid" )
            return DANE_INVALID;
        if ( status == "no-tlsa" )
            return DANE_NO_TLSA;
        if ( status == "dnssec-required" )
            return DANE_DNSSEC_REQUIRED;
        if ( status == "cert-unavailable" )
            return DANE_CERT_UNAVAILABLE;
        throw std::runtime_error( "unknown dane status \"" + status + "\"" );
    }

    bool ChainLink::operator==( const ChainLink &rhs ) const
    {
        return mZone == rhs.mZone && mStatus == rhs.mStatus && mAlgorithm == rhs.mAlgorithm && mKeyTag == rhs.mKeyTag &&
               mError == rhs.mError;
    }

    bool DNSKEYSummary::operator==( const DNSKEYSummary &rhs ) const
    {
        return mZone == rhs.mZone && mFlags == rhs.mFlags && mProtocol == rhs.mProtocol && mAlgorithm == rhs.mAlgorithm &&
               mKeyTag == rhs.mKeyTag && mPublicKey == rhs.mPublicKey;
    }

    bool DSSummary::operator==( const DSSummary &rhs ) const
    {
        return mZone == rhs.mZone && mKeyTag == rhs.mKeyTag && mAlgorithm == rhs.mAlgorithm &&
               mDigestType == rhs.mDigestType && mDigest == rhs.mDigest;
    }

    bool RRSIGSummary::operator==( const RRSIGSummary &rhs ) const
    {
        return mZone == rhs.mZone && mTypeCovered == rhs.mTypeCovered && mAlgorithm == rhs.mAlgorithm &&
               mLabels == rhs.mLabels && mOriginalTTL == rhs.mOriginalTTL && mExpiration == rhs.mExpiration &&
               mInception == rhs.mInception && mKeyTag == rhs.mKeyTag && mSigner == rhs.mSigner;
    }

    bool RecordSummaries::operator==( const RecordSummaries &rhs ) const
    {
        return mDNSKEY == rhs.mDNSKEY && mDS == rhs.mDS && mRRSIG == rhs.mRRSIG;
    }

    bool TLSAAssociation::operator==( const TLSAAssociation &rhs ) const
    {
        return mUsage == rhs.mUsage && mSelector == rhs.mSelector && mMatchingType == rhs.mMatchingType &&
               mExpectedHash == rhs.mExpectedHash && mComputedHash == rhs.mComputedHash && mValid == rhs.mValid &&
               mReason == rhs.mReason;
    }

    bool CertificateInfo::operator==( const CertificateInfo &rhs ) const
    {
        return mSubject == rhs.mSubject && mIssuer == rhs.mIssuer && mSerialNumber == rhs.mSerialNumber &&
               mNotBefore == rhs.mNotBefore && mNotAfter == rhs.mNotAfter && mSubjectAltNames == rhs.mSubjectAltNames &&
               mSHA256 == rhs.mSHA256 && mSHA512 == rhs.mSHA512 && mSPKISHA256 == rhs.mSPKISHA256 &&
               mSPKISHA512 == rhs.mSPKISHA512 && mChainLength == rhs.mChainLength;
    }

    bool TLSADetails::operator==( const TLSADetails &rhs ) const
    {
        return mValidAssociations == rhs.mValidAssociations && mInvalidAssociations == rhs.mInvalidAssociations &&
               mCertificate == rhs.mCertificate && mQueryTimeMSec == rhs.mQueryTimeMSec &&
               mConnectTimeMSec == rhs.mConnectTimeMSec;
    }

    bool TLSASummary::operator==( const TLSASummary &rhs ) const
    {
        return mStatus == rhs.mStatus && mRecordsFound == rhs.mRecordsFound && mDANEStatus == rhs.mDANEStatus &&
               mMessage == rhs.mMessage && mDetails == rhs.mDetails;
    }

    bool ValidationResult::operator==( const ValidationResult &rhs ) const
    {
        return mDomain == rhs.mDomain && mStatus == rhs.mStatus && mValidationTime == rhs.mValidationTime &&
               mChainOfTrust == rhs.mChainOfTrust && mRecords == rhs.mRecords && mTLSASummary == rhs.mTLSASummary &&
               mErrors == rhs.mErrors;
    }

    void BulkSummary::count( Status status )
    {
        mTotal++;
        switch ( status ) {
        case STATUS_VALID:
            mValid++;
            break;
        case STATUS_INSECURE:
            mInsecure++;
            break;
        case STATUS_INDETERMINATE:
            mIndeterminate++;
            break;
        case STATUS_BOGUS:
            mBogus++;
            break;
        case STATUS_ERROR:
            mError++;
            break;
        }
    }

    DNSKEYSummary summarize( const Domainname &zone, const RecordDNSKEY &dnskey )
    {
        DNSKEYSummary summary;
        summary.mZone      = zone.toString();
        summary.mFlags     = dnskey.getFlag();
        summary.mProtocol  = dnskey.getProtocol();
        summary.mAlgorithm = dnskey.getAlgorithm();
        summary.mKeyTag    = dnskey.getKeyTag();
        encodeToBase64( dnskey.getPublicKey(), summary.mPublicKey );
        return summary;
    }

    DSSummary summarize( const Domainname &zone, const RecordDS &ds )
    {
        DSSummary summary;
        summary.mZone       = zone.toString();
        summary.mKeyTag     = ds.getKeyTag();
        summary.mAlgorithm  = ds.getAlgorithm();
        summary.mDigestType = ds.getDigestType();
        encodeToHex( ds.getDigest(), summary.mDigest );
        return summary;
    }

    RRSIGSummary summarize( const Domainname &zone, const RecordRRSIG &rrsig )
    {
        RRSIGSummary summary;
        summary.mZone        = zone.toString();
        summary.mTypeCovered = typeCodeToString( rrsig.getTypeCovered() );
        summary.mAlgorithm   = rrsig.getAlgorithm();
        summary.mLabels      = rrsig.getLabelCount();
        summary.mOriginalTTL = rrsig.getOriginalTTL();
        summary.mExpiration  = rrsig.getExpiration();
        summary.mInception   = rrsig.getInception();
        summary.mKeyTag      = rrsig.getKeyTag();
        summary.mSigner      = rrsig.getSigner().toString();
        return summary;
    }
}
