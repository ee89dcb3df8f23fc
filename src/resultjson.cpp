#include "resultjson.hpp"
#include <memory>
#include <sstream>

namespace dnssec
{
    Json::Value toJson( const ChainLink &link )
    {
        Json::Value value( Json::objectValue );
        value[ "zone" ]   = link.mZone.toString();
        value[ "status" ] = statusToString( link.mStatus );
        if ( link.mAlgorithm )
            value[ "algorithm" ] = Json::UInt( *link.mAlgorithm );
        if ( link.mKeyTag )
            value[ "key_tag" ] = Json::UInt( *link.mKeyTag );
        if ( link.mError )
            value[ "error" ] = *link.mError;
        return value;
    }

    Json::Value toJson( const RecordSummaries &records )
    {
        Json::Value dnskeys( Json::arrayValue );
        for ( auto &dnskey : records.mDNSKEY ) {
            Json::Value v( Json::objectValue );
            v[ "zone" ]       = dnskey.mZone;
            v[ "flags" ]      = Json::UInt( dnskey.mFlags );
            v[ "protocol" ]   = Json::UInt( dnskey.mProtocol );
            v[ "algorithm" ]  = Json::UInt( dnskey.mAlgorithm );
            v[ "key_tag" ]    = Json::UInt( dnskey.mKeyTag );
            v[ "public_key" ] = dnskey.mPublicKey;
            dnskeys.append( v );
        }

        Json::Value dss( Json::arrayValue );
        for ( auto &ds : records.mDS ) {
            Json::Value v( Json::objectValue );
            v[ "zone" ]        = ds.mZone;
            v[ "key_tag" ]     = Json::UInt( ds.mKeyTag );
            v[ "algorithm" ]   = Json::UInt( ds.mAlgorithm );
            v[ "digest_type" ] = Json::UInt( ds.mDigestType );
            v[ "digest" ]      = ds.mDigest;
            dss.append( v );
        }

        Json::Value rrsigs( Json::arrayValue );
        for ( auto &rrsig : records.mRRSIG ) {
            Json::Value v( Json::objectValue );
            v[ "zone" ]         = rrsig.mZone;
            v[ "type_covered" ] = rrsig.mTypeCovered;
            v[ "algorithm" ]    = Json::UInt( rrsig.mAlgorithm );
            v[ "labels" ]       = Json::UInt( rrsig.mLabels );
            v[ "original_ttl" ] = Json::UInt( rrsig.mOriginalTTL );
            v[ "expiration" ]   = Json::UInt( rrsig.mExpiration );
            v[ "inception" ]    = Json::UInt( rrsig.mInception );
            v[ "key_tag" ]      = Json::UInt( rrsig.mKeyTag );
            v[ "signer" ]       = rrsig.mSigner;
            rrsigs.append( v );
        }

        Json::Value value( Json::objectValue );
        value[ "dnskey" ] = dnskeys;
        value[ "ds" ]     = dss;
        value[ "rrsig" ]  = rrsigs;
        return value;
    }

    static Json::Value toJson( const TLSAAssociation &association )
    {
        Json::Value value( Json::objectValue );
        value[ "usage" ]         = Json::UInt( association.mUsage );
        value[ "selector" ]      = Json::UInt( association.mSelector );
        value[ "matching_type" ] = Json::UInt( association.mMatchingType );
        value[ "expected_hash" ] = association.mExpectedHash;
        value[ "computed_hash" ] = association.mComputedHash;
        value[ "valid" ]         = association.mValid;
        value[ "reason" ]        = association.mReason;
        return value;
    }

    Json::Value toJson( const CertificateInfo &certificate )
    {
        Json::Value sans( Json::arrayValue );
        for ( auto &san : certificate.mSubjectAltNames )
            sans.append( san );

        Json::Value fingerprints( Json::objectValue );
        fingerprints[ "sha256" ]      = certificate.mSHA256;
        fingerprints[ "sha512" ]      = certificate.mSHA512;
        fingerprints[ "spki_sha256" ] = certificate.mSPKISHA256;
        fingerprints[ "spki_sha512" ] = certificate.mSPKISHA512;

        Json::Value value( Json::objectValue );
        value[ "subject" ]          = certificate.mSubject;
        value[ "issuer" ]           = certificate.mIssuer;
        value[ "serial_number" ]    = certificate.mSerialNumber;
        value[ "not_valid_before" ] = certificate.mNotBefore;
        value[ "not_valid_after" ]  = certificate.mNotAfter;
        value[ "san" ]              = sans;
        value[ "fingerprints" ]     = fingerprints;
        value[ "chain_length" ]     = Json::UInt( certificate.mChainLength );
        return value;
    }

    Json::Value toJson( const TLSADetails &details )
    {
        Json::Value valid( Json::arrayValue );
        for ( auto &association : details.mValidAssociations )
            valid.append( toJson( association ) );
        Json::Value invalid( Json::arrayValue );
        for ( auto &association : details.mInvalidAssociations )
            invalid.append( toJson( association ) );

        Json::Value dane( Json::objectValue );
        dane[ "valid_associations" ]   = valid;
        dane[ "invalid_associations" ] = invalid;

        Json::Value value( Json::objectValue );
        value[ "dane_validation" ] = dane;
        if ( details.mCertificate )
            value[ "certificate_info" ] = toJson( *details.mCertificate );
        value[ "query_time_ms" ]   = details.mQueryTimeMSec;
        value[ "connect_time_ms" ] = details.mConnectTimeMSec;
        return value;
    }

    Json::Value toJson( const TLSASummary &tlsa )
    {
        Json::Value value( Json::objectValue );
        value[ "status" ]        = statusToString( tlsa.mStatus );
        value[ "records_found" ] = Json::UInt( tlsa.mRecordsFound );
        value[ "dane_status" ]   = daneStatusToString( tlsa.mDANEStatus );
        value[ "message" ]       = tlsa.mMessage;
        if ( tlsa.mDetails )
            value[ "details" ] = toJson( *tlsa.mDetails );
        return value;
    }

    Json::Value toJson( const ValidationResult &result )
    {
        Json::Value value( Json::objectValue );
        value[ "domain" ]          = result.mDomain;
        value[ "status" ]          = statusToString( result.mStatus );
        value[ "validation_time" ] = result.mValidationTime;

        Json::Value chain( Json::arrayValue );
        for ( auto &link : result.mChainOfTrust )
            chain.append( toJson( link ) );
        value[ "chain_of_trust" ] = chain;
        value[ "records" ]        = toJson( result.mRecords );
        if ( result.mTLSASummary )
            value[ "tlsa_summary" ] = toJson( *result.mTLSASummary );

        Json::Value errors( Json::arrayValue );
        for ( auto &error : result.mErrors )
            errors.append( error );
        value[ "errors" ] = errors;
        return value;
    }

    Json::Value toJson( const BulkResult &bulk )
    {
        Json::Value results( Json::arrayValue );
        for ( auto &result : bulk.mResults )
            results.append( toJson( result ) );

        Json::Value summary( Json::objectValue );
        summary[ "total" ]           = bulk.mSummary.mTotal;
        summary[ "valid" ]           = bulk.mSummary.mValid;
        summary[ "insecure" ]        = bulk.mSummary.mInsecure;
        summary[ "bogus" ]           = bulk.mSummary.mBogus;
        summary[ "indeterminate" ]   = bulk.mSummary.mIndeterminate;
        summary[ "error" ]           = bulk.mSummary.mError;
        summary[ "processing_time" ] = bulk.mSummary.mProcessingTime;

        Json::Value value( Json::objectValue );
        value[ "results" ] = results;
        value[ "summary" ] = summary;
        return value;
    }

    static const Json::Value &getMember( const Json::Value &value, const std::string &name )
    {
        if ( !value.isObject() || !value.isMember( name ) )
            throw JSONError( "\"" + name + "\" must be specified" );
        return value[ name ];
    }

    static std::string getString( const Json::Value &value, const std::string &name )
    {
        const Json::Value &member = getMember( value, name );
        if ( !member.isString() )
            throw JSONError( "\"" + name + "\" must be a string" );
        return member.asString();
    }

    static unsigned int getUInt( const Json::Value &value, const std::string &name, unsigned int max )
    {
        const Json::Value &member = getMember( value, name );
        if ( !member.isUInt() || member.asUInt() > max )
            throw JSONError( "\"" + name + "\" must be an unsigned integer" );
        return member.asUInt();
    }

    static const Json::Value &getArray( const Json::Value &value, const std::string &name )
    {
        const Json::Value &member = getMember( value, name );
        if ( !member.isArray() )
            throw JSONError( "\"" + name + "\" must be an array" );
        return member;
    }

    static bool getBool( const Json::Value &value, const std::string &name )
    {
        const Json::Value &member = getMember( value, name );
        if ( !member.isBool() )
            throw JSONError( "\"" + name + "\" must be a boolean" );
        return member.asBool();
    }

    static double getDouble( const Json::Value &value, const std::string &name )
    {
        const Json::Value &member = getMember( value, name );
        if ( !member.isNumeric() )
            throw JSONError( "\"" + name + "\" must be a number" );
        return member.asDouble();
    }

    static Status getStatus( const Json::Value &value, const std::string &name )
    {
        std::string status = getString( value, name );
        try {
            return stringToStatus( status );
        } catch ( const std::runtime_error &e ) {
            throw JSONError( e.what() );
        }
    }

    static ChainLink chainLinkFromJson( const Json::Value &value )
    {
        ChainLink link;
        try {
            link.mZone = Domainname( getString( value, "zone" ) );
        } catch ( const DomainnameError &e ) {
            throw JSONError( std::string( "bad zone: " ) + e.what() );
        }
        link.mStatus = getStatus( value, "status" );
        if ( value.isMember( "algorithm" ) )
            link.mAlgorithm = getUInt( value, "algorithm", 0xff );
        if ( value.isMember( "key_tag" ) )
            link.mKeyTag = getUInt( value, "key_tag", 0xffff );
        if ( value.isMember( "error" ) )
            link.mError = getString( value, "error" );
        return link;
    }

    static RecordSummaries recordsFromJson( const Json::Value &value )
    {
        RecordSummaries records;
        for ( auto &v : getArray( value, "dnskey" ) ) {
            DNSKEYSummary dnskey;
            dnskey.mZone      = getString( v, "zone" );
            dnskey.mFlags     = getUInt( v, "flags", 0xffff );
            dnskey.mProtocol  = getUInt( v, "protocol", 0xff );
            dnskey.mAlgorithm = getUInt( v, "algorithm", 0xff );
            dnskey.mKeyTag    = getUInt( v, "key_tag", 0xffff );
            dnskey.mPublicKey = getString( v, "public_key" );
            records.mDNSKEY.push_back( dnskey );
        }
        for ( auto &v : getArray( value, "ds" ) ) {
            DSSummary ds;
            ds.mZone       = getString( v, "zone" );
            ds.mKeyTag     = getUInt( v, "key_tag", 0xffff );
            ds.mAlgorithm  = getUInt( v, "algorithm", 0xff );
            ds.mDigestType = getUInt( v, "digest_type", 0xff );
            ds.mDigest     = getString( v, "digest" );
            records.mDS.push_back( ds );
        }
        for ( auto &v : getArray( value, "rrsig" ) ) {
            RRSIGSummary rrsig;
            rrsig.mZone        = getString( v, "zone" );
            rrsig.mTypeCovered = getString( v, "type_covered" );
            rrsig.mAlgorithm   = getUInt( v, "algorithm", 0xff );
            rrsig.mLabels      = getUInt( v, "labels", 0xff );
            rrsig.mOriginalTTL = getUInt( v, "original_ttl", 0xffffffff );
            rrsig.mExpiration  = getUInt( v, "expiration", 0xffffffff );
            rrsig.mInception   = getUInt( v, "inception", 0xffffffff );
            rrsig.mKeyTag      = getUInt( v, "key_tag", 0xffff );
            rrsig.mSigner      = getString( v, "signer" );
            records.mRRSIG.push_back( rrsig );
        }
        return records;
    }

    static TLSAAssociation associationFromJson( const Json::Value &value )
    {
        TLSAAssociation association;
        association.mUsage        = getUInt( value, "usage", 0xff );
        association.mSelector     = getUInt( value, "selector", 0xff );
        association.mMatchingType = getUInt( value, "matching_type", 0xff );
        association.mExpectedHash = getString( value, "expected_hash" );
        association.mComputedHash = getString( value, "computed_hash" );
        association.mValid        = getBool( value, "valid" );
        association.mReason       = getString( value, "reason" );
        return association;
    }

    static CertificateInfo certificateInfoFromJson( const Json::Value &value )
    {
        CertificateInfo certificate;
        certificate.mSubject      = getString( value, "subject" );
        certificate.mIssuer       = getString( value, "issuer" );
        certificate.mSerialNumber = getString( value, "serial_number" );
        certificate.mNotBefore    = getString( value, "not_valid_before" );
        certificate.mNotAfter     = getString( value, "not_valid_after" );
        for ( auto &san : getArray( value, "san" ) ) {
            if ( !san.isString() )
                throw JSONError( "\"san\" must be an array of strings" );
            certificate.mSubjectAltNames.push_back( san.asString() );
        }
        const Json::Value &fingerprints = getMember( value, "fingerprints" );
        certificate.mSHA256             = getString( fingerprints, "sha256" );
        certificate.mSHA512             = getString( fingerprints, "sha512" );
        certificate.mSPKISHA256         = getString( fingerprints, "spki_sha256" );
        certificate.mSPKISHA512         = getString( fingerprints, "spki_sha512" );
        certificate.mChainLength        = getUInt( value, "chain_length", 0xffffffff );
        return certificate;
    }

    static TLSADetails tlsaDetailsFromJson( const Json::Value &value )
    {
        TLSADetails        details;
        const Json::Value &dane = getMember( value, "dane_validation" );
        for ( auto &association : getArray( dane, "valid_associations" ) )
            details.mValidAssociations.push_back( associationFromJson( association ) );
        for ( auto &association : getArray( dane, "invalid_associations" ) )
            details.mInvalidAssociations.push_back( associationFromJson( association ) );
        if ( value.isMember( "certificate_info" ) )
            details.mCertificate = certificateInfoFromJson( value[ "certificate_info" ] );
        details.mQueryTimeMSec   = getDouble( value, "query_time_ms" );
        details.mConnectTimeMSec = getDouble( value, "connect_time_ms" );
        return details;
    }

    static TLSASummary tlsaSummaryFromJson( const Json::Value &value )
    {
        TLSASummary tlsa;
        tlsa.mStatus       = getStatus( value, "status" );
        tlsa.mRecordsFound = getUInt( value, "records_found", 0xffffffff );
        std::string dane_status = getString( value, "dane_status" );
        try {
            tlsa.mDANEStatus = stringToDANEStatus( dane_status );
        } catch ( const std::runtime_error &e ) {
            throw JSONError( e.what() );
        }
        tlsa.mMessage = getString( value, "message" );
        if ( value.isMember( "details" ) )
            tlsa.mDetails = tlsaDetailsFromJson( value[ "details" ] );
        return tlsa;
    }

    ValidationResult validationResultFromJson( const Json::Value &value )
    {
        ValidationResult result;
        result.mDomain         = getString( value, "domain" );
        result.mStatus         = getStatus( value, "status" );
        result.mValidationTime = getString( value, "validation_time" );
        for ( auto &link : getArray( value, "chain_of_trust" ) )
            result.mChainOfTrust.push_back( chainLinkFromJson( link ) );
        result.mRecords = recordsFromJson( getMember( value, "records" ) );
        if ( value.isMember( "tlsa_summary" ) )
            result.mTLSASummary = tlsaSummaryFromJson( value[ "tlsa_summary" ] );
        for ( auto &error : getArray( value, "errors" ) ) {
            if ( !error.isString() )
                throw JSONError( "\"errors\" must be an array of strings" );
            result.mErrors.push_back( error.asString() );
        }
        return result;
    }

    std::string writeJson( const Json::Value &value, bool pretty )
    {
        Json::StreamWriterBuilder builder;
        builder[ "indentation" ] = pretty ? "  " : "";
        return Json::writeString( builder, value );
    }

    Json::Value parseJson( const std::string &text )
    {
        Json::CharReaderBuilder           builder;
        std::unique_ptr<Json::CharReader> reader( builder.newCharReader() );
        Json::Value                       value;
        std::string                       errors;
        if ( !reader->parse( text.data(), text.data() + text.size(), &value, &errors ) )
            throw JSONError( "cannot parse JSON: " + errors );
        return value;
    }
}
