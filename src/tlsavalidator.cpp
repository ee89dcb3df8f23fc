#include "tlsavalidator.hpp"
#include "utils.hpp"
#include <arpa/inet.h>
#include <boost/log/trivial.hpp>
#include <chrono>
#include <cstring>
#include <ctime>
#include <memory>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <openssl/x509v3.h>
#include <sstream>

namespace dnssec
{
    typedef std::unique_ptr<X509, decltype( &X509_free )> X509Ptr;

    Domainname getTLSAName( const Domainname &domain, uint16_t port, const std::string &protocol )
    {
        Domainname name = domain;
        name.addSubdomain( "_" + protocol );
        name.addSubdomain( "_" + std::to_string( port ) );
        return name;
    }

    PacketData selectCertificateData( const PacketData &certificate, TLSASelector selector )
    {
        if ( selector == TLSA_FULL_CERTIFICATE )
            return certificate;
        if ( selector != TLSA_SPKI ) {
            std::ostringstream os;
            os << "unknown TLSA selector " << (unsigned int)selector;
            throw CryptoError( os.str() );
        }

        const uint8_t *p = certificate.data();
        X509Ptr        cert( d2i_X509( nullptr, &p, certificate.size() ), X509_free );
        if ( !cert )
            throwCryptoError( "cannot parse certificate" );

        X509_PUBKEY *pubkey = X509_get_X509_PUBKEY( cert.get() );
        int          length = i2d_X509_PUBKEY( pubkey, nullptr );
        if ( length <= 0 )
            throwCryptoError( "cannot encode SubjectPublicKeyInfo" );

        PacketData spki( length );
        uint8_t *  out = spki.data();
        i2d_X509_PUBKEY( pubkey, &out );
        return spki;
    }

    PacketData computeAssociationData( const PacketData &selected, TLSAMatchingType matching_type )
    {
        const EVP_MD *md = nullptr;
        switch ( matching_type ) {
        case TLSA_EXACT:
            return selected;
        case TLSA_SHA256:
            md = EVP_sha256();
            break;
        case TLSA_SHA512:
            md = EVP_sha512();
            break;
        default:
            std::ostringstream os;
            os << "unknown TLSA matching type " << (unsigned int)matching_type;
            throw CryptoError( os.str() );
        }

        PacketData   digest( EVP_MAX_MD_SIZE );
        unsigned int digest_length = 0;
        if ( EVP_Digest( selected.data(), selected.size(), digest.data(), &digest_length, md, nullptr ) != 1 )
            throwCryptoError( "cannot calculate TLSA digest" );
        digest.resize( digest_length );
        return digest;
    }

    static X509Ptr parseCertificate( const PacketData &der )
    {
        const uint8_t *p = der.data();
        X509Ptr        cert( d2i_X509( nullptr, &p, der.size() ), X509_free );
        if ( !cert )
            throwCryptoError( "cannot parse certificate" );
        return cert;
    }

    struct X509StackFree {
        void operator()( STACK_OF( X509 ) * stack ) const
        {
            sk_X509_free( stack );
        }
    };
    typedef std::unique_ptr<STACK_OF( X509 ), X509StackFree>            X509StackPtr;
    typedef std::unique_ptr<X509_STORE, decltype( &X509_STORE_free )>   X509StorePtr;
    typedef std::unique_ptr<X509_STORE_CTX, decltype( &X509_STORE_CTX_free )> X509StoreCTXPtr;

    /*!
     * verify the end entity up to chain[anchor] as the only trusted certificate,
     * the other presented certificates are untrusted intermediates.
     */
    static bool chainsTo( const PeerCertificates &certificates, size_t anchor, std::string &error )
    {
        X509Ptr              leaf    = parseCertificate( certificates.mChain[ 0 ] );
        X509Ptr              trusted = parseCertificate( certificates.mChain[ anchor ] );
        std::vector<X509Ptr> intermediates;
        X509StackPtr         untrusted( sk_X509_new_null() );
        if ( !untrusted )
            throwCryptoError( "cannot create certificate stack" );
        for ( size_t i = 1; i < certificates.mChain.size(); i++ ) {
            if ( i == anchor )
                continue;
            intermediates.push_back( parseCertificate( certificates.mChain[ i ] ) );
            sk_X509_push( untrusted.get(), intermediates.back().get() );
        }

        X509StorePtr store( X509_STORE_new(), X509_STORE_free );
        if ( !store || X509_STORE_add_cert( store.get(), trusted.get() ) != 1 )
            throwCryptoError( "cannot create certificate store" );
        X509_STORE_set_flags( store.get(), X509_V_FLAG_PARTIAL_CHAIN );

        X509StoreCTXPtr ctx( X509_STORE_CTX_new(), X509_STORE_CTX_free );
        if ( !ctx || X509_STORE_CTX_init( ctx.get(), store.get(), leaf.get(), untrusted.get() ) != 1 )
            throwCryptoError( "cannot initialize certificate verification" );

        if ( X509_verify_cert( ctx.get() ) == 1 )
            return true;
        error = X509_verify_cert_error_string( X509_STORE_CTX_get_error( ctx.get() ) );
        return false;
    }

    TLSAAssociation checkAssociation( const RecordTLSA &tlsa, const PeerCertificates &certificates )
    {
        TLSAAssociation association;
        association.mUsage        = tlsa.getUsage();
        association.mSelector     = tlsa.getSelector();
        association.mMatchingType = tlsa.getMatchingType();
        encodeToHex( tlsa.getAssociationData(), association.mExpectedHash );

        std::ostringstream os;
        if ( tlsa.getUsage() > TLSA_DANE_EE )
            os << "unknown certificate usage " << (unsigned int)tlsa.getUsage();
        else if ( tlsa.getSelector() > TLSA_SPKI )
            os << "unsupported selector " << (unsigned int)tlsa.getSelector();
        else if ( tlsa.getMatchingType() > TLSA_SHA512 )
            os << "unsupported matching type " << (unsigned int)tlsa.getMatchingType();
        else if ( certificates.mChain.empty() )
            os << "no certificate presented";
        if ( !os.str().empty() ) {
            association.mReason = os.str();
            return association;
        }

        bool   trust_anchor = tlsa.getUsage() == TLSA_PKIX_TA || tlsa.getUsage() == TLSA_DANE_TA;
        bool   pkix         = tlsa.getUsage() == TLSA_PKIX_TA || tlsa.getUsage() == TLSA_PKIX_EE;
        size_t begin        = trust_anchor ? 1 : 0;
        size_t end          = trust_anchor ? certificates.mChain.size() : 1;
        if ( begin >= end ) {
            association.mReason = "no issuer certificate presented";
            return association;
        }

        try {
            for ( size_t i = begin; i < end; i++ ) {
                PacketData computed = computeAssociationData( selectCertificateData( certificates.mChain[ i ], tlsa.getSelector() ),
                                                              tlsa.getMatchingType() );
                if ( i == begin || computed == tlsa.getAssociationData() )
                    encodeToHex( computed, association.mComputedHash );
                if ( computed != tlsa.getAssociationData() )
                    continue;

                std::string error;
                if ( trust_anchor && !chainsTo( certificates, i, error ) ) {
                    association.mReason = "server certificate does not chain to the matching certificate: " + error;
                    continue;
                }
                if ( pkix && !certificates.mPKIXValid ) {
                    association.mReason = "certificate association matches but PKIX validation failed: " +
                                          certificates.mPKIXError;
                    return association;
                }
                association.mValid  = true;
                association.mReason = "certificate association matches TLSA record";
                return association;
            }
        } catch ( const CryptoError &e ) {
            association.mReason = std::string( "validation error: " ) + e.what();
            return association;
        }

        if ( association.mReason.empty() )
            association.mReason = "certificate association does not match TLSA record";
        return association;
    }

    bool matchTLSA( const RecordTLSA &tlsa, const PeerCertificates &certificates )
    {
        return checkAssociation( tlsa, certificates ).mValid;
    }

    typedef std::unique_ptr<BIO, decltype( &BIO_free )>                     BIOPtr;
    typedef std::unique_ptr<BIGNUM, decltype( &BN_free )>                   BIGNUMPtr;
    typedef std::unique_ptr<GENERAL_NAMES, decltype( &GENERAL_NAMES_free )> GeneralNamesPtr;

    static std::string nameToString( const X509_NAME *name )
    {
        BIOPtr bio( BIO_new( BIO_s_mem() ), BIO_free );
        if ( !bio || X509_NAME_print_ex( bio.get(), name, 0, XN_FLAG_RFC2253 ) < 0 )
            throwCryptoError( "cannot print certificate name" );
        char *data   = nullptr;
        long  length = BIO_get_mem_data( bio.get(), &data );
        return std::string( data, length );
    }

    static std::string serialToString( const ASN1_INTEGER *serial )
    {
        BIGNUMPtr bn( ASN1_INTEGER_to_BN( serial, nullptr ), BN_free );
        if ( !bn )
            throwCryptoError( "cannot decode serial number" );
        char *decimal = BN_bn2dec( bn.get() );
        if ( decimal == nullptr )
            throwCryptoError( "cannot print serial number" );
        std::string str( decimal );
        OPENSSL_free( decimal );
        return str;
    }

    static std::string timeToString( const ASN1_TIME *time )
    {
        struct tm tm;
        std::memset( &tm, 0, sizeof( tm ) );
        if ( ASN1_TIME_to_tm( time, &tm ) != 1 )
            throwCryptoError( "cannot decode certificate validity" );
        char buf[ 32 ];
        strftime( buf, sizeof( buf ), "%Y-%m-%dT%H:%M:%SZ", &tm );
        return buf;
    }

    static std::vector<std::string> getSubjectAltNames( X509 *cert )
    {
        std::vector<std::string> sans;
        GeneralNamesPtr          names(
            static_cast<GENERAL_NAMES *>( X509_get_ext_d2i( cert, NID_subject_alt_name, nullptr, nullptr ) ),
            GENERAL_NAMES_free );
        if ( !names )
            return sans;

        for ( int i = 0; i < sk_GENERAL_NAME_num( names.get() ); i++ ) {
            const GENERAL_NAME *name = sk_GENERAL_NAME_value( names.get(), i );
            if ( name->type == GEN_DNS ) {
                const unsigned char *data = ASN1_STRING_get0_data( name->d.dNSName );
                sans.push_back( std::string( reinterpret_cast<const char *>( data ), ASN1_STRING_length( name->d.dNSName ) ) );
            } else if ( name->type == GEN_IPADD ) {
                const unsigned char *data   = ASN1_STRING_get0_data( name->d.iPAddress );
                int                  length = ASN1_STRING_length( name->d.iPAddress );
                char                 buf[ INET6_ADDRSTRLEN ];
                if ( length == 4 && inet_ntop( AF_INET, data, buf, sizeof( buf ) ) )
                    sans.push_back( buf );
                else if ( length == 16 && inet_ntop( AF_INET6, data, buf, sizeof( buf ) ) )
                    sans.push_back( buf );
            }
        }
        return sans;
    }

    CertificateInfo describeCertificate( const PeerCertificates &certificates )
    {
        if ( certificates.mChain.empty() )
            throw CryptoError( "no certificate presented" );

        const PacketData &der  = certificates.mChain[ 0 ];
        X509Ptr           cert = parseCertificate( der );

        CertificateInfo info;
        info.mSubject         = nameToString( X509_get_subject_name( cert.get() ) );
        info.mIssuer          = nameToString( X509_get_issuer_name( cert.get() ) );
        info.mSerialNumber    = serialToString( X509_get0_serialNumber( cert.get() ) );
        info.mNotBefore       = timeToString( X509_get0_notBefore( cert.get() ) );
        info.mNotAfter        = timeToString( X509_get0_notAfter( cert.get() ) );
        info.mSubjectAltNames = getSubjectAltNames( cert.get() );
        info.mChainLength     = certificates.mChain.size();

        PacketData spki = selectCertificateData( der, TLSA_SPKI );
        encodeToHex( computeAssociationData( der, TLSA_SHA256 ), info.mSHA256 );
        encodeToHex( computeAssociationData( der, TLSA_SHA512 ), info.mSHA512 );
        encodeToHex( computeAssociationData( spki, TLSA_SHA256 ), info.mSPKISHA256 );
        encodeToHex( computeAssociationData( spki, TLSA_SHA512 ), info.mSPKISHA512 );
        return info;
    }

    Status TLSAValidator::validateTLSARRSet( const FetchResult &tlsa, const WalkResult &walk, std::string &message ) const
    {
        const Domainname &owner        = tlsa.mRRSet.getOwner();
        Status            chain_status = walk.getStatus();
        if ( chain_status == STATUS_ERROR )
            chain_status = STATUS_INDETERMINATE;

        if ( tlsa.mRRSIGs.empty() ) {
            if ( chain_status == STATUS_VALID ) {
                message = "TLSA RRset of " + owner.toString() + " is not signed in a signed zone";
                return STATUS_BOGUS;
            }
            message = "TLSA RRset of " + owner.toString() + " is not signed, chain of trust is " +
                      statusToString( chain_status );
            return worseStatus( STATUS_INSECURE, chain_status );
        }

        Domainname       signer = tlsa.mRRSIGs.front()->getSigner();
        const DNSKEYSet *keys   = walk.findValidatedKeys( signer );
        if ( keys == nullptr || !signer.isSubDomain( owner ) ) {
            message = "signer " + signer.toString() + " of TLSA RRset is not in the validated chain of trust";
            if ( chain_status == STATUS_VALID )
                return STATUS_INDETERMINATE;
            return worseStatus( STATUS_INSECURE, chain_status );
        }

        VerifyResult verified = mVerifier.verify( tlsa.mRRSet, tlsa.mRRSIGs, *keys, signer, mNow );
        if ( verified.isValid() )
            return STATUS_VALID;

        message = "TLSA RRset of " + owner.toString() + " is not validated: " + verified.mMessage;
        return verified.isIndeterminate() ? STATUS_INDETERMINATE : STATUS_BOGUS;
    }

    typedef std::chrono::steady_clock Clock;

    static double elapsedMSec( Clock::time_point start )
    {
        return std::chrono::duration<double, std::milli>( Clock::now() - start ).count();
    }

    TLSASummary TLSAValidator::validate( const Domainname & domain,
                                         const WalkResult & walk,
                                         uint16_t           port,
                                         const std::string &protocol,
                                         bool               with_details )
    {
        TLSASummary summary;
        TLSADetails details;
        runValidation( domain, walk, port, protocol, with_details, summary, details );
        if ( with_details )
            summary.mDetails = details;
        return summary;
    }

    void TLSAValidator::runValidation( const Domainname & domain,
                                       const WalkResult & walk,
                                       uint16_t           port,
                                       const std::string &protocol,
                                       bool               with_details,
                                       TLSASummary &      summary,
                                       TLSADetails &      details )
    {
        Clock::time_point start   = Clock::now();
        Domainname        name    = getTLSAName( domain, port, protocol );
        FetchResult       fetched = mFetcher.fetch( name, TYPE_TLSA );

        if ( fetched.isFailure() ) {
            details.mQueryTimeMSec = elapsedMSec( start );
            summary.mStatus        = STATUS_INDETERMINATE;
            summary.mDANEStatus    = DANE_DNSSEC_REQUIRED;
            summary.mMessage       = "cannot fetch TLSA records of " + name.toString() + " (" +
                               fetchStatusToString( fetched.mStatus ) + "): " + fetched.mError;
            BOOST_LOG_TRIVIAL( info ) << "dnssec.tlsa: " << summary.mMessage;
            return;
        }
        if ( fetched.isNotFound() ) {
            details.mQueryTimeMSec = elapsedMSec( start );
            summary.mStatus        = STATUS_INSECURE;
            summary.mDANEStatus    = DANE_NO_TLSA;
            summary.mMessage       = "no TLSA records at " + name.toString();
            BOOST_LOG_TRIVIAL( info ) << "dnssec.tlsa: " << summary.mMessage;
            return;
        }

        std::vector<std::shared_ptr<RecordTLSA>> records = castRRSet<RecordTLSA>( fetched.mRRSet );
        summary.mRecordsFound                             = records.size();

        std::string message;
        summary.mStatus        = validateTLSARRSet( fetched, walk, message );
        details.mQueryTimeMSec = elapsedMSec( start );
        if ( summary.mStatus != STATUS_VALID ) {
            summary.mDANEStatus = DANE_DNSSEC_REQUIRED;
            summary.mMessage    = message;
            BOOST_LOG_TRIVIAL( info ) << "dnssec.tlsa: " << summary.mMessage;
            return;
        }

        Clock::time_point connect = Clock::now();
        PeerCertificates  certificates;
        try {
            certificates = mCertificateSource.fetchCertificate( domain, port );
        } catch ( const TLSError &e ) {
            summary.mDANEStatus = DANE_CERT_UNAVAILABLE;
            summary.mMessage    = std::string( "cannot retrieve certificate: " ) + e.what();
        } catch ( const SocketError &e ) {
            summary.mDANEStatus = DANE_CERT_UNAVAILABLE;
            summary.mMessage    = std::string( "cannot retrieve certificate: " ) + e.what();
        } catch ( const TimeoutError &e ) {
            summary.mDANEStatus = DANE_CERT_UNAVAILABLE;
            summary.mMessage    = std::string( "cannot retrieve certificate: " ) + e.what();
        } catch ( const InvalidAddressFormatError &e ) {
            summary.mDANEStatus = DANE_CERT_UNAVAILABLE;
            summary.mMessage    = std::string( "cannot retrieve certificate: " ) + e.what();
        }
        details.mConnectTimeMSec = elapsedMSec( connect );
        if ( summary.mDANEStatus == DANE_CERT_UNAVAILABLE ) {
            BOOST_LOG_TRIVIAL( info ) << "dnssec.tlsa: " << domain << ":" << port << " " << summary.mMessage;
            return;
        }

        if ( with_details ) {
            try {
                details.mCertificate = describeCertificate( certificates );
            } catch ( const CryptoError &e ) {
                BOOST_LOG_TRIVIAL( warning ) << "dnssec.tlsa: cannot describe certificate of " << domain << ": " << e.what();
            }
        }

        for ( auto tlsa : records ) {
            TLSAAssociation association = checkAssociation( *tlsa, certificates );
            BOOST_LOG_TRIVIAL( debug ) << "dnssec.tlsa: " << tlsa->toString() << ": " << association.mReason;
            if ( association.mValid )
                details.mValidAssociations.push_back( association );
            else
                details.mInvalidAssociations.push_back( association );
        }

        std::ostringstream os;
        if ( !details.mValidAssociations.empty() ) {
            summary.mDANEStatus = DANE_VALID;
            os << details.mValidAssociations.size() << " of " << records.size()
               << " TLSA records match the certificate of " << domain;
        } else {
            summary.mDANEStatus = DANE_INVALID;
            os << "none of " << records.size() << " TLSA records match the certificate of " << domain;
            if ( !certificates.mPKIXValid )
                os << " (PKIX: " << certificates.mPKIXError << ")";
        }
        summary.mMessage = os.str();
        BOOST_LOG_TRIVIAL( info ) << "dnssec.tlsa: " << summary.mMessage;
    }
}
