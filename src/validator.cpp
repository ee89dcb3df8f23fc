#include "validator.hpp"
#include "deadline.hpp"
#include "recordfetcher.hpp"
#include "tlsavalidator.hpp"
#include "zonewalker.hpp"
#include <boost/log/trivial.hpp>

namespace dnssec
{
    ValidationResult Validator::validate( const std::string &domain, const ValidateOptions &options ) const
    {
        ValidationResult result;
        try {
            result = runValidation( domain, options );
        } catch ( const std::exception &e ) {
            BOOST_LOG_TRIVIAL( error ) << "dnssec.validator: validation of " << domain << " failed: " << e.what();
            result                 = ValidationResult();
            result.mDomain         = domain;
            result.mStatus         = STATUS_ERROR;
            result.mValidationTime = formatValidationTime( mClock.now() );
            result.mErrors.push_back( e.what() );
        }

        notifySink( result, options.mSource );
        return result;
    }

    ValidationResult Validator::runValidation( const std::string &domain, const ValidateOptions &options ) const
    {
        Domainname name( domain );
        uint32_t   now = static_cast<uint32_t>( mClock.now() );

        BOOST_LOG_TRIVIAL( info ) << "dnssec.validator: validating " << name;

        Deadline      deadline( mConfig.mDeadlineMSec );
        RecordFetcher fetcher( mTransport, mConfig.mResolver.mRetries, deadline );
        ZoneWalker    walker( fetcher, mConfig.mTrustAnchors, now );
        WalkResult    walk = walker.walk( name );

        boost::optional<TLSASummary> tlsa;
        std::vector<std::string>     errors;
        if ( options.mCheckTLSA && !walk.mChain.empty() && walk.mDomainExists ) {
            TLSAValidator tlsa_validator( fetcher, mCertificateSource, now );
            tlsa = tlsa_validator.validate( name, walk, options.mPort, options.mProtocol, options.mTLSADetails );

            Status tlsa_status = daneStatusToStatus( *tlsa );
            if ( tlsa_status == STATUS_BOGUS || tlsa_status == STATUS_INDETERMINATE )
                errors.push_back( "TLSA: " + tlsa->mMessage );
        }

        ValidationResult result = aggregate( domain, walk, tlsa, errors, mClock.now() );
        BOOST_LOG_TRIVIAL( info ) << "dnssec.validator: " << name << " is " << statusToString( result.mStatus );
        return result;
    }

    void Validator::notifySink( const ValidationResult &result, const std::string &source ) const
    {
        if ( mSink == nullptr )
            return;
        try {
            mSink->record( result.mDomain, result.mStatus, source );
        } catch ( const std::exception &e ) {
            BOOST_LOG_TRIVIAL( warning ) << "dnssec.validator: analytics sink failed: " << e.what();
        }
    }
}
