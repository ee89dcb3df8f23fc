#ifndef DNSSEC_VALIDATOR_HPP
#define DNSSEC_VALIDATOR_HPP

#include "analyticssink.hpp"
#include "certificatesource.hpp"
#include "config.hpp"
#include "resultaggregator.hpp"
#include "transport.hpp"

namespace dnssec
{
    struct ValidateOptions {
        bool        mCheckTLSA;
        bool        mTLSADetails; // per-record results, certificate info and timings
        uint16_t    mPort;
        std::string mProtocol;
        std::string mSource;

        ValidateOptions() : mCheckTLSA( false ), mTLSADetails( false ), mPort( 443 ), mProtocol( "tcp" ), mSource( "cli" )
        {
        }
    };

    /*!
     * validation engine over injected DNS and TLS clients.
     * validate() keeps all state on its own stack, so one Validator can be used by many threads
     * when the injected clients allow concurrent calls.
     */
    class Validator
    {
    public:
        Validator( DNSTransport &      transport,
                   CertificateSource &source,
                   const Config &     config,
                   const Clock &      clock,
                   AnalyticsSink *    sink = nullptr )
            : mTransport( transport ), mCertificateSource( source ), mConfig( config ), mClock( clock ), mSink( sink )
        {
        }

        /*!
         * @param domain fully qualified domain name
         * @return result of the validation. this method never throws.
         */
        ValidationResult validate( const std::string &domain, const ValidateOptions &options = ValidateOptions() ) const;

        const Config &getConfig() const
        {
            return mConfig;
        }

    private:
        DNSTransport &     mTransport;
        CertificateSource &mCertificateSource;
        const Config &     mConfig;
        const Clock &      mClock;
        AnalyticsSink *    mSink;

        ValidationResult runValidation( const std::string &domain, const ValidateOptions &options ) const;
        void             notifySink( const ValidationResult &result, const std::string &source ) const;
    };
}

#endif
