#include "bulkvalidator.hpp"
#include "threadpool.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include <chrono>
#include <sstream>

namespace dnssec
{
    BulkResult BulkValidator::validate( const std::vector<std::string> &domains, const ValidateOptions &options ) const
    {
        if ( domains.empty() )
            throw BulkRequestError( "no domains to validate" );
        if ( domains.size() > mParameters.mMaxDomains ) {
            std::ostringstream os;
            os << "too many domains: " << domains.size() << " (max " << mParameters.mMaxDomains << ")";
            throw BulkRequestError( os.str() );
        }

        auto start = std::chrono::steady_clock::now();

        BulkResult bulk;
        bulk.mResults.resize( domains.size() );

        unsigned int thread_count = std::min<unsigned int>( mParameters.mThreads, domains.size() );
        BOOST_LOG_TRIVIAL( info ) << "dnssec.bulk: validating " << domains.size() << " domains with " << thread_count
                                  << " threads";

        {
            ThreadPool pool( thread_count );
            for ( unsigned int i = 0; i < domains.size(); i++ ) {
                ValidationResult *slot      = &bulk.mResults[ i ];
                const Validator * validator = &mValidator;
                std::string       domain    = domains[ i ];
                pool.submit( [slot, validator, domain, options]() { *slot = validator->validate( domain, options ); } );
            }
            pool.start();
            pool.stop();
            pool.join();
        }

        for ( auto &result : bulk.mResults )
            bulk.mSummary.count( result.mStatus );
        bulk.mSummary.mProcessingTime =
            std::chrono::duration<double>( std::chrono::steady_clock::now() - start ).count();

        BOOST_LOG_TRIVIAL( info ) << "dnssec.bulk: " << bulk.mSummary.mValid << " valid, " << bulk.mSummary.mInsecure
                                  << " insecure, " << bulk.mSummary.mBogus << " bogus, "
                                  << bulk.mSummary.mIndeterminate << " indeterminate, " << bulk.mSummary.mError
                                  << " error in " << bulk.mSummary.mProcessingTime << "s";
        return bulk;
    }
}
