#ifndef DNSSEC_BULKVALIDATOR_HPP
#define DNSSEC_BULKVALIDATOR_HPP

#include "validator.hpp"
#include <stdexcept>

namespace dnssec
{
    /*!
     * bulk request is empty or has too many domains
     */
    class BulkRequestError : public std::runtime_error
    {
    public:
        BulkRequestError( const std::string &msg ) : std::runtime_error( msg )
        {
        }
    };

    /*!
     * validate independent domains concurrently on a ThreadPool.
     * results are in the order of the requested domains.
     */
    class BulkValidator
    {
    public:
        BulkValidator( const Validator &validator, const BulkParameters &param )
            : mValidator( validator ), mParameters( param )
        {
        }

        /*!
         * @throw BulkRequestError domains is empty or exceeds max_domains
         */
        BulkResult validate( const std::vector<std::string> &domains, const ValidateOptions &options ) const;

    private:
        const Validator &mValidator;
        BulkParameters   mParameters;
    };
}

#endif
