#ifndef DNSSEC_RESULTJSON_HPP
#define DNSSEC_RESULTJSON_HPP

#include "result.hpp"
#include <json/json.h>
#include <stdexcept>

namespace dnssec
{
    /*!
     * JSON document does not have the result shape
     */
    class JSONError : public std::runtime_error
    {
    public:
        JSONError( const std::string &msg ) : std::runtime_error( msg )
        {
        }
    };

    Json::Value toJson( const ChainLink &link );
    Json::Value toJson( const RecordSummaries &records );
    Json::Value toJson( const CertificateInfo &certificate );
    Json::Value toJson( const TLSADetails &details );
    Json::Value toJson( const TLSASummary &tlsa );
    Json::Value toJson( const ValidationResult &result );
    Json::Value toJson( const BulkResult &result );

    /*!
     * @throw JSONError missing or mistyped member
     */
    ValidationResult validationResultFromJson( const Json::Value &value );

    std::string writeJson( const Json::Value &value, bool pretty = true );

    /*!
     * @throw JSONError syntax error
     */
    Json::Value parseJson( const std::string &text );
}

#endif
