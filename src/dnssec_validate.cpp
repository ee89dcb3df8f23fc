#include "bulkvalidator.hpp"
#include "logger.hpp"
#include "resolverclient.hpp"
#include "resultjson.hpp"
#include "tlsclient.hpp"
#include "validator.hpp"
#include <boost/program_options.hpp>
#include <iostream>

int main( int argc, char **argv )
{
    namespace po = boost::program_options;

    std::string              config_file;
    bool                     check_tlsa;
    bool                     tlsa_details;
    bool                     bulk;
    uint16_t                 port = 0;
    std::string              log_level;
    std::vector<std::string> domains;

    po::options_description desc( "DNSSEC chain of trust and DANE validator" );
    desc.add_options()( "help,h", "print this message" )
        ( "config,c", po::value<std::string>( &config_file ), "configuration file (YAML)" )
        ( "tlsa,t", po::bool_switch( &check_tlsa ), "validate TLSA records and the server certificate" )
        ( "tlsa-details,d", po::bool_switch( &tlsa_details ), "add per-record TLSA results and certificate info (implies --tlsa)" )
        ( "port,p", po::value<uint16_t>( &port ), "TLS port (default: tls.port of the configuration)" )
        ( "log-level,l", po::value<std::string>( &log_level ), "trace|debug|info|warning|error|fatal" )
        ( "bulk,b", po::bool_switch( &bulk ), "print the bulk result shape with a summary" )
        ( "domain", po::value<std::vector<std::string>>( &domains ), "domain names" );

    po::positional_options_description positional;
    positional.add( "domain", -1 );

    po::variables_map vm;
    try {
        po::store( po::command_line_parser( argc, argv ).options( desc ).positional( positional ).run(), vm );
        po::notify( vm );
    } catch ( const po::error &e ) {
        std::cerr << e.what() << std::endl << desc << std::endl;
        return 1;
    }

    if ( vm.count( "help" ) || domains.empty() ) {
        std::cerr << "usage: " << argv[ 0 ] << " [options] domain..." << std::endl << desc << std::endl;
        return 1;
    }

    dnssec::Config config;
    try {
        if ( vm.count( "config" ) )
            config = dnssec::loadConfigFile( config_file );
        if ( vm.count( "log-level" ) )
            config.mLogLevel = log_level;
        dnssec::logger::initialize( config.mLogLevel );
    } catch ( const std::runtime_error &e ) {
        std::cerr << "cannot load configuration: " << e.what() << std::endl;
        return 1;
    }

    dnssec::ResolverClient  resolver( config.mResolver );
    dnssec::TLSClient       tls( config.mTLS.mTimeoutMSec );
    dnssec::SystemClock     clock;
    dnssec::Validator       validator( resolver, tls, config, clock );
    dnssec::ValidateOptions options;
    options.mCheckTLSA   = check_tlsa || tlsa_details;
    options.mTLSADetails = tlsa_details;
    options.mPort      = vm.count( "port" ) ? port : config.mTLS.mPort;
    options.mProtocol  = config.mTLS.mProtocol;

    if ( !bulk && domains.size() == 1 ) {
        dnssec::ValidationResult result = validator.validate( domains[ 0 ], options );
        std::cout << dnssec::writeJson( dnssec::toJson( result ) ) << std::endl;
        return 0;
    }

    options.mSource = "bulk";
    dnssec::BulkValidator bulk_validator( validator, config.mBulk );
    try {
        dnssec::BulkResult result = bulk_validator.validate( domains, options );
        std::cout << dnssec::writeJson( dnssec::toJson( result ) ) << std::endl;
    } catch ( const dnssec::BulkRequestError &e ) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    return 0;
}
